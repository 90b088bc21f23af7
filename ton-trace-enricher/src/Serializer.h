#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "msgpack-utils.h"
#include "TraceData.h"

// Layout of a trace in the trace store: one hash per trace key with
//   root_node          -> base64 hash of the root inbound message
//   <base64 msg hash>  -> RedisTraceNode for the transaction processing that message
//   ai:<base64 hash>   -> RedisAdditionalInfo, written by the enricher
//   in_progress        -> "1" or "0", written by the enricher
constexpr const char* ROOT_NODE_FIELD = "root_node";
constexpr const char* IN_PROGRESS_FIELD = "in_progress";
constexpr const char* ADDITIONAL_INFO_PREFIX = "ai:";

struct RedisDecodedBody {
  uint32_t opcode;
  std::string operation;

  MSGPACK_DEFINE(opcode, operation);
};

struct RedisMessage {
  td::Bits256 hash;
  std::optional<block::StdAddress> source;
  std::optional<block::StdAddress> destination;
  std::optional<int64_t> value;
  std::optional<int32_t> opcode;
  std::optional<RedisDecodedBody> decoded_body;

  MSGPACK_DEFINE(hash, source, destination, value, opcode, decoded_body);
};

struct RedisTransaction {
  td::Bits256 hash;
  block::StdAddress account;
  uint64_t lt;
  uint32_t now;
  bool aborted;
  std::optional<RedisMessage> in_msg;
  std::vector<RedisMessage> out_msgs;

  MSGPACK_DEFINE(hash, account, lt, now, aborted, in_msg, out_msgs);
};

struct RedisTraceNode {
  RedisTransaction transaction;
  std::vector<std::string> account_interfaces;

  MSGPACK_DEFINE(transaction, account_interfaces);
};

struct RedisNftSale {
  int64_t price;
  std::optional<block::StdAddress> owner;

  MSGPACK_DEFINE(price, owner);
};

struct RedisAdditionalInfo {
  std::optional<block::StdAddress> jetton_master;
  std::optional<RedisNftSale> nft_sale;

  MSGPACK_DEFINE(jetton_master, nft_sale);
};

td::Result<RedisTraceNode> unpack_trace_node(td::Slice data);
std::string pack_trace_node(const RedisTraceNode& node);

td::Result<NftSaleContract> unpack_nft_sale(td::Slice data);
std::string pack_nft_sale(const NftSaleContract& sale);

std::string pack_additional_info(const TraceAdditionalInfo& info);
td::Result<TraceAdditionalInfo> unpack_additional_info(td::Slice data);

schema::Message parse_message(const RedisMessage& msg);
td::Result<Trace> parse_trace_node(const RedisTraceNode& node);
RedisTraceNode serialize_trace_node(const Trace& trace);

// Builds the trace tree from the fields of a stored trace.
// Outbound messages matched to a stored node become children and are removed
// from out_msgs. Stored nodes not reachable from the root are ignored.
td::Result<std::unique_ptr<Trace>> assemble_trace(const std::unordered_map<std::string, std::string>& fields);
