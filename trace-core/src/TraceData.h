#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "crypto/block/block.h"
#include "td/utils/Status.h"
#include "AccountAddress.h"

constexpr td::uint32 JETTON_TRANSFER_OPCODE = 0x0f8a7ea5;

namespace schema {

// Body of a message as decoded by the contract ABI layer
struct DecodedBody {
  td::uint32 opcode;
  std::string operation;
};

struct Message {
  td::Bits256 hash;
  std::optional<block::StdAddress> source;
  std::optional<block::StdAddress> destination;
  std::optional<td::int64> value;
  std::optional<td::int32> opcode;
  std::optional<DecodedBody> decoded_body;
};

struct Transaction {
  td::Bits256 hash;
  block::StdAddress account;
  td::uint64 lt{0};
  td::uint32 now{0};
  bool aborted{false};

  std::optional<Message> in_msg;
  std::vector<Message> out_msgs;
};

}  // namespace schema

enum class ContractInterface : td::uint8 {
  jetton_wallet,
  jetton_master,
  nft_item,
  nft_collection,
  nft_sale,
  nft_sale_getgems,
  nft_auction_getgems
};

td::Slice to_string(ContractInterface iface);
td::Result<ContractInterface> parse_contract_interface(td::Slice name);

// Partial result of "get_sale_data"
struct NftSaleContract {
  td::int64 nft_price{0};
  std::optional<block::StdAddress> owner;

  bool operator==(const NftSaleContract& other) const {
    return nft_price == other.nft_price && owner == other.owner;
  }
};

// Information about a node that is not present in its transaction
struct TraceAdditionalInfo {
  std::optional<block::StdAddress> jetton_master;
  std::optional<NftSaleContract> nft_sale_contract;

  bool operator==(const TraceAdditionalInfo& other) const {
    return jetton_master == other.jetton_master && nft_sale_contract == other.nft_sale_contract;
  }
};

struct Trace {
  // out_msgs keeps only messages not matched to any of the children
  schema::Transaction transaction;
  std::vector<ContractInterface> account_interfaces;
  std::vector<std::unique_ptr<Trace>> children;
  std::optional<TraceAdditionalInfo> additional_info;

  Trace() = default;
  explicit Trace(schema::Transaction tx) : transaction(std::move(tx)) {}
  Trace(Trace&&) = default;
  Trace& operator=(Trace&&) = default;
  ~Trace();

  bool has_interface(ContractInterface iface) const;

  // True while the trace may still grow.
  //
  // Counts every outbound message left in out_msgs, including external
  // outbound messages that will never produce a child. A trace whose only
  // remaining messages are external-out ones is reported as in progress
  // forever.
  bool in_progress() const;
  size_t count_uncompleted() const;

  int depth() const;
  size_t transactions_count() const;
  std::string to_string() const;
};

// Pre-order, depth first, children in order. Uses an explicit stack.
void visit(Trace& trace, const std::function<void(Trace&)>& fn);
void visit(const Trace& trace, const std::function<void(const Trace&)>& fn);
