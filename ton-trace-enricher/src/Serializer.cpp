#include <sstream>
#include <unordered_set>
#include "Serializer.h"
#include "InformationSource.h"
#include "td/utils/base64.h"
#include "td/utils/logging.h"
#include "td/utils/misc.h"


template <class T>
static td::Result<T> unpack_value(td::Slice data, td::Slice what) {
  try {
    msgpack::object_handle oh = msgpack::unpack(data.data(), data.size());
    T value;
    oh.get().convert(value);
    return value;
  } catch (const std::exception& e) {
    return td::Status::Error(ErrorCode::DATA_PARSING_ERROR, PSLICE() << "Failed to unpack " << what << ": " << e.what());
  }
}

template <class T>
static std::string pack_value(const T& value) {
  std::stringstream buffer;
  msgpack::pack(buffer, value);
  return buffer.str();
}

td::Result<RedisTraceNode> unpack_trace_node(td::Slice data) {
  return unpack_value<RedisTraceNode>(data, "trace node");
}

std::string pack_trace_node(const RedisTraceNode& node) {
  return pack_value(node);
}

td::Result<NftSaleContract> unpack_nft_sale(td::Slice data) {
  TRY_RESULT(sale, unpack_value<RedisNftSale>(data, "nft sale"));
  return NftSaleContract{sale.price, sale.owner};
}

std::string pack_nft_sale(const NftSaleContract& sale) {
  return pack_value(RedisNftSale{sale.nft_price, sale.owner});
}

std::string pack_additional_info(const TraceAdditionalInfo& info) {
  RedisAdditionalInfo res;
  res.jetton_master = info.jetton_master;
  if (info.nft_sale_contract) {
    res.nft_sale = RedisNftSale{info.nft_sale_contract->nft_price, info.nft_sale_contract->owner};
  }
  return pack_value(res);
}

td::Result<TraceAdditionalInfo> unpack_additional_info(td::Slice data) {
  TRY_RESULT(info, unpack_value<RedisAdditionalInfo>(data, "additional info"));
  TraceAdditionalInfo res;
  res.jetton_master = info.jetton_master;
  if (info.nft_sale) {
    res.nft_sale_contract = NftSaleContract{info.nft_sale->price, info.nft_sale->owner};
  }
  return res;
}

schema::Message parse_message(const RedisMessage& msg) {
  schema::Message res;
  res.hash = msg.hash;
  res.source = msg.source;
  res.destination = msg.destination;
  res.value = msg.value;
  res.opcode = msg.opcode;
  if (msg.decoded_body) {
    res.decoded_body = schema::DecodedBody{msg.decoded_body->opcode, msg.decoded_body->operation};
  }
  return res;
}

td::Result<Trace> parse_trace_node(const RedisTraceNode& node) {
  schema::Transaction tx;
  tx.hash = node.transaction.hash;
  tx.account = node.transaction.account;
  tx.lt = node.transaction.lt;
  tx.now = node.transaction.now;
  tx.aborted = node.transaction.aborted;
  if (node.transaction.in_msg) {
    tx.in_msg = parse_message(node.transaction.in_msg.value());
  }
  for (const auto& out_msg : node.transaction.out_msgs) {
    tx.out_msgs.push_back(parse_message(out_msg));
  }

  Trace trace(std::move(tx));
  for (const auto& name : node.account_interfaces) {
    auto iface = parse_contract_interface(name);
    if (iface.is_error()) {
      return iface.move_as_error_prefix(PSLICE() << "tx " << node.transaction.hash.to_hex() << ": ");
    }
    trace.account_interfaces.push_back(iface.move_as_ok());
  }
  return trace;
}

static RedisMessage serialize_message(const schema::Message& msg) {
  RedisMessage res;
  res.hash = msg.hash;
  res.source = msg.source;
  res.destination = msg.destination;
  res.value = msg.value;
  res.opcode = msg.opcode;
  if (msg.decoded_body) {
    res.decoded_body = RedisDecodedBody{msg.decoded_body->opcode, msg.decoded_body->operation};
  }
  return res;
}

RedisTraceNode serialize_trace_node(const Trace& trace) {
  RedisTraceNode res;
  const auto& tx = trace.transaction;
  res.transaction.hash = tx.hash;
  res.transaction.account = tx.account;
  res.transaction.lt = tx.lt;
  res.transaction.now = tx.now;
  res.transaction.aborted = tx.aborted;
  if (tx.in_msg) {
    res.transaction.in_msg = serialize_message(tx.in_msg.value());
  }
  for (const auto& out_msg : tx.out_msgs) {
    res.transaction.out_msgs.push_back(serialize_message(out_msg));
  }
  for (auto iface : trace.account_interfaces) {
    res.account_interfaces.push_back(to_string(iface).str());
  }
  return res;
}

static td::Result<td::Bits256> decode_msg_hash(td::Slice field) {
  auto decoded_r = td::base64_decode(field);
  if (decoded_r.is_error()) {
    return td::Status::Error(ErrorCode::DATA_PARSING_ERROR, PSLICE() << "'" << field << "' is not base64: "
                                                                     << decoded_r.error().message());
  }
  auto decoded = decoded_r.move_as_ok();
  if (decoded.size() != 32) {
    return td::Status::Error(ErrorCode::DATA_PARSING_ERROR, PSLICE() << "'" << field << "' is not a message hash");
  }
  td::Bits256 hash;
  hash.as_slice().copy_from(decoded);
  return hash;
}

td::Result<std::unique_ptr<Trace>> assemble_trace(const std::unordered_map<std::string, std::string>& fields) {
  auto root_it = fields.find(ROOT_NODE_FIELD);
  if (root_it == fields.end()) {
    return td::Status::Error(ErrorCode::DATA_PARSING_ERROR, "root_node field is missing");
  }
  TRY_RESULT(root_hash, decode_msg_hash(root_it->second));

  std::unordered_map<td::Bits256, const std::string*, Bits256Hasher> stored_nodes;
  for (const auto& [field, value] : fields) {
    if (field == ROOT_NODE_FIELD || field == IN_PROGRESS_FIELD || td::begins_with(field, ADDITIONAL_INFO_PREFIX)) {
      continue;
    }
    auto hash = decode_msg_hash(field);
    if (hash.is_error()) {
      LOG(DEBUG) << "Skipping unknown trace field " << field;
      continue;
    }
    stored_nodes.emplace(hash.move_as_ok(), &value);
  }

  auto parse_node = [&](const td::Bits256& msg_hash) -> td::Result<std::unique_ptr<Trace>> {
    auto it = stored_nodes.find(msg_hash);
    if (it == stored_nodes.end()) {
      return td::Status::Error(ErrorCode::DATA_PARSING_ERROR, PSLICE() << "node " << td::base64_encode(msg_hash.as_slice()) << " not found");
    }
    TRY_RESULT(redis_node, unpack_trace_node(*it->second));
    TRY_RESULT(node, parse_trace_node(redis_node));
    return std::make_unique<Trace>(std::move(node));
  };

  TRY_RESULT(root, parse_node(root_hash));
  std::unordered_set<td::Bits256, Bits256Hasher> attached{root_hash};
  std::vector<Trace*> stack{root.get()};
  while (!stack.empty()) {
    Trace* current = stack.back();
    stack.pop_back();

    std::vector<schema::Message> unmatched;
    for (auto& out_msg : current->transaction.out_msgs) {
      if (stored_nodes.count(out_msg.hash) == 0) {
        unmatched.push_back(std::move(out_msg));
        continue;
      }
      if (!attached.insert(out_msg.hash).second) {
        return td::Status::Error(ErrorCode::DATA_PARSING_ERROR, PSLICE() << "node " << td::base64_encode(out_msg.hash.as_slice()) << " is reachable twice");
      }
      TRY_RESULT(child, parse_node(out_msg.hash));
      current->children.push_back(std::move(child));
    }
    current->transaction.out_msgs = std::move(unmatched);
    for (auto& child : current->children) {
      stack.push_back(child.get());
    }
  }

  if (attached.size() != stored_nodes.size()) {
    LOG(DEBUG) << "Ignored " << stored_nodes.size() - attached.size() << " unreachable trace nodes";
  }
  return root;
}
