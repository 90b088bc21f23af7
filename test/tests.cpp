#include <algorithm>
#include <chrono>
#include <map>
#include <sstream>
#include "td/utils/port/signals.h"
#include "td/utils/logging.h"
#include "td/utils/check.h"

#include "td/utils/tests.h"
#include "td/utils/base64.h"
#include "td/utils/CancellationToken.h"
#include "crypto/block/block.h"

#include "AccountAddress.h"
#include "AdditionalInfoCollector.h"
#include "Config.h"
#include "RedisInformationSource.h"
#include "Serializer.h"
#include "TraceEnricher.h"


static td::Bits256 make_hash(td::uint8 n) {
  td::Bits256 res;
  res.as_slice().fill(static_cast<char>(n));
  return res;
}

static block::StdAddress make_address(td::uint8 n) {
  return block::StdAddress(0, make_hash(n));
}

static schema::Message make_message(td::uint8 n) {
  schema::Message msg;
  msg.hash = make_hash(n);
  return msg;
}

static schema::Message make_jetton_transfer(td::uint8 n, const block::StdAddress& wallet) {
  auto msg = make_message(n);
  msg.destination = wallet;
  msg.opcode = static_cast<td::int32>(JETTON_TRANSFER_OPCODE);
  msg.decoded_body = schema::DecodedBody{JETTON_TRANSFER_OPCODE, "JettonTransfer"};
  return msg;
}

static std::unique_ptr<Trace> make_node(td::uint8 account, std::optional<schema::Message> in_msg = std::nullopt) {
  schema::Transaction tx;
  tx.hash = make_hash(static_cast<td::uint8>(account + 100));
  tx.account = make_address(account);
  tx.in_msg = std::move(in_msg);
  return std::make_unique<Trace>(std::move(tx));
}

class RecordingSource : public InformationSource {
public:
  enum Query { JETTON_MASTERS, MARKETPLACE_SALES, BASIC_SALES };

  JettonMasters masters;
  NftSaleContracts marketplace_sales;
  NftSaleContracts basic_sales;
  std::optional<Query> failing_query;
  std::vector<std::pair<Query, std::vector<block::StdAddress>>> calls;

  td::Result<JettonMasters> resolve_jetton_masters(const QueryContext& ctx,
      const std::vector<block::StdAddress>& wallets) override {
    TRY_STATUS(record(JETTON_MASTERS, ctx, wallets));
    return masters;
  }
  td::Result<NftSaleContracts> resolve_marketplace_sale_contracts(const QueryContext& ctx,
      const std::vector<block::StdAddress>& accounts) override {
    TRY_STATUS(record(MARKETPLACE_SALES, ctx, accounts));
    return marketplace_sales;
  }
  td::Result<NftSaleContracts> resolve_basic_sale_contracts(const QueryContext& ctx,
      const std::vector<block::StdAddress>& accounts) override {
    TRY_STATUS(record(BASIC_SALES, ctx, accounts));
    return basic_sales;
  }

private:
  td::Status record(Query query, const QueryContext& ctx, const std::vector<block::StdAddress>& keys) {
    calls.emplace_back(query, keys);
    TRY_STATUS(ctx.check());
    if (failing_query == query) {
      return td::Status::Error(ErrorCode::DB_ERROR, PSLICE() << "query " << static_cast<int>(query) << " failed");
    }
    return td::Status::OK();
  }
};

static bool no_additional_info(const Trace& trace) {
  bool res = true;
  visit(trace, [&res](const Trace& node) {
    if (node.additional_info) {
      res = false;
    }
  });
  return res;
}

TEST(Trace, completed_trace_is_not_in_progress) {
  auto root = make_node(1, make_message(1));
  root->children.push_back(make_node(2, make_message(2)));
  root->children.push_back(make_node(3, make_message(3)));
  root->children[0]->children.push_back(make_node(4, make_message(4)));

  ASSERT_EQ(0u, root->count_uncompleted());
  ASSERT_TRUE(!root->in_progress());
  ASSERT_EQ(3, root->depth());
  ASSERT_EQ(4u, root->transactions_count());

  auto dump = root->to_string();
  ASSERT_EQ(4, static_cast<int>(std::count(dump.begin(), dump.end(), '\n')));
  ASSERT_TRUE(dump.find("----TX acc=" + convert::to_raw_address(make_address(4))) != std::string::npos);
}

TEST(Trace, uncompleted_messages_are_summed) {
  auto root = make_node(1, make_message(1));
  root->transaction.out_msgs.push_back(make_message(10));
  root->children.push_back(make_node(2, make_message(2)));
  root->children.push_back(make_node(3, make_message(3)));
  root->children[1]->transaction.out_msgs.push_back(make_message(11));
  root->children[1]->transaction.out_msgs.push_back(make_message(12));

  ASSERT_TRUE(root->in_progress());
  ASSERT_EQ(3u, root->count_uncompleted());
  ASSERT_TRUE(!root->children[0]->in_progress());
  ASSERT_EQ(2u, root->children[1]->count_uncompleted());
}

TEST(Trace, deep_leaf_message_keeps_trace_in_progress) {
  auto root = make_node(1, make_message(1));
  Trace* last = root.get();
  for (td::uint8 i = 2; i < 50; i++) {
    last->children.push_back(make_node(i, make_message(i)));
    last = last->children.back().get();
  }
  last->transaction.out_msgs.push_back(make_message(200));
  ASSERT_TRUE(root->in_progress());
  ASSERT_EQ(1u, root->count_uncompleted());
}

TEST(Trace, visit_is_pre_order) {
  auto root = make_node(1);
  root->children.push_back(make_node(2));
  root->children.push_back(make_node(5));
  root->children[0]->children.push_back(make_node(3));
  root->children[0]->children.push_back(make_node(4));
  root->children[1]->children.push_back(make_node(6));

  std::vector<block::StdAddress> order;
  visit(*static_cast<const Trace*>(root.get()), [&order](const Trace& node) { order.push_back(node.transaction.account); });
  ASSERT_EQ(6u, order.size());
  for (td::uint8 i = 0; i < 6; i++) {
    ASSERT_TRUE(make_address(static_cast<td::uint8>(i + 1)) == order[i]);
  }
}

TEST(Trace, very_deep_chain) {
  const size_t depth = 100000;
  auto root = make_node(0);
  Trace* last = root.get();
  for (size_t i = 1; i < depth; i++) {
    last->children.push_back(make_node(static_cast<td::uint8>(i % 200)));
    last = last->children.back().get();
  }
  last->transaction.out_msgs.push_back(make_message(1));

  ASSERT_EQ(depth, root->transactions_count());
  ASSERT_EQ(static_cast<int>(depth), root->depth());
  ASSERT_EQ(1u, root->count_uncompleted());

  RecordingSource source;
  QueryContext ctx;
  ASSERT_TRUE(collect_additional_info(ctx, &source, *root).is_ok());
  ASSERT_TRUE(last->additional_info.has_value());

  root.reset();
}

TEST(AdditionalInfo, null_source_is_noop) {
  auto root = make_node(1, make_jetton_transfer(1, make_address(50)));
  root->children.push_back(make_node(2, make_message(2)));

  QueryContext ctx;
  ASSERT_TRUE(collect_additional_info(ctx, nullptr, *root).is_ok());
  ASSERT_TRUE(no_additional_info(*root));
}

TEST(AdditionalInfo, failed_query_leaves_trace_untouched) {
  for (auto failing : {RecordingSource::JETTON_MASTERS, RecordingSource::MARKETPLACE_SALES, RecordingSource::BASIC_SALES}) {
    auto root = make_node(1, make_jetton_transfer(1, make_address(50)));
    root->children.push_back(make_node(2, make_message(2)));
    root->children[0]->account_interfaces = {ContractInterface::nft_sale, ContractInterface::nft_sale_getgems};

    RecordingSource source;
    source.masters.emplace(make_address(50), make_address(51));
    source.failing_query = failing;

    QueryContext ctx;
    auto status = collect_additional_info(ctx, &source, *root);
    ASSERT_TRUE(status.is_error());
    ASSERT_EQ(static_cast<int>(ErrorCode::DB_ERROR), status.code());
    ASSERT_EQ(PSTRING() << "query " << static_cast<int>(failing) << " failed", status.message().str());
    ASSERT_EQ(static_cast<size_t>(failing) + 1, source.calls.size());
    ASSERT_TRUE(no_additional_info(*root));
  }
}

TEST(AdditionalInfo, failed_rerun_keeps_previous_info) {
  auto root = make_node(1, make_jetton_transfer(1, make_address(50)));
  root->children.push_back(make_node(2, make_message(2)));
  root->children[0]->account_interfaces = {ContractInterface::nft_sale};

  RecordingSource source;
  source.masters.emplace(make_address(50), make_address(51));
  source.basic_sales.emplace(make_address(2), NftSaleContract{500, make_address(60)});
  QueryContext ctx;
  ASSERT_TRUE(collect_additional_info(ctx, &source, *root).is_ok());
  auto root_info = root->additional_info.value();
  auto child_info = root->children[0]->additional_info.value();
  ASSERT_TRUE(root_info.jetton_master == make_address(51));

  for (auto failing : {RecordingSource::JETTON_MASTERS, RecordingSource::MARKETPLACE_SALES, RecordingSource::BASIC_SALES}) {
    RecordingSource other;
    other.masters.emplace(make_address(50), make_address(70));
    other.basic_sales.emplace(make_address(2), NftSaleContract{900, std::nullopt});
    other.failing_query = failing;
    ASSERT_TRUE(collect_additional_info(ctx, &other, *root).is_error());
    ASSERT_TRUE(root->additional_info.value() == root_info);
    ASSERT_TRUE(root->children[0]->additional_info.value() == child_info);
  }
}

TEST(AdditionalInfo, cancelled_query_leaves_trace_untouched) {
  auto root = make_node(1, make_jetton_transfer(1, make_address(50)));
  RecordingSource source;
  td::CancellationTokenSource cancellation;
  QueryContext ctx(cancellation.get_cancellation_token(), td::Timestamp::in(10.0));
  cancellation.cancel();

  auto status = collect_additional_info(ctx, &source, *root);
  ASSERT_TRUE(status.is_error());
  ASSERT_EQ(static_cast<int>(ErrorCode::CANCELLED), status.code());
  ASSERT_TRUE(no_additional_info(*root));
}

TEST(AdditionalInfo, jetton_master_is_resolved) {
  auto wallet = make_address(50);
  auto master = make_address(51);
  auto root = make_node(1, make_jetton_transfer(1, wallet));

  RecordingSource source;
  source.masters.emplace(wallet, master);

  QueryContext ctx;
  ASSERT_TRUE(collect_additional_info(ctx, &source, *root).is_ok());
  ASSERT_TRUE(root->additional_info.has_value());
  ASSERT_TRUE(root->additional_info->jetton_master == master);
  ASSERT_TRUE(!root->additional_info->nft_sale_contract);
  auto first = root->additional_info.value();

  ASSERT_TRUE(collect_additional_info(ctx, &source, *root).is_ok());
  ASSERT_TRUE(root->additional_info.value() == first);
}

TEST(AdditionalInfo, unresolved_jetton_wallet_leaves_master_unset) {
  auto root = make_node(1, make_jetton_transfer(1, make_address(50)));
  RecordingSource source;
  QueryContext ctx;
  ASSERT_TRUE(collect_additional_info(ctx, &source, *root).is_ok());
  ASSERT_TRUE(root->additional_info.has_value());
  ASSERT_TRUE(!root->additional_info->jetton_master);
}

TEST(AdditionalInfo, basic_sale_wins_over_marketplace_sale) {
  auto root = make_node(1, make_message(1));
  root->account_interfaces = {ContractInterface::nft_sale_getgems, ContractInterface::nft_sale};

  RecordingSource source;
  NftSaleContract marketplace{100, make_address(60)};
  NftSaleContract basic{200, make_address(61)};
  source.marketplace_sales.emplace(make_address(1), marketplace);
  source.basic_sales.emplace(make_address(1), basic);

  QueryContext ctx;
  ASSERT_TRUE(collect_additional_info(ctx, &source, *root).is_ok());
  ASSERT_TRUE(root->additional_info->nft_sale_contract == basic);
}

TEST(AdditionalInfo, marketplace_sale_is_kept_without_basic_data) {
  auto root = make_node(1, make_message(1));
  root->account_interfaces = {ContractInterface::nft_sale_getgems, ContractInterface::nft_sale};

  RecordingSource source;
  NftSaleContract marketplace{100, std::nullopt};
  source.marketplace_sales.emplace(make_address(1), marketplace);

  QueryContext ctx;
  ASSERT_TRUE(collect_additional_info(ctx, &source, *root).is_ok());
  ASSERT_TRUE(root->additional_info->nft_sale_contract == marketplace);
}

TEST(AdditionalInfo, plain_node_gets_empty_info) {
  auto root = make_node(1, make_message(1));
  root->account_interfaces = {ContractInterface::jetton_wallet, ContractInterface::nft_item};

  RecordingSource source;
  QueryContext ctx;
  ASSERT_TRUE(collect_additional_info(ctx, &source, *root).is_ok());
  ASSERT_TRUE(root->additional_info.has_value());
  ASSERT_TRUE(root->additional_info.value() == TraceAdditionalInfo{});
}

TEST(AdditionalInfo, three_batched_queries) {
  auto root = make_node(1, make_jetton_transfer(1, make_address(50)));
  root->children.push_back(make_node(2, make_message(2)));
  root->children.push_back(make_node(3, make_jetton_transfer(3, make_address(52))));
  root->children[0]->account_interfaces = {ContractInterface::nft_sale_getgems};
  root->children[0]->children.push_back(make_node(4, make_jetton_transfer(4, make_address(50))));
  root->children[1]->account_interfaces = {ContractInterface::nft_sale, ContractInterface::nft_sale_getgems};
  for (td::uint8 i = 10; i < 40; i++) {
    root->children[0]->children.push_back(make_node(i, make_message(i)));
  }

  RecordingSource source;
  QueryContext ctx;
  ASSERT_TRUE(collect_additional_info(ctx, &source, *root).is_ok());

  ASSERT_EQ(3u, source.calls.size());
  ASSERT_TRUE(source.calls[0].first == RecordingSource::JETTON_MASTERS);
  ASSERT_TRUE(source.calls[1].first == RecordingSource::MARKETPLACE_SALES);
  ASSERT_TRUE(source.calls[2].first == RecordingSource::BASIC_SALES);

  std::vector<block::StdAddress> wallets{make_address(50), make_address(50), make_address(52)};
  std::vector<block::StdAddress> getgems{make_address(2), make_address(3)};
  std::vector<block::StdAddress> basic{make_address(3)};
  ASSERT_TRUE(source.calls[0].second == wallets);
  ASSERT_TRUE(source.calls[1].second == getgems);
  ASSERT_TRUE(source.calls[2].second == basic);
}

TEST(AdditionalInfo, jetton_transfer_needs_decoded_opcode) {
  auto msg = make_message(1);
  msg.destination = make_address(50);
  msg.opcode = static_cast<td::int32>(JETTON_TRANSFER_OPCODE);
  auto root = make_node(1, msg);
  ASSERT_TRUE(!jetton_transfer_destination(*root));

  root->transaction.in_msg->decoded_body = schema::DecodedBody{0x7362d09c, "JettonNotify"};
  ASSERT_TRUE(!jetton_transfer_destination(*root));

  root->transaction.in_msg->decoded_body = schema::DecodedBody{JETTON_TRANSFER_OPCODE, "JettonTransfer"};
  ASSERT_TRUE(jetton_transfer_destination(*root) == make_address(50));
}

TEST(QueryContext, check) {
  ASSERT_TRUE(QueryContext().check().is_ok());

  QueryContext expired(td::CancellationToken(), td::Timestamp::in(-1.0));
  ASSERT_EQ(static_cast<int>(ErrorCode::TIMEOUT), expired.check().code());

  td::CancellationTokenSource cancellation;
  QueryContext ctx(cancellation.get_cancellation_token(), td::Timestamp::in(10.0));
  ASSERT_TRUE(ctx.check().is_ok());
  cancellation.cancel();
  ASSERT_EQ(static_cast<int>(ErrorCode::CANCELLED), ctx.check().code());
}

TEST(RedisInformationSource, empty_input_needs_no_round_trip) {
  RedisInformationSource source(nullptr);
  QueryContext ctx;
  auto masters = source.resolve_jetton_masters(ctx, {});
  ASSERT_TRUE(masters.is_ok());
  ASSERT_TRUE(masters.ok().empty());
  auto sales = source.resolve_basic_sale_contracts(ctx, {});
  ASSERT_TRUE(sales.is_ok());
  ASSERT_TRUE(sales.ok().empty());
}

TEST(RedisInformationSource, timeouts) {
  auto options = query_connection_options("tcp://127.0.0.1:6380", 1.5);
  ASSERT_EQ("127.0.0.1", options.host);
  ASSERT_EQ(6380, options.port);
  ASSERT_TRUE(options.socket_timeout == std::chrono::milliseconds(1500));
  ASSERT_TRUE(options.connect_timeout == std::chrono::milliseconds(1500));

  ASSERT_EQ(static_cast<int>(ErrorCode::TIMEOUT),
            redis_error_status(sw::redis::TimeoutError("read timeout"), "HMGET").code());
  ASSERT_EQ(static_cast<int>(ErrorCode::DB_ERROR),
            redis_error_status(sw::redis::IoError("connection reset"), "HMGET").code());
}

TEST(ContractInterface, names) {
  for (auto iface : {ContractInterface::jetton_wallet, ContractInterface::jetton_master, ContractInterface::nft_item,
                     ContractInterface::nft_collection, ContractInterface::nft_sale, ContractInterface::nft_sale_getgems,
                     ContractInterface::nft_auction_getgems}) {
    auto parsed = parse_contract_interface(to_string(iface));
    ASSERT_TRUE(parsed.is_ok());
    ASSERT_TRUE(parsed.ok() == iface);
  }
  ASSERT_TRUE(parse_contract_interface("wallet_v4").is_error());
}

TEST(convert, to_std_address) {
  auto raw = convert::to_std_address("0:0e41dc1dc3c9067ed24248580e12b3359818d83dee0304fabcf80845eafafdb2");
  ASSERT_TRUE(raw.is_ok());
  ASSERT_EQ("0:0E41DC1DC3C9067ED24248580E12B3359818D83DEE0304FABCF80845EAFAFDB2", convert::to_raw_address(raw.ok()));

  auto friendly = convert::to_std_address(raw.ok().rserialize(true));
  ASSERT_TRUE(friendly.is_ok());
  ASSERT_TRUE(raw.ok() == friendly.ok());

  ASSERT_TRUE(convert::to_std_address("").is_error());
  ASSERT_TRUE(convert::to_std_address("0:xyz").is_error());
}

TEST(Config, accounts_file) {
  auto accounts = parse_accounts(
      "0:0e41dc1dc3c9067ed24248580e12b3359818d83dee0304fabcf80845eafafdb2,treasury\n"
      "\n"
      "not an address\n"
      "  -1:3333333333333333333333333333333333333333333333333333333333333333  \n");
  ASSERT_EQ(2u, accounts.size());
  ASSERT_EQ(0, accounts[0].workchain);
  ASSERT_EQ(-1, accounts[1].workchain);
}

TEST(Config, environment) {
  std::map<std::string, std::string> env{{"THREADS", "3"}, {"QUERY_TIMEOUT", "1.5"}, {"LOG_LEVEL", "debug"},
                                         {"TRACE_CHANNEL", "traces"}, {"IS_TESTNET", "true"}};
  auto getter = [&env](td::Slice name) -> std::optional<std::string> {
    auto it = env.find(name.str());
    if (it == env.end()) {
      return std::nullopt;
    }
    return it->second;
  };
  auto config = load_config(getter);
  ASSERT_TRUE(config.is_ok());
  ASSERT_EQ(3u, config.ok().threads);
  ASSERT_TRUE(config.ok().query_timeout == 1.5);
  ASSERT_EQ(verbosity_DEBUG, config.ok().verbosity);
  ASSERT_EQ("traces", config.ok().input_channel);
  ASSERT_EQ("enriched_trace", config.ok().output_channel);
  ASSERT_TRUE(config.ok().is_testnet);
  ASSERT_EQ(1u, config.ok().accounts.size());

  env["ACCOUNTS"] = "0:0e41dc1dc3c9067ed24248580e12b3359818d83dee0304fabcf80845eafafdb2,bad";
  ASSERT_TRUE(load_config(getter).is_error());

  env.erase("ACCOUNTS");
  env["THREADS"] = "many";
  ASSERT_TRUE(load_config(getter).is_error());
}

static std::unordered_map<std::string, std::string> store_trace(const Trace& trace, const td::Bits256& root_msg_hash) {
  std::unordered_map<std::string, std::string> fields;
  fields[ROOT_NODE_FIELD] = td::base64_encode(root_msg_hash.as_slice());
  visit(trace, [&fields](const Trace& node) {
    fields[td::base64_encode(node.transaction.in_msg->hash.as_slice())] = pack_trace_node(serialize_trace_node(node));
  });
  return fields;
}

TEST(Serializer, assemble_trace) {
  // stored flat: children are linked through out_msgs
  Trace root(make_node(1, make_message(1))->transaction);
  root.transaction.out_msgs = {make_message(2), make_message(3), make_message(9)};
  root.account_interfaces = {ContractInterface::nft_sale_getgems};
  Trace child(make_node(2, make_jetton_transfer(2, make_address(50)))->transaction);
  Trace other(make_node(3, make_message(3))->transaction);

  auto fields = store_trace(root, make_hash(1));
  for (auto& [key, value] : store_trace(child, make_hash(2))) {
    fields.emplace(key, value);
  }
  for (auto& [key, value] : store_trace(other, make_hash(3))) {
    fields.emplace(key, value);
  }
  fields[IN_PROGRESS_FIELD] = "1";
  fields[std::string(ADDITIONAL_INFO_PREFIX) + td::base64_encode(make_hash(2).as_slice())] = "";

  auto trace_r = assemble_trace(fields);
  ASSERT_TRUE(trace_r.is_ok());
  auto trace = trace_r.move_as_ok();
  ASSERT_EQ(3u, trace->transactions_count());
  ASSERT_EQ(2u, trace->children.size());
  ASSERT_EQ(1u, trace->transaction.out_msgs.size());
  ASSERT_TRUE(trace->transaction.out_msgs[0].hash == make_hash(9));
  ASSERT_EQ(1u, trace->count_uncompleted());
  ASSERT_TRUE(trace->has_interface(ContractInterface::nft_sale_getgems));
  ASSERT_TRUE(jetton_transfer_destination(*trace->children[0]) == make_address(50));

  fields.erase(ROOT_NODE_FIELD);
  ASSERT_TRUE(assemble_trace(fields).is_error());
}

static void store_node(std::unordered_map<std::string, std::string>& fields, td::uint8 n, std::vector<td::uint8> out_msgs) {
  auto node = make_node(n, make_message(n));
  for (auto out : out_msgs) {
    node->transaction.out_msgs.push_back(make_message(out));
  }
  fields[td::base64_encode(make_hash(n).as_slice())] = pack_trace_node(serialize_trace_node(*node));
}

TEST(Serializer, node_reachable_twice_is_rejected) {
  std::unordered_map<std::string, std::string> fields;
  fields[ROOT_NODE_FIELD] = td::base64_encode(make_hash(1).as_slice());
  store_node(fields, 1, {2, 3});
  store_node(fields, 2, {4});
  store_node(fields, 3, {4});
  store_node(fields, 4, {});
  auto shared_child = assemble_trace(fields);
  ASSERT_TRUE(shared_child.is_error());
  ASSERT_EQ(static_cast<int>(ErrorCode::DATA_PARSING_ERROR), shared_child.error().code());

  fields.clear();
  fields[ROOT_NODE_FIELD] = td::base64_encode(make_hash(1).as_slice());
  store_node(fields, 1, {2});
  store_node(fields, 2, {1});
  auto back_to_root = assemble_trace(fields);
  ASSERT_TRUE(back_to_root.is_error());
  ASSERT_EQ(static_cast<int>(ErrorCode::DATA_PARSING_ERROR), back_to_root.error().code());
}

TEST(Serializer, bad_root_node) {
  std::unordered_map<std::string, std::string> fields;
  store_node(fields, 1, {});

  fields[ROOT_NODE_FIELD] = "%%%";
  auto not_base64 = assemble_trace(fields);
  ASSERT_TRUE(not_base64.is_error());
  ASSERT_EQ(static_cast<int>(ErrorCode::DATA_PARSING_ERROR), not_base64.error().code());

  fields[ROOT_NODE_FIELD] = td::base64_encode("short");
  auto short_hash = assemble_trace(fields);
  ASSERT_TRUE(short_hash.is_error());
  ASSERT_EQ(static_cast<int>(ErrorCode::DATA_PARSING_ERROR), short_hash.error().code());

  fields[ROOT_NODE_FIELD] = td::base64_encode(make_hash(7).as_slice());
  auto missing = assemble_trace(fields);
  ASSERT_TRUE(missing.is_error());
  ASSERT_EQ(static_cast<int>(ErrorCode::DATA_PARSING_ERROR), missing.error().code());
}

TEST(Serializer, nft_sale) {
  NftSaleContract with_owner{1000000000, make_address(52)};
  auto unpacked = unpack_nft_sale(pack_nft_sale(with_owner));
  ASSERT_TRUE(unpacked.is_ok());
  ASSERT_TRUE(unpacked.ok() == with_owner);

  NftSaleContract without_owner{42, std::nullopt};
  unpacked = unpack_nft_sale(pack_nft_sale(without_owner));
  ASSERT_TRUE(unpacked.is_ok());
  ASSERT_TRUE(!unpacked.ok().owner);
  ASSERT_EQ(42, unpacked.ok().nft_price);
}

TEST(Serializer, hash_from_hex_string) {
  auto hash = make_hash(0xab);
  std::stringstream buffer;
  msgpack::pack(buffer, hash.to_hex());
  auto data = buffer.str();
  td::Bits256 unpacked;
  msgpack::unpack(data.data(), data.size()).get().convert(unpacked);
  ASSERT_TRUE(unpacked == hash);

  std::stringstream bad_buffer;
  msgpack::pack(bad_buffer, std::string(64, 'z'));
  auto bad_data = bad_buffer.str();
  bool rejected = false;
  try {
    msgpack::unpack(bad_data.data(), bad_data.size()).get().convert(unpacked);
  } catch (const std::exception&) {
    rejected = true;
  }
  ASSERT_TRUE(rejected);
}

TEST(Serializer, additional_info) {
  TraceAdditionalInfo info;
  info.jetton_master = make_address(51);
  info.nft_sale_contract = NftSaleContract{12345, make_address(52)};
  auto unpacked = unpack_additional_info(pack_additional_info(info));
  ASSERT_TRUE(unpacked.is_ok());
  ASSERT_TRUE(unpacked.ok() == info);

  ASSERT_TRUE(unpack_nft_sale("not msgpack").is_error());
}

TEST(TraceEnricher, notification_channels) {
  auto root = make_node(1, make_message(1));
  root->children.push_back(make_node(2, make_message(2)));
  root->children.push_back(make_node(1, make_message(3)));

  AccountSet accounts{make_address(1), make_address(7)};
  auto channels = notification_channels(*root, accounts, "enriched_trace");
  ASSERT_EQ(2u, channels.size());
  ASSERT_EQ("enriched_trace", channels[0]);
  ASSERT_EQ("enriched_trace:" + convert::to_raw_address(make_address(1)), channels[1]);

  ASSERT_EQ(1u, notification_channels(*root, AccountSet{}, "out").size());
}

int main(int argc, char **argv) {
  td::set_default_failure_signal_handler().ensure();
  auto &runner = td::TestsRunner::get_default();
  runner.run_all();
  return 0;
}
