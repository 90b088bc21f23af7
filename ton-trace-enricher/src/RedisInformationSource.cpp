#include <chrono>
#include <cstdint>
#include <iterator>
#include <unordered_set>
#include "RedisInformationSource.h"
#include "Serializer.h"
#include "Statistics.h"
#include "td/utils/logging.h"
#include "td/utils/Timer.h"

sw::redis::ConnectionOptions query_connection_options(const std::string& redis_dsn, double query_timeout) {
  sw::redis::ConnectionOptions connection_options = sw::redis::Uri(redis_dsn).connection_options();
  auto timeout = std::chrono::milliseconds(static_cast<std::int64_t>(query_timeout * 1000));
  connection_options.connect_timeout = timeout;
  connection_options.socket_timeout = timeout;
  return connection_options;
}

td::Status redis_error_status(const sw::redis::Error& e, td::Slice what) {
  if (dynamic_cast<const sw::redis::TimeoutError*>(&e) != nullptr) {
    return td::Status::Error(ErrorCode::TIMEOUT, PSLICE() << what << " timed out: " << e.what());
  }
  return td::Status::Error(ErrorCode::DB_ERROR, PSLICE() << what << " failed: " << e.what());
}

td::Result<RedisInformationSource::Found> RedisInformationSource::hmget(const QueryContext& ctx, const std::string& key,
                                                                        const std::vector<block::StdAddress>& addresses) {
  TRY_STATUS(ctx.check());

  std::vector<block::StdAddress> unique_addresses;
  std::unordered_set<block::StdAddress> seen;
  for (const auto& address : addresses) {
    if (seen.insert(address).second) {
      unique_addresses.push_back(address);
    }
  }
  Found res;
  if (unique_addresses.empty()) {
    return res;
  }

  std::vector<std::string> fields;
  fields.reserve(unique_addresses.size());
  for (const auto& address : unique_addresses) {
    fields.push_back(convert::to_raw_address(address));
  }

  td::Timer timer;
  std::vector<sw::redis::OptionalString> values;
  try {
    redis_->hmget(key, fields.begin(), fields.end(), std::back_inserter(values));
  } catch (const sw::redis::Error& e) {
    return redis_error_status(e, PSLICE() << "HMGET " << key);
  }
  g_statistics.record_time(SOURCE_QUERY, static_cast<uint64_t>(timer.elapsed() * 1e6));

  TRY_STATUS(ctx.check());
  if (values.size() != unique_addresses.size()) {
    return td::Status::Error(ErrorCode::DB_ERROR, PSLICE() << "HMGET " << key << " returned " << values.size()
                                                           << " values for " << unique_addresses.size() << " fields");
  }
  for (size_t i = 0; i < values.size(); i++) {
    if (values[i]) {
      res.emplace_back(unique_addresses[i], std::move(*values[i]));
    }
  }
  LOG(DEBUG) << "HMGET " << key << ": " << res.size() << " of " << unique_addresses.size() << " found";
  return res;
}

td::Result<JettonMasters> RedisInformationSource::resolve_jetton_masters(const QueryContext& ctx,
                                                                         const std::vector<block::StdAddress>& wallets) {
  TRY_RESULT(found, hmget(ctx, JETTON_MASTERS_KEY, wallets));
  JettonMasters res;
  for (auto& [wallet, value] : found) {
    auto master = convert::to_std_address(value);
    if (master.is_error()) {
      return td::Status::Error(ErrorCode::DATA_PARSING_ERROR, PSLICE() << "bad jetton master for wallet "
                               << convert::to_raw_address(wallet) << ": " << master.move_as_error().message());
    }
    res.emplace(wallet, master.move_as_ok());
  }
  return res;
}

td::Result<NftSaleContracts> RedisInformationSource::resolve_sale_contracts(const QueryContext& ctx, const std::string& key,
                                                                            const std::vector<block::StdAddress>& accounts) {
  TRY_RESULT(found, hmget(ctx, key, accounts));
  NftSaleContracts res;
  for (auto& [account, value] : found) {
    auto sale = unpack_nft_sale(value);
    if (sale.is_error()) {
      return sale.move_as_error_prefix(PSLICE() << key << " " << convert::to_raw_address(account) << ": ");
    }
    res.emplace(account, sale.move_as_ok());
  }
  return res;
}

td::Result<NftSaleContracts> RedisInformationSource::resolve_marketplace_sale_contracts(const QueryContext& ctx,
                                                                                        const std::vector<block::StdAddress>& accounts) {
  return resolve_sale_contracts(ctx, GETGEMS_SALES_KEY, accounts);
}

td::Result<NftSaleContracts> RedisInformationSource::resolve_basic_sale_contracts(const QueryContext& ctx,
                                                                                  const std::vector<block::StdAddress>& accounts) {
  return resolve_sale_contracts(ctx, BASIC_SALES_KEY, accounts);
}
