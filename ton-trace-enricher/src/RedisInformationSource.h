#pragma once
#include <memory>
#include <sw/redis++/redis++.h>
#include "InformationSource.h"

// Connection for enrichment queries: a round trip that outlives query_timeout fails with TimeoutError
sw::redis::ConnectionOptions query_connection_options(const std::string& redis_dsn, double query_timeout);

// TimeoutError maps to TIMEOUT, other redis errors to DB_ERROR
td::Status redis_error_status(const sw::redis::Error& e, td::Slice what);

// Reads lookup tables filled by the indexer:
//   jetton_wallet:master  raw wallet address -> raw master address
//   nft_sale:getgems      raw sale address -> msgpack [price, owner]
//   nft_sale:basic        raw sale address -> msgpack [price, owner]
// Every call is a single HMGET.
class RedisInformationSource : public InformationSource {
public:
  static constexpr const char* JETTON_MASTERS_KEY = "jetton_wallet:master";
  static constexpr const char* GETGEMS_SALES_KEY = "nft_sale:getgems";
  static constexpr const char* BASIC_SALES_KEY = "nft_sale:basic";

  explicit RedisInformationSource(std::shared_ptr<sw::redis::Redis> redis) : redis_(std::move(redis)) {}

  td::Result<JettonMasters> resolve_jetton_masters(const QueryContext& ctx,
      const std::vector<block::StdAddress>& wallets) override;
  td::Result<NftSaleContracts> resolve_marketplace_sale_contracts(const QueryContext& ctx,
      const std::vector<block::StdAddress>& accounts) override;
  td::Result<NftSaleContracts> resolve_basic_sale_contracts(const QueryContext& ctx,
      const std::vector<block::StdAddress>& accounts) override;

private:
  using Found = std::vector<std::pair<block::StdAddress, std::string>>;

  td::Result<Found> hmget(const QueryContext& ctx, const std::string& key, const std::vector<block::StdAddress>& addresses);
  td::Result<NftSaleContracts> resolve_sale_contracts(const QueryContext& ctx, const std::string& key,
      const std::vector<block::StdAddress>& accounts);

  std::shared_ptr<sw::redis::Redis> redis_;
};
