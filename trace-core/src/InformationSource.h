#pragma once
#include <unordered_map>
#include <vector>
#include "td/utils/Status.h"
#include "td/utils/Time.h"
#include "td/utils/CancellationToken.h"
#include "TraceData.h"

enum ErrorCode {
  DB_ERROR = 500,
  DATA_PARSING_ERROR = 502,

  TIMEOUT = 652,
  CANCELLED = 653
};

// Carries cancellation and deadline of a single enrichment call.
struct QueryContext {
  td::CancellationToken cancellation_token;
  td::Timestamp deadline;

  QueryContext() = default;
  QueryContext(td::CancellationToken token, td::Timestamp deadline)
      : cancellation_token(std::move(token)), deadline(deadline) {}

  td::Status check() const;
};

using JettonMasters = std::unordered_map<block::StdAddress, block::StdAddress>;
using NftSaleContracts = std::unordered_map<block::StdAddress, NftSaleContract>;

// Batched lookups used to build TraceAdditionalInfo.
//
// Input vectors may contain duplicates. A key missing from the result means
// there is no data for it. Implementations must call ctx.check() around every
// round trip so that cancellation and deadline abort a call in flight.
class InformationSource {
public:
  virtual ~InformationSource() = default;

  virtual td::Result<JettonMasters> resolve_jetton_masters(const QueryContext& ctx,
      const std::vector<block::StdAddress>& wallets) = 0;
  virtual td::Result<NftSaleContracts> resolve_marketplace_sale_contracts(const QueryContext& ctx,
      const std::vector<block::StdAddress>& accounts) = 0;
  virtual td::Result<NftSaleContracts> resolve_basic_sale_contracts(const QueryContext& ctx,
      const std::vector<block::StdAddress>& accounts) = 0;
};
