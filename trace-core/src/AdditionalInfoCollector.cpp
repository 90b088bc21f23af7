#include "AdditionalInfoCollector.h"
#include "Statistics.h"
#include "td/utils/Timer.h"


std::optional<block::StdAddress> jetton_transfer_destination(const Trace& trace) {
  const auto& in_msg = trace.transaction.in_msg;
  if (!in_msg || !in_msg->decoded_body) {
    return std::nullopt;
  }
  if (in_msg->decoded_body->opcode != JETTON_TRANSFER_OPCODE) {
    return std::nullopt;
  }
  return in_msg->destination;
}

AdditionalInfoCandidates collect_candidates(const Trace& trace) {
  AdditionalInfoCandidates res;
  visit(trace, [&res](const Trace& node) {
    if (auto wallet = jetton_transfer_destination(node)) {
      res.jetton_wallets.push_back(wallet.value());
    }
    if (node.has_interface(ContractInterface::nft_sale_getgems)) {
      res.getgems_sales.push_back(node.transaction.account);
    }
    if (node.has_interface(ContractInterface::nft_sale)) {
      res.basic_sales.push_back(node.transaction.account);
    }
  });
  return res;
}

static td::Status do_collect_additional_info(const QueryContext& ctx, InformationSource& source, Trace& trace) {
  auto candidates = collect_candidates(trace);

  TRY_RESULT(masters, source.resolve_jetton_masters(ctx, candidates.jetton_wallets));
  TRY_RESULT(getgems_sales, source.resolve_marketplace_sale_contracts(ctx, candidates.getgems_sales));
  TRY_RESULT(basic_sales, source.resolve_basic_sale_contracts(ctx, candidates.basic_sales));

  visit(trace, [&](Trace& node) {
    auto& info = node.additional_info.emplace();
    if (auto wallet = jetton_transfer_destination(node)) {
      if (auto it = masters.find(wallet.value()); it != masters.end()) {
        info.jetton_master = it->second;
      }
    }
    if (node.has_interface(ContractInterface::nft_sale_getgems)) {
      if (auto it = getgems_sales.find(node.transaction.account); it != getgems_sales.end()) {
        info.nft_sale_contract = it->second;
      }
    }
    if (node.has_interface(ContractInterface::nft_sale)) {
      if (auto it = basic_sales.find(node.transaction.account); it != basic_sales.end()) {
        info.nft_sale_contract = it->second;
      }
    }
  });
  return td::Status::OK();
}

td::Status collect_additional_info(const QueryContext& ctx, InformationSource* source, Trace& trace) {
  if (source == nullptr) {
    return td::Status::OK();
  }
  td::Timer timer;
  auto status = do_collect_additional_info(ctx, *source, trace);
  if (status.is_error()) {
    g_statistics.record_count(ENRICH_TRACE_ERROR);
    return status;
  }
  g_statistics.record_time(ENRICH_TRACE, static_cast<uint64_t>(timer.elapsed() * 1e6));
  return status;
}
