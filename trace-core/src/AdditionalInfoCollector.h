#pragma once
#include <vector>
#include "InformationSource.h"
#include "TraceData.h"

struct AdditionalInfoCandidates {
  std::vector<block::StdAddress> jetton_wallets;
  std::vector<block::StdAddress> getgems_sales;
  std::vector<block::StdAddress> basic_sales;
};

// Destination of the inbound message if it is a decoded jetton transfer
std::optional<block::StdAddress> jetton_transfer_destination(const Trace& trace);

// Single pre-order walk classifying nodes into lookup categories.
// Order is preserved and duplicates are kept.
AdditionalInfoCandidates collect_candidates(const Trace& trace);

// Populates additional_info of every node of the trace.
//
// Issues exactly three queries to the source regardless of the trace size:
// jetton masters, getgems sales, basic sales, in this order. The first failed
// query aborts the call with its error and the trace is left untouched.
// On success every node gets a new TraceAdditionalInfo. For an account that
// implements both sale interfaces the basic sale data wins.
// A null source is not an error: nothing is done.
td::Status collect_additional_info(const QueryContext& ctx, InformationSource* source, Trace& trace);
