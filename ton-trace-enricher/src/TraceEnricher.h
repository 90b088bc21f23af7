#pragma once
#include <memory>
#include <unordered_set>
#include <sw/redis++/redis++.h>
#include "td/actor/actor.h"
#include "InformationSource.h"
#include "TraceData.h"

using AccountSet = std::unordered_set<block::StdAddress>;

// Loads one trace from the trace store, attaches additional info to its nodes
// and writes the result back, then notifies subscribers.
class TraceEnricher : public td::actor::Actor {
public:
  TraceEnricher(std::shared_ptr<sw::redis::Redis> redis, std::shared_ptr<InformationSource> source,
                std::string trace_key, double query_timeout, std::shared_ptr<const AccountSet> accounts,
                std::string output_channel, td::Promise<td::Unit> promise)
      : redis_(std::move(redis)), source_(std::move(source)), trace_key_(std::move(trace_key)),
        query_timeout_(query_timeout), accounts_(std::move(accounts)),
        output_channel_(std::move(output_channel)), promise_(std::move(promise)) {}

  void start_up() override;

private:
  td::Result<std::unique_ptr<Trace>> load_trace();
  td::Status enrich(Trace& trace);
  td::Status write_trace(const Trace& trace);
  void finish(td::Status status);

  std::shared_ptr<sw::redis::Redis> redis_;
  std::shared_ptr<InformationSource> source_;
  std::string trace_key_;
  double query_timeout_;
  std::shared_ptr<const AccountSet> accounts_;
  std::string output_channel_;
  td::Promise<td::Unit> promise_;
};

// Channels a trace notification is published to: the output channel itself
// and "<output>:<raw account>" for each listed account present in the trace.
std::vector<std::string> notification_channels(const Trace& trace, const AccountSet& accounts,
                                               const std::string& output_channel);
