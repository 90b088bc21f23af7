#include <iterator>
#include <unordered_map>
#include "TraceEnricher.h"
#include "AdditionalInfoCollector.h"
#include "RedisInformationSource.h"
#include "Serializer.h"
#include "Statistics.h"
#include "td/utils/base64.h"
#include "td/utils/logging.h"
#include "td/utils/Timer.h"


std::vector<std::string> notification_channels(const Trace& trace, const AccountSet& accounts,
                                               const std::string& output_channel) {
  std::vector<std::string> channels{output_channel};
  if (accounts.empty()) {
    return channels;
  }
  std::unordered_set<block::StdAddress> seen;
  visit(trace, [&](const Trace& node) {
    const auto& account = node.transaction.account;
    if (accounts.count(account) && seen.insert(account).second) {
      channels.push_back(output_channel + ":" + convert::to_raw_address(account));
    }
  });
  return channels;
}

void TraceEnricher::start_up() {
  g_statistics.record_count(TRACE_RECEIVED);

  auto trace_r = load_trace();
  if (trace_r.is_error()) {
    g_statistics.record_count(TRACE_LOAD_ERROR);
    finish(trace_r.move_as_error_prefix("failed to load trace: "));
    return;
  }
  auto trace = trace_r.move_as_ok();
  if (trace->in_progress()) {
    g_statistics.record_count(TRACE_IN_PROGRESS);
  }
  LOG(DEBUG) << "Loaded trace " << trace_key_ << ": " << trace->transactions_count() << " transactions, "
             << trace->depth() << " depth, " << trace->count_uncompleted() << " uncompleted\n" << trace->to_string();

  auto status = enrich(*trace);
  if (status.is_error()) {
    finish(status.move_as_error_prefix("failed to collect additional info: "));
    return;
  }
  finish(write_trace(*trace));
}

td::Result<std::unique_ptr<Trace>> TraceEnricher::load_trace() {
  td::Timer timer;
  std::unordered_map<std::string, std::string> fields;
  try {
    redis_->hgetall(trace_key_, std::inserter(fields, fields.begin()));
  } catch (const sw::redis::Error& e) {
    return redis_error_status(e, "HGETALL");
  }
  if (fields.empty()) {
    return td::Status::Error(ErrorCode::DB_ERROR, "trace not found");
  }
  TRY_RESULT(trace, assemble_trace(fields));
  g_statistics.record_time(LOAD_TRACE, static_cast<uint64_t>(timer.elapsed() * 1e6));
  return trace;
}

td::Status TraceEnricher::enrich(Trace& trace) {
  QueryContext ctx(td::CancellationToken(), td::Timestamp::in(query_timeout_));
  return collect_additional_info(ctx, source_.get(), trace);
}

td::Status TraceEnricher::write_trace(const Trace& trace) {
  td::Timer timer;
  try {
    auto transaction = redis_->transaction();
    visit(trace, [&](const Trace& node) {
      if (!node.additional_info || !node.transaction.in_msg) {
        return;
      }
      auto field = ADDITIONAL_INFO_PREFIX + td::base64_encode(node.transaction.in_msg->hash.as_slice());
      transaction.hset(trace_key_, field, pack_additional_info(node.additional_info.value()));
    });
    transaction.hset(trace_key_, IN_PROGRESS_FIELD, trace.in_progress() ? "1" : "0");
    for (const auto& channel : notification_channels(trace, *accounts_, output_channel_)) {
      transaction.publish(channel, trace_key_);
    }
    transaction.exec();
  } catch (const sw::redis::Error& e) {
    return redis_error_status(e, "write trace");
  } catch (const std::exception& e) {
    return td::Status::Error(PSLICE() << "got exception while writing trace: " << e.what());
  }
  g_statistics.record_time(WRITE_TRACE, static_cast<uint64_t>(timer.elapsed() * 1e6));
  return td::Status::OK();
}

void TraceEnricher::finish(td::Status status) {
  if (status.is_error()) {
    promise_.set_error(std::move(status));
  } else {
    promise_.set_value(td::Unit());
  }
  stop();
}
