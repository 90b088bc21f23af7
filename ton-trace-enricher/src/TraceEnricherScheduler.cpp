#include "TraceEnricherScheduler.h"
#include "Statistics.h"
#include "td/utils/filesystem.h"
#include "td/utils/logging.h"


void TraceEnricherScheduler::start_up() {
  LOG(INFO) << "Listening " << config_.input_channel << ", publishing to " << config_.output_channel
            << ", " << accounts_->size() << " accounts with own channels";
  channel_listener_ = td::actor::create_actor<ChannelListener>("RedisChannelListener", config_.redis_dsn, config_.input_channel,
    [SelfId = actor_id(this)](std::string trace_key) {
      td::actor::send_closure(SelfId, &TraceEnricherScheduler::on_new_trace, std::move(trace_key));
    });
  next_statistics_flush_ = td::Timestamp::in(60.0);
  alarm_timestamp() = next_statistics_flush_;
}

void TraceEnricherScheduler::on_new_trace(std::string trace_key) {
  if (in_flight_.count(trace_key)) {
    rerun_.insert(std::move(trace_key));
    return;
  }
  spawn_enricher(std::move(trace_key));
}

void TraceEnricherScheduler::spawn_enricher(std::string trace_key) {
  in_flight_.insert(trace_key);
  auto P = td::PromiseCreator::lambda([SelfId = actor_id(this), trace_key](td::Result<td::Unit> R) {
    td::actor::send_closure(SelfId, &TraceEnricherScheduler::trace_done, trace_key, std::move(R));
  });
  td::actor::create_actor<TraceEnricher>("TraceEnricher", redis_, source_, trace_key, config_.query_timeout,
                                         accounts_, config_.output_channel, std::move(P)).release();
}

void TraceEnricherScheduler::trace_done(std::string trace_key, td::Result<td::Unit> result) {
  if (result.is_error()) {
    LOG(ERROR) << "Failed to enrich trace " << trace_key << ": " << result.move_as_error();
  } else {
    LOG(DEBUG) << "Enriched trace " << trace_key;
  }
  in_flight_.erase(trace_key);
  if (rerun_.erase(trace_key)) {
    spawn_enricher(std::move(trace_key));
  }
}

void TraceEnricherScheduler::flush_statistics() {
  auto stats = g_statistics.generate_report_and_reset();
  if (config_.stats_path.empty()) {
    LOG(DEBUG) << "Statistics:\n" << stats;
    return;
  }
  auto status = td::atomic_write_file(config_.stats_path, std::move(stats));
  if (status.is_error()) {
    LOG(ERROR) << "Failed to write statistics to " << config_.stats_path << ": " << status.error();
  }
}

void TraceEnricherScheduler::alarm() {
  if (next_statistics_flush_.is_in_past()) {
    flush_statistics();
    next_statistics_flush_ = td::Timestamp::in(60.0);
  }
  alarm_timestamp() = next_statistics_flush_;
}
