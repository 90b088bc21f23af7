#pragma once
#include <memory>
#include <unordered_set>
#include "td/actor/actor.h"
#include "Config.h"
#include "InformationSource.h"
#include "RedisListener.h"
#include "TraceEnricher.h"

class TraceEnricherScheduler : public td::actor::Actor {
  private:
    Config config_;
    std::shared_ptr<sw::redis::Redis> redis_;
    std::shared_ptr<InformationSource> source_;
    std::shared_ptr<const AccountSet> accounts_;

    // keys being enriched now; a key notified again meanwhile is enriched once more afterwards
    std::unordered_set<std::string> in_flight_;
    std::unordered_set<std::string> rerun_;

    td::Timestamp next_statistics_flush_;
    td::actor::ActorOwn<ChannelListener> channel_listener_;

    void on_new_trace(std::string trace_key);
    void spawn_enricher(std::string trace_key);
    void trace_done(std::string trace_key, td::Result<td::Unit> result);
    void flush_statistics();

  public:
    TraceEnricherScheduler(Config config, std::shared_ptr<sw::redis::Redis> redis, std::shared_ptr<InformationSource> source)
        : config_(std::move(config)), redis_(std::move(redis)), source_(std::move(source)),
          accounts_(std::make_shared<const AccountSet>(config_.accounts.begin(), config_.accounts.end())) {}

    void start_up() override;
    void alarm() override;
};
