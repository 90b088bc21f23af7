#pragma once
#include <functional>
#include <optional>
#include <string>
#include <sw/redis++/redis++.h>
#include "td/actor/actor.h"

// Subscribes to a channel and hands every published trace key to the callback.
// The callback is invoked from this actor.
class ChannelListener : public td::actor::Actor {
public:
  ChannelListener(std::string redis_dsn, std::string channel_name, std::function<void(std::string)> on_new_trace)
    : redis_dsn_(std::move(redis_dsn)), channel_name_(std::move(channel_name)), on_new_trace_(std::move(on_new_trace)) {}

  void start_up() override;
  void alarm() override;

private:
  void setup_subscriber();

  std::string redis_dsn_;
  std::string channel_name_;
  std::function<void(std::string)> on_new_trace_;

  std::optional<sw::redis::Subscriber> subscriber_;
};
