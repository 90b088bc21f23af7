#include "RedisListener.h"
#include "td/utils/logging.h"
#include "td/utils/misc.h"

void ChannelListener::setup_subscriber() {
  sw::redis::ConnectionOptions connection_options = sw::redis::Uri(redis_dsn_).connection_options();
  connection_options.socket_timeout = std::chrono::milliseconds(100);
  auto redis = sw::redis::Redis(connection_options);
  subscriber_ = redis.subscriber();
  subscriber_->on_message([this](std::string channel, std::string value) {
    auto trace_key = td::trim(value);
    if (trace_key.empty()) {
      LOG(WARNING) << "Empty trace key in channel " << channel;
      return;
    }
    on_new_trace_(std::move(trace_key));
  });
  subscriber_->subscribe(channel_name_);
  LOG(INFO) << "Subscribed to " << channel_name_;
}

void ChannelListener::start_up() {
  try {
    setup_subscriber();
  } catch (const std::exception &e) {
    LOG(ERROR) << "Failed to subscribe to " << channel_name_ << ": " << e.what();
    subscriber_.reset();
  }
  alarm_timestamp() = td::Timestamp::now();
}

void ChannelListener::alarm() {
  if (!subscriber_) {
    try {
      setup_subscriber();
    } catch (const std::exception &e) {
      LOG(ERROR) << "Failed to subscribe to " << channel_name_ << ": " << e.what();
      subscriber_.reset();
      alarm_timestamp() = td::Timestamp::in(1.0);
      return;
    }
  }
  while (true) {
    try {
      subscriber_->consume();
    } catch (const sw::redis::TimeoutError &e) {
      break;
    } catch (const sw::redis::ReplyError &e) {
      LOG(ERROR) << "Redis error: " << e.what();
      break;
    } catch (const std::exception &e) {
      LOG(ERROR) << "Redis error: " << e.what();
      LOG(ERROR) << "Reconnecting to Redis...";
      subscriber_.reset();
      break;
    }
  }
  alarm_timestamp() = td::Timestamp::now();
}
