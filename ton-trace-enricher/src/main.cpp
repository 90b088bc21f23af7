#include <iostream>
#include "td/utils/port/signals.h"
#include "td/utils/OptionParser.h"
#include "td/utils/format.h"
#include "td/utils/logging.h"
#include "td/utils/check.h"

#include "Config.h"
#include "RedisInformationSource.h"
#include "TraceEnricherScheduler.h"


int main(int argc, char *argv[]) {
  SET_VERBOSITY_LEVEL(verbosity_INFO);
  td::set_default_failure_signal_handler().ensure();

  auto config_r = load_config();
  if (config_r.is_error()) {
    LOG(ERROR) << "failed to load config from environment: " << config_r.move_as_error();
    std::_Exit(2);
  }
  auto config = config_r.move_as_ok();

  td::OptionParser p;
  p.set_description("Attach jetton and NFT sale info to TON traces");
  p.add_option('\0', "help", "prints_help", [&]() {
    char b[10240];
    td::StringBuilder sb(td::MutableSlice{b, 10000});
    sb << p;
    std::cout << sb.as_cslice().c_str();
    std::exit(2);
  });
  p.add_option('\0', "redis", "Redis URI (default: 'tcp://127.0.0.1:6379')", [&](td::Slice fname) {
    config.redis_dsn = fname.str();
  });
  p.add_option('\0', "input-channel", "Redis channel with new trace keys (default: 'new_trace')", [&](td::Slice fname) {
    config.input_channel = fname.str();
  });
  p.add_option('\0', "output-channel", "Redis channel for enriched trace keys (default: 'enriched_trace')", [&](td::Slice fname) {
    config.output_channel = fname.str();
  });
  p.add_checked_option('t', "threads", "Scheduler threads (default: 7)", [&](td::Slice fname) {
    TRY_RESULT_ASSIGN(config.threads, parse_threads(fname));
    return td::Status::OK();
  });
  p.add_checked_option('\0', "query-timeout", "Timeout of enrichment queries in seconds (default: 5)", [&](td::Slice fname) {
    TRY_RESULT_ASSIGN(config.query_timeout, parse_query_timeout(fname));
    return td::Status::OK();
  });
  p.add_checked_option('v', "verbosity", "Log level: DEBUG, INFO, WARNING, ERROR (default: INFO)", [&](td::Slice fname) {
    TRY_RESULT_ASSIGN(config.verbosity, parse_log_level(fname));
    return td::Status::OK();
  });
  p.add_option('\0', "accounts-file", "File with accounts that get own notification channels (default: 'accounts.txt')", [&](td::Slice fname) {
    config.accounts_file = fname.str();
  });
  p.add_option('\0', "testnet", "Work with testnet", [&]() {
    config.is_testnet = true;
  });
  p.add_option('\0', "stats-path", "Path of statistics report, written every minute", [&](td::Slice fname) {
    config.stats_path = fname.str();
  });

  auto S = p.run(argc, argv);
  if (S.is_error()) {
    LOG(ERROR) << "failed to parse options: " << S.move_as_error();
    std::_Exit(2);
  }
  SET_VERBOSITY_LEVEL(config.verbosity);

  if (config.input_channel.empty() || config.output_channel.empty()) {
    std::cerr << "input and output channels must not be empty" << std::endl;
    std::_Exit(2);
  }
  load_accounts(config);
  LOG(INFO) << "Starting enricher on " << (config.is_testnet ? "testnet" : "mainnet") << " with " << config.threads
            << " threads, query timeout " << config.query_timeout << "s";

  std::shared_ptr<sw::redis::Redis> redis;
  try {
    redis = std::make_shared<sw::redis::Redis>(query_connection_options(config.redis_dsn, config.query_timeout));
  } catch (const std::exception &e) {
    LOG(ERROR) << "failed to connect to Redis " << config.redis_dsn << ": " << e.what();
    std::_Exit(2);
  }
  auto source = std::make_shared<RedisInformationSource>(redis);

  td::actor::Scheduler scheduler({config.threads});
  scheduler.run_in_context([&] {
    td::actor::create_actor<TraceEnricherScheduler>("TraceEnricherScheduler", config, redis, source).release();
  });

  scheduler.run();

  return 0;
}
