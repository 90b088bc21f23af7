#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "td/utils/logging.h"
#include "td/utils/Status.h"
#include "crypto/block/block.h"

constexpr const char* DEFAULT_ACCOUNT = "0:0e41dc1dc3c9067ed24248580e12b3359818d83dee0304fabcf80845eafafdb2";

struct Config {
  std::string redis_dsn = "tcp://127.0.0.1:6379";
  std::string input_channel = "new_trace";
  std::string output_channel = "enriched_trace";
  td::uint32 threads = 7;
  double query_timeout = 5.0;
  int verbosity = verbosity_INFO;
  std::vector<block::StdAddress> accounts;
  std::string accounts_file = "accounts.txt";
  bool is_testnet = false;
  std::string stats_path;
};

using EnvGetter = std::function<std::optional<std::string>(td::Slice)>;

std::optional<std::string> get_env(td::Slice name);

// Defaults overridden by environment variables
td::Result<Config> load_config(const EnvGetter& env = get_env);

td::Result<int> parse_log_level(td::Slice level);
td::Result<td::uint32> parse_threads(td::Slice value);
td::Result<double> parse_query_timeout(td::Slice value);
td::Result<bool> parse_bool(td::Slice value);

// One address per line. Anything after a comma is ignored, invalid lines are skipped.
std::vector<block::StdAddress> parse_accounts(td::Slice content);

// Replaces config.accounts with the content of config.accounts_file if it can be read.
void load_accounts(Config& config);
