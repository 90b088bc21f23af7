#include <cstdlib>
#include "Config.h"
#include "AccountAddress.h"
#include "td/utils/filesystem.h"
#include "td/utils/misc.h"


std::optional<std::string> get_env(td::Slice name) {
  const char* value = std::getenv(name.str().c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

td::Result<int> parse_log_level(td::Slice level) {
  auto name = td::to_upper(td::trim(level));
  if (name == "DEBUG") {
    return verbosity_DEBUG;
  }
  if (name == "INFO") {
    return verbosity_INFO;
  }
  if (name == "WARNING" || name == "WARN") {
    return verbosity_WARNING;
  }
  if (name == "ERROR") {
    return verbosity_ERROR;
  }
  return td::Status::Error(PSLICE() << "unknown log level '" << level << "'");
}

td::Result<td::uint32> parse_threads(td::Slice value) {
  int v;
  try {
    v = std::stoi(td::trim(value).str());
  } catch (const std::exception&) {
    return td::Status::Error(PSLICE() << "bad value for threads: '" << value << "' is not a number");
  }
  if (v <= 0) {
    return td::Status::Error(PSLICE() << "bad value for threads: " << v);
  }
  return static_cast<td::uint32>(v);
}

td::Result<double> parse_query_timeout(td::Slice value) {
  double v;
  try {
    v = std::stod(td::trim(value).str());
  } catch (const std::exception&) {
    return td::Status::Error(PSLICE() << "bad value for query timeout: '" << value << "' is not a number");
  }
  if (!(v > 0)) {
    return td::Status::Error(PSLICE() << "bad value for query timeout: " << v);
  }
  return v;
}

td::Result<bool> parse_bool(td::Slice value) {
  auto v = td::to_lower(td::trim(value));
  if (v == "1" || v == "true" || v == "yes") {
    return true;
  }
  if (v.empty() || v == "0" || v == "false" || v == "no") {
    return false;
  }
  return td::Status::Error(PSLICE() << "bad boolean value '" << value << "'");
}

td::Result<Config> load_config(const EnvGetter& env) {
  Config config;
  if (auto v = env("REDIS_DSN")) {
    config.redis_dsn = v.value();
  }
  if (auto v = env("TRACE_CHANNEL")) {
    config.input_channel = v.value();
  }
  if (auto v = env("ENRICHED_CHANNEL")) {
    config.output_channel = v.value();
  }
  if (auto v = env("THREADS")) {
    TRY_RESULT_ASSIGN(config.threads, parse_threads(v.value()));
  }
  if (auto v = env("QUERY_TIMEOUT")) {
    TRY_RESULT_ASSIGN(config.query_timeout, parse_query_timeout(v.value()));
  }
  if (auto v = env("LOG_LEVEL")) {
    TRY_RESULT_ASSIGN(config.verbosity, parse_log_level(v.value()));
  }
  auto accounts = env("ACCOUNTS").value_or(DEFAULT_ACCOUNT);
  auto accounts_r = convert::to_std_address_list(accounts);
  if (accounts_r.is_error()) {
    return accounts_r.move_as_error_prefix("bad ACCOUNTS: ");
  }
  config.accounts = accounts_r.move_as_ok();
  if (auto v = env("ACCOUNTS_FILE")) {
    config.accounts_file = v.value();
  }
  if (auto v = env("IS_TESTNET")) {
    TRY_RESULT_ASSIGN(config.is_testnet, parse_bool(v.value()));
  }
  if (auto v = env("STATS_PATH")) {
    config.stats_path = v.value();
  }
  return config;
}

std::vector<block::StdAddress> parse_accounts(td::Slice content) {
  std::vector<block::StdAddress> res;
  for (auto raw_line : td::full_split(content, '\n')) {
    auto line = td::trim(td::split(raw_line, ',').first);
    if (line.empty()) {
      continue;
    }
    auto address = convert::to_std_address(line);
    if (address.is_error()) {
      LOG(WARNING) << "Skipping account '" << line << "': " << address.move_as_error();
      continue;
    }
    res.push_back(address.move_as_ok());
  }
  return res;
}

void load_accounts(Config& config) {
  if (!config.accounts_file.empty()) {
    auto content = td::read_file_str(config.accounts_file);
    if (content.is_error()) {
      LOG(WARNING) << "Failed to read accounts from " << config.accounts_file << ": " << content.move_as_error()
                   << ", using " << config.accounts.size() << " accounts from environment";
    } else {
      config.accounts = parse_accounts(content.ok());
      LOG(INFO) << "Loaded " << config.accounts.size() << " accounts from " << config.accounts_file;
    }
  }
}
