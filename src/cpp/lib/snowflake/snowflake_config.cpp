#include "snowflake_config.h"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "snowflake_error.h"

using namespace std;

// Parses a whole decimal integer; trailing garbage is an error.
static int64_t parse_int_env(const char* name, const string& value) {
  size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = stoll(value, &consumed);
  } catch (const logic_error&) {
    throw InvalidConfigError(string(name) + "='" + value +
                             "' is not a valid integer");
  }
  if (consumed != value.size()) {
    throw InvalidConfigError(string(name) + "='" + value +
                             "' is not a valid integer");
  }
  return parsed;
}

WaitStrategy parse_wait_strategy(const string& name) {
  if (name == "spin") {
    return WaitStrategy::kSpin;
  } else if (name == "sleep") {
    return WaitStrategy::kSleep;
  }
  throw InvalidConfigError("unknown wait strategy '" + name +
                           "' (expected 'spin' or 'sleep')");
}

string wait_strategy_name(WaitStrategy strategy) {
  return strategy == WaitStrategy::kSleep ? "sleep" : "spin";
}

SnowflakeConfig load_config_from_env() {
  SnowflakeConfig config;

  const char* machine_id_env = getenv("SNOWFLAKE_MACHINE_ID");
  if (machine_id_env == nullptr) {
    throw InvalidConfigError("SNOWFLAKE_MACHINE_ID is not set");
  }
  config.machine_id = parse_int_env("SNOWFLAKE_MACHINE_ID", machine_id_env);

  const char* epoch_env = getenv("SNOWFLAKE_EPOCH_MS");
  if (epoch_env != nullptr) {
    config.epoch_ms = parse_int_env("SNOWFLAKE_EPOCH_MS", epoch_env);
  }

  const char* strategy_env = getenv("SNOWFLAKE_WAIT_STRATEGY");
  if (strategy_env != nullptr) {
    config.wait_strategy = parse_wait_strategy(strategy_env);
  }

  cout << "Loaded Snowflake config: machine id " << config.machine_id
       << ", epoch " << config.epoch_ms << " ms, wait strategy "
       << wait_strategy_name(config.wait_strategy) << endl;

  return config;
}
