#ifndef SNOWFLAKE_CONFIG_H
#define SNOWFLAKE_CONFIG_H

#include <cstdint>
#include <string>

#include "../id_generator.h"
#include "clock.h"

struct SnowflakeConfig {
  int64_t epoch_ms;
  int64_t machine_id;
  WaitStrategy wait_strategy;
  SnowflakeConfig()
      : epoch_ms(EPOCH), machine_id(0), wait_strategy(WaitStrategy::kSpin) {}
};

/**
 * Builds a SnowflakeConfig from the process environment.
 *
 *   SNOWFLAKE_MACHINE_ID     required, 0-1023
 *   SNOWFLAKE_EPOCH_MS       optional, Unix ms (defaults to EPOCH)
 *   SNOWFLAKE_WAIT_STRATEGY  optional, "spin" (default) or "sleep"
 *
 * Throws InvalidConfigError when a variable is missing or malformed. The
 * machine id range is checked by the Snowflake constructor.
 */
SnowflakeConfig load_config_from_env();

WaitStrategy parse_wait_strategy(const std::string& name);
std::string wait_strategy_name(WaitStrategy strategy);

#endif  // SNOWFLAKE_CONFIG_H
