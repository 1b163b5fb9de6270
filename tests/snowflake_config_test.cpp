#include "lib/snowflake/snowflake_config.h"

#include <gtest/gtest.h>
#include <stdlib.h>

#include "lib/snowflake/snowflake.h"
#include "lib/snowflake/snowflake_error.h"

namespace {

class SnowflakeConfigEnvTest : public ::testing::Test {
 protected:
  void SetUp() override { clear(); }
  void TearDown() override { clear(); }

  static void clear() {
    unsetenv("SNOWFLAKE_MACHINE_ID");
    unsetenv("SNOWFLAKE_EPOCH_MS");
    unsetenv("SNOWFLAKE_WAIT_STRATEGY");
  }
};

TEST_F(SnowflakeConfigEnvTest, DefaultsWhenOnlyMachineIdIsSet) {
  setenv("SNOWFLAKE_MACHINE_ID", "12", 1);

  SnowflakeConfig config = load_config_from_env();
  EXPECT_EQ(config.machine_id, 12);
  EXPECT_EQ(config.epoch_ms, EPOCH);
  EXPECT_EQ(config.wait_strategy, WaitStrategy::kSpin);
}

TEST_F(SnowflakeConfigEnvTest, ReadsAllVariables) {
  setenv("SNOWFLAKE_MACHINE_ID", "1023", 1);
  setenv("SNOWFLAKE_EPOCH_MS", "1609459200000", 1);
  setenv("SNOWFLAKE_WAIT_STRATEGY", "sleep", 1);

  SnowflakeConfig config = load_config_from_env();
  EXPECT_EQ(config.machine_id, 1023);
  EXPECT_EQ(config.epoch_ms, 1609459200000LL);
  EXPECT_EQ(config.wait_strategy, WaitStrategy::kSleep);
}

TEST_F(SnowflakeConfigEnvTest, MissingMachineIdFails) {
  EXPECT_THROW(load_config_from_env(), InvalidConfigError);
}

TEST_F(SnowflakeConfigEnvTest, MalformedNumbersFail) {
  setenv("SNOWFLAKE_MACHINE_ID", "node-7", 1);
  EXPECT_THROW(load_config_from_env(), InvalidConfigError);

  setenv("SNOWFLAKE_MACHINE_ID", "7x", 1);
  EXPECT_THROW(load_config_from_env(), InvalidConfigError);

  setenv("SNOWFLAKE_MACHINE_ID", "7", 1);
  setenv("SNOWFLAKE_EPOCH_MS", "99999999999999999999999", 1);
  EXPECT_THROW(load_config_from_env(), InvalidConfigError);
}

TEST_F(SnowflakeConfigEnvTest, UnknownWaitStrategyFails) {
  setenv("SNOWFLAKE_MACHINE_ID", "7", 1);
  setenv("SNOWFLAKE_WAIT_STRATEGY", "yield", 1);
  EXPECT_THROW(load_config_from_env(), InvalidConfigError);
}

TEST_F(SnowflakeConfigEnvTest, OutOfRangeMachineIdIsLeftToTheGenerator) {
  setenv("SNOWFLAKE_MACHINE_ID", "4096", 1);
  EXPECT_EQ(load_config_from_env().machine_id, 4096);
}

TEST_F(SnowflakeConfigEnvTest, MinimumEpochIsRejectedByTheGenerator) {
  setenv("SNOWFLAKE_MACHINE_ID", "7", 1);
  setenv("SNOWFLAKE_EPOCH_MS", "-9223372036854775808", 1);

  SnowflakeConfig config = load_config_from_env();
  EXPECT_THROW(Snowflake generator(config), InvalidConfigError);
}

TEST(WaitStrategyTest, NamesRoundTrip) {
  EXPECT_EQ(parse_wait_strategy("spin"), WaitStrategy::kSpin);
  EXPECT_EQ(parse_wait_strategy("sleep"), WaitStrategy::kSleep);
  EXPECT_EQ(wait_strategy_name(WaitStrategy::kSpin), "spin");
  EXPECT_EQ(wait_strategy_name(WaitStrategy::kSleep), "sleep");
  EXPECT_THROW(parse_wait_strategy("Spin"), InvalidConfigError);
}

}  // namespace
