#ifndef SNOWFLAKE_H
#define SNOWFLAKE_H

#include <cstdint>
#include <memory>
#include <mutex>

#include "../id_generator.h"
#include "clock.h"
#include "snowflake_config.h"

/**
 * Snowflake ID generator.
 *
 * Produces 64-bit IDs laid out as
 *   [1 bit unused] - [41 bits time] - [10 bits node] - [12 bits seq]
 * where time counts milliseconds since the configured epoch.
 *
 * IDs from one instance are unique and non-decreasing. All state lives in the
 * instance and every call to next_id() runs as a single critical section, so
 * one generator may be shared between threads.
 *
 * Errors are thrown as SnowflakeError subclasses (see snowflake_error.h).
 */
class Snowflake : public IdGenerator {
 private:
  int64_t epoch;
  uint64_t node_id;
  std::shared_ptr<Clock> clock;

  std::mutex mtx;  // Protects last_timestamp and sequence
  int64_t last_timestamp;
  uint64_t sequence;

  int64_t elapsed_millis(int64_t unix_ms) const;
  void wait_until_elapsed(int64_t target, int64_t last_ts);

 public:
  static const int64_t ELAPSED_FLOOR = -(static_cast<int64_t>(1) << 62);
  static const int64_t ELAPSED_CEILING = static_cast<int64_t>(1) << 62;

  // Uses a SystemClock configured with config.wait_strategy.
  explicit Snowflake(const SnowflakeConfig& config);
  Snowflake(const SnowflakeConfig& config, std::shared_ptr<Clock> time_source);

  /**
   * Generates the next ID.
   * Throws ClockRolledBackError if the clock is behind the last used
   * timestamp (also while waiting out an exhausted millisecond), and
   * TimeRangeExceededError once the epoch's 41-bit range is used up. Neither
   * error changes the generator state.
   */
  uint64_t next_id() override;

  uint64_t machine_id() const { return node_id; }
  int64_t epoch_ms() const { return epoch; }
};

#endif  // SNOWFLAKE_H
