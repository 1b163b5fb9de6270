#include "snowflake.h"

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

#include "snowflake_error.h"
#include "snowflake_id.h"

using namespace std;

const int64_t Snowflake::ELAPSED_FLOOR;
const int64_t Snowflake::ELAPSED_CEILING;

Snowflake::Snowflake(const SnowflakeConfig& config)
    : Snowflake(config, make_shared<SystemClock>(config.wait_strategy)) {}

Snowflake::Snowflake(const SnowflakeConfig& config,
                     shared_ptr<Clock> time_source)
    : epoch(config.epoch_ms),
      node_id(0),
      clock(std::move(time_source)),
      last_timestamp(-1),
      sequence(MAX_SEQUENCE) {
  if (!clock) {
    throw InvalidConfigError("clock must not be null");
  }
  if (config.machine_id < 0 ||
      config.machine_id > static_cast<int64_t>(MAX_NODE_ID)) {
    throw InvalidConfigError("machine id " + to_string(config.machine_id) +
                             " is outside [0, " + to_string(MAX_NODE_ID) +
                             "]");
  }
  node_id = static_cast<uint64_t>(config.machine_id);

  int64_t now = clock->now_millis();
  if (epoch > now) {
    throw InvalidConfigError("epoch " + to_string(epoch) +
                             " ms is in the future (now " + to_string(now) +
                             " ms)");
  }
  if (elapsed_millis(now) > MAX_TIMESTAMP) {
    throw InvalidConfigError("epoch " + to_string(epoch) +
                             " ms is more than " + to_string(MAX_TIMESTAMP) +
                             " ms in the past (now " + to_string(now) +
                             " ms)");
  }
}

/**
 * Milliseconds between the epoch and the given Unix time, clamped to
 * [ELAPSED_FLOOR, ELAPSED_CEILING]. Both bounds lie far outside the 41-bit
 * range, so a clamped value always fails the range or rollback checks.
 */
int64_t Snowflake::elapsed_millis(int64_t unix_ms) const {
  if (epoch < 0 && unix_ms > numeric_limits<int64_t>::max() + epoch) {
    return ELAPSED_CEILING;
  }
  if (epoch > 0 && unix_ms < numeric_limits<int64_t>::min() + epoch) {
    return ELAPSED_FLOOR;
  }
  return max(ELAPSED_FLOOR, min(ELAPSED_CEILING, unix_ms - epoch));
}

/**
 * Waits until the clock reaches the given elapsed timestamp. How the wait
 * behaves (spin or sleep) is up to the clock's relax().
 * Throws ClockRolledBackError if the clock drops below last_ts while waiting.
 */
void Snowflake::wait_until_elapsed(int64_t target, int64_t last_ts) {
  int64_t timestamp = elapsed_millis(clock->now_millis());
  while (timestamp < target) {
    if (timestamp < last_ts) {
      throw ClockRolledBackError(last_ts - timestamp);
    }
    clock->relax();
    timestamp = elapsed_millis(clock->now_millis());
  }
}

uint64_t Snowflake::next_id() {
  lock_guard<mutex> lock(mtx);

  int64_t now = elapsed_millis(clock->now_millis());

  // Handle clock moving backwards (fail-fast). Before the first ID the
  // reference point is the epoch itself.
  int64_t reference = last_timestamp < 0 ? 0 : last_timestamp;
  if (now < reference) {
    throw ClockRolledBackError(reference - now);
  }

  // Work on copies so a failed call leaves the state untouched
  int64_t timestamp = last_timestamp;
  uint64_t seq = sequence;

  if (now > timestamp) {
    // Reset sequence for a new millisecond
    timestamp = now;
    seq = 0;
  } else {
    // Same millisecond: increment sequence. On overflow (> 4095) the
    // millisecond is used up and the ID moves to the next one.
    seq = (seq + 1) & MAX_SEQUENCE;
    if (seq == 0) {
      ++timestamp;
    }
  }

  if (timestamp > MAX_TIMESTAMP) {
    throw TimeRangeExceededError(timestamp);
  }

  if (timestamp > now) {
    wait_until_elapsed(timestamp, now);
  }

  last_timestamp = timestamp;
  sequence = seq;

  SnowflakeId id;
  id.timestamp = timestamp;
  id.machine_id = node_id;
  id.sequence = seq;
  return id.pack();
}
