#ifndef SNOWFLAKE_ERROR_H
#define SNOWFLAKE_ERROR_H

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * Base class for every error raised by the Snowflake generator.
 */
class SnowflakeError : public std::runtime_error {
 public:
  explicit SnowflakeError(const std::string& what) : std::runtime_error(what) {}
};

// Bad machine id, future epoch or malformed environment settings.
class InvalidConfigError : public SnowflakeError {
 public:
  explicit InvalidConfigError(const std::string& what)
      : SnowflakeError("Invalid Snowflake config: " + what) {}
};

/**
 * The clock returned a reading lower than one already used for an ID.
 * The generator refuses to produce an ID until the clock catches up.
 */
class ClockRolledBackError : public SnowflakeError {
 private:
  int64_t drift;

 public:
  explicit ClockRolledBackError(int64_t drift_ms);

  // How many milliseconds the clock is behind the last used timestamp
  int64_t drift_ms() const { return drift; }
};

// Elapsed time since the epoch no longer fits in the 41-bit timestamp field.
class TimeRangeExceededError : public SnowflakeError {
 private:
  int64_t elapsed;

 public:
  explicit TimeRangeExceededError(int64_t elapsed_ms);

  int64_t elapsed_ms() const { return elapsed; }
};

#endif  // SNOWFLAKE_ERROR_H
