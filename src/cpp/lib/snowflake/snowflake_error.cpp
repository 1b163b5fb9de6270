#include "snowflake_error.h"

#include "../id_generator.h"

using namespace std;

ClockRolledBackError::ClockRolledBackError(int64_t drift_ms)
    : SnowflakeError("Clock moved backwards by " + to_string(drift_ms) +
                     " ms. Refusing to generate id."),
      drift(drift_ms) {}

TimeRangeExceededError::TimeRangeExceededError(int64_t elapsed_ms)
    : SnowflakeError("Timestamp " + to_string(elapsed_ms) +
                     " ms since epoch exceeds the 41-bit limit of " +
                     to_string(MAX_TIMESTAMP) + " ms"),
      elapsed(elapsed_ms) {}
