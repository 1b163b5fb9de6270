#ifndef SNOWFLAKE_ID_H
#define SNOWFLAKE_ID_H

#include <cstdint>

/**
 * Unpacked view of a 64-bit Snowflake ID.
 * Layout: [1 bit unused] - [41 bits time] - [10 bits node] - [12 bits seq]
 */
struct SnowflakeId {
  int64_t timestamp;  // ms since the generator's epoch
  uint64_t machine_id;
  uint64_t sequence;

  // Throws std::invalid_argument if the unused top bit is set.
  static SnowflakeId parse(uint64_t id);

  uint64_t pack() const;

  // Absolute Unix time in ms, given the epoch the ID was generated against
  int64_t unix_millis(int64_t epoch_ms) const { return epoch_ms + timestamp; }
};

#endif  // SNOWFLAKE_ID_H
