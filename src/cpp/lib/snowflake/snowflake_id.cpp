#include "snowflake_id.h"

#include <stdexcept>
#include <string>

#include "../id_generator.h"

using namespace std;

SnowflakeId SnowflakeId::parse(uint64_t id) {
  if (id >> 63) {
    throw invalid_argument("Not a Snowflake id (sign bit set): " +
                           to_string(id));
  }

  SnowflakeId parsed;
  parsed.timestamp = static_cast<int64_t>(id >> TIMESTAMP_SHIFT);
  parsed.machine_id = (id >> NODE_ID_SHIFT) & MAX_NODE_ID;
  parsed.sequence = id & MAX_SEQUENCE;
  return parsed;
}

uint64_t SnowflakeId::pack() const {
  return (static_cast<uint64_t>(timestamp) << TIMESTAMP_SHIFT) |
         ((machine_id & MAX_NODE_ID) << NODE_ID_SHIFT) |
         (sequence & MAX_SEQUENCE);
}
