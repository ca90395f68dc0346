#include "raw_id.h"

uint64_t pack_raw_id(int64_t timestamp_offset, int64_t node_id,
                     int64_t sequence) {
  return (static_cast<uint64_t>(timestamp_offset) << TIMESTAMP_SHIFT) |
         (static_cast<uint64_t>(node_id) << NODE_ID_SHIFT) |
         static_cast<uint64_t>(sequence);
}

RawId unpack_raw_id(uint64_t raw) {
  RawId fields;
  fields.timestamp_offset = static_cast<int64_t>(raw >> TIMESTAMP_SHIFT);
  fields.node_id =
      static_cast<int64_t>(raw >> NODE_ID_SHIFT) & RANDFLAKE_MAX_NODE;
  fields.sequence = static_cast<int64_t>(raw) & RANDFLAKE_MAX_SEQUENCE;
  return fields;
}
