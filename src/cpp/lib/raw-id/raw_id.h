#ifndef RAW_ID_H
#define RAW_ID_H

#include <cstdint>

#include "../id_generator.h"

/**
 * The pre-encryption 64-bit value of an ID.
 *
 * Layout: [30 bits time offset] - [17 bits node] - [17 bits seq]
 * The time offset is seconds since RANDFLAKE_EPOCH_OFFSET. The fields fill
 * all 64 bits, so a raw value with the top bit set reads as negative.
 */
struct RawId {
  int64_t timestamp_offset;
  int64_t node_id;
  int64_t sequence;
};

// Fields must already be within their bit widths; nothing is masked here.
uint64_t pack_raw_id(int64_t timestamp_offset, int64_t node_id,
                     int64_t sequence);

RawId unpack_raw_id(uint64_t raw);

#endif  // RAW_ID_H
