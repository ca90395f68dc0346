#ifndef ID_GENERATOR_H
#define ID_GENERATOR_H

#include <cstdint>
#include <string>

// ---------------------------------------------------------
// Shared Parameters for Randflake 64-bit IDs
// ---------------------------------------------------------
const int64_t RANDFLAKE_EPOCH_OFFSET = 1730000000LL;  // Oct 27, 2024 (seconds)
const int64_t RANDFLAKE_TIMESTAMP_BITS = 30;  // lifetime of 34 years
const int64_t RANDFLAKE_NODE_BITS = 17;
const int64_t RANDFLAKE_SEQUENCE_BITS = 17;

// Max values for bitwise operations
const int64_t RANDFLAKE_MAX_TIMESTAMP =
    RANDFLAKE_EPOCH_OFFSET +
    (static_cast<int64_t>(1) << RANDFLAKE_TIMESTAMP_BITS) - 1;
const int64_t RANDFLAKE_MAX_NODE =
    (static_cast<int64_t>(1) << RANDFLAKE_NODE_BITS) - 1;
const int64_t RANDFLAKE_MAX_SEQUENCE =
    (static_cast<int64_t>(1) << RANDFLAKE_SEQUENCE_BITS) - 1;

// Bit shifts for packing the 64-bit raw value
const int64_t NODE_ID_SHIFT = RANDFLAKE_SEQUENCE_BITS;
const int64_t TIMESTAMP_SHIFT = RANDFLAKE_SEQUENCE_BITS + RANDFLAKE_NODE_BITS;

/**
 * Base interface for all ID generators.
 */
class IdGenerator {
 public:
  virtual ~IdGenerator() = default;

  // Returns the ID as a raw 64-bit pattern
  virtual uint64_t next_id() = 0;

  // Returns the ID as a formatted string (used for IPC)
  virtual std::string next_id_string() { return std::to_string(next_id()); }
};

#endif  // ID_GENERATOR_H
