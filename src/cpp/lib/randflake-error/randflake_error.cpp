#include "randflake_error.h"

const char* randflake_error_message(RandflakeErrc code) {
  switch (code) {
    case RandflakeErrc::kRandflakeDead:
      return "randflake: the randflake id is dead after 34 years of lifetime";
    case RandflakeErrc::kInvalidSecret:
      return "randflake: invalid secret, secret must be 16 bytes long";
    case RandflakeErrc::kInvalidLease:
      return "randflake: invalid lease, lease expired or not started yet";
    case RandflakeErrc::kInvalidNode:
      return "randflake: invalid node id, node id must be between 0 and "
             "131071";
    case RandflakeErrc::kResourceExhausted:
      return "randflake: resource exhausted (generator can't handle current "
             "throughput, try using multiple randflake instances)";
    case RandflakeErrc::kConsistencyViolation:
      return "randflake: timestamp consistency violation, the current time "
             "is less than the last time";
    case RandflakeErrc::kInvalidId:
      return "randflake: invalid id";
  }
  return "randflake: unknown error";
}
