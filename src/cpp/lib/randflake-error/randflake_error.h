#ifndef RANDFLAKE_ERROR_H
#define RANDFLAKE_ERROR_H

#include <stdexcept>
#include <string>

enum class RandflakeErrc {
  kRandflakeDead,
  kInvalidSecret,
  kInvalidLease,
  kInvalidNode,
  kResourceExhausted,
  kConsistencyViolation,
  kInvalidId,
};

// Returns the fixed message text for an error code.
const char* randflake_error_message(RandflakeErrc code);

/**
 * Thrown by every Randflake operation that refuses a request.
 *
 * kResourceExhausted is transient (route the request to another generator),
 * kConsistencyViolation is fatal for the generator that raised it. All other
 * codes describe bad input.
 */
class RandflakeError : public std::runtime_error {
 private:
  RandflakeErrc error_code;

 public:
  explicit RandflakeError(RandflakeErrc code)
      : std::runtime_error(randflake_error_message(code)), error_code(code) {}

  RandflakeErrc code() const noexcept { return error_code; }
};

#endif  // RANDFLAKE_ERROR_H
