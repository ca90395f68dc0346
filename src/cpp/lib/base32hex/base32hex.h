#ifndef BASE32HEX_H
#define BASE32HEX_H

#include <cstdint>
#include <string>

// Canonical text form of an ID: base32hex digits, most significant first,
// lower case, no padding and no leading zero digits ("0" for zero).
std::string base32hex_encode(uint64_t num);

// Case-insensitive inverse of base32hex_encode. Decoding stops at the first
// '=' so padded input is accepted. Any other character outside the
// alphabet throws RandflakeError(kInvalidId).
uint64_t base32hex_decode(const std::string& s);

// Signed views used by callers that store IDs as int64.
std::string encode_id_string(int64_t id);
int64_t decode_id_string(const std::string& s);

#endif  // BASE32HEX_H
