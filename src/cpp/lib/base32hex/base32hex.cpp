#include "base32hex.h"

#include "../randflake-error/randflake_error.h"

using namespace std;

namespace {

const char kBase32HexChars[] = "0123456789abcdefghijklmnopqrstuv";

// 64 bits need at most 13 base32 digits
const int kMaxEncodedLength = 13;

}  // namespace

string base32hex_encode(uint64_t num) {
  if (num == 0) {
    return "0";
  }

  char encoded[kMaxEncodedLength];
  int idx = kMaxEncodedLength;
  while (num > 0) {
    encoded[--idx] = kBase32HexChars[num & 0x1f];
    num >>= 5;
  }

  return string(encoded + idx, encoded + kMaxEncodedLength);
}

uint64_t base32hex_decode(const string& s) {
  uint64_t num = 0;
  for (char c : s) {
    if (c == '=') {
      break;
    }

    uint64_t digit;
    if (c >= '0' && c <= '9') {
      digit = static_cast<uint64_t>(c - '0');
    } else if (c >= 'a' && c <= 'v') {
      digit = static_cast<uint64_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'V') {
      digit = static_cast<uint64_t>(c - 'A' + 10);
    } else {
      throw RandflakeError(RandflakeErrc::kInvalidId);
    }
    num = (num << 5) + digit;
  }
  return num;
}

string encode_id_string(int64_t id) {
  return base32hex_encode(static_cast<uint64_t>(id));
}

int64_t decode_id_string(const string& s) {
  return static_cast<int64_t>(base32hex_decode(s));
}
