#include "randflake.h"

#include <chrono>
#include <iostream>
#include <utility>

#include "../base32hex/base32hex.h"
#include "../randflake-error/randflake_error.h"
#include "../raw-id/raw_id.h"

using namespace std;

namespace {

// The cipher sees the raw value as its little-endian byte string
void put_uint64_le(uint8_t* b, uint64_t v) {
  for (int i = 0; i < 8; ++i) {
    b[i] = static_cast<uint8_t>(v >> (8 * i));
  }
}

uint64_t get_uint64_le(const uint8_t* b) {
  uint64_t v = 0;
  for (int i = 7; i >= 0; --i) {
    v = (v << 8) | b[i];
  }
  return v;
}

}  // namespace

Randflake::Randflake(int64_t node_id, int64_t lease_start, int64_t lease_end,
                     const vector<uint8_t>& secret, TimeSource time_source)
    : lease_start(validate_lease(node_id, lease_start, lease_end, secret)),
      lease_end(lease_end),
      node_id(node_id),
      rollover(lease_start),
      sbox(secret),
      time_source(move(time_source)) {}

/**
 * Runs every construction check before any member is built, so a failed
 * constructor leaves nothing behind. Returns lease_start.
 */
int64_t Randflake::validate_lease(int64_t node_id, int64_t lease_start,
                                  int64_t lease_end,
                                  const vector<uint8_t>& secret) {
  if (lease_end < lease_start) {
    throw RandflakeError(RandflakeErrc::kInvalidLease);
  }
  if (node_id < 0 || node_id > RANDFLAKE_MAX_NODE) {
    throw RandflakeError(RandflakeErrc::kInvalidNode);
  }
  if (lease_start < RANDFLAKE_EPOCH_OFFSET) {
    throw RandflakeError(RandflakeErrc::kInvalidLease);
  }
  if (lease_end > RANDFLAKE_MAX_TIMESTAMP) {
    throw RandflakeError(RandflakeErrc::kRandflakeDead);
  }
  if (secret.size() != SPARX64_KEY_SIZE) {
    throw RandflakeError(RandflakeErrc::kInvalidSecret);
  }
  return lease_start;
}

int64_t Randflake::current_time_seconds() {
  if (time_source) {
    return time_source();
  }
  return chrono::duration_cast<chrono::seconds>(
             chrono::system_clock::now().time_since_epoch())
      .count();
}

bool Randflake::update_lease(int64_t new_lease_start, int64_t new_lease_end) {
  if (new_lease_start != lease_start) {
    return false;
  }
  if (new_lease_end < new_lease_start) {
    return false;
  }
  if (new_lease_end > RANDFLAKE_MAX_TIMESTAMP) {
    return false;
  }

  // Lock-free CAS loop: only ever move the end forward
  int64_t current = lease_end.load();
  while (current < new_lease_end) {
    if (lease_end.compare_exchange_weak(current, new_lease_end)) {
      return true;
    }
  }
  return false;
}

uint64_t Randflake::new_raw() {
  while (true) {
    int64_t now = current_time_seconds();

    if (now < lease_start || now > lease_end.load()) {
      throw RandflakeError(RandflakeErrc::kInvalidLease);
    }

    int64_t ctr = sequence.fetch_add(1) + 1;
    if (ctr > RANDFLAKE_MAX_SEQUENCE) {
      int64_t last_rollover = rollover.load();
      if (now > last_rollover) {
        // Another thread may have rolled over first; start again with a
        // fresh sequence in that case
        if (!rollover.compare_exchange_strong(last_rollover, now)) {
          continue;
        }
        sequence.store(0);
        ctr = 0;
      } else if (now < last_rollover) {
        cerr << "Clock moved backwards. Refusing to generate id." << endl;
        throw RandflakeError(RandflakeErrc::kConsistencyViolation);
      } else {
        throw RandflakeError(RandflakeErrc::kResourceExhausted);
      }
    }

    return pack_raw_id(now - RANDFLAKE_EPOCH_OFFSET, node_id, ctr);
  }
}

int64_t Randflake::generate() {
  uint8_t block[SPARX64_BLOCK_SIZE];
  put_uint64_le(block, new_raw());
  sbox.encrypt(block, block);
  return static_cast<int64_t>(get_uint64_le(block));
}

string Randflake::generate_string() { return encode_id_string(generate()); }

RandflakeIdInfo Randflake::inspect(int64_t id) const {
  uint8_t block[SPARX64_BLOCK_SIZE];
  put_uint64_le(block, static_cast<uint64_t>(id));
  sbox.decrypt(block, block);
  uint64_t raw = get_uint64_le(block);

  if (static_cast<int64_t>(raw) < 0) {
    throw RandflakeError(RandflakeErrc::kInvalidLease);
  }

  RawId fields = unpack_raw_id(raw);
  RandflakeIdInfo info;
  info.timestamp = fields.timestamp_offset + RANDFLAKE_EPOCH_OFFSET;
  info.node_id = fields.node_id;
  info.sequence = fields.sequence;
  return info;
}

RandflakeIdInfo Randflake::inspect_string(const string& id) const {
  return inspect(decode_id_string(id));
}

uint64_t Randflake::next_id() { return static_cast<uint64_t>(generate()); }

string Randflake::next_id_string() { return generate_string(); }
