#ifndef RANDFLAKE_H
#define RANDFLAKE_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "../id_generator.h"
#include "../sparx64/sparx64.h"

// Fields recovered from an ID. timestamp is in unix seconds.
struct RandflakeIdInfo {
  int64_t timestamp;
  int64_t node_id;
  int64_t sequence;
};

/**
 * Lease-bound Randflake ID generator.
 *
 * Packs (seconds since RANDFLAKE_EPOCH_OFFSET, node id, per-second sequence)
 * into a raw value and encrypts it with SPARX-64/128 under the secret, so
 * IDs are unique but not sequential. IDs are only handed out while the
 * current time is inside [lease_start, lease_end]; the lease end may be
 * extended with update_lease().
 *
 * A single instance may be shared by many threads. The sequence, rollover
 * and lease end are updated with atomic CAS only.
 */
class Randflake : public IdGenerator {
 public:
  // Returns the current time in unix seconds.
  using TimeSource = std::function<int64_t()>;

 private:
  int64_t lease_start;
  std::atomic<int64_t> lease_end;
  int64_t node_id;
  std::atomic<int64_t> sequence{0};
  // Last second for which the sequence was reset
  std::atomic<int64_t> rollover;
  Sparx64 sbox;
  TimeSource time_source;

  static int64_t validate_lease(int64_t node_id, int64_t lease_start,
                                int64_t lease_end,
                                const std::vector<uint8_t>& secret);

  int64_t current_time_seconds();
  uint64_t new_raw();

 public:
  /**
   * Throws RandflakeError:
   *   kInvalidLease  if lease_end < lease_start or lease_start is before
   *                  RANDFLAKE_EPOCH_OFFSET
   *   kInvalidNode   if node_id is outside [0, RANDFLAKE_MAX_NODE]
   *   kRandflakeDead if lease_end is after RANDFLAKE_MAX_TIMESTAMP
   *   kInvalidSecret if secret is not 16 bytes
   *
   * time_source defaults to the system wall clock, sampled on every call.
   */
  Randflake(int64_t node_id, int64_t lease_start, int64_t lease_end,
            const std::vector<uint8_t>& secret,
            TimeSource time_source = TimeSource());

  Randflake(const Randflake&) = delete;
  Randflake& operator=(const Randflake&) = delete;

  /**
   * Extends the lease end. Returns true only if lease_start matches the
   * generator's lease start and the new end is valid and later than the
   * stored one. Never throws.
   */
  bool update_lease(int64_t lease_start, int64_t lease_end);

  // Throws RandflakeError(kInvalidLease, kResourceExhausted or
  // kConsistencyViolation).
  int64_t generate();
  std::string generate_string();

  // Only rejects IDs whose decrypted raw value is negative (kInvalidLease);
  // foreign IDs usually decode to meaningless fields.
  RandflakeIdInfo inspect(int64_t id) const;
  RandflakeIdInfo inspect_string(const std::string& id) const;

  uint64_t next_id() override;
  std::string next_id_string() override;

  int64_t get_node_id() const { return node_id; }
  int64_t get_lease_start() const { return lease_start; }
  int64_t get_lease_end() const { return lease_end.load(); }
};

#endif  // RANDFLAKE_H
