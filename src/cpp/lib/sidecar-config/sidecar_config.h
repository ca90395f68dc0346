#ifndef SIDECAR_CONFIG_H
#define SIDECAR_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>

class Randflake;

/**
 * Settings of the ID sidecar, read from the environment:
 *
 *   RANDFLAKE_NODE_ID      node id (default: derived from the host IPv4)
 *   RANDFLAKE_LEASE_START  unix seconds (default: now)
 *   RANDFLAKE_LEASE_END    unix seconds (default: lease start + 3600)
 *   RANDFLAKE_SECRET       32 hex characters, required
 *   SIDECAR_PORT           TCP port (default: 8080)
 *   RANDFLAKE_LEASE_FILE   file holding the current lease end in unix
 *                          seconds, written by the lease holder (optional)
 *
 * Range checks of node id, lease and secret length are left to the
 * Randflake constructor.
 */
struct SidecarConfig {
  int64_t node_id;
  int64_t lease_start;
  int64_t lease_end;
  std::vector<uint8_t> secret;
  uint16_t port;
  std::string lease_file;
};

const int64_t DEFAULT_LEASE_SECONDS = 3600;
const uint16_t DEFAULT_SIDECAR_PORT = 8080;

// Throws std::invalid_argument naming the variable on malformed input.
SidecarConfig load_sidecar_config();

// Decodes a hex string (either case). Throws std::invalid_argument on odd
// length or non-hex characters.
std::vector<uint8_t> parse_hex_secret(const std::string& hex);

// Reads a lease end (unix seconds) from path. Throws std::runtime_error if
// the file cannot be read and std::invalid_argument if it does not hold an
// integer.
int64_t read_lease_end_file(const std::string& path);

/**
 * Extends the generator's lease to the end found in config.lease_file.
 * Returns true if the stored lease end moved forward. Read failures are
 * logged and reported as false.
 */
bool renew_lease_from_file(Randflake& generator, const SidecarConfig& config);

// Overwrites the secret bytes and empties the buffer once the cipher has
// been keyed.
void wipe_secret(SidecarConfig& config);

#endif  // SIDECAR_CONFIG_H
