#include "sidecar_config.h"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

#include "../id_generator.h"
#include "../network_util.h"
#include "../randflake/randflake.h"

using namespace std;

namespace {

int64_t parse_int64_env(const char* name, const char* value) {
  string text(value);
  size_t pos = 0;
  long long parsed = 0;
  try {
    parsed = stoll(text, &pos, 10);
  } catch (const logic_error&) {
    throw invalid_argument(string(name) + " is not an integer: " + text);
  }
  if (pos != text.size()) {
    throw invalid_argument(string(name) + " is not an integer: " + text);
  }
  return static_cast<int64_t>(parsed);
}

int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

int64_t current_time_seconds() {
  return chrono::duration_cast<chrono::seconds>(
             chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace

vector<uint8_t> parse_hex_secret(const string& hex) {
  if (hex.size() % 2 != 0) {
    throw invalid_argument("hex secret has odd length");
  }

  vector<uint8_t> bytes;
  bytes.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hex_digit(hex[i]);
    int lo = hex_digit(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      throw invalid_argument("hex secret contains a non-hex character");
    }
    bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return bytes;
}

SidecarConfig load_sidecar_config() {
  SidecarConfig config;

  const char* node_env = getenv("RANDFLAKE_NODE_ID");
  config.node_id = node_env ? parse_int64_env("RANDFLAKE_NODE_ID", node_env)
                            : get_node_id_from_ip(RANDFLAKE_MAX_NODE);

  const char* start_env = getenv("RANDFLAKE_LEASE_START");
  config.lease_start = start_env
                           ? parse_int64_env("RANDFLAKE_LEASE_START", start_env)
                           : current_time_seconds();

  const char* end_env = getenv("RANDFLAKE_LEASE_END");
  config.lease_end = end_env ? parse_int64_env("RANDFLAKE_LEASE_END", end_env)
                             : config.lease_start + DEFAULT_LEASE_SECONDS;

  const char* secret_env = getenv("RANDFLAKE_SECRET");
  if (secret_env == nullptr) {
    throw invalid_argument("RANDFLAKE_SECRET is not set");
  }
  try {
    config.secret = parse_hex_secret(secret_env);
  } catch (const invalid_argument& e) {
    throw invalid_argument(string("RANDFLAKE_SECRET: ") + e.what());
  }

  const char* port_env = getenv("SIDECAR_PORT");
  if (port_env) {
    int64_t port = parse_int64_env("SIDECAR_PORT", port_env);
    if (port < 1 || port > 65535) {
      throw invalid_argument("SIDECAR_PORT is out of range: " +
                             string(port_env));
    }
    config.port = static_cast<uint16_t>(port);
  } else {
    config.port = DEFAULT_SIDECAR_PORT;
  }

  const char* lease_file_env = getenv("RANDFLAKE_LEASE_FILE");
  config.lease_file = lease_file_env ? lease_file_env : "";

  return config;
}

int64_t read_lease_end_file(const string& path) {
  ifstream in(path);
  if (!in) {
    throw runtime_error("cannot read lease file " + path);
  }
  string text((istreambuf_iterator<char>(in)), istreambuf_iterator<char>());

  // Tolerate the trailing newline most writers add
  size_t end = text.find_last_not_of(" \t\r\n");
  text = (end == string::npos) ? "" : text.substr(0, end + 1);
  return parse_int64_env(path.c_str(), text.c_str());
}

bool renew_lease_from_file(Randflake& generator, const SidecarConfig& config) {
  if (config.lease_file.empty()) {
    return false;
  }

  int64_t lease_end;
  try {
    lease_end = read_lease_end_file(config.lease_file);
  } catch (const exception& e) {
    cerr << "Lease renewal failed: " << e.what() << endl;
    return false;
  }

  if (!generator.update_lease(generator.get_lease_start(), lease_end)) {
    return false;
  }
  cout << "Lease extended to " << lease_end << endl;
  return true;
}

void wipe_secret(SidecarConfig& config) {
  volatile uint8_t* wipe = config.secret.data();
  for (size_t i = 0; i < config.secret.size(); ++i) {
    wipe[i] = 0;
  }
  config.secret.clear();
}
