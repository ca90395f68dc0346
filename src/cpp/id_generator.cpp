#include "lib/id_generator.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "lib/randflake-error/randflake_error.h"
#include "lib/randflake/randflake.h"
#include "lib/sidecar-config/sidecar_config.h"

using namespace std;

int main() {
  int server_fd, new_socket;
  struct sockaddr_in address;
  int opt = 1;
  int addrlen = sizeof(address);

  // ---------------------------------------------------------
  // 1. Load configuration and create the generator
  // ---------------------------------------------------------
  SidecarConfig config;
  try {
    config = load_sidecar_config();
  } catch (const invalid_argument& e) {
    cerr << "Invalid configuration: " << e.what() << endl;
    return EXIT_FAILURE;
  }

  unique_ptr<Randflake> generator;
  try {
    generator = make_unique<Randflake>(config.node_id, config.lease_start,
                                       config.lease_end, config.secret);
  } catch (const RandflakeError& e) {
    wipe_secret(config);
    cerr << "Failed to create generator: " << e.what() << endl;
    return EXIT_FAILURE;
  }
  // The cipher holds its own key schedule from here on
  wipe_secret(config);

  cout << "Initializing Randflake generator (node " << config.node_id
       << ", lease " << config.lease_start << ".." << config.lease_end << ")..."
       << endl;

  // ---------------------------------------------------------
  // 2. Setup TCP Server Socket
  // ---------------------------------------------------------
  if ((server_fd = socket(AF_INET, SOCK_STREAM, 0)) < 0) {
    perror("Socket creation failed");
    return EXIT_FAILURE;
  }

  // Allow reuse of address and port to prevent "Address already in use" errors
  if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR | SO_REUSEPORT, &opt,
                 sizeof(opt))) {
    perror("setsockopt failed");
    close(server_fd);
    return EXIT_FAILURE;
  }

  memset(&address, 0, sizeof(address));
  address.sin_family = AF_INET;
  address.sin_addr.s_addr = INADDR_ANY;
  address.sin_port = htons(config.port);

  if (bind(server_fd, (struct sockaddr*)&address, sizeof(address)) < 0) {
    perror("Bind failed");
    close(server_fd);
    return EXIT_FAILURE;
  }

  if (listen(server_fd, SOMAXCONN) < 0) {
    perror("Listen failed");
    close(server_fd);
    return EXIT_FAILURE;
  }

  cout << "Sidecar listening on port " << config.port << "..." << endl;

  // ---------------------------------------------------------
  // 3. Main Server Loop
  // ---------------------------------------------------------
  while (true) {
    if ((new_socket = accept(server_fd, (struct sockaddr*)&address,
                             (socklen_t*)&addrlen)) < 0) {
      perror("Accept failed");
      continue;
    }

    // One base32hex ID per connection. Refused requests get no payload.
    // An expired lease is renewed from the lease file once per request.
    bool renewed = false;
    while (true) {
      try {
        string id_str = generator->next_id_string();
        if (send(new_socket, id_str.c_str(), id_str.length(), 0) < 0) {
          perror("Send failed");
        }
      } catch (const RandflakeError& e) {
        if (e.code() == RandflakeErrc::kInvalidLease && !renewed) {
          int64_t now = chrono::duration_cast<chrono::seconds>(
                            chrono::system_clock::now().time_since_epoch())
                            .count();
          if (now > generator->get_lease_end()) {
            renewed = true;
            if (renew_lease_from_file(*generator, config)) {
              continue;
            }
            // Nothing can be served any more; let the supervisor restart
            // the sidecar with a fresh lease
            cerr << "Lease expired at " << generator->get_lease_end()
                 << ". Shutting down." << endl;
            close(new_socket);
            close(server_fd);
            return EXIT_FAILURE;
          }
        }
        cerr << "Refusing request: " << e.what() << endl;
        if (e.code() == RandflakeErrc::kConsistencyViolation) {
          // The ordering guarantee is void until the clock is fixed
          close(new_socket);
          close(server_fd);
          return EXIT_FAILURE;
        }
      }
      break;
    }

    // Close the connection immediately after sending (stateless IPC)
    close(new_socket);
  }

  return 0;
}
