#ifndef NETWORK_UTIL_H
#define NETWORK_UTIL_H

#include <arpa/inet.h>
#include <ifaddrs.h>

#include <cstdint>
#include <cstring>
#include <iostream>

#include "id_generator.h"

/**
 * Derives a Randflake node id from the host's IPv4 address.
 *
 * Walks the network interfaces, takes the first non-loopback IPv4 address
 * and keeps the bits selected by mask. Used when no node id is configured;
 * the result is only unique if the fleet's addresses differ in those bits.
 *
 * @param mask The bitmask to apply to the IP address
 * @return The derived id, or 1 if no suitable interface is found.
 */
inline int64_t get_node_id_from_ip(int64_t mask = RANDFLAKE_MAX_NODE) {
  struct ifaddrs* interfaces = nullptr;
  int64_t node_id = 1;  // Default fallback ID

  if (getifaddrs(&interfaces) == 0) {
    for (struct ifaddrs* it = interfaces; it != nullptr; it = it->ifa_next) {
      if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
        continue;
      }
      if (strcmp(it->ifa_name, "lo") == 0) {
        continue;
      }
      struct sockaddr_in* addr = (struct sockaddr_in*)it->ifa_addr;
      uint32_t ip = ntohl(addr->sin_addr.s_addr);
      node_id = static_cast<int64_t>(ip) & mask;
      std::cout << "Derived Node ID " << node_id << " from IP interface "
                << it->ifa_name << std::endl;
      break;
    }
  }

  if (interfaces != nullptr) {
    freeifaddrs(interfaces);
  }

  return node_id;
}

#endif  // NETWORK_UTIL_H
