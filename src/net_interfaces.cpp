// ============================================================================
// net_interfaces.cpp - implementation for net_interfaces.hpp
// For API/overview see the matching .hpp.
// ============================================================================

/**
 * @file net_interfaces.cpp
 */

#include "net_interfaces.hpp"
#include "akka/log.hpp"

#include <ifaddrs.h>       // getifaddrs / freeifaddrs
#include <net/if.h>        // IFF_UP, IFF_LOOPBACK, IFF_BROADCAST
#include <netinet/in.h>    // sockaddr_in
#include <arpa/inet.h>     // ntohl
#include <cerrno>
#include <cstring>         // strerror
#include <string>
#include <utility>

namespace akka {

std::vector<InterfaceAddress> list_ipv4_interfaces() {
  std::vector<InterfaceAddress> out;

  ifaddrs* head = nullptr;
  if (::getifaddrs(&head) != 0) {
    log::warn("netif", "getifaddrs_failed", std::string("errno=") + std::strerror(errno));
    return out;
  }

  for (ifaddrs* it = head; it; it = it->ifa_next) {
    if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;   // IPv4 only

    InterfaceAddress a;
    a.name = it->ifa_name ? it->ifa_name : "";
    a.ip = ntohl(reinterpret_cast<const sockaddr_in*>(it->ifa_addr)->sin_addr.s_addr);
    if (it->ifa_netmask) {
      a.netmask = ntohl(reinterpret_cast<const sockaddr_in*>(it->ifa_netmask)->sin_addr.s_addr);
    }
    a.up                = (it->ifa_flags & IFF_UP) != 0;
    a.loopback          = (it->ifa_flags & IFF_LOOPBACK) != 0;
    a.broadcast_capable = (it->ifa_flags & IFF_BROADCAST) != 0;
    out.push_back(std::move(a));
  }

  ::freeifaddrs(head);
  return out;
}

std::vector<BroadcastTarget> list_broadcast_targets() {
  return select_broadcast_targets(list_ipv4_interfaces());
}

} // namespace akka
