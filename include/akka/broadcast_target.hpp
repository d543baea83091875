/**
 * @file broadcast_target.hpp
 * @brief Subnet-directed broadcast targets derived from interface state.
 *
 * @details
 * ## Field Brief
 * Discovery has to reach a server on a subnet nobody told us about. The only
 * thing we know is our own interfaces. For every interface that is up, not
 * loopback and broadcast-capable, the directed broadcast address is
 *
 * ```
 *   broadcast = ip | ~netmask        e.g. 192.168.1.42 / 255.255.255.0 -> 192.168.1.255
 * ```
 *
 * Limited broadcast (255.255.255.255) is never used. Several interfaces may
 * qualify (wifi plus a USB gadget link); discovery sends to all of them.
 *
 * This header is pure arithmetic plus selection. The OS query lives in
 * `net_interfaces.hpp` and feeds `select_broadcast_targets()`, so the math is
 * testable without a network.
 *
 * Targets are rebuilt for every send attempt and never cached, so a laptop
 * that roams between networks picks up the new subnet on the next attempt.
 */
#ifndef AKKA_BROADCAST_TARGET_HPP
#define AKKA_BROADCAST_TARGET_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "etl/string.h"

namespace akka {

/// Dotted-quad IPv4 text, "255.255.255.255" is the longest.
using AddressStr = etl::string<15>;

/// One interface as reported by the OS. Addresses in host byte order.
struct InterfaceAddress {
  std::string name;
  uint32_t    ip{0};
  uint32_t    netmask{0};
  bool        up{false};
  bool        loopback{false};
  bool        broadcast_capable{false};
};

struct BroadcastTarget {
  std::string interface_name;
  AddressStr  broadcast_address;
};

uint32_t broadcast_for(uint32_t ip, uint32_t netmask);

AddressStr format_ipv4(uint32_t host_order);

/// Strict dotted-quad: four decimal octets 0..255, no leading '+', no spaces.
std::optional<uint32_t> parse_ipv4(const char* text);
std::optional<uint32_t> parse_ipv4(const std::string& text);

/**
 * @brief Pick the interfaces discovery should broadcast on.
 *
 * Skips interfaces that are down, loopback, not broadcast-capable, or that
 * carry no address. Duplicate broadcast addresses (two aliases on one
 * subnet) are sent to once. Order follows the input.
 */
std::vector<BroadcastTarget> select_broadcast_targets(const std::vector<InterfaceAddress>& ifaces);

} // namespace akka

#endif // AKKA_BROADCAST_TARGET_HPP
