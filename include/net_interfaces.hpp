/**
 * @file net_interfaces.hpp
 * @brief Linux interface enumeration for discovery targets (getifaddrs).
 *
 * @details
 * PURPOSE
 * -------
 * Ask the kernel which IPv4 interfaces exist right now and turn them into
 * `akka::InterfaceAddress` records. The selection rules and broadcast math
 * live in `akka/broadcast_target.hpp`; this file is only the OS query.
 *
 * USED BY
 * -------
 * - akka-client and akka-probe: passed to DiscoveryEngine as its target
 *   provider, so every send attempt sees current interface state.
 * - tests/test-discover: prints the table for a quick "what will we hit" check.
 *
 * FAILURE MODEL
 * -------------
 * getifaddrs() failure yields an empty list. Discovery treats that the same as
 * "no network": the attempt is logged as NetworkUnavailable and still counts.
 */
#ifndef AKKA_NET_INTERFACES_HPP
#define AKKA_NET_INTERFACES_HPP

#include <vector>
#include "akka/broadcast_target.hpp"

namespace akka {

/// All AF_INET interfaces with their flags, unfiltered.
std::vector<InterfaceAddress> list_ipv4_interfaces();

/// list_ipv4_interfaces() run through select_broadcast_targets().
std::vector<BroadcastTarget> list_broadcast_targets();

} // namespace akka

#endif // AKKA_NET_INTERFACES_HPP
