/**
 * @file discovery_reply.hpp
 * @brief Wire constants and reply parsing for the UDP discovery exchange.
 *
 * @details
 * ## Wire format
 * - Request: the ASCII bytes `DISCOVER_AKKA_SERVER`, no terminator, sent to
 *   `<directed broadcast>:37020`.
 * - Reply: any datagram whose text contains the marker `ip` followed by a
 *   quoted dotted-quad. Servers have sent both JSON and Python-repr flavours:
 *
 * ```
 *   {"ip": "192.168.1.10", "port": 8000}
 *   {'ip': '192.168.1.10'}
 * ```
 *
 * The parser looks only at the text after the first `ip`. It splits that on
 * `"` when the text has a double quote, otherwise on `'`, and the first
 * piece containing a dot is the address. If that piece is not a valid IPv4
 * address the reply is rejected; later pieces are not tried.
 * Unrelated fields are ignored. A reply with the marker but no usable
 * address is malformed: the engine logs it and keeps broadcasting.
 *
 * Our own broadcast comes back to us on some stacks. `is_echo()` spots it.
 */
#ifndef AKKA_DISCOVERY_REPLY_HPP
#define AKKA_DISCOVERY_REPLY_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include "akka/broadcast_target.hpp"

namespace akka::discovery {

inline constexpr const char* MAGIC        = "DISCOVER_AKKA_SERVER";
inline constexpr std::size_t MAGIC_LEN    = 20;
inline constexpr const char* REPLY_MARKER = "ip";
inline constexpr uint16_t    DEFAULT_PORT = 37020;

bool is_echo(const uint8_t* data, std::size_t len);

/// True when the datagram carries the reply marker at all.
bool looks_like_reply(const std::string& text);

/**
 * @brief Extract the server address from a reply payload.
 * @return the address, or nullopt when the marker is missing, no piece
 *         after it has a dot, or the first dotted piece is not IPv4.
 */
std::optional<AddressStr> parse_server_reply(const std::string& text);

} // namespace akka::discovery

#endif // AKKA_DISCOVERY_REPLY_HPP
