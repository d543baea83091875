/**
 * @page akka-udp-io-hdr Akka UDP I/O API (Header)
 * @file udp_io.hpp
 * @brief Free functions for one IPv4 datagram socket: open, send, read, close.
 *
 * @details
 * PURPOSE
 * -------
 * Discovery needs exactly one socket: bound to an ephemeral port, allowed to
 * broadcast, read without blocking the event loop. These functions are that
 * socket and nothing more. The header-only `akka::transport::LinuxUdp`
 * wraps them behind the engine's transport interface, and the probe harness
 * in tests/test-discover uses them directly.
 *
 * FUNCTIONS
 * ---------
 * - akka::open_udp_socket: socket + SO_REUSEADDR + optional SO_BROADCAST +
 *   bind to INADDR_ANY:port, non-blocking. Returns fd or -1.
 * - akka::send_datagram: one sendto(2). Returns true when every byte left.
 * - akka::read_datagram: poll(2) up to timeout_ms, then one recvfrom(2).
 *   Returns bytes read (>0), 0 on timeout or nothing queued, -1 on error.
 * - akka::close_socket: close the fd, ignore -1.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Addresses are host byte order everywhere in Akka; conversion to network
 *   order happens here and nowhere else.
 * - timeout_ms = 0 makes read_datagram a pure non-blocking check.
 * - Errors are reported with errno intact so callers can log strerror().
 *
 * EXAMPLE
 * -------
 * @code
 *   int fd = akka::open_udp_socket(0, true);
 *   if (fd < 0) { // SocketError }
 *   akka::send_datagram(fd, bcast, 37020, buf, len);
 *   std::vector<uint8_t> in;
 *   uint32_t from = 0;
 *   if (akka::read_datagram(fd, in, 1000, &from) > 0) { ... }
 *   akka::close_socket(fd);
 * @endcode
 */
#ifndef AKKA_UDP_IO_HPP
#define AKKA_UDP_IO_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace akka {

/// Largest datagram read_datagram() accepts; longer ones are truncated.
constexpr std::size_t UDP_READ_CAP = 2048;

int  open_udp_socket(uint16_t local_port, bool broadcast);
bool send_datagram(int fd, uint32_t ipv4, uint16_t port, const uint8_t* data, std::size_t len);
int  read_datagram(int fd, std::vector<uint8_t>& out, int timeout_ms, uint32_t* from_ipv4 = nullptr);
void close_socket(int fd);

} // namespace akka

#endif // AKKA_UDP_IO_HPP
