// ============================================================================
// udp_io.cpp - implementation for udp_io.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file udp_io.cpp
 */

#include "udp_io.hpp"

#include <sys/socket.h>    // socket, bind, sendto, recvfrom, setsockopt
#include <netinet/in.h>    // sockaddr_in, INADDR_ANY, htonl/htons
#include <arpa/inet.h>     // ntohl
#include <fcntl.h>         // fcntl O_NONBLOCK
#include <unistd.h>        // close
#include <poll.h>          // poll(2) for timeout-based read
#include <cerrno>
#include <cstring>         // memset

namespace akka {

// ---------------------------------------------------------------------------
// open_udp_socket()
// -----------------
// AF_INET/SOCK_DGRAM, non-blocking, bound to INADDR_ANY:local_port.
// broadcast=true sets SO_BROADCAST; without it sendto() to x.x.x.255 fails
// with EACCES on Linux.
//
// Returns: fd (>=0) or -1. On failure the partially built socket is closed
// and errno reflects the failing call.
// ---------------------------------------------------------------------------
int open_udp_socket(uint16_t local_port, bool broadcast) {
  int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) return -1;

  auto fail = [fd]() {
    int saved = errno;
    ::close(fd);
    errno = saved;
    return -1;
  };

  int one = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) != 0) return fail();
  if (broadcast && ::setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &one, sizeof(one)) != 0) return fail();

  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) return fail();

  sockaddr_in local{};
  local.sin_family      = AF_INET;
  local.sin_addr.s_addr = htonl(INADDR_ANY);
  local.sin_port        = htons(local_port);
  if (::bind(fd, reinterpret_cast<sockaddr*>(&local), sizeof(local)) != 0) return fail();

  return fd;
}


// ---------------------------------------------------------------------------
// send_datagram()
// ---------------
// One sendto(2). A short send on a datagram socket means the datagram was
// not sent as a unit, so anything but a full count is a failure.
// ---------------------------------------------------------------------------
bool send_datagram(int fd, uint32_t ipv4, uint16_t port, const uint8_t* data, std::size_t len) {
  if (fd < 0 || !data || len == 0) return false;

  sockaddr_in dst{};
  dst.sin_family      = AF_INET;
  dst.sin_addr.s_addr = htonl(ipv4);
  dst.sin_port        = htons(port);

  ssize_t n = ::sendto(fd, data, len, 0, reinterpret_cast<sockaddr*>(&dst), sizeof(dst));
  return n == static_cast<ssize_t>(len);
}


// ---------------------------------------------------------------------------
// read_datagram()
// ---------------
// Wait up to timeout_ms for the fd to become readable, then pull exactly one
// datagram into `out` (resized to the byte count).
//
// Returns: >0 bytes, 0 on timeout / EAGAIN, -1 on poll or recvfrom error.
// ---------------------------------------------------------------------------
int read_datagram(int fd, std::vector<uint8_t>& out, int timeout_ms, uint32_t* from_ipv4) {
  out.clear();
  if (fd < 0) return -1;

  pollfd p{};
  p.fd = fd;
  p.events = POLLIN;
  int pr = ::poll(&p, 1, timeout_ms);
  if (pr < 0) return (errno == EINTR) ? 0 : -1;
  if (pr == 0) return 0;                              // timeout
  if (p.revents & (POLLERR | POLLNVAL)) return -1;

  out.resize(UDP_READ_CAP);
  sockaddr_in src{};
  socklen_t slen = sizeof(src);
  ssize_t n = ::recvfrom(fd, out.data(), out.size(), 0, reinterpret_cast<sockaddr*>(&src), &slen);
  if (n < 0) {
    out.clear();
    return (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) ? 0 : -1;
  }

  out.resize(static_cast<std::size_t>(n));
  if (from_ipv4) *from_ipv4 = ntohl(src.sin_addr.s_addr);
  return static_cast<int>(n);                         // 0-length datagram reads as "nothing"
}


void close_socket(int fd) {
  if (fd >= 0) ::close(fd);
}

} // namespace akka
