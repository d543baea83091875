#pragma once
/**
 * @file transport_linux_udp.hpp
 * @brief Linux UDP transport for discovery (header-only, non-blocking).
 *
 * Thin adapter from IDatagramTransport to the free functions in udp_io.hpp.
 */

#if !defined(__linux__)
#  error "transport_linux_udp.hpp is Linux-only."
#endif

#include "akka/transport/transport_base.hpp"
#include "udp_io.hpp"
#include <cerrno>
#include <cstring>
#include <vector>

namespace akka::transport {

static_assert(akka::UDP_READ_CAP == MAX_DATAGRAM, "socket read size and engine buffer must agree");

class LinuxUdp : public IDatagramTransport {
public:
  LinuxUdp() = default;
  ~LinuxUdp() override { end(); }

  LinuxUdp(const LinuxUdp&) = delete;
  LinuxUdp& operator=(const LinuxUdp&) = delete;

  bool begin(const Config& cfg) override {
    end();                                    // re-begin closes the old socket first
    fd_ = akka::open_udp_socket(cfg.local_port, cfg.broadcast);
    if (fd_ < 0) last_errno_ = errno;
    return fd_ >= 0;
  }

  void end() override {
    if (fd_ >= 0) { akka::close_socket(fd_); fd_ = -1; }
  }

  bool is_open() const override { return fd_ >= 0; }

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len, uint32_t* from_ipv4) override {
    out_len = 0;
    if (fd_ < 0 || !out || cap == 0) return RxResult::Error;
    int n = akka::read_datagram(fd_, scratch_, 0, from_ipv4);
    if (n < 0) { last_errno_ = errno; return RxResult::Error; }
    if (n == 0) return RxResult::None;
    out_len = scratch_.size() < cap ? scratch_.size() : cap;
    std::memcpy(out, scratch_.data(), out_len);
    return RxResult::Ok;
  }

  TxResult send_to(uint32_t ipv4, uint16_t port, const uint8_t* data, std::size_t len) override {
    if (fd_ < 0) return TxResult::Error;
    if (akka::send_datagram(fd_, ipv4, port, data, len)) return TxResult::Ok;
    last_errno_ = errno;
    return (errno == EAGAIN || errno == EWOULDBLOCK) ? TxResult::Busy : TxResult::Error;
  }

  int native_handle() const override { return fd_; }
  const char* name() const override { return "linux-udp"; }

  /// errno from the last failing call, for log lines.
  int last_errno() const { return last_errno_; }

private:
  int fd_{-1};
  int last_errno_{0};
  std::vector<uint8_t> scratch_;
};

} // namespace akka::transport
