#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal datagram transport interface used by the discovery engine.
 *
 * Header-only. The engine never touches sockets directly; tests hand it a
 * scripted fake and the Linux build hands it LinuxUdp.
 */

#include <cstddef>
#include <cstdint>

namespace akka::transport {

// Return codes kept simple; details go to the log.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

// Largest datagram a backend delivers whole; recv() buffers are this big.
constexpr std::size_t MAX_DATAGRAM = 2048;

struct Config {
  uint16_t local_port{0};     // 0 = ephemeral
  bool     broadcast{true};   // SO_BROADCAST
};

/**
 * @brief Datagram transport every discovery backend provides.
 *
 * Contract:
 *  - begin(cfg) opens and binds the socket. false = SocketError.
 *  - end() closes it; safe to call when already closed.
 *  - recv(buf,cap,len) never blocks. RxResult::None when nothing is queued.
 *    `from_ipv4` receives the sender (host order) when non-null.
 *  - send_to(ipv4,port,buf,len) transmits one datagram, ipv4 in host order.
 *  - native_handle() is the fd for poll(2), -1 when closed.
 *  - name() is a short identifier for logs.
 */
class IDatagramTransport {
public:
  virtual ~IDatagramTransport() = default;
  virtual bool        begin(const Config& cfg) = 0;
  virtual void        end() = 0;
  virtual bool        is_open() const = 0;
  virtual RxResult    recv(uint8_t* out, std::size_t cap, std::size_t& out_len, uint32_t* from_ipv4) = 0;
  virtual TxResult    send_to(uint32_t ipv4, uint16_t port, const uint8_t* data, std::size_t len) = 0;
  virtual int         native_handle() const = 0;
  virtual const char* name() const = 0;
};

} // namespace akka::transport
