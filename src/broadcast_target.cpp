// -----------------------------------------------------------------------------
// broadcast_target.cpp - Implementation of broadcast target selection
//
// API: see include/akka/broadcast_target.hpp
// Tests: tests/test_broadcast_target.cpp
// -----------------------------------------------------------------------------
#include "akka/broadcast_target.hpp"

namespace akka {

uint32_t broadcast_for(uint32_t ip, uint32_t netmask) {
  return (ip & netmask) | ~netmask;
}

AddressStr format_ipv4(uint32_t v) {
  AddressStr s;
  for (int shift = 24; shift >= 0; shift -= 8) {
    unsigned octet = (v >> shift) & 0xFFu;
    char digits[3];
    int n = 0;
    do { digits[n++] = static_cast<char>('0' + octet % 10); octet /= 10; } while (octet);
    while (n) s += digits[--n];
    if (shift) s += '.';
  }
  return s;
}

std::optional<uint32_t> parse_ipv4(const char* text) {
  if (!text || !*text) return std::nullopt;

  uint32_t out = 0;
  const char* p = text;
  for (int part = 0; part < 4; ++part) {
    if (*p < '0' || *p > '9') return std::nullopt;   // empty octet or junk
    unsigned v = 0;
    int digits = 0;
    while (*p >= '0' && *p <= '9') {
      v = v * 10 + static_cast<unsigned>(*p - '0');
      if (++digits > 3 || v > 255) return std::nullopt;
      ++p;
    }
    out = (out << 8) | v;
    if (part < 3) {
      if (*p != '.') return std::nullopt;
      ++p;
    }
  }
  if (*p != '\0') return std::nullopt;               // trailing characters
  return out;
}

std::optional<uint32_t> parse_ipv4(const std::string& text) {
  return parse_ipv4(text.c_str());
}

std::vector<BroadcastTarget> select_broadcast_targets(const std::vector<InterfaceAddress>& ifaces) {
  std::vector<BroadcastTarget> out;
  for (const auto& i : ifaces) {
    if (!i.up || i.loopback || !i.broadcast_capable) continue;
    if (i.ip == 0) continue;                           // configured but unaddressed

    const uint32_t directed = broadcast_for(i.ip, i.netmask);
    if (directed == 0xFFFFFFFFu) continue;            // /0 mask would mean limited broadcast

    AddressStr bcast = format_ipv4(directed);
    bool seen = false;
    for (const auto& t : out) {
      if (t.broadcast_address == bcast) { seen = true; break; }
    }
    if (seen) continue;

    out.push_back(BroadcastTarget{i.name, bcast});
  }
  return out;
}

} // namespace akka
