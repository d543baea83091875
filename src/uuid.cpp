// -----------------------------------------------------------------------------
// uuid.cpp - Implementation of akka::Uuid
//
// API: see include/akka/uuid.hpp
// Tests: tests/test_uuid.cpp
// -----------------------------------------------------------------------------
#include "akka/uuid.hpp"

namespace akka {

namespace {
constexpr char HEX[] = "0123456789abcdef";
} // namespace

Uuid Uuid::generate(std::mt19937_64& rng) {
  Uuid u;
  for (size_t i = 0; i < 16; i += 8) {
    uint64_t r = rng();                               // 8 random bytes per draw
    for (size_t b = 0; b < 8; ++b) {
      u.bytes_[i + b] = static_cast<uint8_t>(r >> (b * 8));
    }
  }
  u.bytes_[6] = static_cast<uint8_t>((u.bytes_[6] & 0x0F) | 0x40);  // version 4
  u.bytes_[8] = static_cast<uint8_t>((u.bytes_[8] & 0x3F) | 0x80);  // variant 10xx
  return u;
}

Uuid::TextStr Uuid::to_string() const {
  TextStr s;
  for (size_t b = 0; b < 16; ++b) {
    if (b == 4 || b == 6 || b == 8 || b == 10) s += '-';
    s += HEX[bytes_[b] >> 4];
    s += HEX[bytes_[b] & 0x0F];
  }
  return s;
}

bool Uuid::is_nil() const {
  for (uint8_t b : bytes_) if (b != 0) return false;
  return true;
}

} // namespace akka
