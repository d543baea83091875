// -----------------------------------------------------------------------------
// wav.cpp - Implementation of the WAV header writer
//
// API: see include/akka/wav.hpp
// -----------------------------------------------------------------------------
#include "akka/wav.hpp"

namespace akka {

namespace {

void put_tag(std::vector<uint8_t>& out, const char* tag) {
  for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>(tag[i]));
}

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>(v >> 8));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
  for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

} // namespace

std::vector<uint8_t> wav_header(const WavFormat& fmt, uint32_t data_bytes) {
  const uint16_t bytes_per_sample = static_cast<uint16_t>(fmt.bits_per_sample / 8);
  std::vector<uint8_t> h;
  h.reserve(WAV_HEADER_BYTES);

  put_tag(h, "RIFF");
  put_u32(h, data_bytes + static_cast<uint32_t>(WAV_HEADER_BYTES) - 8);  // file size - 8
  put_tag(h, "WAVE");
  put_tag(h, "fmt ");
  put_u32(h, 16);                                                        // PCM fmt chunk
  put_u16(h, 1);                                                         // PCM
  put_u16(h, fmt.channels);
  put_u32(h, fmt.sample_rate);
  put_u32(h, fmt.sample_rate * fmt.channels * bytes_per_sample);         // byte rate
  put_u16(h, static_cast<uint16_t>(fmt.channels * bytes_per_sample));    // block align
  put_u16(h, fmt.bits_per_sample);
  put_tag(h, "data");
  put_u32(h, data_bytes);
  return h;
}

std::vector<uint8_t> encode_wav(const int16_t* samples, std::size_t count, uint32_t sample_rate) {
  WavFormat fmt;
  fmt.sample_rate = sample_rate;
  std::vector<uint8_t> out = wav_header(fmt, static_cast<uint32_t>(count * 2));
  out.reserve(WAV_HEADER_BYTES + count * 2);
  for (std::size_t i = 0; i < count; ++i) put_u16(out, static_cast<uint16_t>(samples[i]));
  return out;
}

} // namespace akka
