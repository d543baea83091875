#pragma once
/**
 * @file wav.hpp
 * @brief Canonical 44-byte RIFF/WAVE header for 16-bit PCM.
 *
 * The child-process recognizer hands each utterance to the engine as a WAV
 * file. Fields are written little-endian byte by byte, so the output does not
 * depend on host endianness or struct packing.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace akka {

constexpr std::size_t WAV_HEADER_BYTES = 44;

struct WavFormat {
  uint32_t sample_rate{16000};
  uint16_t channels{1};
  uint16_t bits_per_sample{16};
};

/// Header for `data_bytes` of PCM payload.
std::vector<uint8_t> wav_header(const WavFormat& fmt, uint32_t data_bytes);

/// Header plus samples, ready to write to disk.
std::vector<uint8_t> encode_wav(const int16_t* samples, std::size_t count, uint32_t sample_rate);

} // namespace akka
