#include <doctest/doctest.h>
#include <cstring>
#include "akka/wav.hpp"

using namespace akka;

static uint32_t u32_at(const std::vector<uint8_t>& b, size_t off) {
    return uint32_t(b[off]) | uint32_t(b[off + 1]) << 8 | uint32_t(b[off + 2]) << 16 | uint32_t(b[off + 3]) << 24;
}

static uint16_t u16_at(const std::vector<uint8_t>& b, size_t off) {
    return static_cast<uint16_t>(b[off] | b[off + 1] << 8);
}

TEST_CASE("Header layout for 16 kHz mono 16-bit") {
    auto h = wav_header(WavFormat{}, 32000);
    REQUIRE(h.size() == WAV_HEADER_BYTES);
    CHECK(std::memcmp(h.data(), "RIFF", 4) == 0);
    CHECK(u32_at(h, 4) == 32000 + 36);
    CHECK(std::memcmp(h.data() + 8, "WAVEfmt ", 8) == 0);
    CHECK(u32_at(h, 16) == 16);
    CHECK(u16_at(h, 20) == 1);          // PCM
    CHECK(u16_at(h, 22) == 1);          // mono
    CHECK(u32_at(h, 24) == 16000);
    CHECK(u32_at(h, 28) == 32000);      // byte rate
    CHECK(u16_at(h, 32) == 2);          // block align
    CHECK(u16_at(h, 34) == 16);
    CHECK(std::memcmp(h.data() + 36, "data", 4) == 0);
    CHECK(u32_at(h, 40) == 32000);
}

TEST_CASE("Samples follow the header little-endian") {
    const int16_t samples[] = {1, -2, 0x1234};
    auto w = encode_wav(samples, 3, 8000);
    REQUIRE(w.size() == WAV_HEADER_BYTES + 6);
    CHECK(u32_at(w, 24) == 8000);
    CHECK(u32_at(w, 40) == 6);
    CHECK(w[44] == 0x01);
    CHECK(w[45] == 0x00);
    CHECK(w[46] == 0xFE);
    CHECK(w[47] == 0xFF);
    CHECK(w[48] == 0x34);
    CHECK(w[49] == 0x12);
}

TEST_CASE("Empty utterance is a bare header") {
    auto w = encode_wav(nullptr, 0, 16000);
    CHECK(w.size() == WAV_HEADER_BYTES);
    CHECK(u32_at(w, 40) == 0);
}
