// src/common/writer.hpp
// The inverse of reader.hpp: append big-endian integers and MIDI VLQs to a
// growing byte buffer.
#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct ByteWriter {
  std::vector<std::uint8_t> out;

  void u8(std::uint8_t v) { out.push_back(v); }

  void be16(std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
  }

  void be24(std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
  }

  void be32(std::uint32_t v) {
    be16(static_cast<std::uint16_t>(v >> 16));
    be16(static_cast<std::uint16_t>(v & 0xFFFF));
  }

  void text(const std::string &s) { out.insert(out.end(), s.begin(), s.end()); }

  void bytes(const std::vector<std::uint8_t> &b) {
    out.insert(out.end(), b.begin(), b.end());
  }

  // Write a MIDI VLQ: 7 bits per byte, most significant group first, high bit
  // set on every byte but the last. Values are clamped to 28 bits.
  void vlq(std::uint32_t v) {
    v &= 0x0FFFFFFF;
    std::uint8_t buf[4];
    int n = 0;
    buf[n++] = static_cast<std::uint8_t>(v & 0x7F);
    while ((v >>= 7) != 0) {
      buf[n++] = static_cast<std::uint8_t>((v & 0x7F) | 0x80);
    }
    while (n > 0) {
      out.push_back(buf[--n]);
    }
  }
};
