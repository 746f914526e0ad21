// src/common/reader.hpp
// Tiny safe cursor for big-endian reads, MIDI VLQ and raw byte runs.
// Every read past the end throws smf::MalformedStreamError, so callers can
// walk a chunk without checking sizes themselves.
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "smf/error.hpp"

struct Bytes {
  const std::uint8_t *data = nullptr; // not owned
  std::size_t size = 0;
  std::size_t off = 0; // current read position

  // Views `src` without copying it; `src` must outlive the cursor.
  explicit Bytes(const std::vector<std::uint8_t> &src)
      : data(src.data()), size(src.size()), off(0) {}
  Bytes(std::vector<std::uint8_t> &&) = delete;
  Bytes(const std::uint8_t *p, std::size_t n) : data(p), size(n), off(0) {}

  [[nodiscard]] bool at_end() const { return off >= size; }
  [[nodiscard]] std::size_t remaining() const { return size - off; }

  [[nodiscard]] std::uint8_t u8() {
    need(1, "u8");
    return data[off++];
  }

  [[nodiscard]] std::uint16_t be16() {
    need(2, "be16");
    std::uint16_t hi = data[off], lo = data[off + 1];
    off += 2;
    return static_cast<std::uint16_t>((hi << 8) | lo);
  }

  [[nodiscard]] std::uint32_t be24() {
    need(3, "be24");
    std::uint32_t b0 = data[off], b1 = data[off + 1], b2 = data[off + 2];
    off += 3;
    return (b0 << 16) | (b1 << 8) | b2;
  }

  [[nodiscard]] std::uint32_t be32() {
    need(4, "be32");
    std::uint32_t b0 = data[off], b1 = data[off + 1], b2 = data[off + 2],
                  b3 = data[off + 3];
    off += 4;
    return (b0 << 24) | (b1 << 16) | (b2 << 8) | b3;
  }

  // n raw bytes as a string (meta text payloads).
  [[nodiscard]] std::string text(std::size_t n) {
    need(n, "text");
    std::string s(reinterpret_cast<const char *>(data + off), n);
    off += n;
    return s;
  }

  // Sub-cursor over the next n bytes; this cursor moves past them.
  [[nodiscard]] Bytes slice(std::size_t n) {
    need(n, "chunk");
    Bytes sub(data + off, n);
    off += n;
    return sub;
  }

  void skip(std::size_t n) {
    need(n, "skip");
    off += n;
  }

private:
  void need(std::size_t n, const char *what) const {
    if (n > size - off) {
      throw smf::MalformedStreamError(std::string("EOF while reading ") +
                                      what);
    }
  }
};

// Read a MIDI VLQ (Variable Length Quantity).
// At most 4 bytes; a fourth byte with the continuation bit set is malformed.
inline std::uint32_t read_vlq(Bytes &r) {
  std::uint32_t v = 0;
  for (int i = 0; i < 4; ++i) {
    std::uint8_t b = r.u8();
    v = (v << 7) | (b & 0x7F);
    if ((b & 0x80) == 0)
      return v; // high bit 0 => last byte
  }
  throw smf::MalformedStreamError("Variable-length quantity exceeds 4 bytes");
}
