// tests/smf_bytes.hpp
// Hand assembly of Standard MIDI File bytes for tests, independent of the
// writer under test.
#pragma once
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace testing_smf {

inline void put_vlq(std::vector<std::uint8_t> &out, std::uint32_t v) {
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

inline void put_be(std::vector<std::uint8_t> &out, std::uint32_t v, int n) {
  for (int i = n - 1; i >= 0; --i) {
    out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
  }
}

// Events are appended as (delta, raw bytes); end() adds End of Track.
struct TrackBytes {
  std::vector<std::uint8_t> body;

  TrackBytes &ev(std::uint32_t delta, std::initializer_list<std::uint8_t> b) {
    put_vlq(body, delta);
    body.insert(body.end(), b.begin(), b.end());
    return *this;
  }

  TrackBytes &meta(std::uint32_t delta, std::uint8_t type,
                   const std::string &payload) {
    put_vlq(body, delta);
    body.push_back(0xFF);
    body.push_back(type);
    put_vlq(body, static_cast<std::uint32_t>(payload.size()));
    body.insert(body.end(), payload.begin(), payload.end());
    return *this;
  }

  TrackBytes &tempo(std::uint32_t delta, std::uint32_t usPerQN) {
    put_vlq(body, delta);
    body.insert(body.end(), {0xFF, 0x51, 0x03});
    put_be(body, usPerQN, 3);
    return *this;
  }

  TrackBytes &name(std::uint32_t delta, const std::string &text) {
    return meta(delta, 0x03, text);
  }

  TrackBytes &end(std::uint32_t delta = 0) {
    put_vlq(body, delta);
    body.insert(body.end(), {0xFF, 0x2F, 0x00});
    return *this;
  }
};

inline std::vector<std::uint8_t> file(std::uint16_t format, std::uint16_t ppq,
                                      const std::vector<TrackBytes> &tracks) {
  std::vector<std::uint8_t> out = {'M', 'T', 'h', 'd'};
  put_be(out, 6, 4);
  put_be(out, format, 2);
  put_be(out, static_cast<std::uint32_t>(tracks.size()), 2);
  put_be(out, ppq, 2);
  for (const auto &t : tracks) {
    out.insert(out.end(), {'M', 'T', 'r', 'k'});
    put_be(out, static_cast<std::uint32_t>(t.body.size()), 4);
    out.insert(out.end(), t.body.begin(), t.body.end());
  }
  return out;
}

} // namespace testing_smf
