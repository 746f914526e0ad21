// src/smf/writer.cpp
// Serialize per-track token lists into Standard MIDI File bytes.

#include "smf/smf.hpp"
#include "common/writer.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Ordering among tokens that share a tick: setup first, then releases, then
// new notes (avoids cutting a re-struck note short).
int priority(smf::TokenType t) {
  switch (t) {
  case smf::TokenType::TrackName:
  case smf::TokenType::InstrumentName:
  case smf::TokenType::SetTempo:
  case smf::TokenType::TimeSignature:
    return 0;
  case smf::TokenType::ProgramChange:
    return 1;
  case smf::TokenType::Controller:
  case smf::TokenType::PitchBend:
    return 2;
  case smf::TokenType::NoteOff:
    return 3;
  case smf::TokenType::NoteOn:
    return 4;
  }
  return 5;
}

std::uint8_t status_byte(std::uint8_t type, int ch) {
  return static_cast<std::uint8_t>(type | (ch & 0x0F));
}

std::uint8_t data7(int v) { return static_cast<std::uint8_t>(v & 0x7F); }

void write_meta(ByteWriter &w, std::uint8_t metaType,
                const std::vector<std::uint8_t> &payload) {
  w.u8(0xFF);
  w.u8(metaType);
  w.vlq(static_cast<std::uint32_t>(payload.size()));
  w.bytes(payload);
}

std::uint8_t log2_denominator(int denominator) {
  std::uint8_t power = 0;
  while (denominator > 1) {
    denominator >>= 1;
    ++power;
  }
  return power;
}

// Emit one event body (no delta). Running status is not used on output.
void write_event(ByteWriter &w, const smf::Token &t) {
  switch (t.type) {
  case smf::TokenType::NoteOn:
    w.u8(status_byte(0x90, t.channel));
    w.u8(data7(t.data1));
    w.u8(data7(t.data2));
    break;
  case smf::TokenType::NoteOff:
    w.u8(status_byte(0x80, t.channel));
    w.u8(data7(t.data1));
    w.u8(data7(t.data2));
    break;
  case smf::TokenType::Controller:
    w.u8(status_byte(0xB0, t.channel));
    w.u8(data7(t.data1));
    w.u8(data7(t.data2));
    break;
  case smf::TokenType::ProgramChange:
    w.u8(status_byte(0xC0, t.channel));
    w.u8(data7(t.data1));
    break;
  case smf::TokenType::PitchBend:
    w.u8(status_byte(0xE0, t.channel));
    w.u8(static_cast<std::uint8_t>(t.value & 0x7F));
    w.u8(static_cast<std::uint8_t>((t.value >> 7) & 0x7F));
    break;
  case smf::TokenType::TrackName:
    write_meta(w, 0x03, {t.text.begin(), t.text.end()});
    break;
  case smf::TokenType::InstrumentName:
    if (t.has_channel()) {
      write_meta(w, 0x20, {static_cast<std::uint8_t>(t.channel & 0x0F)});
      w.u8(0x00); // delta for the name that follows the prefix
    }
    write_meta(w, 0x04, {t.text.begin(), t.text.end()});
    break;
  case smf::TokenType::SetTempo:
    write_meta(w, 0x51,
               {static_cast<std::uint8_t>((t.value >> 16) & 0xFF),
                static_cast<std::uint8_t>((t.value >> 8) & 0xFF),
                static_cast<std::uint8_t>(t.value & 0xFF)});
    break;
  case smf::TokenType::TimeSignature:
    // 24 clocks per metronome click, 8 thirty-seconds per quarter
    write_meta(w, 0x58,
               {t.data1, log2_denominator(t.data2), 24, 8});
    break;
  }
}

std::vector<std::uint8_t> encode_track(std::vector<smf::TimedToken> events) {
  std::stable_sort(events.begin(), events.end(),
                   [](const smf::TimedToken &a, const smf::TimedToken &b) {
                     if (a.tick != b.tick)
                       return a.tick < b.tick;
                     return priority(a.token.type) < priority(b.token.type);
                   });

  ByteWriter body;
  std::uint32_t lastTick = 0;
  for (const auto &e : events) {
    body.vlq(e.tick - lastTick);
    lastTick = e.tick;
    write_event(body, e.token);
  }
  body.vlq(0);
  write_meta(body, 0x2F, {}); // End of Track
  return body.out;
}

} // namespace

namespace smf {

std::vector<std::uint8_t>
write_smf(unsigned ppqn, const std::vector<std::vector<TimedToken>> &tracks) {
  if (ppqn == 0 || ppqn > 0x7FFF) {
    throw std::invalid_argument("PPQ must be in 1..32767, got " +
                                std::to_string(ppqn));
  }
  if (tracks.size() > 0xFFFF) {
    throw std::invalid_argument("Too many tracks for a MIDI file");
  }

  ByteWriter w;
  w.be32(0x4D546864); // "MThd"
  w.be32(6);
  w.be16(1); // format 1: simultaneous tracks
  w.be16(static_cast<std::uint16_t>(tracks.size()));
  w.be16(static_cast<std::uint16_t>(ppqn));

  for (const auto &track : tracks) {
    const std::vector<std::uint8_t> body = encode_track(track);
    w.be32(0x4D54726B); // "MTrk"
    w.be32(static_cast<std::uint32_t>(body.size()));
    w.bytes(body);
  }
  return w.out;
}

} // namespace smf
