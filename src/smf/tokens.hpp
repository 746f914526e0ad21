// src/smf/tokens.hpp
// Token vocabulary shared by the SMF reader and writer.
// Keep this header light: plain structs, no implementation details.

#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace smf {

// --- Event kinds the codec produces and consumes ---
enum class TokenType {
  NoteOn,
  NoteOff,
  Controller,
  ProgramChange,
  PitchBend,
  TrackName,
  InstrumentName,
  SetTempo,
  TimeSignature
};

// One decoded event. Which fields are meaningful depends on `type`:
//   NoteOn/NoteOff : channel, data1 = note, data2 = velocity
//   Controller     : channel, data1 = controller number, data2 = value
//   ProgramChange  : channel, data1 = program
//   PitchBend      : channel, value = 14-bit raw (0..16383, 8192 = centre)
//   TrackName,
//   InstrumentName : text; channel = channel-prefix meta in effect, or -1
//   SetTempo       : value = microseconds per quarter note
//   TimeSignature  : data1 = numerator, data2 = denominator (not a power)
struct Token {
  std::uint32_t delta = 0; // ticks since the previous token in this track
  TokenType type = TokenType::NoteOn;
  int channel = -1; // 0..15, -1 for meta tokens without a prefix
  std::uint8_t data1 = 0;
  std::uint8_t data2 = 0;
  std::uint32_t value = 0;
  std::string text;

  [[nodiscard]] bool has_channel() const { return channel >= 0; }
};

// Parsed SMF header (subset we need)
struct SMFHeader {
  std::uint16_t format = 1;   // 0, 1, or 2
  std::uint16_t nTracks = 0;  // number of track chunks
  std::uint16_t division = 0; // raw division field

  bool isPPQN = true;  // true if PPQN timing, false if SMPTE
  unsigned ppqn = 480; // ticks per quarter; SMPTE files fall back to 480
  int smpte_fps = 0;   // valid when isPPQN == false
  int smpte_sub = 0;   // valid when isPPQN == false
};

// Whole file as the reader sees it: header + one token list per MTrk chunk.
struct RawFile {
  SMFHeader header;
  std::vector<std::vector<Token>> tracks;
};

// A token pinned to an absolute tick, as handed to the writer.
struct TimedToken {
  std::uint32_t tick = 0;
  Token token;
};

// --- Token constructors (delta left at 0) ---
Token note_on(int ch, int note, int vel);
Token note_off(int ch, int note, int vel = 0);
Token controller(int ch, int number, int value);
Token program_change(int ch, int program);
Token pitch_bend(int ch, std::uint32_t raw);
Token track_name(const std::string &name);
Token instrument_name(const std::string &name, int ch = -1);
Token set_tempo(std::uint32_t usPerQN);
Token time_signature(int numerator, int denominator);

} // namespace smf
