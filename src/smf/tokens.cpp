// src/smf/tokens.cpp

#include "smf/tokens.hpp"

#include <algorithm>

namespace {

std::uint8_t clamp7(int v) {
  return static_cast<std::uint8_t>(std::clamp(v, 0, 127));
}

int clamp_channel(int ch) { return std::clamp(ch, 0, 15); }

} // namespace

namespace smf {

Token note_on(int ch, int note, int vel) {
  Token t;
  t.type = TokenType::NoteOn;
  t.channel = clamp_channel(ch);
  t.data1 = clamp7(note);
  t.data2 = clamp7(vel);
  return t;
}

Token note_off(int ch, int note, int vel) {
  Token t = note_on(ch, note, vel);
  t.type = TokenType::NoteOff;
  return t;
}

Token controller(int ch, int number, int value) {
  Token t;
  t.type = TokenType::Controller;
  t.channel = clamp_channel(ch);
  t.data1 = clamp7(number);
  t.data2 = clamp7(value);
  return t;
}

Token program_change(int ch, int program) {
  Token t;
  t.type = TokenType::ProgramChange;
  t.channel = clamp_channel(ch);
  t.data1 = clamp7(program);
  return t;
}

Token pitch_bend(int ch, std::uint32_t raw) {
  Token t;
  t.type = TokenType::PitchBend;
  t.channel = clamp_channel(ch);
  t.value = std::min<std::uint32_t>(raw, 0x3FFF);
  return t;
}

Token track_name(const std::string &name) {
  Token t;
  t.type = TokenType::TrackName;
  t.text = name;
  return t;
}

Token instrument_name(const std::string &name, int ch) {
  Token t;
  t.type = TokenType::InstrumentName;
  t.text = name;
  t.channel = ch < 0 ? -1 : clamp_channel(ch);
  return t;
}

Token set_tempo(std::uint32_t usPerQN) {
  Token t;
  t.type = TokenType::SetTempo;
  t.value = std::min<std::uint32_t>(usPerQN, 0xFFFFFF);
  return t;
}

Token time_signature(int numerator, int denominator) {
  Token t;
  t.type = TokenType::TimeSignature;
  t.data1 = static_cast<std::uint8_t>(std::clamp(numerator, 1, 255));
  t.data2 = static_cast<std::uint8_t>(std::clamp(denominator, 1, 128));
  return t;
}

} // namespace smf
