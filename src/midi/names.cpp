// src/midi/names.cpp

#include "midi/names.hpp"
#include "midi/events.hpp"

#include <array>
#include <cctype>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace {

const std::array<const char *, 128> kInstruments = {
    // piano
    "acoustic grand piano", "bright acoustic piano", "electric grand piano",
    "honky-tonk piano", "electric piano 1", "electric piano 2", "harpsichord",
    "clavi",
    // chromatic percussion
    "celesta", "glockenspiel", "music box", "vibraphone", "marimba",
    "xylophone", "tubular bells", "dulcimer",
    // organ
    "drawbar organ", "percussive organ", "rock organ", "church organ",
    "reed organ", "accordion", "harmonica", "tango accordion",
    // guitar
    "acoustic guitar (nylon)", "acoustic guitar (steel)",
    "electric guitar (jazz)", "electric guitar (clean)",
    "electric guitar (muted)", "overdriven guitar", "distortion guitar",
    "guitar harmonics",
    // bass
    "acoustic bass", "electric bass (finger)", "electric bass (pick)",
    "fretless bass", "slap bass 1", "slap bass 2", "synth bass 1",
    "synth bass 2",
    // strings
    "violin", "viola", "cello", "contrabass", "tremolo strings",
    "pizzicato strings", "orchestral harp", "timpani",
    // ensemble
    "string ensemble 1", "string ensemble 2", "synthstrings 1",
    "synthstrings 2", "choir aahs", "voice oohs", "synth voice",
    "orchestra hit",
    // brass
    "trumpet", "trombone", "tuba", "muted trumpet", "french horn",
    "brass section", "synthbrass 1", "synthbrass 2",
    // reed
    "soprano sax", "alto sax", "tenor sax", "baritone sax", "oboe",
    "english horn", "bassoon", "clarinet",
    // pipe
    "piccolo", "flute", "recorder", "pan flute", "blown bottle",
    "shakuhachi", "whistle", "ocarina",
    // synth lead
    "lead 1 (square)", "lead 2 (sawtooth)", "lead 3 (calliope)",
    "lead 4 (chiff)", "lead 5 (charang)", "lead 6 (voice)",
    "lead 7 (fifths)", "lead 8 (bass + lead)",
    // synth pad
    "pad 1 (new age)", "pad 2 (warm)", "pad 3 (polysynth)", "pad 4 (choir)",
    "pad 5 (bowed)", "pad 6 (metallic)", "pad 7 (halo)", "pad 8 (sweep)",
    // synth effects
    "fx 1 (rain)", "fx 2 (soundtrack)", "fx 3 (crystal)",
    "fx 4 (atmosphere)", "fx 5 (brightness)", "fx 6 (goblins)",
    "fx 7 (echoes)", "fx 8 (sci-fi)",
    // ethnic
    "sitar", "banjo", "shamisen", "koto", "kalimba", "bag pipe", "fiddle",
    "shanai",
    // percussive
    "tinkle bell", "agogo", "steel drums", "woodblock", "taiko drum",
    "melodic tom", "synth drum", "reverse cymbal",
    // sound effects
    "guitar fret noise", "breath noise", "seashore", "bird tweet",
    "telephone ring", "helicopter", "applause", "gunshot"};

const std::array<const char *, 16> kFamilies = {
    "piano",     "chromatic percussion", "organ",      "guitar",
    "bass",      "strings",              "ensemble",   "brass",
    "reed",      "pipe",                 "synth lead", "synth pad",
    "synth effects", "ethnic",           "percussive", "sound effects"};

const std::array<const char *, 12> kPitchClasses = {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};

// Lower-case alphanumerics and punctuation other than separators.
std::string fold(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    if (c == ' ' || c == '_' || c == '-') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

} // namespace

namespace midi {

std::string gm_instrument_name(int program) {
  if (program < 0 || program >= static_cast<int>(kInstruments.size())) {
    return {};
  }
  return kInstruments[static_cast<std::size_t>(program)];
}

std::string gm_instrument_family(int program) {
  if (program < 0 || program >= static_cast<int>(kInstruments.size())) {
    return {};
  }
  return kFamilies[static_cast<std::size_t>(program / 8)];
}

std::optional<int> gm_program_from_name(const std::string &name) {
  const std::string key = fold(name);
  if (key.empty()) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < kInstruments.size(); ++i) {
    if (fold(kInstruments[i]) == key) {
      return static_cast<int>(i);
    }
  }
  return std::nullopt;
}

std::string note_name(int pitch) {
  if (pitch < 0 || pitch > 127) {
    return {};
  }
  const int octave = pitch / 12 - 1;
  return std::string(kPitchClasses[static_cast<std::size_t>(pitch % 12)]) +
         std::to_string(octave);
}

std::string Note::name() const { return note_name(pitch); }

std::optional<int> pitch_from_name(const std::string &name) {
  if (name.empty()) {
    return std::nullopt;
  }

  static const int kBase[7] = {9, 11, 0, 2, 4, 5, 7}; // A..G
  const char letter = static_cast<char>(std::toupper(
      static_cast<unsigned char>(name[0])));
  if (letter < 'A' || letter > 'G') {
    return std::nullopt;
  }
  int pc = kBase[letter - 'A'];

  std::size_t i = 1;
  while (i < name.size() && (name[i] == '#' || name[i] == 'b')) {
    pc += name[i] == '#' ? 1 : -1;
    ++i;
  }

  const std::string octaveText = name.substr(i);
  if (octaveText.empty()) {
    return std::nullopt;
  }
  std::size_t used = 0;
  int octave = 0;
  try {
    octave = std::stoi(octaveText, &used);
  } catch (const std::exception &) {
    return std::nullopt;
  }
  if (used != octaveText.size() || octave < -1 || octave > 9) {
    return std::nullopt;
  }

  const int pitch = (octave + 1) * 12 + pc;
  if (pitch < 0 || pitch > 127) {
    return std::nullopt;
  }
  return pitch;
}

std::string clean_name(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (unsigned char c : raw) {
    if (c < 0x20 || c == 0x7F) {
      continue;
    }
    out.push_back(static_cast<char>(c));
  }
  const auto first = out.find_first_not_of(' ');
  if (first == std::string::npos) {
    return {};
  }
  const auto last = out.find_last_not_of(' ');
  return out.substr(first, last - first + 1);
}

} // namespace midi
