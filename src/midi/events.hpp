// src/midi/events.hpp
// Core MIDI domain types shared across the app.
// Keep this header light: plain structs, no implementation details.
// All times are seconds. Before the tempo warp they are *nominal* seconds
// (constant reference tempo); afterwards they are real elapsed seconds.

#pragma once
#include <optional>
#include <string>
#include <utility>

namespace midi {

inline constexpr unsigned kDefaultPpq = 480;
inline constexpr double kDefaultBpm = 120.0;
inline constexpr int kDefaultPitchBendRange = 2; // semitones

// Controller numbers are 0..127; pitch bend is filed beside them under a
// symbolic id outside the MIDI range.
using ControllerId = int;
inline constexpr ControllerId kPitchBend = 128;

// Placeholder programs for instrument names that are not General MIDI start
// here, above every real program number.
inline constexpr int kFirstPlaceholderInstrument = 128;

// Registered / non-registered parameter controllers. RPN 0 (MSB 0, LSB 0)
// is the pitch-bend range, set in semitones by the data-entry MSB.
inline constexpr int kDataEntryMsb = 6;
inline constexpr int kDataEntryLsb = 38;
inline constexpr int kNrpnLsb = 98;
inline constexpr int kNrpnMsb = 99;
inline constexpr int kRpnLsb = 100;
inline constexpr int kRpnMsb = 101;

// File-level information.
struct Header {
  std::optional<std::string> name;
  unsigned ppq = kDefaultPpq; // ticks per quarter note
  double bpm = kDefaultBpm;   // reference tempo of the nominal timeline
  std::pair<int, int> timeSignature{4, 4};
  int formatType = 1;
};

// A sounding note. `duration` stays unset until the matching note-off.
struct Note {
  int pitch = 60; // MIDI note number 0..127
  double time = 0;
  std::optional<double> duration;
  double velocity = 1; // 0..1
  std::optional<int> channel;
  std::optional<int> instrument;

  [[nodiscard]] double end() const { return time + duration.value_or(0.0); }
  // Scientific pitch name, e.g. "C4" for 60 (see names.hpp).
  [[nodiscard]] std::string name() const;
};

// A controller or pitch-bend value at a point in time.
// `value` is 0..1 for controllers and a signed semitone offset for pitch bend.
struct ControlChange {
  ControllerId controller = 0;
  double time = 0;
  double value = 0;
  std::optional<int> channel;
  std::optional<int> instrument;
};

// A tempo change on the nominal timeline.
struct TempoBreakpoint {
  double time = 0; // nominal seconds
  double bpm = kDefaultBpm;
};

// Knobs for the decode pipeline.
struct DecodeOptions {
  // Pitch-bend range in semitones until an RPN 0 data entry overrides it.
  int pitchBendRange = kDefaultPitchBendRange;
  // A controller whose value names the track program (e.g. a sequencer
  // specific "track program" controller). Unset: no controller does.
  std::optional<int> programController;
};

} // namespace midi
