// src/midi/track.hpp
// One output track: notes and control changes for a single
// (channel, instrument) pair once decoding is finished.

#pragma once
#include "midi/events.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace midi {

struct Track {
  int id = 0;
  std::optional<std::string> name;
  std::optional<int> channel;    // 0..15
  std::optional<int> instrument; // program number (or placeholder)
  std::vector<Note> notes;       // in discovery order
  std::map<ControllerId, std::vector<ControlChange>> controlChanges;

  Track() = default;
  explicit Track(std::optional<std::string> trackName)
      : name(std::move(trackName)) {}

  // Append a note. Returns a reference that is valid until the next append.
  Note &add_note(int pitch, double time, std::optional<double> duration,
                 double velocity, std::optional<int> ch = std::nullopt,
                 std::optional<int> program = std::nullopt);

  // Append a control change to its controller's list.
  ControlChange &add_control_change(ControllerId controller, double time,
                                    double value,
                                    std::optional<int> ch = std::nullopt,
                                    std::optional<int> program = std::nullopt);

  // Multiply every time and duration by `ratio`.
  void scale(double ratio);

  // Copy with the notes starting in [start, end) (durations clipped to end)
  // and the control changes in [start, end). Times are kept as they are.
  [[nodiscard]] Track slice(double start, double end) const;

  // Start of the first note, 0 if there are none.
  [[nodiscard]] double start_time() const;
  // Latest note end or control change time, 0 if empty.
  [[nodiscard]] double end_time() const;
  // Number of notes plus control changes.
  [[nodiscard]] std::size_t length() const;

  // General MIDI name / family of the track program ("" when unknown).
  [[nodiscard]] std::string instrument_name() const;
  [[nodiscard]] std::string instrument_family() const;
};

} // namespace midi
