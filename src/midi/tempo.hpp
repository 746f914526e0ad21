// src/midi/tempo.hpp
// Tempo curve and the warp from nominal to real time.
//
// Contract:
//  - TempoCurve collects breakpoints discovered while demuxing raw tracks.
//    Tracks are scanned one after another, so discovery order is not time
//    order; insert() keeps the list sorted anyway.
//  - warp_notes / warp_control_changes turn nominal times (reference tempo
//    assumed throughout) into real elapsed seconds. They return new
//    collections and leave their input untouched.
//  - apply_tempo_changes runs the warp over every list of every track.

#pragma once
#include "midi/events.hpp"
#include "midi/track.hpp"

#include <cstddef>
#include <vector>

namespace midi {

class TempoCurve {
public:
  // Insert after every breakpoint whose time is <= bp.time.
  void insert(const TempoBreakpoint &bp);

  [[nodiscard]] bool empty() const { return points_.empty(); }
  [[nodiscard]] std::size_t size() const { return points_.size(); }
  [[nodiscard]] const TempoBreakpoint &operator[](std::size_t i) const {
    return points_[i];
  }
  [[nodiscard]] const std::vector<TempoBreakpoint> &points() const {
    return points_;
  }

private:
  std::vector<TempoBreakpoint> points_; // non-decreasing by time
};

// Warp a note list. Notes are ordered by nominal time first (stable), then
// each start is mapped piecewise-linearly and each duration is scaled by the
// speed of the segment the note starts in.
std::vector<Note> warp_notes(const std::vector<Note> &notes,
                             const TempoCurve &curve, double referenceBpm);

// Same scan for one controller's change list (no durations).
std::vector<ControlChange>
warp_control_changes(const std::vector<ControlChange> &changes,
                     const TempoCurve &curve, double referenceBpm);

// Rewrite every note and control change of every track. No-op when the
// curve is empty.
void apply_tempo_changes(std::vector<Track> &tracks, const TempoCurve &curve,
                         double referenceBpm);

} // namespace midi
