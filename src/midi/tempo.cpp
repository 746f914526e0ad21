// src/midi/tempo.cpp
// Implementation of the tempo curve and the tempo warp.

#include "midi/tempo.hpp"

#include <algorithm>
#include <vector>

namespace {

void scale_duration(midi::Note &n, double speed) {
  if (n.duration) {
    *n.duration *= speed;
  }
}

void scale_duration(midi::ControlChange &, double) {}

// Left-to-right scan shared by notes and control changes.
//
// `speed` is reference BPM / segment BPM: one nominal second inside the
// segment lasts `speed` real seconds. `newTime` is the real time at which
// the current segment starts. The stretch before the first breakpoint runs
// at the reference tempo, so the first segment starts at the same real and
// nominal time.
template <typename T>
std::vector<T> warp(const std::vector<T> &in, const midi::TempoCurve &curve,
                    double referenceBpm) {
  std::vector<T> out = in;
  if (curve.empty() || out.empty()) {
    return out;
  }

  // The index below only moves forward, so elements must come in time order.
  std::stable_sort(out.begin(), out.end(),
                   [](const T &a, const T &b) { return a.time < b.time; });

  double oldTime = curve[0].time;
  double newTime = curve[0].time;
  std::size_t index = 0;
  double speed = 1;

  for (auto &element : out) {
    if (element.time < curve[0].time) {
      continue; // before any tempo change: nominal time is real time
    }
    oldTime = curve[index].time;
    speed = referenceBpm / curve[index].bpm;

    while (index + 1 < curve.size() && element.time >= curve[index + 1].time) {
      newTime += (curve[index + 1].time - oldTime) * speed;
      ++index;
      oldTime = curve[index].time;
      speed = referenceBpm / curve[index].bpm;
    }

    element.time = (element.time - oldTime) * speed + newTime;
    scale_duration(element, speed);
  }
  return out;
}

} // namespace

namespace midi {

void TempoCurve::insert(const TempoBreakpoint &bp) {
  auto pos = std::upper_bound(points_.begin(), points_.end(), bp.time,
                              [](double t, const TempoBreakpoint &p) {
                                return t < p.time;
                              });
  points_.insert(pos, bp);
}

std::vector<Note> warp_notes(const std::vector<Note> &notes,
                             const TempoCurve &curve, double referenceBpm) {
  return warp(notes, curve, referenceBpm);
}

std::vector<ControlChange>
warp_control_changes(const std::vector<ControlChange> &changes,
                     const TempoCurve &curve, double referenceBpm) {
  return warp(changes, curve, referenceBpm);
}

void apply_tempo_changes(std::vector<Track> &tracks, const TempoCurve &curve,
                         double referenceBpm) {
  if (curve.empty()) {
    return;
  }
  for (auto &track : tracks) {
    track.notes = warp_notes(track.notes, curve, referenceBpm);
    for (auto &entry : track.controlChanges) {
      entry.second = warp_control_changes(entry.second, curve, referenceBpm);
    }
  }
}

} // namespace midi
