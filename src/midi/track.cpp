// src/midi/track.cpp

#include "midi/track.hpp"
#include "midi/names.hpp"

#include <algorithm>

namespace midi {

namespace {

constexpr int kPercussionChannel = 9;

} // namespace

Note &Track::add_note(int pitch, double time, std::optional<double> duration,
                      double velocity, std::optional<int> ch,
                      std::optional<int> program) {
  Note n;
  n.pitch = pitch;
  n.time = time;
  n.duration = duration;
  n.velocity = velocity;
  n.channel = ch;
  n.instrument = program;
  notes.push_back(n);
  return notes.back();
}

ControlChange &Track::add_control_change(ControllerId controller, double time,
                                         double value, std::optional<int> ch,
                                         std::optional<int> program) {
  ControlChange cc;
  cc.controller = controller;
  cc.time = time;
  cc.value = value;
  cc.channel = ch;
  cc.instrument = program;
  auto &list = controlChanges[controller];
  list.push_back(cc);
  return list.back();
}

void Track::scale(double ratio) {
  for (auto &n : notes) {
    n.time *= ratio;
    if (n.duration) {
      *n.duration *= ratio;
    }
  }
  for (auto &entry : controlChanges) {
    for (auto &cc : entry.second) {
      cc.time *= ratio;
    }
  }
}

Track Track::slice(double start, double end) const {
  Track out(name);
  out.id = id;
  out.channel = channel;
  out.instrument = instrument;

  for (const auto &n : notes) {
    if (n.time < start || n.time >= end) {
      continue;
    }
    Note clipped = n;
    if (clipped.duration) {
      clipped.duration = std::min(*clipped.duration, end - n.time);
    }
    out.notes.push_back(clipped);
  }

  for (const auto &entry : controlChanges) {
    for (const auto &cc : entry.second) {
      if (cc.time >= start && cc.time < end) {
        out.controlChanges[entry.first].push_back(cc);
      }
    }
  }
  return out;
}

double Track::start_time() const {
  if (notes.empty()) {
    return 0;
  }
  double t = notes.front().time;
  for (const auto &n : notes) {
    t = std::min(t, n.time);
  }
  return t;
}

double Track::end_time() const {
  double t = 0;
  for (const auto &n : notes) {
    t = std::max(t, n.end());
  }
  for (const auto &entry : controlChanges) {
    for (const auto &cc : entry.second) {
      t = std::max(t, cc.time);
    }
  }
  return t;
}

std::size_t Track::length() const {
  std::size_t n = notes.size();
  for (const auto &entry : controlChanges) {
    n += entry.second.size();
  }
  return n;
}

std::string Track::instrument_name() const {
  if (channel == kPercussionChannel) {
    return "drums";
  }
  return instrument ? gm_instrument_name(*instrument) : std::string();
}

std::string Track::instrument_family() const {
  if (channel == kPercussionChannel) {
    return "drums";
  }
  return instrument ? gm_instrument_family(*instrument) : std::string();
}

} // namespace midi
