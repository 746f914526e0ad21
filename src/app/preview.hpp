// src/app/preview.hpp
// Pretty, compact console preview of a decoded song.
// - Prints header summary
// - Prints one line per track, then the first 10 notes with real timestamps

#pragma once
#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <ostream>
#include <string>

#include "midi/midi.hpp"

namespace app {

inline void print_preview(std::ostream &os, const midi::Midi &song) {
  const midi::Header &h = song.header;

  // Header
  os << "MIDI header:\n";
  os << "  name     = " << h.name.value_or("(none)") << "\n";
  os << "  format   = " << h.formatType << "\n";
  os << "  PPQ      = " << h.ppq << " ticks/qn\n";
  os << "  bpm      = " << std::fixed << std::setprecision(2) << h.bpm << "\n";
  os << "  time sig = " << h.timeSignature.first << "/"
     << h.timeSignature.second << "\n";
  os << "  start    = " << std::setprecision(3) << song.start_time() << "s\n";
  os << "  duration = " << song.duration() << "s\n";

  // Tracks
  os << "\nTracks (" << song.tracks.size() << "):\n";
  for (const auto &t : song.tracks) {
    os << "  #" << t.id << " ch=";
    if (t.channel) {
      os << *t.channel;
    } else {
      os << "-";
    }
    os << " notes=" << t.notes.size()
       << " controls=" << (t.length() - t.notes.size());
    const std::string instrument = t.instrument_name();
    if (!instrument.empty()) {
      os << " [" << instrument << "]";
    }
    if (t.name) {
      os << " \"" << *t.name << "\"";
    }
    os << "\n";
  }

  // First 10 notes of the first track that has any
  for (const auto &t : song.tracks) {
    if (t.notes.empty()) {
      continue;
    }
    os << "\nFirst notes of track #" << t.id << ":\n";
    const std::size_t limit = std::min<std::size_t>(10, t.notes.size());
    for (std::size_t i = 0; i < limit; ++i) {
      const auto &n = t.notes[i];
      os << "t=" << std::fixed << std::setprecision(3) << n.time << "s  "
         << std::setw(4) << std::left << n.name() << std::right
         << " dur=";
      if (n.duration) {
        os << *n.duration << "s";
      } else {
        os << "open";
      }
      os << " vel=" << std::setprecision(2) << n.velocity << "\n";
    }
    break;
  }
}

} // namespace app
