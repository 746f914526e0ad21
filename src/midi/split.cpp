// src/midi/split.cpp

#include "midi/split.hpp"

#include <map>
#include <utility>

namespace midi {

int resolve_channel(std::optional<int> own, const Track &raw) {
  if (own) {
    return *own;
  }
  return raw.channel.value_or(0);
}

int resolve_instrument(std::optional<int> own, const Track &raw) {
  if (own) {
    return *own;
  }
  // Drum tracks often never send a program change; they land on 0.
  return raw.instrument.value_or(0);
}

std::vector<Track> split_track(const Track &raw, int firstId) {
  // channel -> instrument -> track; std::map keeps both levels ascending
  std::map<int, std::map<int, Track>> groups;

  auto subtrack = [&](int ch, int program) -> Track & {
    auto &byInstrument = groups[ch];
    auto it = byInstrument.find(program);
    if (it == byInstrument.end()) {
      Track t(raw.name);
      t.channel = ch;
      t.instrument = program;
      it = byInstrument.emplace(program, std::move(t)).first;
    }
    return it->second;
  };

  for (const auto &note : raw.notes) {
    Note n = note;
    n.channel = resolve_channel(note.channel, raw);
    n.instrument = resolve_instrument(note.instrument, raw);
    subtrack(*n.channel, *n.instrument).notes.push_back(n);
  }

  for (const auto &entry : raw.controlChanges) {
    for (const auto &change : entry.second) {
      ControlChange cc = change;
      cc.channel = resolve_channel(change.channel, raw);
      cc.instrument = resolve_instrument(change.instrument, raw);
      subtrack(*cc.channel, *cc.instrument)
          .controlChanges[entry.first]
          .push_back(cc);
    }
  }

  std::vector<Track> out;
  int id = firstId;
  for (auto &channelTracks : groups) {
    for (auto &entry : channelTracks.second) {
      entry.second.id = id++;
      out.push_back(std::move(entry.second));
    }
  }
  return out;
}

} // namespace midi
