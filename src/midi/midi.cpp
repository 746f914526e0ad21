// src/midi/midi.cpp
// Decode / encode pipeline and the whole-file operations of midi::Midi.

#include "midi/midi.hpp"
#include "io/io.hpp"
#include "midi/demux.hpp"
#include "midi/split.hpp"
#include "midi/tempo.hpp"
#include "midi/time.hpp"
#include "net/fetch.hpp"
#include "smf/smf.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

// File-level header: PPQ and format from MThd; the reference tempo from a
// set-tempo event at tick 0 (SMF default of 120 BPM otherwise); the time
// signature from the first time-signature event. Tracks are searched in file
// order.
midi::Header parse_header(const smf::RawFile &file) {
  midi::Header h;
  h.ppq = file.header.ppqn;
  h.formatType = file.header.format;

  bool haveTempo = false;
  bool haveTimeSignature = false;
  for (const auto &tokens : file.tracks) {
    std::uint64_t tick = 0;
    for (const auto &t : tokens) {
      tick += t.delta;
      if (t.type == smf::TokenType::SetTempo && !haveTempo && tick == 0 &&
          t.value > 0) {
        h.bpm = 60000000.0 / static_cast<double>(t.value);
        haveTempo = true;
      } else if (t.type == smf::TokenType::TimeSignature &&
                 !haveTimeSignature) {
        h.timeSignature = {t.data1, t.data2};
        haveTimeSignature = true;
      }
    }
  }
  return h;
}

std::uint8_t to_7bit(double unit) {
  return static_cast<std::uint8_t>(
      std::clamp<long>(std::lround(unit * 127.0), 0, 127));
}

std::uint32_t bend_to_raw(double semitones, int range) {
  if (range <= 0) {
    return 8192;
  }
  const double raw = semitones / range * 8192.0 + 8192.0;
  return static_cast<std::uint32_t>(
      std::clamp<long>(std::lround(raw), 0, 0x3FFF));
}

// Order of control changes that share a tick: parameter selects, then data
// entry, then other controllers, then pitch bend. RPN blocks read back in
// the order a decoder needs them.
int controller_rank(midi::ControllerId id) {
  switch (id) {
  case midi::kRpnMsb:
  case midi::kRpnLsb:
  case midi::kNrpnMsb:
  case midi::kNrpnLsb:
    return 0;
  case midi::kDataEntryMsb:
  case midi::kDataEntryLsb:
    return 1;
  case midi::kPitchBend:
    return 3;
  default:
    return 2;
  }
}

// Replays written controllers the way demux does, so every bend is encoded
// against the range a reader will apply to it.
class BendRanges {
public:
  int range(int ch) const {
    auto it = ranges_.find(ch);
    return it == ranges_.end() ? midi::kDefaultPitchBendRange : it->second;
  }

  // Last value written for a controller on `ch`, or `fallback`.
  int last(int ch, int number, int fallback) const {
    auto c = memory_.find(ch);
    if (c == memory_.end()) {
      return fallback;
    }
    auto it = c->second.find(number);
    return it == c->second.end() ? fallback : it->second;
  }

  void controller(int ch, int number, int raw) {
    auto &memory = memory_[ch];
    memory[number] = raw;
    if (number != midi::kDataEntryMsb) {
      return;
    }
    auto lsb = memory.find(midi::kRpnLsb);
    auto msb = memory.find(midi::kRpnMsb);
    const bool lsbClear = lsb == memory.end() || lsb->second == 0;
    if (lsbClear && msb != memory.end() && msb->second == 0) {
      ranges_[ch] = raw;
    }
  }

private:
  std::map<int, std::map<int, int>> memory_;
  std::map<int, int> ranges_;
};

void push_controller(std::vector<smf::TimedToken> &events, BendRanges &ranges,
                     std::uint32_t tick, int ch, int number, int raw) {
  ranges.controller(ch, number, raw);
  events.push_back({tick, smf::controller(ch, number, raw)});
}

// RPN 0 block setting the bend range of `ch`, followed by the previous
// parameter selection (127 = none) so later data entries mean what they did.
void push_bend_range(std::vector<smf::TimedToken> &events, BendRanges &ranges,
                     std::uint32_t tick, int ch, int semitones) {
  const int msb = ranges.last(ch, midi::kRpnMsb, 127);
  const int lsb = ranges.last(ch, midi::kRpnLsb, 127);
  push_controller(events, ranges, tick, ch, midi::kRpnMsb, 0);
  push_controller(events, ranges, tick, ch, midi::kRpnLsb, 0);
  push_controller(events, ranges, tick, ch, midi::kDataEntryMsb, semitones);
  push_controller(events, ranges, tick, ch, midi::kRpnMsb, msb);
  push_controller(events, ranges, tick, ch, midi::kRpnLsb, lsb);
}

std::vector<smf::TimedToken> encode_track(const midi::Track &track,
                                          const midi::Header &header) {
  std::vector<smf::TimedToken> events;
  if (track.name) {
    events.push_back({0, smf::track_name(*track.name)});
  }
  events.push_back({0, smf::set_tempo(static_cast<std::uint32_t>(
                           std::lround(60000000.0 / header.bpm)))});

  const int trackChannel = track.channel.value_or(0);
  if (track.instrument && *track.instrument >= 0 && *track.instrument < 128) {
    events.push_back({0, smf::program_change(trackChannel, *track.instrument)});
  }

  for (const auto &n : track.notes) {
    const int ch = n.channel.value_or(trackChannel);
    // velocity 0 would read back as a note-off
    const int vel = std::max<int>(1, to_7bit(n.velocity));
    events.push_back(
        {midi::seconds_to_ticks(n.time, header), smf::note_on(ch, n.pitch, vel)});
    if (n.duration) {
      events.push_back({midi::seconds_to_ticks(n.end(), header),
                        smf::note_off(ch, n.pitch)});
    }
  }

  // All controllers in one list, in the order they are written.
  struct Change {
    std::uint32_t tick;
    int channel;
    const midi::ControlChange *cc;
  };
  std::vector<Change> changes;
  std::map<int, double> widestBend; // channel -> largest |bend|
  for (const auto &entry : track.controlChanges) {
    for (const auto &cc : entry.second) {
      const int ch = cc.channel.value_or(trackChannel);
      changes.push_back({midi::seconds_to_ticks(cc.time, header), ch, &cc});
      if (entry.first == midi::kPitchBend) {
        widestBend[ch] = std::max(widestBend[ch], std::fabs(cc.value));
      }
    }
  }
  std::stable_sort(changes.begin(), changes.end(),
                   [](const Change &a, const Change &b) {
                     if (a.tick != b.tick)
                       return a.tick < b.tick;
                     return controller_rank(a.cc->controller) <
                            controller_rank(b.cc->controller);
                   });

  BendRanges ranges;
  for (const auto &c : changes) {
    if (c.cc->controller != midi::kPitchBend) {
      push_controller(events, ranges, c.tick, c.channel, c.cc->controller,
                      to_7bit(c.cc->value));
      continue;
    }
    if (std::fabs(c.cc->value) > ranges.range(c.channel)) {
      const int wanted = static_cast<int>(std::clamp<double>(
          std::ceil(widestBend[c.channel]), midi::kDefaultPitchBendRange, 127));
      push_bend_range(events, ranges, c.tick, c.channel, wanted);
    }
    events.push_back(
        {c.tick, smf::pitch_bend(c.channel, bend_to_raw(c.cc->value,
                                                        ranges.range(c.channel)))});
  }
  return events;
}

} // namespace

namespace midi {

Midi Midi::decode(const std::vector<std::uint8_t> &bytes,
                  const DecodeOptions &options) {
  const smf::RawFile file = smf::read_smf(bytes);

  Midi midi;
  midi.header = parse_header(file);

  // Stage 1: nominal timeline, tempo curve collected along the way.
  TempoCurve tempo;
  std::vector<Track> rawTracks;
  rawTracks.reserve(file.tracks.size());
  for (const auto &tokens : file.tracks) {
    DemuxResult r = demux_track(tokens, midi.header, options, tempo);
    // A name-only track is taken to be the title of the file.
    if (!midi.header.name && r.track.length() == 0 && r.track.name &&
        !r.track.name->empty()) {
      midi.header.name = r.track.name;
    }
    rawTracks.push_back(std::move(r.track));
  }

  int nextId = 0;
  for (const auto &raw : rawTracks) {
    std::vector<Track> parts = split_track(raw, nextId);
    nextId += static_cast<int>(parts.size());
    for (auto &t : parts) {
      midi.tracks.push_back(std::move(t));
    }
  }

  // Stage 2: real time.
  apply_tempo_changes(midi.tracks, tempo, midi.header.bpm);
  return midi;
}

Midi Midi::load_file(const std::filesystem::path &path,
                     const DecodeOptions &options) {
  return decode(io::read_all(path), options);
}

Midi Midi::load_url(const std::string &url, const DecodeOptions &options) {
  return decode(net::fetch(url), options);
}

std::vector<std::uint8_t> Midi::encode() const {
  std::vector<const Track *> ordered;
  ordered.reserve(tracks.size());
  for (const auto &t : tracks) {
    ordered.push_back(&t);
  }
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const Track *a, const Track *b) { return a->id < b->id; });

  std::vector<std::vector<smf::TimedToken>> out;

  const Track *firstEmpty = nullptr;
  for (const Track *t : ordered) {
    if (t->length() == 0) {
      firstEmpty = t;
      break;
    }
  }
  if (header.name && !(firstEmpty && firstEmpty->name == header.name)) {
    std::vector<smf::TimedToken> title;
    title.push_back({0, smf::track_name(*header.name)});
    out.push_back(std::move(title));
  }

  for (const Track *t : ordered) {
    out.push_back(encode_track(*t, header));
  }

  if (out.empty()) {
    out.emplace_back();
  }
  out.front().push_back({0, smf::time_signature(header.timeSignature.first,
                                                header.timeSignature.second)});

  return smf::write_smf(header.ppq, out);
}

Midi Midi::slice(double start, double end) const {
  Midi m;
  m.header = header;
  m.tracks.reserve(tracks.size());
  for (const auto &t : tracks) {
    m.tracks.push_back(t.slice(start, end));
  }
  return m;
}

Track &Midi::add_track(const std::optional<std::string> &name) {
  Track t(name);
  t.id = static_cast<int>(tracks.size());
  tracks.push_back(std::move(t));
  return tracks.back();
}

Track *Midi::find_track(std::size_t index) {
  return index < tracks.size() ? &tracks[index] : nullptr;
}

Track *Midi::find_track(const std::string &name) {
  for (auto &t : tracks) {
    if (t.name == name) {
      return &t;
    }
  }
  return nullptr;
}

const Track *Midi::find_track(std::size_t index) const {
  return index < tracks.size() ? &tracks[index] : nullptr;
}

const Track *Midi::find_track(const std::string &name) const {
  for (const auto &t : tracks) {
    if (t.name == name) {
      return &t;
    }
  }
  return nullptr;
}

void Midi::set_bpm(double bpm) {
  if (!(bpm > 0)) {
    throw std::invalid_argument("BPM must be positive, got " +
                                std::to_string(bpm));
  }
  const double ratio = header.bpm / bpm;
  header.bpm = bpm;
  for (auto &t : tracks) {
    t.scale(ratio);
  }
}

double Midi::start_time() const {
  bool any = false;
  double t = 0;
  for (const auto &track : tracks) {
    if (track.notes.empty()) {
      continue;
    }
    t = any ? std::min(t, track.start_time()) : track.start_time();
    any = true;
  }
  return t;
}

double Midi::duration() const {
  double d = 0;
  for (const auto &track : tracks) {
    d = std::max(d, track.end_time());
  }
  return d;
}

} // namespace midi
