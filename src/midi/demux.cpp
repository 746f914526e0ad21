// src/midi/demux.cpp
// Token-by-token assembly of notes and control changes for one raw track.

#include "midi/demux.hpp"
#include "midi/names.hpp"
#include "midi/time.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace {

// Everything that lives for the duration of one raw track scan.
class TrackScanner {
public:
  TrackScanner(const midi::Header &header, const midi::DecodeOptions &options,
               midi::TempoCurve &tempo)
      : header_(header), options_(options), tempo_(tempo) {}

  void feed(const smf::Token &t) {
    ticks_ += t.delta;
    const double now = midi::ticks_to_seconds(static_cast<double>(ticks_),
                                              header_);

    if (t.has_channel() && !out_.track.channel) {
      out_.track.channel = t.channel;
    }

    switch (t.type) {
    case smf::TokenType::TrackName:
      out_.track.name = midi::clean_name(t.text);
      break;
    case smf::TokenType::NoteOn:
      note_on(t, now);
      break;
    case smf::TokenType::NoteOff:
      note_off(t, now);
      break;
    case smf::TokenType::Controller:
      control_change(t, now);
      break;
    case smf::TokenType::InstrumentName:
      instrument_name(t);
      break;
    case smf::TokenType::ProgramChange:
      channel_ = t.channel;
      assign_track_instrument(t.data1);
      channelInstruments_[t.channel] = t.data1;
      break;
    case smf::TokenType::PitchBend:
      pitch_bend(t, now);
      break;
    case smf::TokenType::SetTempo:
      if (t.value > 0) {
        const double bpm = 60.0 / (static_cast<double>(t.value) / 1000000.0);
        tempo_.insert(midi::TempoBreakpoint{now, bpm});
      }
      break;
    case smf::TokenType::TimeSignature:
      break; // header-level, read by Midi::decode
    }
  }

  midi::DemuxResult finish() { return std::move(out_); }

private:
  std::optional<int> instrument_for(int ch) const {
    auto it = channelInstruments_.find(ch);
    if (it == channelInstruments_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void assign_track_instrument(int program) {
    if (!out_.track.instrument) {
      out_.track.instrument = program;
    }
  }

  void note_on(const smf::Token &t, double now) {
    channel_ = t.channel;
    out_.track.add_note(t.data1, now, std::nullopt, t.data2 / 127.0,
                        t.channel, instrument_for(t.channel));
    pending_[{t.data1, t.channel}].push_back(out_.track.notes.size() - 1);
  }

  void note_off(const smf::Token &t, double now) {
    auto it = pending_.find({t.data1, t.channel});
    if (it == pending_.end() || it->second.empty()) {
      ++out_.unmatchedNoteOffs;
      return;
    }
    midi::Note &note = out_.track.notes[it->second.front()];
    it->second.pop_front();
    note.duration = now - note.time;
  }

  void control_change(const smf::Token &t, double now) {
    const int number = t.data1;
    auto &memory = channelControllers_[t.channel];
    memory[number] = t.data2;

    channel_ = t.channel;
    out_.track.add_control_change(number, now, t.data2 / 127.0, t.channel,
                                  instrument_for(t.channel));

    if (number == midi::kDataEntryMsb) {
      auto lsb = memory.find(midi::kRpnLsb);
      auto msb = memory.find(midi::kRpnMsb);
      const bool lsbClear = lsb == memory.end() || lsb->second == 0;
      if (lsbClear && msb != memory.end() && msb->second == 0) {
        bendRange_[t.channel] = t.data2;
      }
    }

    if (options_.programController && *options_.programController == number) {
      assign_track_instrument(t.data2);
    }
  }

  void instrument_name(const smf::Token &t) {
    if (t.has_channel()) {
      channel_ = t.channel;
    }
    const std::string name = midi::clean_name(t.text);
    int program = 0;
    if (auto gm = midi::gm_program_from_name(name)) {
      program = *gm;
    } else {
      auto it = placeholders_.find(name);
      if (it == placeholders_.end()) {
        it = placeholders_
                 .emplace(name, midi::kFirstPlaceholderInstrument +
                                    static_cast<int>(placeholders_.size()))
                 .first;
      }
      program = it->second;
    }
    assign_track_instrument(program);
    if (channel_) {
      channelInstruments_[*channel_] = program;
    }
  }

  void pitch_bend(const smf::Token &t, double now) {
    channel_ = t.channel;
    auto it = bendRange_.find(t.channel);
    const int range =
        it == bendRange_.end() ? options_.pitchBendRange : it->second;
    const double value =
        range * (static_cast<double>(t.value) - 8192.0) / 8192.0;
    out_.track.add_control_change(midi::kPitchBend, now, value, t.channel,
                                  instrument_for(t.channel));
  }

  const midi::Header &header_;
  const midi::DecodeOptions &options_;
  midi::TempoCurve &tempo_;

  midi::DemuxResult out_;
  std::uint64_t ticks_ = 0;
  std::optional<int> channel_; // channel of the latest channel event
  std::map<int, int> channelInstruments_;
  std::map<int, std::map<int, int>> channelControllers_;
  std::map<int, int> bendRange_;
  std::map<std::pair<int, int>, std::deque<std::size_t>> pending_;
  std::map<std::string, int> placeholders_;
};

} // namespace

namespace midi {

DemuxResult demux_track(const std::vector<smf::Token> &tokens,
                        const Header &header, const DecodeOptions &options,
                        TempoCurve &tempo) {
  TrackScanner scanner(header, options, tempo);
  for (const auto &t : tokens) {
    scanner.feed(t);
  }
  return scanner.finish();
}

} // namespace midi
