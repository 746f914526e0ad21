// tests/test_demux.cpp

#include "midi/demux.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

namespace {

smf::Token after(std::uint32_t delta, smf::Token t) {
  t.delta = delta;
  return t;
}

midi::Header header_480_120() {
  midi::Header h;
  h.ppq = 480;
  h.bpm = 120;
  return h;
}

midi::DemuxResult run(const std::vector<smf::Token> &tokens,
                      midi::TempoCurve &curve,
                      const midi::DecodeOptions &options = {}) {
  return midi::demux_track(tokens, header_480_120(), options, curve);
}

midi::DemuxResult run(const std::vector<smf::Token> &tokens) {
  midi::TempoCurve curve;
  return run(tokens, curve);
}

} // namespace

TEST(Demux, NotesGetNominalTimesAndDurations) {
  const auto r = run({after(480, smf::note_on(0, 60, 127)),
                      after(240, smf::note_off(0, 60))});
  ASSERT_EQ(r.track.notes.size(), 1u);
  const midi::Note &n = r.track.notes[0];
  EXPECT_EQ(n.pitch, 60);
  EXPECT_DOUBLE_EQ(n.time, 0.5);
  ASSERT_TRUE(n.duration.has_value());
  EXPECT_DOUBLE_EQ(*n.duration, 0.25);
  EXPECT_DOUBLE_EQ(n.velocity, 1.0);
  EXPECT_EQ(n.channel, 0);
  EXPECT_FALSE(n.instrument.has_value());
}

TEST(Demux, SecondNoteOffForTheSamePitchIsIgnored) {
  const auto r = run({after(0, smf::note_on(0, 60, 64)),
                      after(480, smf::note_off(0, 60)),
                      after(480, smf::note_off(0, 60))});
  ASSERT_EQ(r.track.notes.size(), 1u);
  ASSERT_TRUE(r.track.notes[0].duration.has_value());
  EXPECT_DOUBLE_EQ(*r.track.notes[0].duration, 0.5);
  EXPECT_EQ(r.unmatchedNoteOffs, 1u);
}

TEST(Demux, NoteOffOnAnotherChannelDoesNotCloseTheNote) {
  const auto r = run({after(0, smf::note_on(0, 60, 64)),
                      after(480, smf::note_off(1, 60))});
  ASSERT_EQ(r.track.notes.size(), 1u);
  EXPECT_FALSE(r.track.notes[0].duration.has_value());
  EXPECT_EQ(r.unmatchedNoteOffs, 1u);
}

TEST(Demux, OverlappingNotesOfOnePitchPairFirstInFirstOut) {
  const auto r = run({after(0, smf::note_on(0, 60, 64)),
                      after(480, smf::note_on(0, 60, 64)),
                      after(480, smf::note_off(0, 60)),
                      after(480, smf::note_off(0, 60))});
  ASSERT_EQ(r.track.notes.size(), 2u);
  EXPECT_DOUBLE_EQ(*r.track.notes[0].duration, 1.0);
  EXPECT_DOUBLE_EQ(*r.track.notes[1].duration, 1.0);
  EXPECT_EQ(r.unmatchedNoteOffs, 0u);
}

TEST(Demux, TrackChannelIsTheFirstChannelSeen) {
  const auto r = run({after(0, smf::controller(4, 7, 100)),
                      after(0, smf::note_on(2, 60, 64))});
  EXPECT_EQ(r.track.channel, 4);
  EXPECT_EQ(r.track.notes[0].channel, 2);
}

TEST(Demux, ProgramChangeSetsTrackAndChannelInstrument) {
  const auto r = run({after(0, smf::note_on(0, 60, 64)),
                      after(0, smf::program_change(0, 33)),
                      after(0, smf::note_on(0, 62, 64)),
                      after(0, smf::program_change(0, 34)),
                      after(0, smf::note_on(0, 64, 64))});
  EXPECT_EQ(r.track.instrument, 33);
  ASSERT_EQ(r.track.notes.size(), 3u);
  EXPECT_FALSE(r.track.notes[0].instrument.has_value());
  EXPECT_EQ(r.track.notes[1].instrument, 33);
  EXPECT_EQ(r.track.notes[2].instrument, 34);
}

TEST(Demux, ControllerValuesAreNormalized) {
  const auto r = run({after(960, smf::controller(0, 64, 127)),
                      after(0, smf::controller(0, 7, 0))});
  ASSERT_EQ(r.track.controlChanges.count(64), 1u);
  const midi::ControlChange &sustain = r.track.controlChanges.at(64)[0];
  EXPECT_DOUBLE_EQ(sustain.value, 1.0);
  EXPECT_DOUBLE_EQ(sustain.time, 1.0);
  EXPECT_DOUBLE_EQ(r.track.controlChanges.at(7)[0].value, 0.0);
}

TEST(Demux, PitchBendUsesTheDefaultRange) {
  const auto r = run({after(0, smf::pitch_bend(0, 0)),
                      after(0, smf::pitch_bend(0, 8192)),
                      after(0, smf::pitch_bend(0, 12288))});
  const auto &bends = r.track.controlChanges.at(midi::kPitchBend);
  ASSERT_EQ(bends.size(), 3u);
  EXPECT_DOUBLE_EQ(bends[0].value, -2.0);
  EXPECT_DOUBLE_EQ(bends[1].value, 0.0);
  EXPECT_DOUBLE_EQ(bends[2].value, 1.0);
}

TEST(Demux, RpnDataEntrySetsThePitchBendRange) {
  const auto r = run({after(0, smf::controller(1, 101, 0)),
                      after(0, smf::controller(1, 100, 0)),
                      after(0, smf::controller(1, 6, 12)),
                      after(0, smf::pitch_bend(1, 0)),
                      after(0, smf::pitch_bend(0, 0))});
  const auto &bends = r.track.controlChanges.at(midi::kPitchBend);
  EXPECT_DOUBLE_EQ(bends[0].value, -12.0);
  EXPECT_DOUBLE_EQ(bends[1].value, -2.0); // other channel keeps the default
}

TEST(Demux, DataEntryForAnotherParameterLeavesTheRangeAlone) {
  const auto r = run({after(0, smf::controller(0, 101, 0)),
                      after(0, smf::controller(0, 100, 1)), // fine tuning
                      after(0, smf::controller(0, 6, 12)),
                      after(0, smf::pitch_bend(0, 0))});
  EXPECT_DOUBLE_EQ(r.track.controlChanges.at(midi::kPitchBend)[0].value, -2.0);
}

TEST(Demux, DefaultBendRangeComesFromOptions) {
  midi::TempoCurve curve;
  midi::DecodeOptions options;
  options.pitchBendRange = 12;
  const auto r = run({after(0, smf::pitch_bend(0, 0))}, curve, options);
  EXPECT_DOUBLE_EQ(r.track.controlChanges.at(midi::kPitchBend)[0].value, -12.0);
}

TEST(Demux, TempoEventsGoIntoTheCurveAtNominalTime) {
  midi::TempoCurve curve;
  run({after(0, smf::set_tempo(500000)), after(480, smf::set_tempo(1000000))},
      curve);
  ASSERT_EQ(curve.size(), 2u);
  EXPECT_DOUBLE_EQ(curve[0].time, 0.0);
  EXPECT_DOUBLE_EQ(curve[0].bpm, 120.0);
  EXPECT_DOUBLE_EQ(curve[1].time, 0.5);
  EXPECT_DOUBLE_EQ(curve[1].bpm, 60.0);
}

TEST(Demux, GeneralMidiInstrumentNameBindsItsProgram) {
  const auto r = run({after(0, smf::instrument_name("Violin", 3)),
                      after(0, smf::note_on(3, 67, 80))});
  EXPECT_EQ(r.track.instrument, 40);
  EXPECT_EQ(r.track.notes[0].instrument, 40);
}

TEST(Demux, UnknownInstrumentNamesGetPlaceholders) {
  const auto r = run({after(0, smf::note_on(0, 60, 80)),
                      after(0, smf::instrument_name("Wobble Synth")),
                      after(0, smf::note_on(0, 62, 80)),
                      after(0, smf::note_on(1, 62, 80)),
                      after(0, smf::instrument_name("Other Thing")),
                      after(0, smf::note_on(1, 64, 80)),
                      after(0, smf::instrument_name("Wobble Synth", 1)),
                      after(0, smf::note_on(1, 65, 80))});
  EXPECT_EQ(r.track.instrument, midi::kFirstPlaceholderInstrument);
  EXPECT_EQ(r.track.notes[1].instrument, midi::kFirstPlaceholderInstrument);
  EXPECT_EQ(r.track.notes[3].instrument, midi::kFirstPlaceholderInstrument + 1);
  EXPECT_EQ(r.track.notes[4].instrument, midi::kFirstPlaceholderInstrument);
}

TEST(Demux, ProgramControllerOptionAssignsTheTrackInstrument) {
  midi::TempoCurve curve;
  midi::DecodeOptions options;
  options.programController = 3;
  const auto r = run({after(0, smf::controller(0, 3, 19)),
                      after(0, smf::controller(0, 3, 20))},
                     curve, options);
  EXPECT_EQ(r.track.instrument, 19);
  EXPECT_EQ(r.track.controlChanges.at(3).size(), 2u);
}

TEST(Demux, WithoutProgramControllerNoControllerSetsTheInstrument) {
  const auto r = run({after(0, smf::controller(0, 3, 19))});
  EXPECT_FALSE(r.track.instrument.has_value());
}

TEST(Demux, TrackNameIsCleaned) {
  const auto r = run({after(0, smf::track_name(std::string("  Bass\0\0", 8)))});
  EXPECT_EQ(r.track.name, "Bass");
  EXPECT_EQ(r.track.length(), 0u);
}
