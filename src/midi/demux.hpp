// src/midi/demux.hpp
// Stage 1 of decoding: turn one raw track's tokens into notes and control
// changes on the *nominal* timeline.
//
// Nominal times assume the header's reference tempo from tick 0 to the end.
// They are deliberately wrong for files that change tempo; the tempo
// breakpoints found here go into the caller's TempoCurve and the warp in
// tempo.hpp corrects every time once all raw tracks have been scanned.

#pragma once
#include "midi/events.hpp"
#include "midi/tempo.hpp"
#include "midi/track.hpp"
#include "smf/tokens.hpp"

#include <cstddef>
#include <vector>

namespace midi {

struct DemuxResult {
  // Raw (possibly multi-channel) track. `channel` is the first channel seen,
  // `instrument` the first program assigned; elements carry their own
  // channel and, when one was known at the time, their instrument.
  Track track;
  // Note-offs that found no pending note-on for their (pitch, channel).
  // They are ignored; the count is kept for diagnostics.
  std::size_t unmatchedNoteOffs = 0;
};

// Scan one raw track. Tempo events are inserted into `tempo` at their
// nominal time. Never throws for well-formed tokens.
DemuxResult demux_track(const std::vector<smf::Token> &tokens,
                        const Header &header, const DecodeOptions &options,
                        TempoCurve &tempo);

} // namespace midi
