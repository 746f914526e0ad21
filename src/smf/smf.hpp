// src/smf/smf.hpp
// Public API of the byte codec: Standard MIDI File bytes <-> token streams.
// - No printing here; pure data extraction / emission.
// - Throws smf::MalformedStreamError on malformed input.

#pragma once
#include <cstdint>
#include <vector>

#include "smf/error.hpp"
#include "smf/tokens.hpp"

namespace smf {

// Parse an entire Standard MIDI File already loaded in memory.
// On success, returns a RawFile containing:
//   - header: SMFHeader (format, nTracks, timing division info)
//   - tracks: one token list per MTrk chunk, in file order, each token
//             carrying its preceding delta-tick count
// Chunks other than MTrk between track chunks are skipped.
RawFile read_smf(const std::vector<std::uint8_t> &bytes);

// Serialize track token lists into a format-1 Standard MIDI File.
// Each track's tokens are ordered by absolute tick (stable, with metas and
// program changes before controllers, note-offs before note-ons at the same
// tick); their `delta` fields are ignored and recomputed.
std::vector<std::uint8_t>
write_smf(unsigned ppqn, const std::vector<std::vector<TimedToken>> &tracks);

} // namespace smf
