// src/midi/time.hpp
// Constant-tempo conversions between ticks and seconds.
//
// These only ever see the header's single reference tempo. On decode that
// yields the nominal timeline, which the tempo warp corrects afterwards; on
// encode it is the one tempo every written track runs at.

#pragma once
#include <cmath>
#include <cstdint>

#include "midi/events.hpp"

namespace midi {

// Elapsed seconds for `ticks` at the header's PPQ and BPM.
inline double ticks_to_seconds(double ticks, const Header &header) {
  return ticks / header.ppq * (60.0 / header.bpm);
}

// Largest tick a delta VLQ can carry from the start of a track.
inline constexpr std::uint32_t kMaxTick = 0x0FFFFFFF;

// Nearest tick for `seconds` at the header's PPQ and BPM. Negative times
// clamp to tick 0, times past kMaxTick to kMaxTick.
inline std::uint32_t seconds_to_ticks(double seconds, const Header &header) {
  const double ticks = seconds * header.bpm / 60.0 * header.ppq;
  if (!(ticks > 0))
    return 0;
  if (ticks >= kMaxTick)
    return kMaxTick;
  return static_cast<std::uint32_t>(std::lround(ticks));
}

} // namespace midi
