// src/midi/split.hpp
// Split a raw track into one track per (channel, instrument) pair.

#pragma once
#include "midi/track.hpp"

#include <optional>
#include <vector>

namespace midi {

// Effective channel of an element: its own, else the raw track's, else 0.
int resolve_channel(std::optional<int> own, const Track &raw);

// Effective instrument of an element: its own, else the raw track's, else 0.
int resolve_instrument(std::optional<int> own, const Track &raw);

// Output tracks ordered by channel, then instrument, with ids firstId,
// firstId + 1, ... . Each inherits the raw track's name and carries the
// resolved channel/instrument; so does every element in it. No element is
// dropped or duplicated.
std::vector<Track> split_track(const Track &raw, int firstId);

} // namespace midi
