// src/midi/names.hpp
// Human-readable names: General MIDI programs and families, note names,
// and cleanup of text pulled out of meta events.

#pragma once
#include <optional>
#include <string>

namespace midi {

// "acoustic grand piano" for program 0, ... ; "" outside 0..127.
std::string gm_instrument_name(int program);

// "piano", "chromatic percussion", ... (8 programs per family); "" outside
// 0..127.
std::string gm_instrument_family(int program);

// Program number for a General MIDI name. Case, spaces, underscores and
// hyphens are ignored, so "Acoustic_Grand_Piano" matches.
std::optional<int> gm_program_from_name(const std::string &name);

// Scientific pitch notation with middle C (60) as "C4"; sharps only. "" for
// pitches outside 0..127.
std::string note_name(int pitch);

// Inverse of note_name; also accepts flats ("Db4") and negative octaves
// ("C-1" = 0). Unset for malformed names or pitches outside 0..127.
std::optional<int> pitch_from_name(const std::string &name);

// Strip control characters (NULs and the like) and surrounding whitespace.
std::string clean_name(const std::string &raw);

} // namespace midi
