// src/midi/midi.hpp
// Public API: the semantic MIDI model and its conversion to and from
// Standard MIDI File bytes.
//
// Decoding runs in two explicit stages:
//   1. every raw track is demuxed onto the nominal timeline (reference tempo
//      assumed throughout) and split per (channel, instrument);
//   2. once every tempo event of the file is known, all times are warped
//      into real elapsed seconds.
// Encoding writes every track at the single header tempo, so files with
// tempo changes come back with the same real timing but a flattened tempo
// map.

#pragma once
#include "midi/events.hpp"
#include "midi/track.hpp"
#include "smf/error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace midi {

using ParseError = smf::MalformedStreamError;

class Midi {
public:
  Header header;
  std::vector<Track> tracks;

  // Parse SMF bytes. Throws ParseError on malformed input; nothing partial
  // is returned.
  static Midi decode(const std::vector<std::uint8_t> &bytes,
                     const DecodeOptions &options = {});

  // Read and decode a local file. Throws std::runtime_error when the file
  // cannot be read, ParseError when it is not a MIDI file.
  static Midi load_file(const std::filesystem::path &path,
                        const DecodeOptions &options = {});

  // Fetch and decode an http(s) URL. Throws net::TransportError on fetch
  // failure, ParseError on malformed content.
  static Midi load_url(const std::string &url,
                       const DecodeOptions &options = {});

  // Serialize to a format-1 SMF at the header tempo.
  [[nodiscard]] std::vector<std::uint8_t> encode() const;

  // Copy restricted to [start, end): see Track::slice.
  [[nodiscard]] Midi slice(double start, double end) const;

  // Append an empty track whose id is its index.
  Track &add_track(const std::optional<std::string> &name = std::nullopt);

  // nullptr when out of range / no track has that name (first match wins).
  Track *find_track(std::size_t index);
  Track *find_track(const std::string &name);
  const Track *find_track(std::size_t index) const;
  const Track *find_track(const std::string &name) const;

  // Change the reference tempo, stretching every time and duration by
  // old / new.
  void set_bpm(double bpm);
  [[nodiscard]] double bpm() const { return header.bpm; }

  // Earliest note start over all tracks (0 without notes).
  [[nodiscard]] double start_time() const;
  // Latest track end (0 without tracks).
  [[nodiscard]] double duration() const;
};

} // namespace midi
