// src/midi/record.cpp

#include "midi/record.hpp"

#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

using nlohmann::json;

namespace {

template <typename T> json optional_field(const std::optional<T> &v) {
  return v ? json(*v) : json(nullptr);
}

template <typename T>
std::optional<T> read_optional(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

json note_record(const midi::Note &n) {
  return json{{"midi", n.pitch},
              {"name", n.name()},
              {"time", n.time},
              {"duration", optional_field(n.duration)},
              {"velocity", n.velocity},
              {"channel", optional_field(n.channel)},
              {"instrument", optional_field(n.instrument)}};
}

json control_record(const midi::ControlChange &cc) {
  json number = cc.controller == midi::kPitchBend
                    ? json(midi::controller_key(cc.controller))
                    : json(cc.controller);
  return json{{"number", number},
              {"time", cc.time},
              {"value", cc.value},
              {"channel", optional_field(cc.channel)},
              {"instrument", optional_field(cc.instrument)}};
}

json track_record(const midi::Track &t) {
  json notes = json::array();
  for (const auto &n : t.notes) {
    notes.push_back(note_record(n));
  }
  json controls = json::object();
  for (const auto &entry : t.controlChanges) {
    json list = json::array();
    for (const auto &cc : entry.second) {
      list.push_back(control_record(cc));
    }
    controls[midi::controller_key(entry.first)] = std::move(list);
  }
  return json{{"id", t.id},
              {"name", optional_field(t.name)},
              {"channelNumber", optional_field(t.channel)},
              {"instrumentNumber", optional_field(t.instrument)},
              {"instrument", t.instrument_name()},
              {"instrumentFamily", t.instrument_family()},
              {"notes", std::move(notes)},
              {"controlChanges", std::move(controls)}};
}

midi::Track track_from(const json &j) {
  midi::Track t(read_optional<std::string>(j, "name"));
  t.id = j.value("id", 0);
  t.channel = read_optional<int>(j, "channelNumber");
  t.instrument = read_optional<int>(j, "instrumentNumber");

  if (auto it = j.find("notes"); it != j.end()) {
    for (const auto &n : *it) {
      t.add_note(n.at("midi").get<int>(), n.at("time").get<double>(),
                 read_optional<double>(n, "duration"),
                 n.value("velocity", 1.0), read_optional<int>(n, "channel"),
                 read_optional<int>(n, "instrument"));
    }
  }

  if (auto it = j.find("controlChanges"); it != j.end()) {
    for (const auto &entry : it->items()) {
      const midi::ControllerId id = midi::controller_from_key(entry.key());
      auto &list = t.controlChanges[id];
      for (const auto &c : entry.value()) {
        midi::ControlChange cc;
        cc.controller = id;
        cc.time = c.at("time").get<double>();
        cc.value = c.at("value").get<double>();
        cc.channel = read_optional<int>(c, "channel");
        cc.instrument = read_optional<int>(c, "instrument");
        list.push_back(cc);
      }
    }
  }
  return t;
}

} // namespace

namespace midi {

std::string controller_key(ControllerId id) {
  return id == kPitchBend ? std::string("pitchBend") : std::to_string(id);
}

ControllerId controller_from_key(const std::string &key) {
  if (key == "pitchBend") {
    return kPitchBend;
  }
  if (key.empty() || key.size() > 3) {
    throw std::invalid_argument("Unknown control change key: " + key);
  }
  for (unsigned char c : key) {
    if (!std::isdigit(c)) {
      throw std::invalid_argument("Unknown control change key: " + key);
    }
  }
  const int n = std::stoi(key);
  if (n > 127) {
    throw std::invalid_argument("Controller number out of range: " + key);
  }
  return n;
}

json to_record(const Midi &midi) {
  json tracks = json::array();
  for (const auto &t : midi.tracks) {
    tracks.push_back(track_record(t));
  }
  const Header &h = midi.header;
  return json{
      {"header",
       {{"name", h.name.value_or("")},
        {"PPQ", h.ppq},
        {"bpm", h.bpm},
        {"timeSignature",
         json::array({h.timeSignature.first, h.timeSignature.second})},
        {"formatType", h.formatType}}},
      {"startTime", midi.start_time()},
      {"duration", midi.duration()},
      {"tracks", std::move(tracks)}};
}

Midi from_record(const json &record) {
  Midi midi;
  const json &h = record.at("header");
  const std::string name = h.value("name", std::string());
  if (!name.empty()) {
    midi.header.name = name;
  }
  midi.header.ppq = h.value("PPQ", kDefaultPpq);
  midi.header.bpm = h.value("bpm", kDefaultBpm);
  if (auto it = h.find("timeSignature"); it != h.end()) {
    midi.header.timeSignature = {it->at(0).get<int>(), it->at(1).get<int>()};
  }
  midi.header.formatType = h.value("formatType", 1);

  if (auto it = record.find("tracks"); it != record.end()) {
    for (const auto &t : *it) {
      midi.tracks.push_back(track_from(t));
    }
  }
  return midi;
}

} // namespace midi
