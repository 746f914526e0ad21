// src/midi/record.hpp
// Structural JSON mirror of midi::Midi for persistence and interop.
//
// Layout:
//   { "header": { "name", "PPQ", "bpm", "timeSignature": [n, d],
//                 "formatType" },
//     "startTime", "duration",
//     "tracks": [ { "id", "name", "channelNumber", "instrumentNumber",
//                   "instrument", "instrumentFamily",
//                   "notes": [ { "midi", "name", "time", "duration",
//                                "velocity", "channel", "instrument" } ],
//                   "controlChanges": { "<number>" | "pitchBend":
//                       [ { "number", "time", "value", "channel",
//                           "instrument" } ] } } ] }
// Unset optionals are null. Derived fields (startTime, duration, note and
// instrument names) are written for readers but ignored by from_record.

#pragma once
#include "midi/midi.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace midi {

nlohmann::json to_record(const Midi &midi);

// Throws nlohmann::json::exception when a field has the wrong type, and
// std::invalid_argument for an unknown control-change key.
Midi from_record(const nlohmann::json &record);

// "pitchBend" for kPitchBend, the decimal number otherwise.
std::string controller_key(ControllerId id);
ControllerId controller_from_key(const std::string &key);

} // namespace midi
