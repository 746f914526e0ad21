// src/app/cli.hpp
// Minimal, robust CLI parsing for the midiconvert tool.
// Responsibilities:
//  - Extract the positional input (MIDI file path or http(s) URL).
//  - Parse output and transform options.
//  - Validate that a local input file exists (fail early with a clear error).
//
// Design notes:
//  * Header-only; main() catches and prints.
//  * UsageError for bad invocations (exit code 2), std::runtime_error for
//    anything else.
//
// Usage from main.cpp:
//   app::Cli cli = app::parse_cli(argc, argv);

#pragma once
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "midi/events.hpp"
#include "net/fetch.hpp"

namespace app {

class UsageError : public std::runtime_error {
public:
  explicit UsageError(const std::string &what) : std::runtime_error(what) {}
};

struct Cli {
  std::string input;                          // path or URL
  std::optional<std::filesystem::path> jsonOut; // --json <file>, "-" = stdout
  std::optional<std::filesystem::path> midiOut; // --out <file.mid>
  std::optional<double> bpm;                    // --bpm <value>
  std::optional<std::pair<double, double>> slice; // --slice <start> <end>
  midi::DecodeOptions options; // --bend-range <n>, --program-cc <n>
  bool verbose = false;        // --verbose: progress on stderr
  bool quiet = false;          // --quiet: no preview on stdout
};

inline std::string usage(const std::string &prog) {
  return "Usage:\n  " + prog +
         " <file.mid|http(s)://url> [options]\n"
         "Options:\n"
         "  --json <file|->        Write the decoded model as JSON\n"
         "  --out <file.mid>       Re-encode to a MIDI file\n"
         "  --bpm <value>          Rescale to a new reference tempo\n"
         "  --slice <start> <end>  Keep notes starting in [start, end) seconds\n"
         "  --bend-range <n>       Default pitch-bend range in semitones (2)\n"
         "  --program-cc <n>       Controller that carries the track program\n"
         "  --verbose              Report progress on stderr\n"
         "  --quiet                Do not print the summary\n";
}

// Small helper: true if s looks like a flag (starts with '-' and not just "-")
inline bool is_flag_like(const std::string &s) {
  return !s.empty() && s[0] == '-' && s != "-";
}

inline double parse_number(const std::string &flag, const std::string &text) {
  std::size_t used = 0;
  double v = 0;
  try {
    v = std::stod(text, &used);
  } catch (const std::exception &) {
    throw UsageError(flag + " expects a number, got '" + text + "'");
  }
  if (used != text.size()) {
    throw UsageError(flag + " expects a number, got '" + text + "'");
  }
  return v;
}

inline int parse_int(const std::string &flag, const std::string &text, int lo,
                     int hi) {
  const double v = parse_number(flag, text);
  if (v != static_cast<int>(v) || v < lo || v > hi) {
    throw UsageError(flag + " expects an integer in " + std::to_string(lo) +
                     ".." + std::to_string(hi) + ", got '" + text + "'");
  }
  return static_cast<int>(v);
}

// Parse argv into our Cli struct.
// Contract:
//  - argv[1] must be the input path or URL (positional).
//  - Throws UsageError on any invalid input.
inline Cli parse_cli(int argc, char **argv) {
  const std::string prog = argc > 0 ? argv[0] : "midiconvert";
  if (argc < 2) {
    throw UsageError(usage(prog));
  }

  Cli cli;

  // 1) Positional input
  cli.input = argv[1];
  if (cli.input == "--help" || cli.input == "-h") {
    throw UsageError(usage(prog));
  }
  if (is_flag_like(cli.input)) {
    throw UsageError("First argument must be a MIDI file path or URL, not a "
                     "flag.");
  }
  if (!net::is_url(cli.input)) {
    const std::filesystem::path p = cli.input;
    if (!std::filesystem::exists(p) || !std::filesystem::is_regular_file(p)) {
      throw UsageError("MIDI file not found: " + cli.input);
    }
  }

  // 2) Optional flags
  auto value = [&](int &i, const std::string &flag) -> std::string {
    if (i + 1 >= argc) {
      throw UsageError(flag + " requires a value");
    }
    return argv[++i];
  };

  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      throw UsageError(usage(prog));
    } else if (a == "--json") {
      cli.jsonOut = std::filesystem::path(value(i, a));
    } else if (a == "--out") {
      cli.midiOut = std::filesystem::path(value(i, a));
    } else if (a == "--bpm") {
      const double bpm = parse_number(a, value(i, a));
      if (!(bpm > 0)) {
        throw UsageError("--bpm must be positive");
      }
      cli.bpm = bpm;
    } else if (a == "--slice") {
      const double start = parse_number(a, value(i, a));
      const double end = parse_number(a, value(i, a));
      if (end < start) {
        throw UsageError("--slice end must not be before start");
      }
      cli.slice = std::make_pair(start, end);
    } else if (a == "--bend-range") {
      cli.options.pitchBendRange = parse_int(a, value(i, a), 0, 127);
    } else if (a == "--program-cc") {
      cli.options.programController = parse_int(a, value(i, a), 0, 127);
    } else if (a == "--verbose" || a == "-v") {
      cli.verbose = true;
    } else if (a == "--quiet" || a == "-q") {
      cli.quiet = true;
    } else {
      // Unknown flags are errors to avoid surprises.
      throw UsageError("Unknown option: " + a);
    }
  }

  return cli;
}

} // namespace app
