// src/main.cpp
// midiconvert: decode a Standard MIDI File (local or http/https) into the
// real-time performance model, optionally transform it, and write JSON and/or
// a re-encoded MIDI file.

#include "app/cli.hpp"
#include "app/preview.hpp"
#include "io/io.hpp"
#include "midi/midi.hpp"
#include "midi/record.hpp"
#include "net/fetch.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int main(int argc, char **argv) {
  try {
    const app::Cli cli = app::parse_cli(argc, argv);

    // 1) Fetch or read, then decode
    const bool remote = net::is_url(cli.input);
    if (cli.verbose)
      std::cerr << (remote ? "fetching " : "reading ") << cli.input << "\n";
    midi::Midi song =
        remote ? midi::Midi::load_url(cli.input, cli.options)
               : midi::Midi::load_file(std::filesystem::path(cli.input),
                                       cli.options);
    if (cli.verbose)
      std::cerr << "decoded " << song.tracks.size() << " tracks, "
                << song.duration() << "s\n";

    // 2) Transforms
    if (cli.bpm) {
      if (cli.verbose)
        std::cerr << "rescaling " << song.bpm() << " -> " << *cli.bpm
                  << " bpm\n";
      song.set_bpm(*cli.bpm);
    }
    if (cli.slice) {
      if (cli.verbose)
        std::cerr << "slicing [" << cli.slice->first << ", "
                  << cli.slice->second << ")\n";
      song = song.slice(cli.slice->first, cli.slice->second);
    }

    // 3) Outputs
    if (!cli.quiet) {
      app::print_preview(std::cout, song);
    }
    if (cli.jsonOut) {
      const std::string text = midi::to_record(song).dump(2);
      if (cli.jsonOut->string() == "-") {
        std::cout << text << "\n";
      } else {
        io::write_all(*cli.jsonOut, text + "\n");
        if (cli.verbose)
          std::cerr << "wrote " << cli.jsonOut->string() << "\n";
      }
    }
    if (cli.midiOut) {
      io::write_all(*cli.midiOut, song.encode());
      if (cli.verbose)
        std::cerr << "wrote " << cli.midiOut->string() << "\n";
    }

    return 0;
  } catch (const app::UsageError &ex) {
    std::cerr << ex.what() << "\n";
    return 2;
  } catch (const std::exception &ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }
}
