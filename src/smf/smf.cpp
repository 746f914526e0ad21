// src/smf/smf.cpp
// Parse a Standard MIDI File (SMF) from memory into smf::RawFile.
// Pure parsing: no printing, no I/O.

#include "smf/smf.hpp"
#include "common/reader.hpp" // Bytes cursor + read_vlq()

#include <cstdint>
#include <sstream>
#include <utility>
#include <vector>

namespace {

constexpr std::uint32_t kMThd = 0x4D546864;
constexpr std::uint32_t kMTrk = 0x4D54726B;

// Parse SMF header (MThd chunk) and fill smf::SMFHeader.
smf::SMFHeader parse_header(Bytes &r) {
  const std::uint32_t id = r.be32();
  if (id != kMThd) {
    throw smf::MalformedStreamError("Not a MIDI file (missing 'MThd')");
  }

  const std::uint32_t length = r.be32();
  if (length < 6) {
    throw smf::MalformedStreamError("Header chunk length must be at least 6");
  }

  smf::SMFHeader h{};
  h.format = r.be16();
  h.nTracks = r.be16();
  h.division = r.be16();
  r.skip(length - 6);

  if ((h.division & 0x8000) == 0) {
    // PPQN timing (ticks per quarter note)
    h.isPPQN = true;
    h.ppqn = static_cast<unsigned>(h.division & 0x7FFF);
    if (h.ppqn == 0) {
      throw smf::MalformedStreamError("Header division of 0 ticks per quarter");
    }
  } else {
    // SMPTE timing (two's-complement FPS in high byte, subframes in low byte)
    h.isPPQN = false;
    h.smpte_fps = 256 - ((h.division >> 8) & 0xFF); // e.g., 24, 25, 29, 30
    h.smpte_sub = static_cast<int>(h.division & 0xFF);
    h.ppqn = 480; // approximation until SMPTE timing is modelled
  }

  return h; // r.off now points to first track chunk (MTrk)
}

// Decode the payload of a meta event into `out`. Returns false for meta
// types we do not turn into tokens.
bool decode_meta(Bytes &payload, std::uint8_t metaType, int prefixChannel,
                 smf::Token &out) {
  const std::size_t mlen = payload.remaining();
  switch (metaType) {
  case 0x03: // Sequence/Track Name
    out.type = smf::TokenType::TrackName;
    out.text = payload.text(mlen);
    return true;
  case 0x04: // Instrument Name
    out.type = smf::TokenType::InstrumentName;
    out.text = payload.text(mlen);
    out.channel = prefixChannel;
    return true;
  case 0x51: // Tempo: 3 bytes big-endian microseconds per quarter note
    if (mlen != 3) {
      throw smf::MalformedStreamError("Set-tempo meta event must be 3 bytes");
    }
    out.type = smf::TokenType::SetTempo;
    out.value = payload.be24();
    return true;
  case 0x58: { // Time signature: nn dd cc bb, denominator as a power of two
    if (mlen < 2) {
      throw smf::MalformedStreamError("Time-signature meta event too short");
    }
    out.type = smf::TokenType::TimeSignature;
    out.data1 = payload.u8();
    const std::uint8_t power = payload.u8();
    out.data2 = static_cast<std::uint8_t>(power < 8 ? (1u << power) : 0);
    return true;
  }
  default:
    return false;
  }
}

// Walk a single MTrk chunk payload and return its tokens.
// Delta times accumulate across skipped events so every token keeps its
// correct distance from the previous token.
std::vector<smf::Token> walk_one_track(Bytes tr) {
  std::vector<smf::Token> tokens;
  std::uint32_t pending = 0; // delta ticks not yet attached to a token
  std::uint8_t running = 0;  // last seen channel status for running status
  int prefixChannel = -1;    // from FF 20 (MIDI channel prefix)

  auto emit = [&](smf::Token t) {
    t.delta = pending;
    pending = 0;
    tokens.push_back(std::move(t));
  };

  while (!tr.at_end()) {
    // 1) Delta-time (Variable-Length Quantity)
    pending += read_vlq(tr);

    // 2) Status or running status?
    std::uint8_t first = tr.u8();
    std::uint8_t status = 0;
    bool haveData1 = false;
    std::uint8_t data1 = 0;

    if (first & 0x80) {
      // New status byte
      status = first;
      if ((status & 0xF0) < 0xF0) {
        running = status; // only channel messages set running status
      }
    } else {
      // Running status: 'first' is actually data1 for the previous channel
      // status
      if (running == 0) {
        throw smf::MalformedStreamError(
            "Running status used before any status");
      }
      status = running;
      haveData1 = true;
      data1 = first;
    }

    const std::uint8_t type = status & 0xF0;
    const int ch = status & 0x0F;

    // Channel messages with two data bytes
    if (type == 0x80 || type == 0x90 || type == 0xA0 || type == 0xB0 ||
        type == 0xE0) {
      std::uint8_t d1 = haveData1 ? data1 : tr.u8();
      std::uint8_t d2 = tr.u8();

      smf::Token t;
      t.channel = ch;
      t.data1 = d1;
      t.data2 = d2;
      if (type == 0x90 && d2 != 0) {
        t.type = smf::TokenType::NoteOn;
      } else if (type == 0x80 || type == 0x90) {
        // Note Off (either true 0x80 or "Note On with velocity 0")
        t.type = smf::TokenType::NoteOff;
      } else if (type == 0xB0) {
        t.type = smf::TokenType::Controller;
      } else if (type == 0xE0) {
        t.type = smf::TokenType::PitchBend;
        t.value = (static_cast<std::uint32_t>(d2 & 0x7F) << 7) | (d1 & 0x7F);
      } else {
        continue; // Poly aftertouch
      }
      emit(std::move(t));
      continue;
    }

    // Channel messages with one data byte
    if (type == 0xC0 || type == 0xD0) {
      std::uint8_t d1 = haveData1 ? data1 : tr.u8();
      if (type == 0xC0) {
        smf::Token t;
        t.type = smf::TokenType::ProgramChange;
        t.channel = ch;
        t.data1 = d1;
        emit(std::move(t));
      }
      continue; // Channel pressure is ignored
    }

    // Meta events
    if (status == 0xFF) {
      std::uint8_t metaType = tr.u8();
      std::uint32_t mlen = read_vlq(tr);
      Bytes payload = tr.slice(mlen);

      if (metaType == 0x2F) { // End of Track
        break;
      }
      if (metaType == 0x20 && mlen >= 1) {
        prefixChannel = payload.u8() & 0x0F;
        continue;
      }
      smf::Token t;
      if (decode_meta(payload, metaType, prefixChannel, t)) {
        emit(std::move(t));
      }
      continue;
    }

    // SysEx events
    if (status == 0xF0 || status == 0xF7) {
      std::uint32_t slen = read_vlq(tr);
      tr.skip(slen);
      continue;
    }

    // Anything else is unsupported/malformed at this stage
    std::ostringstream oss;
    oss << "Unsupported or malformed status byte: 0x" << std::hex
        << int(status);
    throw smf::MalformedStreamError(oss.str());
  }

  return tokens;
}

} // namespace

namespace smf {

RawFile read_smf(const std::vector<std::uint8_t> &bytes) {
  Bytes r(bytes);

  RawFile file;
  file.header = parse_header(r);
  file.tracks.reserve(file.header.nTracks);

  while (file.tracks.size() < file.header.nTracks) {
    const std::uint32_t id = r.be32();
    const std::uint32_t len = r.be32();
    Bytes chunk = r.slice(len);
    if (id != kMTrk) {
      continue; // alien chunk
    }
    file.tracks.push_back(walk_one_track(chunk));
  }

  return file;
}

} // namespace smf
