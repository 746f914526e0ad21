// src/io/io.hpp
// Thin I/O facade for whole-file reads and writes, over common/util.hpp.
//
// Usage:
//   auto bytes = io::read_all(path);   // std::filesystem::path or std::string
//   io::write_all(path, bytes);
//
// Throws std::runtime_error on errors (propagated from util.hpp).

#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "common/util.hpp"

namespace io {

inline std::vector<std::uint8_t> read_all(const std::string &path) {
  return ::read_all(path);
}

inline std::vector<std::uint8_t> read_all(const std::filesystem::path &p) {
  return ::read_all(p.string());
}

inline void write_all(const std::filesystem::path &p,
                      const std::vector<std::uint8_t> &bytes) {
  ::write_all(p.string(), bytes);
}

inline void write_all(const std::filesystem::path &p, const std::string &text) {
  ::write_all(p.string(), std::vector<std::uint8_t>(text.begin(), text.end()));
}

} // namespace io
