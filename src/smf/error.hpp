// src/smf/error.hpp
// Error type thrown by the byte codec when input cannot be tokenized.

#pragma once
#include <stdexcept>
#include <string>

namespace smf {

class MalformedStreamError : public std::runtime_error {
public:
  explicit MalformedStreamError(const std::string &what)
      : std::runtime_error(what) {}
};

} // namespace smf
