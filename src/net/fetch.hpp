// src/net/fetch.hpp
// Blocking HTTP(S) GET of a whole resource into memory, using libcurl.
// No retries: any failure is reported once to the caller.

#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace net {

// Network failure or a non-200 response. `status()` is the HTTP status, or
// -1 when no response was received.
class TransportError : public std::runtime_error {
public:
  TransportError(const std::string &what, long status)
      : std::runtime_error(what), status_(status) {}

  [[nodiscard]] long status() const { return status_; }

private:
  long status_;
};

// True for "http://" and "https://" addresses.
bool is_url(const std::string &address);

// Fetch `url`. Throws TransportError on curl errors, non-http(s) URLs and
// any status other than 200.
std::vector<std::uint8_t> fetch(const std::string &url, long timeoutSeconds = 60);

} // namespace net
