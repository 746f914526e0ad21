// src/net/fetch.cpp

#include "net/fetch.hpp"

#include <curl/curl.h>

#include <memory>
#include <string>

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *data) {
  const size_t realsize = size * nmemb;
  auto *out = static_cast<std::vector<std::uint8_t> *>(data);
  out->insert(out->end(), ptr, ptr + realsize);
  return realsize;
}

struct CurlDeleter {
  void operator()(CURL *c) const { curl_easy_cleanup(c); }
};

void check(CURLcode cc, const char *what) {
  if (cc != CURLE_OK) {
    throw net::TransportError(std::string("curl_easy_setopt(") + what +
                                  ") failed: " + curl_easy_strerror(cc),
                              -1);
  }
}

} // namespace

namespace net {

bool is_url(const std::string &address) {
  return address.rfind("http://", 0) == 0 || address.rfind("https://", 0) == 0;
}

std::vector<std::uint8_t> fetch(const std::string &url, long timeoutSeconds) {
  if (!is_url(url)) {
    throw TransportError("Not a http[s] URL: " + url, -1);
  }

  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    throw TransportError("curl_easy_init() failed", -1);
  }

  std::vector<std::uint8_t> body;
  char errorBuffer[CURL_ERROR_SIZE];
  errorBuffer[0] = 0;

  check(curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str()), "CURLOPT_URL");
  check(curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback),
        "CURLOPT_WRITEFUNCTION");
  check(curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA,
                         static_cast<void *>(&body)),
        "CURLOPT_WRITEDATA");
  check(curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer),
        "CURLOPT_ERRORBUFFER");
  check(curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeoutSeconds),
        "CURLOPT_TIMEOUT");
  check(curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L), "CURLOPT_NOSIGNAL");
  check(curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L),
        "CURLOPT_FOLLOWLOCATION");
  check(curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "midiconvert"),
        "CURLOPT_USERAGENT");

  const CURLcode result = curl_easy_perform(curl.get());
  long status = -1;
  if (curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status) !=
      CURLE_OK) {
    status = -1;
  }

  if (result != CURLE_OK) {
    throw TransportError("HTTP request failed: (" + std::to_string(result) +
                             ") " +
                             (errorBuffer[0] ? errorBuffer
                                             : curl_easy_strerror(result)),
                         -1);
  }
  if (status != 200) {
    throw TransportError("HTTP request status: " + std::to_string(status),
                         status);
  }
  return body;
}

} // namespace net
