#include "libcurl_util.h"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#ifndef HARVEST_VERSION_STR
#error "HARVEST_VERSION_STR must be defined by the build system"
#endif

namespace harvest {

namespace {

constexpr char kDefaultUserAgent[]{ "harvest/" HARVEST_VERSION_STR };

struct body_sink {
  std::string data;
  std::uint64_t max_bytes;
  bool overflowed{ false };
};

size_t curl_write_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *sink{ static_cast<body_sink *>(userdata) };
  size_t const total{ size * nmemb };
  if (sink->data.size() + total > sink->max_bytes) {
    sink->overflowed = true;
    return 0;  // aborts the transfer with CURLE_WRITE_ERROR
  }
  sink->data.append(ptr, total);
  return total;
}

}  // namespace

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    CURLcode const code{ curl_global_init(CURL_GLOBAL_DEFAULT) };
    if (code != CURLE_OK) {
      throw std::runtime_error(std::string("curl_global_init failed: ") +
                               curl_easy_strerror(code));
    }
  });
}

std::string libcurl_fetch(std::string_view url, libcurl_fetch_cfg const &cfg) {
  libcurl_ensure_initialized();

  if (url.empty()) { throw std::invalid_argument("libcurl_fetch: url is empty"); }
  std::string const url_copy{ url };

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle{ curl_easy_init(),
                                                              &curl_easy_cleanup };
  if (!handle) { throw std::runtime_error("curl_easy_init failed"); }

  auto const setopt = [handle = handle.get()](auto option, auto value) {
    CURLcode const rc{ curl_easy_setopt(handle, option, value) };
    if (rc != CURLE_OK) {
      throw std::runtime_error(std::string("curl_easy_setopt failed: ") +
                               curl_easy_strerror(rc));
    }
  };

  body_sink sink{ .data = {}, .max_bytes = cfg.max_bytes };
  char error_buffer[CURL_ERROR_SIZE]{};

  setopt(CURLOPT_URL, url_copy.c_str());
  setopt(CURLOPT_FOLLOWLOCATION, 1L);
  setopt(CURLOPT_MAXREDIRS, 10L);
  setopt(CURLOPT_FAILONERROR, 1L);
  setopt(CURLOPT_NOSIGNAL, 1L);
  setopt(CURLOPT_USERAGENT, kDefaultUserAgent);
  setopt(CURLOPT_ACCEPT_ENCODING, "");
  setopt(CURLOPT_TIMEOUT_MS, static_cast<long>(cfg.timeout.count()));
  setopt(CURLOPT_ERRORBUFFER, error_buffer);
  setopt(CURLOPT_WRITEFUNCTION, curl_write_body);
  setopt(CURLOPT_WRITEDATA, &sink);
  setopt(CURLOPT_NOPROGRESS, 1L);

  CURLcode const perform_result{ curl_easy_perform(handle.get()) };
  if (perform_result != CURLE_OK) {
    if (sink.overflowed) {
      throw std::runtime_error("libcurl_fetch: " + url_copy + ": body exceeds " +
                               std::to_string(cfg.max_bytes) + " bytes");
    }
    std::string detail{ error_buffer[0] ? error_buffer : curl_easy_strerror(perform_result) };
    throw std::runtime_error("libcurl_fetch: " + url_copy + ": " + detail);
  }

  return std::move(sink.data);
}

}  // namespace harvest
