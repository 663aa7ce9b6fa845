#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace harvest {

struct libcurl_fetch_cfg {
  std::chrono::milliseconds timeout{ 60000 };  // whole transfer, connect included
  std::uint64_t max_bytes{ 64ull * 1024 * 1024 };
};

void libcurl_ensure_initialized();

// Retrieves the body of an http(s) or file URL. Redirects are followed; HTTP status
// >= 400, a timeout, or a body larger than max_bytes throws std::runtime_error.
std::string libcurl_fetch(std::string_view url, libcurl_fetch_cfg const &cfg);

}  // namespace harvest
