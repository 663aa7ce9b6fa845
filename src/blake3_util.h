#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace harvest {

using blake3_t = std::array<unsigned char, 32>;
blake3_t blake3_hash(void const *data, size_t length);

// Lowercase hex of the digest of `data`, truncated to `hex_chars` (at most 64).
std::string blake3_hex_prefix(std::string_view data, size_t hex_chars);

}  // namespace harvest
