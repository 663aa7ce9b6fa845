#include "blake3_util.h"

#include "util.h"

#include "blake3.h"

#include <stdexcept>

namespace harvest {

blake3_t blake3_hash(void const *data, size_t length) {
  blake3_t digest;
  blake3_hasher hasher;

  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, length);
  blake3_hasher_finalize(&hasher, digest.data(), digest.size());
  return digest;
}

std::string blake3_hex_prefix(std::string_view data, size_t hex_chars) {
  if (hex_chars > sizeof(blake3_t) * 2) {
    throw std::invalid_argument("blake3_hex_prefix: prefix longer than digest");
  }

  auto const digest{ blake3_hash(data.data(), data.size()) };
  auto hex{ util_bytes_to_hex(digest.data(), digest.size()) };
  hex.resize(hex_chars);
  return hex;
}

}  // namespace harvest
