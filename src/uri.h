#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace harvest {

// Canonical form of a URL for keying. Equivalent spellings map to the same string:
//   - scheme and host are lowercased, default ports (:80 http, :443 https) dropped
//   - trailing slashes are stripped from the path; an empty path becomes "/"
//   - query parameters are sorted by key, then value; the fragment is dropped
// Path and query case is preserved. Input without "://" is treated as a bare path.
std::string uri_normalize(std::string_view url);

// First http://, https:// or file:// token in free text (up to the next whitespace).
std::optional<std::string> uri_extract_first(std::string_view text);

}  // namespace harvest
