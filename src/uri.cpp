#include "uri.h"

#include "util.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace harvest {
namespace {

constexpr std::array<std::string_view, 3> kExtractSchemes{ "https://",
                                                            "http://",
                                                            "file://" };

std::string to_lower_copy(std::string_view value) {
  std::string out{ value };
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool istarts_with(std::string_view value, std::string_view prefix) {
  return prefix.size() <= value.size() &&
         util_iequals(value.substr(0, prefix.size()), prefix);
}

// Drops ":80" / ":443" when it matches the scheme's default. Userinfo and IPv6
// literals are respected: the port is only what follows the host.
std::string strip_default_port(std::string netloc, std::string_view scheme) {
  auto const at{ netloc.rfind('@') };
  size_t const host_start{ at == std::string::npos ? 0 : at + 1 };
  auto const colon{ netloc.rfind(':') };
  if (colon == std::string::npos || colon < host_start) { return netloc; }
  if (netloc.find(']', colon) != std::string::npos) { return netloc; }

  std::string_view const port{ std::string_view{ netloc }.substr(colon + 1) };
  if ((scheme == "http" && port == "80") || (scheme == "https" && port == "443")) {
    netloc.erase(colon);
  }
  return netloc;
}

std::string normalize_path(std::string_view path) {
  if (path.size() > 1 && path.back() == '/') {
    auto const last{ path.find_last_not_of('/') };
    path = last == std::string_view::npos ? std::string_view{} : path.substr(0, last + 1);
  }
  if (path.empty()) { return "/"; }
  return std::string{ path };
}

std::string normalize_query(std::string_view query) {
  std::vector<std::pair<std::string, std::string>> params;

  for (auto const part : query | std::views::split('&')) {
    std::string_view const kv{ part.begin(), part.end() };
    if (kv.empty()) { continue; }
    auto const eq{ kv.find('=') };
    if (eq == std::string_view::npos) {
      params.emplace_back(std::string{ kv }, std::string{});
    } else {
      params.emplace_back(std::string{ kv.substr(0, eq) }, std::string{ kv.substr(eq + 1) });
    }
  }

  std::ranges::sort(params);

  std::string out;
  for (auto const &[key, value] : params) {
    if (!out.empty()) { out.push_back('&'); }
    out.append(key).append("=").append(value);
  }
  return out;
}

}  // namespace

std::string uri_normalize(std::string_view url) {
  std::string_view rest{ util_trim(url) };

  if (auto const hash{ rest.find('#') }; hash != std::string_view::npos) {
    rest = rest.substr(0, hash);
  }

  std::string_view query;
  if (auto const q{ rest.find('?') }; q != std::string_view::npos) {
    query = rest.substr(q + 1);
    rest = rest.substr(0, q);
  }

  std::string scheme;
  std::string netloc;
  std::string_view path{ rest };

  if (auto const sep{ rest.find("://") }; sep != std::string_view::npos) {
    scheme = to_lower_copy(rest.substr(0, sep));
    auto const after{ rest.substr(sep + 3) };
    auto const slash{ after.find('/') };
    netloc = to_lower_copy(after.substr(0, slash));
    path = slash == std::string_view::npos ? std::string_view{} : after.substr(slash);
    netloc = strip_default_port(std::move(netloc), scheme);
  }

  std::string out;
  if (!scheme.empty()) { out.append(scheme).append("://").append(netloc); }
  out.append(normalize_path(path));

  if (auto const q{ normalize_query(query) }; !q.empty()) { out.append("?").append(q); }
  return out;
}

std::optional<std::string> uri_extract_first(std::string_view text) {
  for (size_t i{ 0 }; i < text.size(); ++i) {
    auto const tail{ text.substr(i) };
    bool const matched{ std::ranges::any_of(kExtractSchemes, [&](std::string_view s) {
      return istarts_with(tail, s);
    }) };
    if (!matched) { continue; }

    auto const end{ std::ranges::find_if(tail, [](unsigned char c) {
      return std::isspace(c) != 0;
    }) };
    return std::string{ tail.begin(), end };
  }
  return std::nullopt;
}

}  // namespace harvest
