#include "cache_key.h"

#include "blake3_util.h"
#include "platform.h"
#include "uri.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace harvest {

namespace {

thread_local std::uint64_t t_task_id{ 0 };
std::atomic<std::uint64_t> s_next_task_id{ 1 };

constexpr std::string_view kPrefix{ "cache_" };

bool is_hex_field(std::string_view field, std::size_t length) {
  return field.size() == length && std::all_of(field.begin(), field.end(), [](char c) {
           return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
         });
}

bool is_decimal_field(std::string_view field) {
  return !field.empty() && std::all_of(field.begin(), field.end(), [](char c) {
           return std::isdigit(static_cast<unsigned char>(c));
         });
}

// Splits off the text before the next '_'; false when there is none.
bool next_field(std::string_view &rest, std::string_view &field) {
  auto const sep{ rest.find('_') };
  if (sep == std::string_view::npos) { return false; }
  field = rest.substr(0, sep);
  rest.remove_prefix(sep + 1);
  return true;
}

}  // namespace

cache_key::cache_key(std::string url_hash,
                     std::string ns_hash,
                     std::int64_t pid,
                     std::uint64_t task)
    : url_hash_{ std::move(url_hash) },
      ns_hash_{ std::move(ns_hash) },
      pid_{ pid },
      task_id_{ task },
      canonical_{ "cache_" + url_hash_ + "_" + ns_hash_ + "_" + std::to_string(pid_) + "_" +
                  std::to_string(task_id_) } {}

cache_key cache_key::compose(std::string_view url, std::string_view ns) {
  return compose(url, ns, platform::get_pid(), t_task_id);
}

cache_key cache_key::compose(std::string_view url,
                             std::string_view ns,
                             std::int64_t pid,
                             std::uint64_t task_id) {
  if (util_trim(url).empty()) {
    throw std::invalid_argument("cache_key: url must not be empty");
  }

  std::string const normalized_ns{ util_collapse_whitespace(ns) };
  if (normalized_ns.empty()) {
    throw std::invalid_argument("cache_key: namespace must not be empty");
  }

  return cache_key{ blake3_hex_prefix(uri_normalize(url), kUrlHashChars),
                    blake3_hex_prefix(normalized_ns, kNamespaceHashChars),
                    pid,
                    task_id };
}

std::optional<std::int64_t> cache_key::owner_pid(std::string_view filename) {
  if (!filename.starts_with(kPrefix)) { return std::nullopt; }
  if (filename.ends_with(".txt")) {
    filename.remove_suffix(4);
  } else if (filename.ends_with(".failed")) {
    filename.remove_suffix(7);
  } else {
    return std::nullopt;
  }
  filename.remove_prefix(kPrefix.size());

  std::string_view url_hash, ns_hash, pid;
  if (!next_field(filename, url_hash) || !next_field(filename, ns_hash) ||
      !next_field(filename, pid)) {
    return std::nullopt;
  }
  if (!is_hex_field(url_hash, kUrlHashChars) || !is_hex_field(ns_hash, kNamespaceHashChars) ||
      !is_decimal_field(pid) || !is_decimal_field(filename)) {
    return std::nullopt;
  }

  std::int64_t value{ 0 };
  auto const [end, ec]{ std::from_chars(pid.data(), pid.data() + pid.size(), value) };
  if (ec != std::errc{} || end != pid.data() + pid.size()) { return std::nullopt; }
  return value;
}

std::uint64_t cache_key_current_task() { return t_task_id; }

std::uint64_t cache_key_next_task() {
  return s_next_task_id.fetch_add(1, std::memory_order_relaxed);
}

scoped_task_id::scoped_task_id(std::uint64_t id)
    : id_{ id }, previous_{ std::exchange(t_task_id, id) } {}

scoped_task_id::~scoped_task_id() { t_task_id = previous_; }

}  // namespace harvest
