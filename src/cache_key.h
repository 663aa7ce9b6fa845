#pragma once

#include "util.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace harvest {

// Identity of one fetched document: "cache_<urlhash16>_<nshash8>_<pid>_<taskid>".
// The URL hash covers the normalized URL, the namespace hash the whitespace-normalized
// project name. Immutable after construction.
class cache_key {
 public:
  static constexpr size_t kUrlHashChars{ 16 };
  static constexpr size_t kNamespaceHashChars{ 8 };

  // Uses the calling process id and the task id installed on this thread (0 if none).
  // Throws std::invalid_argument if url or ns is empty after normalization.
  static cache_key compose(std::string_view url, std::string_view ns);
  static cache_key compose(std::string_view url,
                           std::string_view ns,
                           std::int64_t pid,
                           std::uint64_t task_id);

  std::string const &canonical() const { return canonical_; }
  std::string const &url_hash() const { return url_hash_; }
  std::string const &ns_hash() const { return ns_hash_; }
  std::int64_t pid() const { return pid_; }
  std::uint64_t task_id() const { return task_id_; }

  std::string entry_name() const { return canonical_ + ".txt"; }
  std::string failure_marker_name() const { return canonical_ + ".failed"; }

  // Process id embedded in an entry or failure marker file name; nullopt for any other
  // file name.
  static std::optional<std::int64_t> owner_pid(std::string_view filename);

  bool operator==(cache_key const &other) const { return canonical_ == other.canonical_; }
  auto operator<=>(cache_key const &other) const { return canonical_ <=> other.canonical_; }

 private:
  cache_key(std::string url_hash, std::string ns_hash, std::int64_t pid, std::uint64_t task);

  std::string url_hash_;
  std::string ns_hash_;
  std::int64_t pid_;
  std::uint64_t task_id_;
  std::string canonical_;
};

// Task id visible to cache_key::compose on the current thread.
std::uint64_t cache_key_current_task();

// Fresh process-unique task id (never 0).
std::uint64_t cache_key_next_task();

// Installs a task id on the current thread for the lifetime of the guard; restores the
// previous id on destruction so guards may nest.
class scoped_task_id : unmovable {
 public:
  explicit scoped_task_id(std::uint64_t id);
  ~scoped_task_id();

  std::uint64_t id() const { return id_; }

 private:
  std::uint64_t id_;
  std::uint64_t previous_;
};

}  // namespace harvest

template <>
struct std::hash<harvest::cache_key> {
  size_t operator()(harvest::cache_key const &k) const {
    return std::hash<std::string>{}(k.canonical());
  }
};
