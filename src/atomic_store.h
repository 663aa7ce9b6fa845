#pragma once

#include "util.h"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace harvest {

// Raised once a write has exhausted its retries, or a remove fails for a reason other
// than the file being absent.
class storage_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Flat name -> blob store in one directory, shared by threads and processes. Writes go
// to a unique temporary in the same directory, are fsynced, then renamed over the
// destination, so readers see either the previous complete value or the new one.
class atomic_store : unmovable {
 public:
  struct options {
    int max_attempts{ 3 };
    std::chrono::milliseconds backoff_base{ 1000 };  // doubles after each failed attempt
    std::function<void(std::chrono::milliseconds)> sleep;  // empty: this_thread::sleep_for
  };

  // Creates the directory if needed. Throws std::filesystem::filesystem_error.
  explicit atomic_store(std::filesystem::path root);
  atomic_store(std::filesystem::path root, options opts);

  void write(std::string_view name, std::string_view content);
  std::optional<std::string> read(std::string_view name) const;
  void remove(std::string_view name);
  bool contains(std::string_view name) const;

  // Deletes leftover temporaries older than max_age; returns how many were removed.
  // Younger ones may belong to live writers in other processes.
  std::size_t remove_stale_temporaries(std::chrono::seconds max_age);

  std::filesystem::path path_for(std::string_view name) const;
  std::filesystem::path const &root() const { return root_; }

  static bool is_temporary_name(std::string_view filename);

 private:
  void write_once(std::filesystem::path const &dest, std::string_view content);

  std::filesystem::path root_;
  options opts_;
};

}  // namespace harvest
