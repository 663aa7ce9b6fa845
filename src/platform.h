#pragma once

#include "util.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace harvest::platform {

// Exclusive advisory lock on a file, acquired without blocking. POSIX record locks are
// per-process, so a path held by another thread of this process is also reported busy.
class file_lock : unmovable {
 public:
  using ptr_t = std::unique_ptr<file_lock>;

  // Returns nullptr when another process or thread holds the lock.
  // Throws std::system_error if the lock file cannot be opened or locked for other reasons.
  static ptr_t try_acquire(std::filesystem::path const &path);

  ~file_lock();

  // Replace the lock file's contents (diagnostics only, never read back for correctness).
  void write_note(std::string_view note);

  std::filesystem::path const &path() const { return path_; }

 private:
  file_lock(int fd, std::filesystem::path path, std::string key);

  int fd_;
  std::filesystem::path path_;
  std::string key_;
};

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);
void flush_directory(std::filesystem::path const &dir);

std::optional<std::filesystem::path> get_default_cache_root();
char const *get_default_cache_root_env_vars();

std::filesystem::path get_exe_path();

void env_var_set(char const *name, char const *value);
void env_var_unset(char const *name);

std::int64_t get_pid();

// Physical memory currently available to new allocations, if the OS reports it.
std::optional<std::uint64_t> available_memory_bytes();
unsigned hardware_threads();

bool is_tty();

}  // namespace harvest::platform
