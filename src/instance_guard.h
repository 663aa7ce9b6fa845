#pragma once

#include "platform.h"
#include "util.h"

#include <filesystem>
#include <string_view>

namespace harvest {

// Ensures at most one live process works on a given input scope. The lock is an
// advisory file lock, so the OS drops it when the holder dies; the lock file itself is
// left in place.
class instance_guard : unmovable {
 public:
  enum class acquire_result { HELD, ALREADY_HELD };

  explicit instance_guard(std::filesystem::path lock_path);
  ~instance_guard();

  // Non-blocking. Losing to another holder is reported, not thrown.
  // Throws std::system_error when the lock file cannot be created or locked.
  acquire_result try_acquire();
  void release();

  bool held() const { return lock_ != nullptr; }
  std::filesystem::path const &lock_path() const { return lock_path_; }

 private:
  std::filesystem::path lock_path_;
  platform::file_lock::ptr_t lock_;
};

// <lock_dir>/harvest-<blake3(scope) prefix>.lock
std::filesystem::path instance_lock_path(std::filesystem::path const &lock_dir,
                                         std::string_view scope);

}  // namespace harvest
