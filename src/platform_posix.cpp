#include "platform.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_set>
#include <vector>

namespace harvest::platform {

namespace {

// POSIX file locks are per-process, not per-thread: a second open+fcntl from another
// thread of the same process would succeed. Paths held by this process live here.
std::mutex s_held_mutex;
std::unordered_set<std::string> s_held_paths;

}  // namespace

file_lock::ptr_t file_lock::try_acquire(std::filesystem::path const &path) {
  // Canonicalize so different spellings of the same path share one registry entry
  std::string key{ std::filesystem::absolute(path).lexically_normal().string() };

  {
    std::lock_guard<std::mutex> lock{ s_held_mutex };
    if (!s_held_paths.insert(key).second) { return nullptr; }
  }

  auto unregister{ [&key] {
    std::lock_guard<std::mutex> lock{ s_held_mutex };
    s_held_paths.erase(key);
  } };

  int const fd{ ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644) };
  if (fd == -1) {
    int const err{ errno };
    unregister();
    throw std::system_error(err,
                            std::system_category(),
                            "Failed to open lock file: " + path.string());
  }

  struct flock fl{ .l_type = F_WRLCK,
                   .l_whence = SEEK_SET,
                   .l_start = 0,
                   .l_len = 0,
                   .l_pid = 0 };

  if (::fcntl(fd, F_SETLK, &fl) == -1) {
    int const err{ errno };
    ::close(fd);
    unregister();
    if (err == EACCES || err == EAGAIN) { return nullptr; }
    throw std::system_error(err,
                            std::system_category(),
                            "Failed to acquire exclusive lock: " + path.string());
  }

  return ptr_t{ new file_lock{ fd, path, std::move(key) } };
}

file_lock::file_lock(int fd, std::filesystem::path path, std::string key)
    : fd_{ fd }, path_{ std::move(path) }, key_{ std::move(key) } {}

file_lock::~file_lock() {
  // The lock file is left in place: unlinking it would let a new opener lock a fresh
  // inode while a waiter still holds the old one.
  ::close(fd_);

  std::lock_guard<std::mutex> lock{ s_held_mutex };
  s_held_paths.erase(key_);
}

void file_lock::write_note(std::string_view note) {
  if (::ftruncate(fd_, 0) == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to truncate lock file: " + path_.string());
  }
  if (::lseek(fd_, 0, SEEK_SET) == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to seek lock file: " + path_.string());
  }
  util_write_all(fd_, note.data(), note.size());
}

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

void flush_directory(std::filesystem::path const &dir) {
  fd_cleanup fd{ ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC) };
  if (fd.get() == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to open directory: " + dir.string());
  }
  if (::fsync(fd.get()) == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to fsync directory: " + dir.string());
  }
}

std::optional<std::filesystem::path> get_default_cache_root() {
  // HARVEST_CACHE_ROOT takes precedence
  if (char const *env_root{ std::getenv("HARVEST_CACHE_ROOT") }) {
    return std::filesystem::path{ env_root };
  }

  if (char const *xdg_cache{ std::getenv("XDG_CACHE_HOME") }) {
    return std::filesystem::path{ xdg_cache } / "harvest";
  }

  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / ".cache" / "harvest";
  }

  return std::nullopt;
}

char const *get_default_cache_root_env_vars() {
  return "HARVEST_CACHE_ROOT, XDG_CACHE_HOME or HOME";
}

std::filesystem::path get_exe_path() {
  std::vector<char> buf(4096);
  ssize_t const len{ ::readlink("/proc/self/exe", buf.data(), buf.size() - 1) };
  if (len == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "readlink /proc/self/exe failed");
  }
  buf[static_cast<size_t>(len)] = '\0';
  return std::filesystem::path{ buf.data() };
}

void env_var_set(char const *name, char const *value) {
  if (name == nullptr || value == nullptr) {
    throw std::invalid_argument("env_var_set: null name or value");
  }

  if (::setenv(name, value, 1) != 0) {
    throw std::runtime_error(std::string("env_var_set: failed to set ") + name);
  }
}

void env_var_unset(char const *name) {
  if (name == nullptr) { throw std::invalid_argument("env_var_unset: null name"); }
  ::unsetenv(name);
}

std::int64_t get_pid() { return static_cast<std::int64_t>(::getpid()); }

std::optional<std::uint64_t> available_memory_bytes() {
  long const pages{ ::sysconf(_SC_AVPHYS_PAGES) };
  long const page_size{ ::sysconf(_SC_PAGESIZE) };
  if (pages <= 0 || page_size <= 0) { return std::nullopt; }
  return static_cast<std::uint64_t>(pages) * static_cast<std::uint64_t>(page_size);
}

unsigned hardware_threads() {
  unsigned const n{ std::thread::hardware_concurrency() };
  return n == 0 ? 1u : n;
}

bool is_tty() { return ::isatty(::fileno(stderr)) != 0; }

}  // namespace harvest::platform
