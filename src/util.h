#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace harvest {

template <typename T, typename... Types>
concept one_of = (std::same_as<T, Types> || ...);

struct uncopyable {
  uncopyable() = default;
  uncopyable(uncopyable &&) = default;
  uncopyable &operator=(uncopyable &&) = default;
};

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Convert bytes to lowercase hex string
std::string util_bytes_to_hex(void const *data, size_t length);

// Trim leading/trailing whitespace and collapse interior whitespace runs to one space.
// Case is preserved. Example: "  Project \t X  " -> "Project X"
std::string util_collapse_whitespace(std::string_view value);

std::string_view util_trim(std::string_view value);

bool util_iequals(std::string_view lhs, std::string_view rhs);

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory.
// Throws std::runtime_error if file cannot be opened or read.
std::string util_load_file(std::filesystem::path const &path);

// Human-readable byte formatter (B, KB, MB, GB, TB), e.g. 1536 -> "1.50KB".
std::string util_format_bytes(std::uint64_t bytes);

// Write the whole buffer, retrying on EINTR and short writes. Throws std::system_error.
void util_write_all(int fd, char const *data, size_t size);

// Owns a POSIX file descriptor; closes on destruction.
class fd_cleanup {
 public:
  explicit fd_cleanup(int fd = -1) : fd_{ fd } {}
  ~fd_cleanup();

  fd_cleanup(fd_cleanup const &) = delete;
  fd_cleanup &operator=(fd_cleanup const &) = delete;
  fd_cleanup(fd_cleanup &&other) noexcept : fd_{ other.fd_ } { other.fd_ = -1; }
  fd_cleanup &operator=(fd_cleanup &&other) noexcept;

  int get() const { return fd_; }

  // Close now. Returns false if close(2) reported an error (other than EINTR).
  bool release();

 private:
  int fd_{ -1 };
};

class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  void dismiss() { path_.clear(); }  // forget the path without removing it
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace harvest
