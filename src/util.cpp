#include "util.h"

#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <iomanip>
#include <ranges>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace harvest {

namespace {

constexpr char kWhitespace[]{ " \t\n\r\f\v" };
constexpr auto to_lower = [](unsigned char c) { return std::tolower(c); };

}  // namespace

std::string util_bytes_to_hex(void const *data, size_t length) {
  static constexpr char hex_chars[] = "0123456789abcdef";

  auto const bytes = static_cast<unsigned char const *>(data);
  std::string result;
  result.reserve(length * 2);

  for (size_t i{}; i < length; ++i) {
    result += hex_chars[(bytes[i] >> 4) & 0xf];
    result += hex_chars[bytes[i] & 0xf];
  }

  return result;
}

std::string_view util_trim(std::string_view value) {
  auto const first{ value.find_first_not_of(kWhitespace) };
  if (first == std::string_view::npos) { return {}; }

  auto const last{ value.find_last_not_of(kWhitespace) };
  return value.substr(first, last - first + 1);
}

std::string util_collapse_whitespace(std::string_view value) {
  auto const trimmed{ util_trim(value) };

  std::string result;
  result.reserve(trimmed.size());

  bool in_space{ false };
  for (char const ch : trimmed) {
    if (std::isspace(static_cast<unsigned char>(ch))) {
      in_space = true;
      continue;
    }
    if (in_space) {
      result.push_back(' ');
      in_space = false;
    }
    result.push_back(ch);
  }

  return result;
}

bool util_iequals(std::string_view lhs, std::string_view rhs) {
  return std::ranges::equal(lhs, rhs, {}, to_lower, to_lower);
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::string util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::system_error(errno,
                            std::generic_category(),
                            "util_load_file: failed to open file: " + path.string());
  }

  std::string buffer;
  std::array<char, 16 * 1024> chunk{};
  while (true) {
    size_t const n{ std::fread(chunk.data(), 1, chunk.size(), file.get()) };
    buffer.append(chunk.data(), n);
    if (n < chunk.size()) {
      if (std::ferror(file.get())) {
        throw std::runtime_error("util_load_file: failed to read file: " + path.string());
      }
      break;
    }
  }

  return buffer;
}

std::string util_format_bytes(std::uint64_t bytes) {
  static constexpr std::array<char const *, 5> kUnits{ "B", "KB", "MB", "GB", "TB" };

  double value{ static_cast<double>(bytes) };
  std::size_t unit{ 0 };

  while (value >= 1024.0 && unit + 1 < kUnits.size()) {
    value /= 1024.0;
    ++unit;
  }

  if (unit == 0) { return std::to_string(static_cast<std::uint64_t>(value)) + "B"; }

  std::ostringstream oss;
  oss.setf(std::ios::fixed, std::ios::floatfield);
  oss << std::setprecision(2) << value << kUnits[unit];
  return oss.str();
}

void util_write_all(int fd, char const *data, size_t size) {
  while (size > 0) {
    ssize_t const written{ ::write(fd, data, size) };
    if (written == -1) {
      if (errno == EINTR) { continue; }
      throw std::system_error(errno, std::generic_category(), "write failed");
    }
    size -= static_cast<size_t>(written);
    data += written;
  }
}

fd_cleanup::~fd_cleanup() { release(); }

fd_cleanup &fd_cleanup::operator=(fd_cleanup &&other) noexcept {
  if (this == &other) { return *this; }
  release();
  fd_ = std::exchange(other.fd_, -1);
  return *this;
}

bool fd_cleanup::release() {
  if (fd_ == -1) { return true; }
  int const fd{ std::exchange(fd_, -1) };

  // POSIX leaves the descriptor state unspecified after EINTR; Linux always closes it.
  if (::close(fd) == -1 && errno != EINTR) { return false; }
  return true;
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  path_.clear();
}

}  // namespace harvest
