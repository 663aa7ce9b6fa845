#pragma once

#include "util.h"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace harvest {

struct item_log_row {
  std::string url;
  std::string project_name;
  std::string fetch_status;  // "success" or "failed"
  std::string fetch_error;
  std::optional<std::uint64_t> content_length;
  std::string process_status;  // "success", "failed" or "skipped"
  std::string process_error;
  std::int64_t duration_ms{ 0 };
};

// Append-only CSV ledger with one row per processed (unit, url). Safe to share between
// threads. A failed append is logged and otherwise ignored.
class item_log : unmovable {
 public:
  explicit item_log(std::filesystem::path path);

  void append(item_log_row const &row);

  std::filesystem::path const &path() const { return path_; }

  static constexpr std::string_view kHeader{
    "url,project_name,timestamp,fetch_status,fetch_error,content_length,"
    "process_status,process_error,duration_ms"
  };

  // RFC 4180 field quoting.
  static std::string csv_field(std::string_view value);

 private:
  std::filesystem::path path_;
  std::mutex mutex_;
  bool header_checked_{ false };
};

}  // namespace harvest
