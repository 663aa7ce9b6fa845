#include "item_log.h"

#include "tui.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <system_error>
#include <utility>

namespace harvest {

namespace {

std::string iso8601_utc_now() {
  auto const now{ std::chrono::system_clock::now() };
  auto const millis{ std::chrono::duration_cast<std::chrono::milliseconds>(
                         now.time_since_epoch())
                         .count() %
                     1000 };
  std::time_t const t{ std::chrono::system_clock::to_time_t(now) };
  std::tm utc{};
  gmtime_r(&t, &utc);

  char buf[40]{};
  std::size_t const n{ std::strftime(buf, sizeof buf, "%Y-%m-%dT%H:%M:%S", &utc) };
  std::snprintf(buf + n, sizeof buf - n, ".%03dZ", static_cast<int>(millis));
  return buf;
}

}  // namespace

item_log::item_log(std::filesystem::path path) : path_{ std::move(path) } {}

std::string item_log::csv_field(std::string_view value) {
  if (value.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string{ value };
  }

  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (char const c : value) {
    if (c == '"') { out.push_back('"'); }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

void item_log::append(item_log_row const &row) {
  std::string line;
  line += csv_field(row.url) + ',';
  line += csv_field(row.project_name) + ',';
  line += iso8601_utc_now() + ',';
  line += csv_field(row.fetch_status) + ',';
  line += csv_field(row.fetch_error) + ',';
  line += (row.content_length ? std::to_string(*row.content_length) : std::string{}) + ',';
  line += csv_field(row.process_status) + ',';
  line += csv_field(row.process_error) + ',';
  line += std::to_string(row.duration_ms);
  line += "\r\n";

  std::lock_guard<std::mutex> lock{ mutex_ };

  if (!header_checked_) {
    std::error_code ec;
    auto const size{ std::filesystem::file_size(path_, ec) };
    if (ec || size == 0) { line = std::string{ kHeader } + "\r\n" + line; }
    if (auto const parent{ path_.parent_path() }; !parent.empty()) {
      std::filesystem::create_directories(parent, ec);
    }
  }

  auto const file{ util_open_file(path_, "ab") };
  if (!file) {
    tui::warn("Cannot open item log %s", path_.c_str());
    return;
  }
  if (std::fwrite(line.data(), 1, line.size(), file.get()) != line.size() ||
      std::fflush(file.get()) != 0) {
    tui::warn("Failed to append to item log %s", path_.c_str());
    return;
  }
  header_checked_ = true;
}

}  // namespace harvest
