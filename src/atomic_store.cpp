#include "atomic_store.h"

#include "platform.h"
#include "trace.h"
#include "tui.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace harvest {

namespace {

constexpr std::string_view kTempSuffix{ ".tmp" };

void validate_name(std::string_view name) {
  if (name.empty() || name == "." || name == ".." ||
      name.find('/') != std::string_view::npos) {
    throw std::invalid_argument("atomic_store: invalid entry name '" + std::string{ name } +
                                "'");
  }
}

}  // namespace

atomic_store::atomic_store(std::filesystem::path root)
    : atomic_store{ std::move(root), options{} } {}

atomic_store::atomic_store(std::filesystem::path root, options opts)
    : root_{ std::move(root) }, opts_{ std::move(opts) } {
  if (opts_.max_attempts < 1) {
    throw std::invalid_argument("atomic_store: max_attempts must be at least 1");
  }
  if (!opts_.sleep) {
    opts_.sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
  std::filesystem::create_directories(root_);
}

std::filesystem::path atomic_store::path_for(std::string_view name) const {
  validate_name(name);
  return root_ / std::string{ name };
}

bool atomic_store::is_temporary_name(std::string_view filename) {
  return filename.size() > 1 + kTempSuffix.size() && filename.front() == '.' &&
         filename.ends_with(kTempSuffix);
}

void atomic_store::write(std::string_view name, std::string_view content) {
  auto const dest{ path_for(name) };
  auto delay{ opts_.backoff_base };
  std::string last_error;

  for (int attempt{ 1 }; attempt <= opts_.max_attempts; ++attempt) {
    try {
      write_once(dest, content);
      if (attempt > 1) {
        tui::debug("Wrote %s on attempt %d", dest.c_str(), attempt);
      }
      return;
    } catch (std::exception const &e) {
      last_error = e.what();
    }

    if (attempt == opts_.max_attempts) { break; }

    tui::warn("Write to %s failed (attempt %d/%d): %s; retrying in %lldms",
              dest.c_str(),
              attempt,
              opts_.max_attempts,
              last_error.c_str(),
              static_cast<long long>(delay.count()));
    HARVEST_TRACE_STORE_RETRY(std::string{ name }, attempt, last_error);

    opts_.sleep(delay);
    delay *= 2;
  }

  tui::error("Write to %s failed after %d attempts: %s",
             dest.c_str(),
             opts_.max_attempts,
             last_error.c_str());
  throw storage_error("atomic_store: failed to write " + dest.string() + " after " +
                      std::to_string(opts_.max_attempts) + " attempts: " + last_error);
}

void atomic_store::write_once(std::filesystem::path const &dest, std::string_view content) {
  std::string const pattern{
    (root_ / ("." + dest.filename().string() + "_XXXXXX" + std::string{ kTempSuffix }))
        .string()
  };

  std::vector<char> path_buffer{ pattern.begin(), pattern.end() };
  path_buffer.push_back('\0');

  fd_cleanup fd{ ::mkstemps(path_buffer.data(), static_cast<int>(kTempSuffix.size())) };
  if (fd.get() == -1) {
    throw std::system_error(errno, std::generic_category(), "mkstemps failed in " +
                                                                root_.string());
  }

  std::filesystem::path const tmp_path{ path_buffer.data() };
  scoped_path_cleanup tmp_cleanup{ tmp_path };

  if (::fchmod(fd.get(), S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH) == -1) {
    throw std::system_error(errno, std::generic_category(), "fchmod failed");
  }

  util_write_all(fd.get(), content.data(), content.size());

  if (::fsync(fd.get()) == -1) {
    throw std::system_error(errno, std::generic_category(), "fsync failed");
  }

  if (!fd.release()) {
    throw std::system_error(errno, std::generic_category(), "close failed");
  }

  platform::atomic_rename(tmp_path, dest);
  tmp_cleanup.dismiss();

  try {
    platform::flush_directory(root_);
  } catch (std::system_error const &e) {
    // The entry is visible; only its durability across power loss is in doubt.
    tui::warn("Directory flush after writing %s failed: %s", dest.c_str(), e.what());
  }
}

std::optional<std::string> atomic_store::read(std::string_view name) const {
  auto const path{ path_for(name) };
  try {
    return util_load_file(path);
  } catch (std::system_error const &e) {
    if (e.code() == std::errc::no_such_file_or_directory) { return std::nullopt; }
    throw;
  }
}

bool atomic_store::contains(std::string_view name) const {
  std::error_code ec;
  return std::filesystem::exists(path_for(name), ec);
}

void atomic_store::remove(std::string_view name) {
  auto const path{ path_for(name) };
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    throw storage_error("atomic_store: failed to remove " + path.string() + ": " +
                        ec.message());
  }
}

std::size_t atomic_store::remove_stale_temporaries(std::chrono::seconds max_age) {
  std::size_t removed{ 0 };
  auto const now{ std::filesystem::file_time_type::clock::now() };

  std::error_code ec;
  std::filesystem::directory_iterator it{ root_, ec };
  if (ec) {
    tui::warn("Cannot scan %s for stale temporaries: %s",
              root_.c_str(),
              ec.message().c_str());
    return 0;
  }

  for (auto const &entry : it) {
    auto const filename{ entry.path().filename().string() };
    if (!is_temporary_name(filename)) { continue; }

    std::error_code entry_ec;
    auto const mtime{ entry.last_write_time(entry_ec) };
    if (entry_ec || now - mtime < max_age) { continue; }

    if (std::filesystem::remove(entry.path(), entry_ec)) {
      ++removed;
    } else if (entry_ec) {
      tui::warn("Failed to remove stale temporary %s: %s",
                entry.path().c_str(),
                entry_ec.message().c_str());
    }
  }

  if (removed > 0) {
    tui::info("Removed %zu stale temporary file(s) from %s", removed, root_.c_str());
  }
  return removed;
}

}  // namespace harvest
