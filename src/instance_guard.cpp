#include "instance_guard.h"

#include "blake3_util.h"
#include "trace.h"
#include "tui.h"

#include <chrono>
#include <ctime>
#include <string>
#include <system_error>
#include <utility>

namespace harvest {

namespace {

std::string utc_timestamp() {
  std::time_t const now{ std::chrono::system_clock::to_time_t(
      std::chrono::system_clock::now()) };
  std::tm utc{};
  gmtime_r(&now, &utc);
  char buf[32]{};
  std::strftime(buf, sizeof buf, "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buf;
}

}  // namespace

instance_guard::instance_guard(std::filesystem::path lock_path)
    : lock_path_{ std::move(lock_path) } {}

instance_guard::~instance_guard() { release(); }

instance_guard::acquire_result instance_guard::try_acquire() {
  if (lock_) { return acquire_result::HELD; }

  if (auto const parent{ lock_path_.parent_path() }; !parent.empty()) {
    std::filesystem::create_directories(parent);
  }

  lock_ = platform::file_lock::try_acquire(lock_path_);
  HARVEST_TRACE_INSTANCE_LOCK(lock_path_.string(), lock_ != nullptr);

  if (!lock_) {
    tui::debug("Instance lock %s is held elsewhere", lock_path_.c_str());
    return acquire_result::ALREADY_HELD;
  }

  try {
    lock_->write_note("pid=" + std::to_string(platform::get_pid()) +
                      "\nacquired=" + utc_timestamp() + "\n");
  } catch (std::system_error const &e) {
    tui::warn("Could not record holder in %s: %s", lock_path_.c_str(), e.what());
  }

  tui::debug("Instance lock %s acquired", lock_path_.c_str());
  return acquire_result::HELD;
}

void instance_guard::release() {
  if (!lock_) { return; }
  lock_.reset();
  tui::debug("Instance lock %s released", lock_path_.c_str());
}

std::filesystem::path instance_lock_path(std::filesystem::path const &lock_dir,
                                         std::string_view scope) {
  return lock_dir / ("harvest-" + blake3_hex_prefix(scope, 16) + ".lock");
}

}  // namespace harvest
