#include "fetch_cache.h"

#include "trace.h"
#include "tui.h"

#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>

namespace harvest {

fetch_cache::fetch_cache(atomic_store &store) : store_{ store } {}

std::shared_ptr<fetch_cache::entry> fetch_cache::find_or_create(cache_key const &key) {
  std::lock_guard<std::mutex> lock{ mutex_ };
  auto &slot{ entries_[key] };
  if (!slot) { slot = std::make_shared<entry>(); }
  return slot;
}

bool fetch_cache::contains(cache_key const &key) const {
  std::lock_guard<std::mutex> lock{ mutex_ };
  return entries_.contains(key);
}

std::string fetch_cache::get_or_fetch(cache_key const &key, fetch_fn_t const &fetch) {
  auto const e{ find_or_create(key) };
  std::unique_lock<std::mutex> lock{ e->mutex };

  e->cv.wait(lock, [&] { return e->st != state::FETCHING; });

  switch (e->st) {
    case state::CACHED:
      HARVEST_TRACE_CACHE_HIT(key.canonical(), std::string{ "memory" });
      return e->content;
    case state::FAILED: std::rethrow_exception(e->error);
    case state::UNFETCHED:
    case state::FETCHING: break;
  }

  e->st = state::FETCHING;
  lock.unlock();

  std::optional<std::string> adopted;
  try {
    adopted = store_.read(key.entry_name());
  } catch (std::exception const &ex) {
    tui::warn("Cache read of %s failed, fetching instead: %s",
              key.entry_name().c_str(),
              ex.what());
  }

  if (adopted) {
    HARVEST_TRACE_CACHE_HIT(key.canonical(), std::string{ "store" });
    lock.lock();
    e->content = std::move(*adopted);
    e->st = state::CACHED;
    e->cv.notify_all();
    return e->content;
  }

  HARVEST_TRACE_CACHE_MISS(key.canonical());

  std::string content;
  std::exception_ptr error;
  try {
    content = fetch();
  } catch (...) {
    error = std::current_exception();  // rethrown below once waiters are woken
  }

  lock.lock();

  if (error) {
    e->error = error;
    e->st = state::FAILED;
    if (!e->released) {
      try {
        store_.write(key.failure_marker_name(), "");
      } catch (std::exception const &ex) {
        tui::warn("Failed to write failure marker %s: %s",
                  key.failure_marker_name().c_str(),
                  ex.what());
      }
    }
    e->cv.notify_all();
    std::rethrow_exception(error);
  }

  // Writing under the entry lock orders this write before any concurrent release.
  if (!e->released) {
    try {
      store_.write(key.entry_name(), content);
    } catch (std::exception const &ex) {
      tui::warn("Cache entry %s kept in memory only: %s",
                key.entry_name().c_str(),
                ex.what());
    }
  }

  e->content = std::move(content);
  e->st = state::CACHED;
  e->cv.notify_all();
  return e->content;
}

void fetch_cache::release(cache_key const &key) {
  std::shared_ptr<entry> e;
  {
    std::lock_guard<std::mutex> lock{ mutex_ };
    if (auto it{ entries_.find(key) }; it != entries_.end()) {
      e = std::move(it->second);
      entries_.erase(it);
    }
  }

  if (e) {
    std::lock_guard<std::mutex> lock{ e->mutex };
    e->released = true;
  }

  remove_quietly(key.entry_name());
  remove_quietly(key.failure_marker_name());
  HARVEST_TRACE_ENTRY_RELEASED(key.canonical());
}

std::size_t fetch_cache::remove_orphaned_entries(std::chrono::seconds max_age,
                                                 std::int64_t self_pid) {
  std::size_t removed{ 0 };
  auto const now{ std::filesystem::file_time_type::clock::now() };

  std::error_code ec;
  std::filesystem::directory_iterator it{ store_.root(), ec };
  if (ec) {
    tui::warn("Cannot scan %s for orphaned entries: %s",
              store_.root().c_str(),
              ec.message().c_str());
    return 0;
  }

  for (auto const &entry : it) {
    auto const owner{ cache_key::owner_pid(entry.path().filename().string()) };
    if (!owner || *owner == self_pid) { continue; }

    std::error_code entry_ec;
    auto const mtime{ entry.last_write_time(entry_ec) };
    if (entry_ec || now - mtime < max_age) { continue; }

    if (std::filesystem::remove(entry.path(), entry_ec)) {
      ++removed;
    } else if (entry_ec) {
      tui::warn("Failed to remove orphaned entry %s: %s",
                entry.path().c_str(),
                entry_ec.message().c_str());
    }
  }

  if (removed > 0) {
    tui::info("Removed %zu orphaned entr%s from %s",
              removed,
              removed == 1 ? "y" : "ies",
              store_.root().c_str());
  }
  return removed;
}

void fetch_cache::remove_quietly(std::string const &name) {
  try {
    store_.remove(name);
  } catch (std::exception const &ex) {
    tui::warn("Failed to remove cache file %s: %s", name.c_str(), ex.what());
  }
}

fetch_cache::scoped_release::scoped_release(fetch_cache &cache, cache_key key)
    : cache_{ cache }, key_{ std::move(key) } {}

fetch_cache::scoped_release::~scoped_release() {
  try {
    cache_.release(key_);
  } catch (std::exception const &ex) {
    tui::warn("Release of %s failed: %s", key_.canonical().c_str(), ex.what());
  }
}

}  // namespace harvest
