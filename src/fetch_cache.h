#pragma once

#include "atomic_store.h"
#include "cache_key.h"
#include "util.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace harvest {

// Fetch-once cache for one orchestrator process. The first requester of a key either
// adopts a durable entry left in the store or runs the fetch; concurrent requesters of
// the same key block until that single fetch settles. Successful content is kept in
// memory and written to the store; failures are remembered and rethrown without
// fetching again until the key is released.
class fetch_cache : unmovable {
 public:
  using fetch_fn_t = std::function<std::string()>;

  explicit fetch_cache(atomic_store &store);

  std::string get_or_fetch(cache_key const &key, fetch_fn_t const &fetch);

  // Drops in-memory state and deletes the durable entry and failure marker. Safe to
  // call repeatedly and for keys that were never fetched. Storage errors are logged.
  void release(cache_key const &key);

  bool contains(cache_key const &key) const;

  // Deletes entries and failure markers older than max_age that another process created.
  // A process that exits without releasing its keys leaves them behind, and no later
  // process composes the same names. Returns how many were removed.
  std::size_t remove_orphaned_entries(std::chrono::seconds max_age, std::int64_t self_pid);

  class scoped_release : unmovable {
   public:
    scoped_release(fetch_cache &cache, cache_key key);
    ~scoped_release();

   private:
    fetch_cache &cache_;
    cache_key key_;
  };

 private:
  enum class state { UNFETCHED, FETCHING, CACHED, FAILED };

  struct entry {
    std::mutex mutex;
    std::condition_variable cv;
    state st{ state::UNFETCHED };
    bool released{ false };
    std::string content;
    std::exception_ptr error;
  };

  std::shared_ptr<entry> find_or_create(cache_key const &key);
  void remove_quietly(std::string const &name);

  atomic_store &store_;
  mutable std::mutex mutex_;
  std::unordered_map<cache_key, std::shared_ptr<entry>> entries_;
};

}  // namespace harvest
