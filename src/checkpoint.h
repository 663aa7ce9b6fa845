#pragma once

#include "atomic_store.h"
#include "util.h"
#include "work_unit.h"

#include "picojson.h"

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace harvest {

// Durable record of completed work units and their merged results, kept as one JSON
// document replaced atomically on every flush. The units present in the last flushed
// document are exactly the units a later run skips.
class checkpoint_store : unmovable {
 public:
  using units_t = std::map<std::string, unit_result>;

  static constexpr int kFormatVersion{ 1 };

  explicit checkpoint_store(std::filesystem::path path);
  checkpoint_store(std::filesystem::path path, atomic_store::options opts);

  // Replaces the in-memory snapshot with the file's contents and returns it. A missing
  // file yields an empty map; an unreadable, corrupt or foreign-version file is logged
  // and also yields an empty map.
  units_t load();

  void record(std::string const &id, unit_result result);
  bool contains(std::string const &id) const;
  std::size_t size() const;
  units_t snapshot() const;

  // Writes the current snapshot. Flushes are serialized, so a slower flush of an older
  // snapshot can never land after a newer one. Throws storage_error.
  void flush();

  // Deletes the checkpoint file; the in-memory snapshot is kept.
  void remove();

  std::filesystem::path const &path() const { return path_; }

  // <state_dir>/checkpoint-<blake3(scope) prefix>.json
  static std::filesystem::path default_path(std::filesystem::path const &state_dir,
                                            std::string_view scope);

 private:
  std::filesystem::path path_;
  std::string name_;
  atomic_store store_;

  mutable std::mutex mutex_;  // guards units_
  std::mutex flush_mutex_;
  units_t units_;
};

picojson::value unit_result_to_json(unit_result const &result);

// nullopt if the value does not have the shape unit_result_to_json produces.
std::optional<unit_result> unit_result_from_json(picojson::value const &value);

}  // namespace harvest
