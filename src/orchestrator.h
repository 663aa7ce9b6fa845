#pragma once

#include "atomic_store.h"
#include "processor.h"
#include "results.h"
#include "util.h"
#include "work_unit.h"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace harvest {

struct orchestrator_cfg {
  std::filesystem::path cache_dir;
  std::filesystem::path checkpoint_path;
  std::filesystem::path lock_path;
  std::optional<std::filesystem::path> output_path;
  std::optional<std::filesystem::path> item_log_path;
  std::size_t max_concurrent{ 1 };   // units holding a fetch slot at once
  std::size_t worker_threads{ 0 };   // 0: one per admission slot
  std::size_t checkpoint_every{ 1 };  // completions between checkpoint flushes
  bool keep_checkpoint{ false };
  std::chrono::seconds stale_temp_age{ 3600 };  // temporaries and orphaned entries
  atomic_store::options store_options;
};

// Drives one batch run: single-instance gate, checkpoint skip, bounded admission,
// fetch-once per URL, process per template, checkpoint on unit completion.
class orchestrator : unmovable {
 public:
  using fetch_fn_t = std::function<std::string(std::string const &url)>;
  using process_fn_t = std::function<item_fields_t(processor_input const &input)>;

  // Throws std::invalid_argument for an unusable configuration.
  orchestrator(orchestrator_cfg cfg, fetch_fn_t fetch, process_fn_t process);

  // Failures of individual units are reported, not thrown. Throws only when the run
  // cannot start (e.g. the lock file cannot be opened).
  run_report run(std::vector<work_unit> const &units,
                 std::vector<prompt_template> const &templates);

  orchestrator_cfg const &cfg() const { return cfg_; }

 private:
  struct run_state;

  void run_unit(work_unit const &unit, run_state &state) const;

  orchestrator_cfg cfg_;
  fetch_fn_t fetch_;
  process_fn_t process_;
};

}  // namespace harvest
