#pragma once

#include "checkpoint.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace harvest {

enum class run_status {
  COMPLETED,        // every unit done
  INCOMPLETE,       // some units failed or were never started
  FAILED,           // run aborted by an unrecoverable error
  ALREADY_RUNNING,  // another instance holds the lock
};

std::string_view run_status_name(run_status status);

struct unit_failure {
  std::string id;
  std::string reason;
};

struct run_report {
  run_status status{ run_status::COMPLETED };
  std::vector<std::string> completed;  // finished during this run
  std::vector<std::string> skipped;    // already in the checkpoint
  std::vector<unit_failure> failed;
  std::vector<std::string> not_started;
  checkpoint_store::units_t results;  // every done unit, this run or earlier

  // 0 all done, 2 retry needed, 75 lock busy, 1 fatal
  int exit_code() const;
};

std::string results_to_json(run_report const &report);

// Atomically replaces `path` with the aggregated results. Throws storage_error.
void results_write(std::filesystem::path const &path, run_report const &report);

}  // namespace harvest
