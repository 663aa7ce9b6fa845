#include "orchestrator.h"

#include "cache_key.h"
#include "checkpoint.h"
#include "concurrency_limiter.h"
#include "fetch_cache.h"
#include "instance_guard.h"
#include "item_log.h"
#include "platform.h"
#include "termination.h"
#include "trace.h"
#include "tui.h"

#include "tbb/global_control.h"
#include "tbb/task_arena.h"
#include "tbb/task_group.h"

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

namespace harvest {

namespace {

using steady = std::chrono::steady_clock;

std::int64_t elapsed_ms(steady::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(steady::now() - start)
      .count();
}

// Collaborators are opaque; anything they throw becomes a unit failure. Must be called
// from inside a catch block.
std::string current_exception_message() {
  try {
    throw;
  } catch (std::exception const &e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

}  // namespace

// Shared between the admitting thread and unit tasks for the duration of one run.
struct orchestrator::run_state {
  fetch_cache &cache;
  checkpoint_store &checkpoint;
  item_log *log;
  std::vector<prompt_template> const &templates;
  std::size_t checkpoint_every;

  std::atomic_bool aborted{ false };
  std::atomic_size_t since_flush{ 0 };

  std::mutex mutex;  // guards the report vectors below
  std::vector<std::string> completed;
  std::vector<unit_failure> failed;
  std::string abort_reason;

  void abort(std::string reason) {
    std::lock_guard const lock{ mutex };
    if (!aborted.exchange(true)) { abort_reason = std::move(reason); }
  }
};

orchestrator::orchestrator(orchestrator_cfg cfg, fetch_fn_t fetch, process_fn_t process)
    : cfg_{ std::move(cfg) }, fetch_{ std::move(fetch) }, process_{ std::move(process) } {
  if (cfg_.max_concurrent < 1) {
    throw std::invalid_argument("orchestrator: max_concurrent must be at least 1");
  }
  if (cfg_.checkpoint_every < 1) {
    throw std::invalid_argument("orchestrator: checkpoint_every must be at least 1");
  }
  if (!fetch_ || !process_) {
    throw std::invalid_argument("orchestrator: fetch and process functions are required");
  }
}

run_report orchestrator::run(std::vector<work_unit> const &units,
                             std::vector<prompt_template> const &templates) {
  run_report report;

  instance_guard guard{ cfg_.lock_path };
  if (guard.try_acquire() == instance_guard::acquire_result::ALREADY_HELD) {
    tui::warn("Another run holds %s; exiting", cfg_.lock_path.c_str());
    report.status = run_status::ALREADY_RUNNING;
    return report;
  }

  atomic_store cache_store{ cfg_.cache_dir, cfg_.store_options };
  if (auto const swept{ cache_store.remove_stale_temporaries(cfg_.stale_temp_age) }) {
    tui::debug("Removed %zu stale temporary file(s) from %s",
               swept,
               cache_store.root().c_str());
  }
  fetch_cache cache{ cache_store };
  cache.remove_orphaned_entries(cfg_.stale_temp_age, platform::get_pid());

  checkpoint_store checkpoint{ cfg_.checkpoint_path, cfg_.store_options };
  auto const done{ checkpoint.load() };

  std::vector<work_unit const *> pending;
  std::unordered_set<std::string> seen;
  for (auto const &unit : units) {
    if (!seen.insert(unit.id).second) { continue; }
    if (done.contains(unit.id)) {
      report.skipped.push_back(unit.id);
    } else {
      pending.push_back(&unit);
    }
  }

  tui::info("%zu unit(s) to process, %zu already done, %zu template(s)",
            pending.size(),
            report.skipped.size(),
            templates.size());

  std::unique_ptr<item_log> log;
  if (cfg_.item_log_path) { log = std::make_unique<item_log>(*cfg_.item_log_path); }

  run_state state{ .cache = cache,
                   .checkpoint = checkpoint,
                   .log = log.get(),
                   .templates = templates,
                   .checkpoint_every = cfg_.checkpoint_every };

  concurrency_limiter limiter{ cfg_.max_concurrent };

  // Unit tasks block on I/O, so every admitted unit gets its own worker.
  int const workers{ static_cast<int>(cfg_.worker_threads ? cfg_.worker_threads
                                                           : cfg_.max_concurrent) };
  tbb::global_control const parallelism{ tbb::global_control::max_allowed_parallelism,
                                         static_cast<std::size_t>(workers) + 1 };
  tbb::task_arena arena{ workers + 1 };
  tbb::task_group tg;

  std::size_t admitted{ 0 };
  for (; admitted < pending.size(); ++admitted) {
    if (termination_requested() || state.aborted) { break; }

    work_unit const &unit{ *pending[admitted] };
    auto const wait_start{ steady::now() };
    auto held{ std::make_shared<concurrency_limiter::slot>(limiter.acquire()) };

    if (termination_requested() || state.aborted) { break; }
    HARVEST_TRACE_SLOT_ACQUIRED(unit.id, limiter.in_use(), elapsed_ms(wait_start));

    arena.execute([&, held, unit_ptr = &unit] {
      tg.run([&, held, unit_ptr] {
        auto slot{ std::move(*held) };
        run_unit(*unit_ptr, state);
        slot.reset();
        HARVEST_TRACE_SLOT_RELEASED(unit_ptr->id, limiter.in_use());
      });
    });
  }

  arena.execute([&] { tg.wait(); });

  for (; admitted < pending.size(); ++admitted) {
    report.not_started.push_back(pending[admitted]->id);
  }
  if (!report.not_started.empty() && termination_requested()) {
    tui::warn("Stopped on request; %zu unit(s) not started", report.not_started.size());
  }

  if (!state.aborted && state.since_flush > 0) {
    try {
      checkpoint.flush();
    } catch (std::exception const &e) {
      state.abort(std::string{ "checkpoint flush failed: " } + e.what());
    }
  }

  report.completed = std::move(state.completed);
  report.failed = std::move(state.failed);
  report.results = checkpoint.snapshot();

  if (state.aborted) {
    tui::error("Run aborted: %s", state.abort_reason.c_str());
    report.status = run_status::FAILED;
  } else if (report.failed.empty() && report.not_started.empty()) {
    report.status = run_status::COMPLETED;
  } else {
    report.status = run_status::INCOMPLETE;
  }

  if (cfg_.output_path) {
    try {
      results_write(*cfg_.output_path, report);
    } catch (std::exception const &e) {
      tui::error("Cannot write results to %s: %s", cfg_.output_path->c_str(), e.what());
      report.status = run_status::FAILED;
    }
  }

  if (report.status == run_status::COMPLETED && !cfg_.keep_checkpoint) {
    try {
      checkpoint.remove();
    } catch (std::exception const &e) {
      tui::warn("Cannot remove checkpoint %s: %s", checkpoint.path().c_str(), e.what());
    }
  }

  tui::info("Run %s: %zu completed, %zu skipped, %zu failed, %zu not started",
            std::string{ run_status_name(report.status) }.c_str(),
            report.completed.size(),
            report.skipped.size(),
            report.failed.size(),
            report.not_started.size());
  return report;
}

void orchestrator::run_unit(work_unit const &unit, run_state &state) const {
  scoped_task_id const task{ cache_key_next_task() };
  auto const unit_start{ steady::now() };
  HARVEST_TRACE_UNIT_START(unit.id, unit.urls.size());
  tui::debug("[%s] started (%zu url(s))", unit.id.c_str(), unit.urls.size());

  unit_result result;
  std::size_t errors{ 0 };
  std::string first_error;
  auto const note_error{ [&](std::string message) {
    if (errors++ == 0) { first_error = std::move(message); }
  } };

  for (auto const &url : unit.urls) {
    auto const item_start{ steady::now() };
    item_log_row row{ .url = url, .project_name = unit.id };

    try {
      auto const key{ cache_key::compose(url, unit.id) };
      fetch_cache::scoped_release const release{ state.cache, key };

      std::string content;
      HARVEST_TRACE_FETCH_START(key.canonical(), url);
      try {
        content = state.cache.get_or_fetch(key, [&] { return fetch_(url); });
      } catch (...) {
        HARVEST_TRACE_FETCH_FAILED(key.canonical(), url, current_exception_message());
        throw;
      }
      HARVEST_TRACE_FETCH_COMPLETE(key.canonical(),
                                   url,
                                   content.size(),
                                   elapsed_ms(item_start));
      row.fetch_status = "success";
      row.content_length = content.size();

      url_summary summary{ .url = url };
      std::size_t process_errors{ 0 };
      for (auto const &tmpl : state.templates) {
        try {
          work_unit_merge_fields(summary,
                                 process_(processor_input{ .unit = unit.id,
                                                           .url = url,
                                                           .content = content,
                                                           .tmpl = tmpl }));
        } catch (...) {
          auto const why{ current_exception_message() };
          tui::warn("[%s] %s [%s]: %s",
                    unit.id.c_str(),
                    url.c_str(),
                    tmpl.name.c_str(),
                    why.c_str());
          if (process_errors++ == 0) { row.process_error = why; }
          note_error(url + " [" + tmpl.name + "]: " + why);
        }
      }
      row.process_status = process_errors ? "failed" : "success";
      result.urls.push_back(std::move(summary));
    } catch (...) {
      auto const why{ current_exception_message() };
      tui::warn("[%s] fetch %s failed: %s", unit.id.c_str(), url.c_str(), why.c_str());
      row.fetch_status = "failed";
      row.fetch_error = why;
      row.process_status = "skipped";
      note_error(url + ": " + why);
    }

    row.duration_ms = elapsed_ms(item_start);
    if (state.log) { state.log->append(row); }
  }

  if (errors) {
    auto reason{ errors == 1 ? first_error
                             : first_error + " (and " + std::to_string(errors - 1) +
                                   " more)" };
    HARVEST_TRACE_UNIT_FAILED(unit.id, reason);
    tui::error("[%s] failed: %s", unit.id.c_str(), reason.c_str());
    std::lock_guard const lock{ state.mutex };
    state.failed.push_back(unit_failure{ .id = unit.id, .reason = std::move(reason) });
    return;
  }

  state.checkpoint.record(unit.id, std::move(result));
  {
    std::lock_guard const lock{ state.mutex };
    state.completed.push_back(unit.id);
  }
  HARVEST_TRACE_UNIT_COMPLETE(unit.id, elapsed_ms(unit_start));
  tui::info("[%s] done", unit.id.c_str());

  if (++state.since_flush % state.checkpoint_every == 0) {
    try {
      state.checkpoint.flush();
    } catch (std::exception const &e) {
      state.abort(std::string{ "checkpoint flush failed: " } + e.what());
    }
  }
}

}  // namespace harvest
