#include "cmd_run.h"

#include "checkpoint.h"
#include "cmd_common.h"
#include "concurrency_limiter.h"
#include "instance_guard.h"
#include "libcurl_util.h"
#include "manifest.h"
#include "orchestrator.h"
#include "processor.h"
#include "termination.h"
#include "tui.h"

#include "CLI11.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace harvest {

void cmd_run::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("run", "Fetch every manifest URL once and process it") };
  auto cfg_ptr{ std::make_shared<cfg>() };

  sub->add_option("--manifest", cfg_ptr->manifest_path, "Manifest JSON file")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("--templates", cfg_ptr->templates_dir, "Prompt template directory")
      ->required()
      ->check(CLI::ExistingDirectory);
  sub->add_option("--template-base",
                  cfg_ptr->template_base,
                  "Template file prefix (<base>*.txt)")
      ->capture_default_str();
  sub->add_option("--processor",
                  cfg_ptr->processor_command,
                  "Shell command evaluating one page against one template")
      ->required();
  sub->add_option("--cache-dir", cfg_ptr->cache_dir, "Fetched content directory");
  sub->add_option("--state-dir", cfg_ptr->state_dir, "Checkpoint and lock directory");
  sub->add_option("--output", cfg_ptr->output_path, "Aggregated results JSON file");
  sub->add_option("--item-log", cfg_ptr->item_log_path, "Per-URL CSV ledger");
  sub->add_option("--max-concurrent", cfg_ptr->max_concurrent, "Units in flight at once")
      ->check(CLI::PositiveNumber);
  sub->add_option("--workers", cfg_ptr->workers, "Worker threads (0: one per unit slot)");
  sub->add_option("--checkpoint-every",
                  cfg_ptr->checkpoint_every,
                  "Completed units between checkpoint flushes")
      ->check(CLI::PositiveNumber)
      ->capture_default_str();
  sub->add_flag("--keep-checkpoint",
                cfg_ptr->keep_checkpoint,
                "Keep the checkpoint after every unit is done");
  sub->add_option("--fetch-timeout-ms", cfg_ptr->fetch_timeout_ms, "Per-URL fetch timeout")
      ->check(CLI::PositiveNumber)
      ->capture_default_str();
  sub->add_option("--process-timeout-ms",
                  cfg_ptr->process_timeout_ms,
                  "Per-evaluation processor timeout")
      ->check(CLI::PositiveNumber)
      ->capture_default_str();
  sub->add_option("--max-fetch-bytes", cfg_ptr->max_fetch_bytes, "Largest accepted page")
      ->check(CLI::PositiveNumber)
      ->capture_default_str();
  sub->add_option("--unit-memory-mb",
                  cfg_ptr->unit_memory_mb,
                  "Memory budget per unit when sizing --max-concurrent")
      ->check(CLI::PositiveNumber)
      ->capture_default_str();

  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_run::cmd_run(cmd_run::cfg cfg,
                 std::optional<std::filesystem::path> const &cli_cache_root)
    : cfg_{ std::move(cfg) }, cli_cache_root_{ cli_cache_root } {}

orchestrator_cfg cmd_run::make_orchestrator_cfg(std::string const &scope) const {
  auto const state_dir{ resolve_state_dir(cfg_.state_dir, cli_cache_root_) };

  orchestrator_cfg out{
    .cache_dir = cfg_.cache_dir ? *cfg_.cache_dir
                                : resolve_cache_root(cli_cache_root_) / "fetch",
    .checkpoint_path = checkpoint_store::default_path(state_dir, scope),
    .lock_path = instance_lock_path(state_dir, scope),
    .output_path = cfg_.output_path,
    .item_log_path = cfg_.item_log_path,
    .max_concurrent = cfg_.max_concurrent
                          ? *cfg_.max_concurrent
                          : concurrency_limiter::default_capacity(cfg_.unit_memory_mb *
                                                                  1024 * 1024),
    .worker_threads = cfg_.workers,
    .checkpoint_every = cfg_.checkpoint_every,
    .keep_checkpoint = cfg_.keep_checkpoint,
  };
  return out;
}

int cmd_run::execute() {
  if (cfg_.processor_command.empty()) {
    throw std::runtime_error("run: processor command is required");
  }

  auto const m{ load_manifest_or_throw(cfg_.manifest_path) };
  auto const templates{ templates_load(cfg_.templates_dir, cfg_.template_base) };
  auto const orch_cfg{ make_orchestrator_cfg(m->scope()) };

  tui::debug("Cache %s, checkpoint %s, %zu unit slot(s)",
             orch_cfg.cache_dir.c_str(),
             orch_cfg.checkpoint_path.c_str(),
             orch_cfg.max_concurrent);

  libcurl_ensure_initialized();
  termination_handler_install();

  libcurl_fetch_cfg const fetch_cfg{
    .timeout = std::chrono::milliseconds{ cfg_.fetch_timeout_ms },
    .max_bytes = cfg_.max_fetch_bytes,
  };
  processor_cfg const proc_cfg{
    .command = cfg_.processor_command,
    .timeout = std::chrono::milliseconds{ cfg_.process_timeout_ms },
  };

  orchestrator orch{
    orch_cfg,
    [fetch_cfg](std::string const &url) { return libcurl_fetch(url, fetch_cfg); },
    [proc_cfg](processor_input const &input) { return processor_run(proc_cfg, input); }
  };

  auto const report{ orch.run(m->units, templates) };
  return report.exit_code();
}

}  // namespace harvest
