#include "cmd_status.h"

#include "checkpoint.h"
#include "cmd_common.h"
#include "manifest.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <string>
#include <vector>

namespace harvest {

void cmd_status::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("status", "List done and pending units") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--manifest", cfg_ptr->manifest_path, "Manifest JSON file")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("--state-dir", cfg_ptr->state_dir, "Checkpoint and lock directory");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_status::cmd_status(cmd_status::cfg cfg,
                       std::optional<std::filesystem::path> const &cli_cache_root)
    : cfg_{ std::move(cfg) }, cli_cache_root_{ cli_cache_root } {}

int cmd_status::execute() {
  auto const m{ load_manifest_or_throw(cfg_.manifest_path) };
  auto const state_dir{ resolve_state_dir(cfg_.state_dir, cli_cache_root_) };

  checkpoint_store cp{ checkpoint_store::default_path(state_dir, m->scope()) };
  auto const done{ cp.load() };

  std::vector<std::string const *> pending;
  std::size_t completed{ 0 };
  for (auto const &unit : m->units) {
    if (done.contains(unit.id)) {
      ++completed;
    } else {
      pending.push_back(&unit.id);
    }
  }

  tui::print_stdout("checkpoint: %s\n", cp.path().c_str());
  tui::print_stdout("done: %zu\npending: %zu\n", completed, pending.size());
  for (auto const *id : pending) { tui::print_stdout("  %s\n", id->c_str()); }

  return pending.empty() ? 0 : 2;
}

}  // namespace harvest
