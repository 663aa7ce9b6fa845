#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>

namespace CLI { class App; }

namespace harvest {

// Reports which manifest units the checkpoint already holds. Read-only; works while a
// run is in progress.
class cmd_status : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_status> {
    std::filesystem::path manifest_path;
    std::optional<std::filesystem::path> state_dir;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_status(cfg cfg, std::optional<std::filesystem::path> const &cli_cache_root);

  // 0 when every unit is done, 2 otherwise.
  int execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_cache_root_;
};

}  // namespace harvest
