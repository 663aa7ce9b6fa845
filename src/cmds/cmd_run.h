#pragma once

#include "cmd.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace harvest {

struct orchestrator_cfg;

class cmd_run : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_run> {
    std::filesystem::path manifest_path;
    std::filesystem::path templates_dir;
    std::string template_base{ "prompt" };
    std::string processor_command;
    std::optional<std::filesystem::path> cache_dir;
    std::optional<std::filesystem::path> state_dir;
    std::optional<std::filesystem::path> output_path;
    std::optional<std::filesystem::path> item_log_path;
    std::optional<std::size_t> max_concurrent;  // unset: sized from free memory
    std::size_t workers{ 0 };
    std::size_t checkpoint_every{ 1 };
    bool keep_checkpoint{ false };
    std::int64_t fetch_timeout_ms{ 60000 };
    std::int64_t process_timeout_ms{ 300000 };
    std::uint64_t max_fetch_bytes{ 64ull * 1024 * 1024 };
    std::uint64_t unit_memory_mb{ 256 };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_run(cfg cfg, std::optional<std::filesystem::path> const &cli_cache_root);

  int execute() override;
  cfg const &get_cfg() const { return cfg_; }

  // Derives the orchestrator configuration for a manifest scope. Throws
  // std::runtime_error if no cache root can be determined.
  orchestrator_cfg make_orchestrator_cfg(std::string const &scope) const;

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_cache_root_;
};

}  // namespace harvest
