#pragma once

#include "cmd.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace harvest {

// Prints the cache key a fetch of URL for NAMESPACE would use.
class cmd_key : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_key> {
    std::string url;
    std::string ns;
    std::optional<std::int64_t> pid;
    std::uint64_t task{ 0 };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_key(cfg cfg, std::optional<std::filesystem::path> const &cli_cache_root);

  int execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace harvest
