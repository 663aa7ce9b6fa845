#pragma once

#include "cmds/cmd_key.h"
#include "cmds/cmd_run.h"
#include "cmds/cmd_status.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace harvest {

struct cli_args {
  using cmd_cfg_t =
      std::variant<cmd_run::cfg, cmd_key::cfg, cmd_status::cfg, cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<std::filesystem::path> cache_root;  // Global cache root override
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace harvest
