#include "cli.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  harvest::tui::init();

  auto args{ harvest::cli_parse(argc, argv) };
  harvest::tui::configure_trace_outputs(args.trace_outputs);
  harvest::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      harvest::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    harvest::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit(
      [&args](auto const &cfg) { return harvest::cmd::create(cfg, args.cache_root); },
      *args.cmd_cfg) };

  try {
    return cmd->execute();
  } catch (std::exception const &ex) {
    harvest::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  } catch (...) {
    harvest::tui::error("Execution failed: unknown exception");
    return EXIT_FAILURE;
  }
}
