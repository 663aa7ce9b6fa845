#include "cli.h"
#include "tui.h"

#include "CLI11.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace harvest {

namespace {

// "stderr" and "file:<path>" tokens, comma separated. nullopt on an unknown token.
std::optional<std::vector<tui::trace_output_spec>> parse_trace_outputs(
    std::string_view spec,
    std::string &bad_token) {
  std::vector<tui::trace_output_spec> outputs;
  for (std::string_view sv{ spec }; !sv.empty();) {
    auto const pos{ sv.find(',') };
    std::string const token{ sv.substr(0, pos) };
    sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);

    if (token.empty()) { continue; }
    if (token == "stderr") {
      outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
    } else if (token.starts_with("file:") && token.size() > 5) {
      outputs.push_back(
          { tui::trace_output_type::file, std::filesystem::path{ token.substr(5) } });
    } else {
      bad_token = token;
      return std::nullopt;
    }
  }

  if (outputs.empty()) {
    outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
  }
  return outputs;
}

}  // namespace

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "harvest - fetch-once, process-many batch runner" };
  app.require_subcommand(0, 1);

  bool verbose{ false };
  app.add_flag("--verbose",
               verbose,
               "Enable decorated verbose logging (prefix with timestamp and level)");

  bool debug{ false };
  app.add_flag("--debug", debug, "Lower the log threshold to debug");

  std::string trace_spec;
  auto *trace_option{ app.add_option("--trace",
                                     trace_spec,
                                     "Enable trace logging. Provide a comma-separated "
                                     "list: 'stderr' for human-readable stderr and/or "
                                     "'file:<path>' for JSONL file output. Defaults to "
                                     "stderr if no value provided.") };
  trace_option->expected(0, 1);

  std::optional<std::filesystem::path> cache_root;
  app.add_option("--cache-root", cache_root, "Cache root directory");

  bool version_flag{ false };
  app.add_flag("-v,--version", version_flag, "Show version information");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  cmd_run::register_cli(app, [&cmd_cfg](cmd_run::cfg cfg) { cmd_cfg = std::move(cfg); });
  cmd_key::register_cli(app, [&cmd_cfg](cmd_key::cfg cfg) { cmd_cfg = std::move(cfg); });
  cmd_status::register_cli(app,
                           [&cmd_cfg](cmd_status::cfg cfg) { cmd_cfg = std::move(cfg); });
  cmd_version::register_cli(app,
                            [&cmd_cfg](cmd_version::cfg cfg) { cmd_cfg = std::move(cfg); });

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) {
    args.cli_output = std::string(e.what());
    cmd_cfg.reset();
  }

  args.cache_root = cache_root;

  if (trace_option->count() > 0) {
    std::string bad_token;
    if (auto outputs{ parse_trace_outputs(trace_spec, bad_token) }) {
      args.trace_outputs = std::move(*outputs);
      args.verbosity = tui::level::TUI_TRACE;
      args.decorated_logging = true;
    } else {
      args.cli_output = "Invalid trace output spec: " + bad_token;
      return args;
    }
  } else if (debug || verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = verbose;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    args.cmd_cfg = std::move(*cmd_cfg);
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace harvest
