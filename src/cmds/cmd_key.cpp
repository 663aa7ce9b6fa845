#include "cmd_key.h"

#include "cache_key.h"
#include "platform.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>

namespace harvest {

void cmd_key::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("key", "Print the cache key for a URL and namespace") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("url", cfg_ptr->url, "Document URL")->required();
  sub->add_option("namespace", cfg_ptr->ns, "Project name")->required();
  sub->add_option("--pid", cfg_ptr->pid, "Process id (default: this process)");
  sub->add_option("--task", cfg_ptr->task, "Task id")->capture_default_str();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_key::cmd_key(cmd_key::cfg cfg,
                 std::optional<std::filesystem::path> const & /*cli_cache_root*/)
    : cfg_{ std::move(cfg) } {}

int cmd_key::execute() {
  auto const key{ cache_key::compose(cfg_.url,
                                     cfg_.ns,
                                     cfg_.pid.value_or(platform::get_pid()),
                                     cfg_.task) };
  tui::print_stdout("%s\n", key.canonical().c_str());
  return 0;
}

}  // namespace harvest
