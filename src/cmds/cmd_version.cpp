#include "cmd_version.h"

#include "platform.h"
#include "tui.h"

#include "CLI11.hpp"
#include "blake3.h"
#include "curl/curl.h"
#include "tbb/version.h"

#include <string>
#include <vector>

#ifndef HARVEST_VERSION_STR
#error "HARVEST_VERSION_STR must be defined by the build system"
#endif

namespace harvest {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_version::cmd_version(cmd_version::cfg cfg,
                         std::optional<std::filesystem::path> const & /*cli_cache_root*/)
    : cfg_{ std::move(cfg) } {}

int cmd_version::execute() {
  tui::info("harvest version %s (%s)",
            HARVEST_VERSION_STR,
            platform::get_exe_path().string().c_str());
  tui::info("");
  tui::info("Third-party component versions:");

  curl_version_info_data const *curl_info{ curl_version_info(CURLVERSION_NOW) };
  std::vector<std::string> curl_features;
  if (curl_info->features & CURL_VERSION_SSL) { curl_features.push_back(curl_info->ssl_version); }
  if (curl_info->features & CURL_VERSION_LIBZ) { curl_features.push_back("zlib"); }
  if (curl_info->features & CURL_VERSION_BROTLI) { curl_features.push_back("brotli"); }
  if (curl_info->features & CURL_VERSION_ZSTD) { curl_features.push_back("zstd"); }
  if (!curl_features.empty()) {
    std::string features;
    for (size_t i{ 0 }; i < curl_features.size(); ++i) {
      if (i > 0) features.append(", ");
      features.append(curl_features[i]);
    }
    tui::info("  libcurl: %s (%s)", curl_info->version, features.c_str());
  } else {
    tui::info("  libcurl: %s", curl_info->version);
  }

  tui::info("  oneTBB: %s (runtime %s)", TBB_VERSION_STRING, TBB_runtime_version());
  tui::info("  BLAKE3: %s", BLAKE3_VERSION_STRING);
  tui::info("  CLI11: %s", CLI11_VERSION);
  return 0;
}

}  // namespace harvest
