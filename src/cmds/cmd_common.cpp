#include "cmd_common.h"

#include "manifest.h"
#include "platform.h"

#include <stdexcept>
#include <string>

namespace harvest {

std::unique_ptr<manifest> load_manifest_or_throw(std::filesystem::path const &manifest_path) {
  if (manifest_path.empty()) { throw std::runtime_error("manifest path is required"); }
  if (!std::filesystem::is_regular_file(manifest_path)) {
    throw std::runtime_error("manifest not found: " + manifest_path.string());
  }

  auto m{ manifest::load(manifest_path) };
  if (!m) { throw std::runtime_error("could not load manifest"); }
  return m;
}

std::filesystem::path resolve_cache_root(
    std::optional<std::filesystem::path> const &cache_root) {
  if (cache_root) { return *cache_root; }

  auto default_cache_root{ platform::get_default_cache_root() };
  if (!default_cache_root) {
    throw std::runtime_error(std::string{ "could not determine cache root; set " } +
                             platform::get_default_cache_root_env_vars());
  }
  return *default_cache_root;
}

std::filesystem::path resolve_state_dir(
    std::optional<std::filesystem::path> const &state_dir,
    std::optional<std::filesystem::path> const &cache_root) {
  if (state_dir) { return *state_dir; }
  return resolve_cache_root(cache_root) / "state";
}

}  // namespace harvest
