#pragma once

#include <filesystem>
#include <memory>
#include <optional>

namespace harvest {

struct manifest;

std::unique_ptr<manifest> load_manifest_or_throw(std::filesystem::path const &manifest_path);

// Explicit root, else the platform default (HARVEST_CACHE_ROOT, XDG_CACHE_HOME, HOME).
std::filesystem::path resolve_cache_root(
    std::optional<std::filesystem::path> const &cache_root);

// Checkpoints and instance locks live under <cache root>/state unless overridden.
std::filesystem::path resolve_state_dir(
    std::optional<std::filesystem::path> const &state_dir,
    std::optional<std::filesystem::path> const &cache_root);

}  // namespace harvest
