#pragma once

#include "util.h"
#include "work_unit.h"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace harvest {

// Batch input: {"units":[{"id":"<project>","items":["<text containing a URL>", ...]}]}
struct manifest : unmovable {
  std::vector<work_unit> units;
  std::filesystem::path manifest_path;

  manifest() = default;

  // Throws std::runtime_error on unreadable or malformed input.
  static std::unique_ptr<manifest> load(std::filesystem::path const &manifest_path);
  static std::unique_ptr<manifest> load(std::string_view content,
                                        std::filesystem::path const &manifest_path);

  // Identity of this input for the checkpoint and instance lock: the absolute,
  // lexically normal manifest path.
  std::string scope() const;
};

// Loads <dir>/<base>*.txt sorted by file name. Throws std::runtime_error if none match.
std::vector<prompt_template> templates_load(std::filesystem::path const &dir,
                                            std::string_view base);

}  // namespace harvest
