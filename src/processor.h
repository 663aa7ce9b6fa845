#pragma once

#include "work_unit.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace harvest {

using processor_env_t = std::unordered_map<std::string, std::string>;

// External command evaluating one (content, template) pair. The command runs under
// /bin/sh -c with the page content on stdin and these variables added to the inherited
// environment:
//   HARVEST_UNIT, HARVEST_URL, HARVEST_TEMPLATE_NAME, HARVEST_TEMPLATE_PATH
// It must print a single JSON object on stdout; each member becomes one result field.
struct processor_cfg {
  std::string command;
  std::chrono::milliseconds timeout{ 300000 };
  std::uint64_t max_output_bytes{ 8ull * 1024 * 1024 };
};

struct processor_input {
  std::string_view unit;
  std::string_view url;
  std::string_view content;
  prompt_template const &tmpl;
};

struct processor_result {
  int exit_code;
  std::optional<int> signal;
  std::string out;
  std::string err;
};

processor_env_t processor_getenv();

// Runs the command to completion. Throws std::runtime_error if it times out or produces
// more than max_output_bytes (the child is killed), and std::system_error on OS failures.
processor_result processor_exec(processor_cfg const &cfg,
                                processor_env_t const &env,
                                std::string_view stdin_content);

// Runs the command and parses its output. A non-zero exit or invalid output throws
// std::runtime_error carrying the tail of the command's stderr.
item_fields_t processor_run(processor_cfg const &cfg, processor_input const &input);

// String members are taken verbatim; null becomes ""; other values are serialized.
item_fields_t processor_parse_output(std::string_view out);

}  // namespace harvest
