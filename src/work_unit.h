#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace harvest {

// One project's worth of work; the checkpoint granularity.
struct work_unit {
  std::string id;
  std::vector<std::string> urls;  // distinct, in manifest order
};

struct prompt_template {
  std::string name;
  std::string text;
  std::filesystem::path path;
};

// Ordered (field, value) pairs returned for one (url, template) evaluation.
using item_fields_t = std::vector<std::pair<std::string, std::string>>;

struct field_values {
  std::string name;
  std::vector<std::string> values;

  bool operator==(field_values const &) const = default;
};

struct url_summary {
  std::string url;
  std::vector<field_values> fields;

  bool operator==(url_summary const &) const = default;
};

struct unit_result {
  std::vector<url_summary> urls;

  bool operator==(unit_result const &) const = default;
};

// True for values that carry no information: empty, "nan" or "none" (any case, after
// trimming).
bool work_unit_is_blank_value(std::string_view value);

// Folds one evaluation into the summary for its URL. Each field keeps its distinct
// non-blank values in first-seen order; a field seen only with blank values is kept
// with no values.
void work_unit_merge_fields(url_summary &summary, item_fields_t const &fields);

// Collapses URLs that normalize to the same key, keeping the first spelling of each in
// first-seen order.
std::vector<std::string> work_unit_dedupe_urls(std::vector<std::string> urls);

}  // namespace harvest
