#include "work_unit.h"

#include "uri.h"
#include "util.h"

#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace harvest {

bool work_unit_is_blank_value(std::string_view value) {
  auto const trimmed{ util_trim(value) };
  return trimmed.empty() || util_iequals(trimmed, "nan") || util_iequals(trimmed, "none");
}

void work_unit_merge_fields(url_summary &summary, item_fields_t const &fields) {
  for (auto const &[name, value] : fields) {
    auto it{ std::ranges::find(summary.fields, name, &field_values::name) };
    if (it == summary.fields.end()) {
      summary.fields.push_back(field_values{ .name = name, .values = {} });
      it = std::prev(summary.fields.end());
    }

    if (work_unit_is_blank_value(value)) { continue; }
    if (std::ranges::find(it->values, value) == it->values.end()) {
      it->values.push_back(value);
    }
  }
}

std::vector<std::string> work_unit_dedupe_urls(std::vector<std::string> urls) {
  std::unordered_set<std::string> seen;
  std::vector<std::string> out;
  out.reserve(urls.size());
  for (auto &url : urls) {
    if (seen.insert(uri_normalize(url)).second) { out.push_back(std::move(url)); }
  }
  return out;
}

}  // namespace harvest
