#include "checkpoint.h"

#include "blake3_util.h"
#include "trace.h"
#include "tui.h"

#include <chrono>
#include <utility>

namespace harvest {

namespace {

std::filesystem::path parent_or_cwd(std::filesystem::path const &path) {
  auto parent{ path.parent_path() };
  return parent.empty() ? std::filesystem::path{ "." } : parent;
}

std::string serialize_units(checkpoint_store::units_t const &units) {
  picojson::object units_obj;
  for (auto const &[id, result] : units) { units_obj[id] = unit_result_to_json(result); }

  picojson::object root;
  root["version"] = picojson::value(static_cast<double>(checkpoint_store::kFormatVersion));
  root["units"] = picojson::value(std::move(units_obj));
  return picojson::value(std::move(root)).serialize();
}

std::optional<checkpoint_store::units_t> parse_units(std::string const &content,
                                                     std::string &why) {
  picojson::value root;
  if (std::string const err{ picojson::parse(root, content) }; !err.empty()) {
    why = err;
    return std::nullopt;
  }
  if (!root.is<picojson::object>()) {
    why = "top level is not an object";
    return std::nullopt;
  }

  auto const &obj{ root.get<picojson::object>() };
  auto const version_it{ obj.find("version") };
  if (version_it == obj.end() || !version_it->second.is<double>() ||
      version_it->second.get<double>() != checkpoint_store::kFormatVersion) {
    why = "unsupported format version";
    return std::nullopt;
  }

  auto const units_it{ obj.find("units") };
  if (units_it == obj.end() || !units_it->second.is<picojson::object>()) {
    why = "missing units object";
    return std::nullopt;
  }

  checkpoint_store::units_t units;
  for (auto const &[id, value] : units_it->second.get<picojson::object>()) {
    auto result{ unit_result_from_json(value) };
    if (!result) {
      why = "malformed result for unit '" + id + "'";
      return std::nullopt;
    }
    units.emplace(id, std::move(*result));
  }
  return units;
}

}  // namespace

checkpoint_store::checkpoint_store(std::filesystem::path path)
    : checkpoint_store{ std::move(path), atomic_store::options{} } {}

checkpoint_store::checkpoint_store(std::filesystem::path path, atomic_store::options opts)
    : path_{ std::move(path) },
      name_{ path_.filename().string() },
      store_{ parent_or_cwd(path_), std::move(opts) } {}

std::filesystem::path checkpoint_store::default_path(std::filesystem::path const &state_dir,
                                                     std::string_view scope) {
  return state_dir / ("checkpoint-" + blake3_hex_prefix(scope, 16) + ".json");
}

checkpoint_store::units_t checkpoint_store::load() {
  units_t loaded;

  std::optional<std::string> content;
  try {
    content = store_.read(name_);
  } catch (std::exception const &e) {
    tui::warn("Cannot read checkpoint %s, starting fresh: %s", path_.c_str(), e.what());
  }

  if (content) {
    std::string why;
    if (auto parsed{ parse_units(*content, why) }) {
      loaded = std::move(*parsed);
      tui::info("Resuming from checkpoint %s (%zu completed unit(s))",
                path_.c_str(),
                loaded.size());
    } else {
      tui::warn("Ignoring corrupt checkpoint %s, starting fresh: %s",
                path_.c_str(),
                why.c_str());
    }
  }

  std::lock_guard<std::mutex> lock{ mutex_ };
  units_ = loaded;
  return loaded;
}

void checkpoint_store::record(std::string const &id, unit_result result) {
  std::lock_guard<std::mutex> lock{ mutex_ };
  units_.insert_or_assign(id, std::move(result));
}

bool checkpoint_store::contains(std::string const &id) const {
  std::lock_guard<std::mutex> lock{ mutex_ };
  return units_.contains(id);
}

std::size_t checkpoint_store::size() const {
  std::lock_guard<std::mutex> lock{ mutex_ };
  return units_.size();
}

checkpoint_store::units_t checkpoint_store::snapshot() const {
  std::lock_guard<std::mutex> lock{ mutex_ };
  return units_;
}

void checkpoint_store::flush() {
  std::lock_guard<std::mutex> flush_lock{ flush_mutex_ };

  auto const start{ std::chrono::steady_clock::now() };
  auto const units{ snapshot() };
  store_.write(name_, serialize_units(units));

  auto const elapsed{ std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start) };
  tui::debug("Checkpoint %s flushed (%zu unit(s))", path_.c_str(), units.size());
  HARVEST_TRACE_CHECKPOINT_FLUSHED(path_.string(), units.size(), elapsed.count());
}

void checkpoint_store::remove() {
  std::lock_guard<std::mutex> flush_lock{ flush_mutex_ };
  store_.remove(name_);
}

picojson::value unit_result_to_json(unit_result const &result) {
  picojson::array urls;
  for (auto const &summary : result.urls) {
    picojson::array fields;
    for (auto const &field : summary.fields) {
      picojson::array values;
      for (auto const &v : field.values) { values.emplace_back(v); }

      picojson::object field_obj;
      field_obj["name"] = picojson::value(field.name);
      field_obj["values"] = picojson::value(std::move(values));
      fields.emplace_back(std::move(field_obj));
    }

    picojson::object url_obj;
    url_obj["url"] = picojson::value(summary.url);
    url_obj["fields"] = picojson::value(std::move(fields));
    urls.emplace_back(std::move(url_obj));
  }

  picojson::object obj;
  obj["urls"] = picojson::value(std::move(urls));
  return picojson::value(std::move(obj));
}

std::optional<unit_result> unit_result_from_json(picojson::value const &value) {
  if (!value.is<picojson::object>()) { return std::nullopt; }
  auto const &obj{ value.get<picojson::object>() };
  auto const urls_it{ obj.find("urls") };
  if (urls_it == obj.end() || !urls_it->second.is<picojson::array>()) { return std::nullopt; }

  unit_result result;
  for (auto const &url_value : urls_it->second.get<picojson::array>()) {
    if (!url_value.is<picojson::object>()) { return std::nullopt; }
    auto const &url_obj{ url_value.get<picojson::object>() };

    auto const url_it{ url_obj.find("url") };
    auto const fields_it{ url_obj.find("fields") };
    if (url_it == url_obj.end() || !url_it->second.is<std::string>() ||
        fields_it == url_obj.end() || !fields_it->second.is<picojson::array>()) {
      return std::nullopt;
    }

    url_summary summary{ .url = url_it->second.get<std::string>(), .fields = {} };
    for (auto const &field_value : fields_it->second.get<picojson::array>()) {
      if (!field_value.is<picojson::object>()) { return std::nullopt; }
      auto const &field_obj{ field_value.get<picojson::object>() };

      auto const name_it{ field_obj.find("name") };
      auto const values_it{ field_obj.find("values") };
      if (name_it == field_obj.end() || !name_it->second.is<std::string>() ||
          values_it == field_obj.end() || !values_it->second.is<picojson::array>()) {
        return std::nullopt;
      }

      field_values field{ .name = name_it->second.get<std::string>(), .values = {} };
      for (auto const &v : values_it->second.get<picojson::array>()) {
        if (!v.is<std::string>()) { return std::nullopt; }
        field.values.push_back(v.get<std::string>());
      }
      summary.fields.push_back(std::move(field));
    }
    result.urls.push_back(std::move(summary));
  }
  return result;
}

}  // namespace harvest
