#include "manifest.h"

#include "tui.h"
#include "uri.h"

#include "picojson.h"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace harvest {

namespace {

std::string unit_id_from(picojson::object const &unit, std::size_t index) {
  auto const it{ unit.find("id") };
  if (it == unit.end() || !it->second.is<std::string>()) {
    throw std::runtime_error("manifest: unit " + std::to_string(index) +
                             " has no string 'id'");
  }
  auto id{ util_collapse_whitespace(it->second.get<std::string>()) };
  if (id.empty()) {
    throw std::runtime_error("manifest: unit " + std::to_string(index) + " has an empty id");
  }
  return id;
}

std::vector<std::string> unit_urls_from(picojson::object const &unit,
                                        std::string const &id) {
  std::vector<std::string> urls;
  auto const it{ unit.find("items") };
  if (it == unit.end()) { return urls; }
  if (!it->second.is<picojson::array>()) {
    throw std::runtime_error("manifest: 'items' of unit '" + id + "' is not an array");
  }

  for (auto const &item : it->second.get<picojson::array>()) {
    if (!item.is<std::string>()) {
      tui::warn("Unit '%s': skipping non-string item %s",
                id.c_str(),
                item.serialize().c_str());
      continue;
    }
    auto url{ uri_extract_first(item.get<std::string>()) };
    if (!url) {
      tui::warn("Unit '%s': no URL in item '%s'", id.c_str(), item.get<std::string>().c_str());
      continue;
    }
    urls.push_back(std::move(*url));
  }
  return urls;
}

}  // namespace

std::unique_ptr<manifest> manifest::load(std::filesystem::path const &manifest_path) {
  std::string content;
  try {
    content = util_load_file(manifest_path);
  } catch (std::system_error const &e) {
    throw std::runtime_error("manifest: cannot read " + manifest_path.string() + ": " +
                             e.what());
  }
  return load(content, manifest_path);
}

std::unique_ptr<manifest> manifest::load(std::string_view content,
                                         std::filesystem::path const &manifest_path) {
  picojson::value root;
  std::string const json{ content };
  if (std::string const err{ picojson::parse(root, json) }; !err.empty()) {
    throw std::runtime_error("manifest: " + manifest_path.string() + ": " + err);
  }
  if (!root.is<picojson::object>()) {
    throw std::runtime_error("manifest: " + manifest_path.string() +
                             ": top level must be an object");
  }

  auto const &obj{ root.get<picojson::object>() };
  auto const units_it{ obj.find("units") };
  if (units_it == obj.end() || !units_it->second.is<picojson::array>()) {
    throw std::runtime_error("manifest: " + manifest_path.string() +
                             ": missing 'units' array");
  }

  auto m{ std::make_unique<manifest>() };
  m->manifest_path = manifest_path;

  std::unordered_map<std::string, std::size_t> index_by_id;
  auto const &units{ units_it->second.get<picojson::array>() };
  for (std::size_t i{ 0 }; i < units.size(); ++i) {
    if (!units[i].is<picojson::object>()) {
      throw std::runtime_error("manifest: unit " + std::to_string(i) + " is not an object");
    }
    auto const &unit{ units[i].get<picojson::object>() };
    auto id{ unit_id_from(unit, i) };
    auto urls{ unit_urls_from(unit, id) };

    if (auto const it{ index_by_id.find(id) }; it != index_by_id.end()) {
      tui::debug("Merging repeated unit '%s'", id.c_str());
      auto &existing{ m->units[it->second].urls };
      existing.insert(existing.end(), urls.begin(), urls.end());
    } else {
      index_by_id.emplace(id, m->units.size());
      m->units.push_back(work_unit{ .id = std::move(id), .urls = std::move(urls) });
    }
  }

  for (auto &unit : m->units) { unit.urls = work_unit_dedupe_urls(std::move(unit.urls)); }
  return m;
}

std::string manifest::scope() const {
  return std::filesystem::absolute(manifest_path).lexically_normal().string();
}

std::vector<prompt_template> templates_load(std::filesystem::path const &dir,
                                            std::string_view base) {
  std::error_code ec;
  std::filesystem::directory_iterator it{ dir, ec };
  if (ec) {
    throw std::runtime_error("templates: cannot list " + dir.string() + ": " + ec.message());
  }

  std::vector<std::filesystem::path> paths;
  for (auto const &entry : it) {
    if (!entry.is_regular_file()) { continue; }
    auto const name{ entry.path().filename().string() };
    if (name.starts_with(base) && entry.path().extension() == ".txt") {
      paths.push_back(entry.path());
    }
  }
  std::ranges::sort(paths);

  if (paths.empty()) {
    throw std::runtime_error("templates: no '" + std::string{ base } + "*.txt' files in " +
                             dir.string());
  }

  std::vector<prompt_template> templates;
  templates.reserve(paths.size());
  for (auto const &p : paths) {
    templates.push_back(prompt_template{ .name = p.stem().string(),
                                         .text = util_load_file(p),
                                         .path = p });
  }
  tui::debug("Loaded %zu template(s) from %s", templates.size(), dir.c_str());
  return templates;
}

}  // namespace harvest
