#include "results.h"

#include "atomic_store.h"
#include "tui.h"

#include "picojson.h"

#include <utility>

namespace harvest {

std::string_view run_status_name(run_status status) {
  switch (status) {
    case run_status::COMPLETED: return "completed";
    case run_status::INCOMPLETE: return "incomplete";
    case run_status::FAILED: return "failed";
    case run_status::ALREADY_RUNNING: return "already_running";
  }
  return "unknown";
}

int run_report::exit_code() const {
  switch (status) {
    case run_status::COMPLETED: return 0;
    case run_status::INCOMPLETE: return 2;
    case run_status::ALREADY_RUNNING: return 75;  // EX_TEMPFAIL
    case run_status::FAILED: return 1;
  }
  return 1;
}

std::string results_to_json(run_report const &report) {
  picojson::object units;
  for (auto const &[id, result] : report.results) { units[id] = unit_result_to_json(result); }

  picojson::array failed;
  for (auto const &f : report.failed) {
    picojson::object entry;
    entry["id"] = picojson::value(f.id);
    entry["reason"] = picojson::value(f.reason);
    failed.emplace_back(std::move(entry));
  }

  picojson::array not_started;
  for (auto const &id : report.not_started) { not_started.emplace_back(id); }

  picojson::object root;
  root["status"] = picojson::value(std::string{ run_status_name(report.status) });
  root["units"] = picojson::value(std::move(units));
  root["failed"] = picojson::value(std::move(failed));
  root["not_started"] = picojson::value(std::move(not_started));
  return picojson::value(std::move(root)).serialize(true);
}

void results_write(std::filesystem::path const &path, run_report const &report) {
  auto const parent{ path.parent_path() };
  atomic_store store{ parent.empty() ? std::filesystem::path{ "." } : parent };
  store.write(path.filename().string(), results_to_json(report));
  tui::info("Wrote results for %zu unit(s) to %s", report.results.size(), path.c_str());
}

}  // namespace harvest
