#include "results.h"

#include "doctest.h"

#include "picojson.h"

#include <filesystem>
#include <random>
#include <string>

TEST_CASE("run_report exit codes") {
  harvest::run_report report;
  CHECK(report.exit_code() == 0);
  report.status = harvest::run_status::INCOMPLETE;
  CHECK(report.exit_code() == 2);
  report.status = harvest::run_status::ALREADY_RUNNING;
  CHECK(report.exit_code() == 75);
  report.status = harvest::run_status::FAILED;
  CHECK(report.exit_code() == 1);
}

TEST_CASE("results_to_json lists units, failures and unstarted units") {
  harvest::run_report report;
  report.status = harvest::run_status::INCOMPLETE;
  report.results["A"].urls.push_back(harvest::url_summary{
      .url = "https://a.example/",
      .fields = { harvest::field_values{ .name = "name", .values = { "Alpha" } } } });
  report.failed.push_back(harvest::unit_failure{ .id = "B", .reason = "fetch failed" });
  report.not_started.push_back("C");

  picojson::value root;
  REQUIRE(picojson::parse(root, harvest::results_to_json(report)).empty());
  REQUIRE(root.is<picojson::object>());
  auto const &obj{ root.get<picojson::object>() };

  CHECK(obj.at("status").get<std::string>() == "incomplete");

  auto const &units{ obj.at("units").get<picojson::object>() };
  REQUIRE(units.size() == 1);
  auto const parsed{ harvest::unit_result_from_json(units.at("A")) };
  REQUIRE(parsed.has_value());
  CHECK(*parsed == report.results.at("A"));

  auto const &failed{ obj.at("failed").get<picojson::array>() };
  REQUIRE(failed.size() == 1);
  CHECK(failed[0].get<picojson::object>().at("id").get<std::string>() == "B");
  CHECK(failed[0].get<picojson::object>().at("reason").get<std::string>() ==
        "fetch failed");

  auto const &not_started{ obj.at("not_started").get<picojson::array>() };
  REQUIRE(not_started.size() == 1);
  CHECK(not_started[0].get<std::string>() == "C");
}

TEST_CASE("results_write replaces the output file") {
  static std::mt19937_64 rng{ std::random_device{}() };
  auto const dir{ std::filesystem::temp_directory_path() /
                  ("harvest-results-test-" + std::to_string(rng())) };
  auto const path{ dir / "results.json" };

  harvest::run_report report;
  report.results["A"];
  harvest::results_write(path, report);
  auto const first{ harvest::util_load_file(path) };
  CHECK(first.find("\"A\"") != std::string::npos);

  report.results.clear();
  harvest::results_write(path, report);
  CHECK(harvest::util_load_file(path).find("\"A\"") == std::string::npos);

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}
