#include "orchestrator.h"

#include "cache_key.h"
#include "checkpoint.h"
#include "instance_guard.h"
#include "platform.h"
#include "termination.h"

#include "doctest.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

struct temp_run_fixture {
  temp_run_fixture() {
    static std::mt19937_64 rng{ std::random_device{}() };
    temp_root = std::filesystem::temp_directory_path() /
                ("harvest-orchestrator-test-" + std::to_string(rng()));
    std::filesystem::create_directories(temp_root);
  }

  ~temp_run_fixture() {
    std::error_code ec;
    std::filesystem::remove_all(temp_root, ec);
  }

  harvest::orchestrator_cfg make_cfg() const {
    harvest::orchestrator_cfg cfg{ .cache_dir = temp_root / "cache",
                                   .checkpoint_path = temp_root / "state" / "checkpoint.json",
                                   .lock_path = temp_root / "state" / "run.lock" };
    cfg.store_options.max_attempts = 1;
    cfg.store_options.sleep = [](std::chrono::milliseconds) {};
    return cfg;
  }

  // Counts fetches per URL; URLs listed in `failing` throw.
  harvest::orchestrator::fetch_fn_t counting_fetch() {
    return [this](std::string const &url) {
      {
        std::lock_guard const lock{ mutex };
        ++fetches[url];
        if (std::find(failing.begin(), failing.end(), url) != failing.end()) {
          throw std::runtime_error("HTTP 503");
        }
      }
      return "content of " + url;
    };
  }

  std::size_t cache_entries() const {
    std::size_t n{ 0 };
    std::error_code ec;
    for (auto it{ std::filesystem::directory_iterator(temp_root / "cache", ec) };
         !ec && it != std::filesystem::directory_iterator{};
         it.increment(ec)) {
      ++n;
    }
    return n;
  }

  std::filesystem::path temp_root;
  std::mutex mutex;
  std::map<std::string, int> fetches;
  std::vector<std::string> failing;
};

harvest::item_fields_t echo_process(harvest::processor_input const &input) {
  return { { input.tmpl.name, std::string{ input.content } } };
}

std::vector<harvest::prompt_template> const kTemplates{
  harvest::prompt_template{ .name = "sponsor",
                            .text = "Who sponsors it?",
                            .path = "sponsor.txt" },
  harvest::prompt_template{ .name = "status",
                            .text = "What is the status?",
                            .path = "status.txt" },
};

std::vector<harvest::work_unit> three_units() {
  return { harvest::work_unit{ .id = "A",
                               .urls = { "https://a.example/1", "https://a.example/2" } },
           harvest::work_unit{ .id = "B", .urls = { "https://b.example/1" } },
           harvest::work_unit{ .id = "C", .urls = { "https://c.example/1" } } };
}

}  // namespace

TEST_CASE("orchestrator rejects unusable configuration") {
  harvest::orchestrator::fetch_fn_t const empty_fetch{ [](std::string const &) {
    return std::string{};
  } };

  harvest::orchestrator_cfg cfg{};
  cfg.max_concurrent = 0;
  CHECK_THROWS_AS(harvest::orchestrator(cfg, empty_fetch, echo_process),
                  std::invalid_argument);

  cfg.max_concurrent = 1;
  cfg.checkpoint_every = 0;
  CHECK_THROWS_AS(harvest::orchestrator(cfg, empty_fetch, echo_process),
                  std::invalid_argument);

  cfg.checkpoint_every = 1;
  CHECK_THROWS_AS(harvest::orchestrator(cfg, nullptr, echo_process), std::invalid_argument);
}

TEST_CASE_FIXTURE(temp_run_fixture, "orchestrator completes every unit and merges template fields") {
  auto cfg{ make_cfg() };
  cfg.max_concurrent = 2;
  cfg.output_path = temp_root / "out" / "results.json";

  harvest::orchestrator orch{ cfg, counting_fetch(), echo_process };
  auto const report{ orch.run(three_units(), kTemplates) };

  CHECK(report.status == harvest::run_status::COMPLETED);
  CHECK(report.exit_code() == 0);
  CHECK(report.completed.size() == 3);
  CHECK(report.failed.empty());
  CHECK(report.not_started.empty());

  REQUIRE(report.results.contains("A"));
  auto const &a{ report.results.at("A") };
  REQUIRE(a.urls.size() == 2);
  CHECK(a.urls[0].url == "https://a.example/1");
  REQUIRE(a.urls[0].fields.size() == 2);
  CHECK(a.urls[0].fields[0].name == "sponsor");
  CHECK(a.urls[0].fields[0].values ==
        std::vector<std::string>{ "content of https://a.example/1" });
  CHECK(a.urls[0].fields[1].name == "status");

  // one fetch per URL regardless of how many templates ran on it
  CHECK(fetches.size() == 4);
  for (auto const &[url, count] : fetches) { CHECK(count == 1); }

  CHECK(std::filesystem::exists(*cfg.output_path));
  CHECK_FALSE(std::filesystem::exists(cfg.checkpoint_path));
  CHECK(cache_entries() == 0);
}

TEST_CASE_FIXTURE(temp_run_fixture, "orchestrator resumes only unfinished units after a failure") {
  auto cfg{ make_cfg() };
  failing = { "https://c.example/1" };

  {
    harvest::orchestrator orch{ cfg, counting_fetch(), echo_process };
    auto const report{ orch.run(three_units(), kTemplates) };

    CHECK(report.status == harvest::run_status::INCOMPLETE);
    CHECK(report.exit_code() == 2);
    CHECK(report.completed.size() == 2);
    REQUIRE(report.failed.size() == 1);
    CHECK(report.failed[0].id == "C");
    CHECK(report.failed[0].reason.find("HTTP 503") != std::string::npos);
    CHECK_FALSE(report.results.contains("C"));
  }

  harvest::checkpoint_store cp{ cfg.checkpoint_path };
  auto const saved{ cp.load() };
  CHECK(saved.size() == 2);
  CHECK(saved.contains("A"));
  CHECK(saved.contains("B"));

  failing.clear();
  fetches.clear();

  harvest::orchestrator orch{ cfg, counting_fetch(), echo_process };
  auto const report{ orch.run(three_units(), kTemplates) };

  CHECK(report.status == harvest::run_status::COMPLETED);
  CHECK(report.completed == std::vector<std::string>{ "C" });
  CHECK(report.skipped.size() == 2);
  CHECK(report.results.size() == 3);
  CHECK(report.results.at("A") == saved.at("A"));

  REQUIRE(fetches.size() == 1);
  CHECK(fetches.begin()->first == "https://c.example/1");
  CHECK_FALSE(std::filesystem::exists(cfg.checkpoint_path));
}

TEST_CASE_FIXTURE(temp_run_fixture, "orchestrator fails a unit when one template fails") {
  auto cfg{ make_cfg() };
  cfg.keep_checkpoint = true;

  harvest::orchestrator orch{ cfg,
                              counting_fetch(),
                              [](harvest::processor_input const &input) -> harvest::item_fields_t {
                                if (input.unit == "B" && input.tmpl.name == "status") {
                                  throw std::runtime_error("model unavailable");
                                }
                                return echo_process(input);
                              } };
  auto const report{ orch.run(three_units(), kTemplates) };

  CHECK(report.status == harvest::run_status::INCOMPLETE);
  REQUIRE(report.failed.size() == 1);
  CHECK(report.failed[0].id == "B");
  CHECK(report.failed[0].reason.find("model unavailable") != std::string::npos);
  CHECK(report.results.size() == 2);
  CHECK(std::filesystem::exists(cfg.checkpoint_path));
}

TEST_CASE_FIXTURE(temp_run_fixture, "orchestrator keeps concurrent units within the limit") {
  auto cfg{ make_cfg() };
  cfg.max_concurrent = 2;
  cfg.checkpoint_every = 3;

  std::vector<harvest::work_unit> units;
  for (int i{ 0 }; i < 8; ++i) {
    units.push_back(harvest::work_unit{
        .id = "unit" + std::to_string(i),
        .urls = { "https://example.com/" + std::to_string(i) } });
  }

  std::atomic_int active{ 0 };
  std::atomic_int peak{ 0 };
  harvest::orchestrator orch{ cfg,
                              [&](std::string const &url) {
                                int const now{ ++active };
                                int prev{ peak.load() };
                                while (prev < now && !peak.compare_exchange_weak(prev, now)) {}
                                std::this_thread::sleep_for(std::chrono::milliseconds{ 20 });
                                --active;
                                return url;
                              },
                              echo_process };
  auto const report{ orch.run(units, kTemplates) };

  CHECK(report.status == harvest::run_status::COMPLETED);
  CHECK(report.completed.size() == 8);
  CHECK(peak.load() >= 1);
  CHECK(peak.load() <= 2);
}

TEST_CASE_FIXTURE(temp_run_fixture, "orchestrator exits when another instance holds the lock") {
  auto const cfg{ make_cfg() };

  harvest::instance_guard other{ cfg.lock_path };
  REQUIRE(other.try_acquire() == harvest::instance_guard::acquire_result::HELD);

  harvest::orchestrator orch{ cfg, counting_fetch(), echo_process };
  auto const report{ orch.run(three_units(), kTemplates) };

  CHECK(report.status == harvest::run_status::ALREADY_RUNNING);
  CHECK(report.exit_code() == 75);
  CHECK(fetches.empty());
}

TEST_CASE_FIXTURE(temp_run_fixture, "orchestrator admits nothing once termination is requested") {
  auto const cfg{ make_cfg() };

  harvest::termination_reset();
  harvest::termination_request();

  harvest::orchestrator orch{ cfg, counting_fetch(), echo_process };
  auto const report{ orch.run(three_units(), kTemplates) };
  harvest::termination_reset();

  CHECK(report.status == harvest::run_status::INCOMPLETE);
  CHECK(report.not_started == std::vector<std::string>{ "A", "B", "C" });
  CHECK(report.completed.empty());
  CHECK(fetches.empty());
}

TEST_CASE_FIXTURE(temp_run_fixture, "orchestrator aborts when the checkpoint cannot be written") {
  auto cfg{ make_cfg() };
  // a non-empty directory where the checkpoint file belongs defeats the rename
  std::filesystem::create_directories(cfg.checkpoint_path / "blocker");

  harvest::orchestrator orch{ cfg, counting_fetch(), echo_process };
  auto const report{ orch.run(three_units(), kTemplates) };

  CHECK(report.status == harvest::run_status::FAILED);
  CHECK(report.exit_code() == 1);
  CHECK(report.completed.size() == 1);
  CHECK(report.not_started.size() == 2);
}

TEST_CASE_FIXTURE(temp_run_fixture, "orchestrator writes one item log row per url") {
  auto cfg{ make_cfg() };
  cfg.item_log_path = temp_root / "items.csv";
  failing = { "https://b.example/1" };

  harvest::orchestrator orch{ cfg, counting_fetch(), echo_process };
  orch.run(three_units(), kTemplates);

  std::ifstream in{ *cfg.item_log_path };
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) { lines.push_back(line); }

  REQUIRE(lines.size() == 5);  // header + 4 urls
  auto const failed_rows{ std::count_if(lines.begin(), lines.end(), [](auto const &l) {
    return l.find("https://b.example/1") != std::string::npos &&
           l.find("failed") != std::string::npos && l.find("skipped") != std::string::npos;
  }) };
  CHECK(failed_rows == 1);
}

TEST_CASE_FIXTURE(temp_run_fixture,
                  "orchestrator contains non-standard exceptions to their unit") {
  auto cfg{ make_cfg() };
  cfg.max_concurrent = 2;
  cfg.output_path = temp_root / "results.json";

  harvest::orchestrator orch{ cfg,
                              [](std::string const &url) -> std::string {
                                if (url == "https://c.example/1") { throw 7; }
                                return "content of " + url;
                              },
                              [](harvest::processor_input const &input) -> harvest::item_fields_t {
                                if (input.unit == "B") { throw 42; }
                                return echo_process(input);
                              } };

  harvest::run_report report;
  REQUIRE_NOTHROW(report = orch.run(three_units(), kTemplates));

  CHECK(report.status == harvest::run_status::INCOMPLETE);
  CHECK(report.completed == std::vector<std::string>{ "A" });
  REQUIRE(report.failed.size() == 2);
  for (auto const &failure : report.failed) {
    CHECK(failure.reason.find("unknown exception") != std::string::npos);
  }
  CHECK(std::filesystem::exists(*cfg.output_path));
  CHECK(cache_entries() == 0);
}

TEST_CASE_FIXTURE(temp_run_fixture, "orchestrator clears entries orphaned by a crashed run") {
  auto const cfg{ make_cfg() };
  std::filesystem::create_directories(cfg.cache_dir);

  auto const crashed_pid{ harvest::platform::get_pid() + 1 };
  auto const orphan{ harvest::cache_key::compose("https://a.example/1", "A", crashed_pid, 9) };
  auto const marker{ harvest::cache_key::compose("https://b.example/1", "B", crashed_pid, 10) };
  auto const entry_path{ cfg.cache_dir / orphan.entry_name() };
  auto const marker_path{ cfg.cache_dir / marker.failure_marker_name() };
  std::ofstream{ entry_path } << "left behind";
  std::ofstream{ marker_path } << "";

  auto const old_time{ std::filesystem::file_time_type::clock::now() - std::chrono::hours{ 2 } };
  std::filesystem::last_write_time(entry_path, old_time);
  std::filesystem::last_write_time(marker_path, old_time);

  harvest::orchestrator orch{ cfg, counting_fetch(), echo_process };
  auto const report{ orch.run(three_units(), kTemplates) };

  CHECK(report.status == harvest::run_status::COMPLETED);
  CHECK_FALSE(std::filesystem::exists(entry_path));
  CHECK_FALSE(std::filesystem::exists(marker_path));
  CHECK(cache_entries() == 0);
}
