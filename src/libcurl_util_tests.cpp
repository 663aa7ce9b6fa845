#include "libcurl_util.h"

#include "doctest.h"

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

namespace {

struct temp_file_fixture {
  temp_file_fixture() {
    static std::mt19937_64 rng{ std::random_device{}() };
    path = std::filesystem::temp_directory_path() /
           ("harvest-curl-test-" + std::to_string(rng()) + ".html");
    std::ofstream{ path, std::ios::binary } << "<html>hello</html>";
  }

  ~temp_file_fixture() {
    std::error_code ec;
    std::filesystem::remove(path, ec);
  }

  std::string url() const { return "file://" + path.string(); }

  std::filesystem::path path;
};

}  // namespace

TEST_CASE_FIXTURE(temp_file_fixture, "libcurl_fetch reads file URLs") {
  CHECK(harvest::libcurl_fetch(url(), {}) == "<html>hello</html>");
}

TEST_CASE_FIXTURE(temp_file_fixture, "libcurl_fetch enforces the size limit") {
  harvest::libcurl_fetch_cfg cfg;
  cfg.max_bytes = 4;
  CHECK_THROWS_AS(harvest::libcurl_fetch(url(), cfg), std::runtime_error);
}

TEST_CASE("libcurl_fetch reports missing files") {
  CHECK_THROWS_AS(harvest::libcurl_fetch("file:///nonexistent/harvest/page.html", {}),
                  std::runtime_error);
}

TEST_CASE("libcurl_fetch rejects an empty url") {
  CHECK_THROWS_AS(harvest::libcurl_fetch("", {}), std::invalid_argument);
}
