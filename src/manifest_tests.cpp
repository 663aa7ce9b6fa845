#include "manifest.h"

#include "doctest.h"

#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace fs = std::filesystem;

std::unique_ptr<harvest::manifest> load_text(char const *json) {
  return harvest::manifest::load(std::string_view{ json }, fs::path{ "/batch/manifest.json" });
}

struct temp_dir_fixture {
  temp_dir_fixture() {
    static std::mt19937_64 rng{ std::random_device{}() };
    root = fs::temp_directory_path() / ("harvest-manifest-test-" + std::to_string(rng()));
    fs::create_directories(root);
  }

  ~temp_dir_fixture() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  void write(char const *name, char const *content) const {
    std::ofstream{ root / name } << content;
  }

  fs::path root;
};

}  // namespace

TEST_CASE("manifest loads units in order") {
  auto const m{ load_text(R"({"units":[
    {"id":"ProjectX","items":["https://example.com/a","see https://example.com/b here"]},
    {"id":"ProjectY","items":["http://other.example/"]}
  ]})") };

  REQUIRE(m->units.size() == 2);
  CHECK(m->units[0].id == "ProjectX");
  CHECK(m->units[0].urls ==
        std::vector<std::string>{ "https://example.com/a", "https://example.com/b" });
  CHECK(m->units[1].id == "ProjectY");
  CHECK(m->units[1].urls == std::vector<std::string>{ "http://other.example/" });
  CHECK(m->manifest_path == "/batch/manifest.json");
}

TEST_CASE("manifest skips items without a URL") {
  auto const m{ load_text(R"({"units":[
    {"id":"ProjectX","items":["no link here","", 42, "https://example.com/a"]}
  ]})") };

  REQUIRE(m->units.size() == 1);
  CHECK(m->units[0].urls == std::vector<std::string>{ "https://example.com/a" });
}

TEST_CASE("manifest merges repeated ids and dedupes urls") {
  auto const m{ load_text(R"({"units":[
    {"id":"Project  X","items":["https://example.com/a"]},
    {"id":"Other","items":[]},
    {"id":" Project X ","items":["https://example.com/a","https://example.com/b"]}
  ]})") };

  REQUIRE(m->units.size() == 2);
  CHECK(m->units[0].id == "Project X");
  CHECK(m->units[0].urls ==
        std::vector<std::string>{ "https://example.com/a", "https://example.com/b" });
  CHECK(m->units[1].id == "Other");
  CHECK(m->units[1].urls.empty());
}

TEST_CASE("manifest treats equivalent url spellings as one item") {
  auto const m{ load_text(R"({"units":[
    {"id":"ProjectX","items":["https://example.com/a","see https://Example.com/a/ here"]},
    {"id":"ProjectX","items":["https://example.com:443/a#intro","https://example.com/b"]}
  ]})") };

  REQUIRE(m->units.size() == 1);
  CHECK(m->units[0].urls ==
        std::vector<std::string>{ "https://example.com/a", "https://example.com/b" });
}

TEST_CASE("manifest rejects malformed input") {
  CHECK_THROWS_AS(load_text("{\"units\":["), std::runtime_error);
  CHECK_THROWS_AS(load_text("[]"), std::runtime_error);
  CHECK_THROWS_AS(load_text("{\"projects\":[]}"), std::runtime_error);
  CHECK_THROWS_AS(load_text("{\"units\":[{\"items\":[]}]}"), std::runtime_error);
  CHECK_THROWS_AS(load_text("{\"units\":[{\"id\":\"  \"}]}"), std::runtime_error);
  CHECK_THROWS_AS(load_text("{\"units\":[{\"id\":\"X\",\"items\":\"u\"}]}"),
                  std::runtime_error);
  CHECK_THROWS_AS(harvest::manifest::load(fs::path{ "/nonexistent/harvest/manifest.json" }),
                  std::runtime_error);
}

TEST_CASE("manifest scope is the absolute normal path") {
  harvest::manifest m;
  m.manifest_path = "/batch/./inputs/../manifest.json";
  CHECK(m.scope() == "/batch/manifest.json");
}

TEST_CASE_FIXTURE(temp_dir_fixture, "manifest loads from disk") {
  write("m.json", R"({"units":[{"id":"A","items":["https://a.example/"]}]})");
  auto const m{ harvest::manifest::load(root / "m.json") };
  REQUIRE(m->units.size() == 1);
  CHECK(m->units[0].id == "A");
}

TEST_CASE_FIXTURE(temp_dir_fixture, "templates load sorted by name") {
  write("prompt_b.txt", "second");
  write("prompt_a.txt", "first");
  write("prompt_c.md", "ignored extension");
  write("other.txt", "ignored prefix");

  auto const templates{ harvest::templates_load(root, "prompt") };
  REQUIRE(templates.size() == 2);
  CHECK(templates[0].name == "prompt_a");
  CHECK(templates[0].text == "first");
  CHECK(templates[0].path == root / "prompt_a.txt");
  CHECK(templates[1].name == "prompt_b");
  CHECK(templates[1].text == "second");
}

TEST_CASE_FIXTURE(temp_dir_fixture, "templates require at least one match") {
  write("other.txt", "x");
  CHECK_THROWS_AS(harvest::templates_load(root, "prompt"), std::runtime_error);
  CHECK_THROWS_AS(harvest::templates_load(root / "missing", "prompt"), std::runtime_error);
}
