#include "work_unit.h"

#include "doctest.h"

#include <string>
#include <vector>

TEST_CASE("work_unit blank values") {
  CHECK(harvest::work_unit_is_blank_value(""));
  CHECK(harvest::work_unit_is_blank_value("   "));
  CHECK(harvest::work_unit_is_blank_value("NaN"));
  CHECK(harvest::work_unit_is_blank_value(" none "));
  CHECK(harvest::work_unit_is_blank_value("NONE"));
  CHECK_FALSE(harvest::work_unit_is_blank_value("nanometer"));
  CHECK_FALSE(harvest::work_unit_is_blank_value("0"));
}

TEST_CASE("work_unit merge keeps distinct values in first-seen order") {
  harvest::url_summary summary{ .url = "https://example.com/a", .fields = {} };

  harvest::work_unit_merge_fields(summary,
                                  { { "name", "ACME" }, { "status", "nan" } });
  harvest::work_unit_merge_fields(summary,
                                  { { "status", "approved" }, { "name", "Acme Corp" } });
  harvest::work_unit_merge_fields(summary,
                                  { { "name", "ACME" }, { "status", "" }, { "phase", "None" } });

  REQUIRE(summary.fields.size() == 3);
  CHECK(summary.fields[0].name == "name");
  CHECK(summary.fields[0].values == std::vector<std::string>{ "ACME", "Acme Corp" });
  CHECK(summary.fields[1].name == "status");
  CHECK(summary.fields[1].values == std::vector<std::string>{ "approved" });
  CHECK(summary.fields[2].name == "phase");
  CHECK(summary.fields[2].values.empty());
}

TEST_CASE("work_unit merge is case sensitive for real values") {
  harvest::url_summary summary;
  harvest::work_unit_merge_fields(summary, { { "k", "Value" }, { "k", "value" } });
  REQUIRE(summary.fields.size() == 1);
  CHECK(summary.fields[0].values.size() == 2);
}

TEST_CASE("work_unit dedupe keeps first occurrence") {
  auto const urls{ harvest::work_unit_dedupe_urls(
      { "https://a.example/", "https://b.example/", "https://a.example/" }) };
  CHECK(urls == std::vector<std::string>{ "https://a.example/", "https://b.example/" });
}

TEST_CASE("work_unit dedupe collapses equivalent spellings") {
  auto const urls{ harvest::work_unit_dedupe_urls({ "https://a.example/x",
                                                    "https://a.example/x/",
                                                    "HTTPS://A.example:443/x#top",
                                                    "https://a.example/x?b=2&a=1",
                                                    "https://a.example/x?a=1&b=2",
                                                    "https://a.example/X" }) };
  CHECK(urls == std::vector<std::string>{ "https://a.example/x",
                                          "https://a.example/x?b=2&a=1",
                                          "https://a.example/X" });
}
