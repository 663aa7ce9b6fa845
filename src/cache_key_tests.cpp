#include "cache_key.h"

#include "blake3_util.h"
#include "platform.h"

#include "doctest.h"

#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_set>

namespace {

std::string random_token(std::mt19937_64 &rng, size_t length) {
  static constexpr char kAlphabet[]{ "abcdefghijklmnopqrstuvwxyz0123456789-" };
  std::uniform_int_distribution<size_t> pick{ 0, sizeof kAlphabet - 2 };
  std::string out;
  out.reserve(length);
  for (size_t i{ 0 }; i < length; ++i) { out.push_back(kAlphabet[pick(rng)]); }
  return out;
}

}  // namespace

TEST_CASE("cache_key has the documented shape") {
  auto const key{ harvest::cache_key::compose("https://example.com/a", "ProjectX", 4242, 7) };

  CHECK(key.url_hash() == harvest::blake3_hex_prefix("https://example.com/a", 16));
  CHECK(key.ns_hash() == harvest::blake3_hex_prefix("ProjectX", 8));
  CHECK(key.pid() == 4242);
  CHECK(key.task_id() == 7);
  CHECK(key.canonical() ==
        "cache_" + key.url_hash() + "_" + key.ns_hash() + "_4242_7");
  CHECK(key.entry_name() == key.canonical() + ".txt");
  CHECK(key.failure_marker_name() == key.canonical() + ".failed");
}

TEST_CASE("cache_key is stable for equal inputs") {
  auto const a{ harvest::cache_key::compose("https://example.com/a", "ProjectX", 1, 0) };
  auto const b{ harvest::cache_key::compose("https://example.com/a", "ProjectX", 1, 0) };
  CHECK(a == b);
  CHECK(std::hash<harvest::cache_key>{}(a) == std::hash<harvest::cache_key>{}(b));
}

TEST_CASE("cache_key normalizes url and namespace before hashing") {
  auto const base{ harvest::cache_key::compose("https://example.com/a", "Project X", 1, 0) };

  CHECK(harvest::cache_key::compose("HTTPS://EXAMPLE.com:443/a/#frag", "Project X", 1, 0) ==
        base);
  CHECK(harvest::cache_key::compose("https://example.com/a", "  Project \t X ", 1, 0) ==
        base);

  // Namespace case is significant, path case is significant
  CHECK(harvest::cache_key::compose("https://example.com/a", "project x", 1, 0) != base);
  CHECK(harvest::cache_key::compose("https://example.com/A", "Project X", 1, 0) != base);
}

TEST_CASE("cache_key differs across process and task") {
  auto const a{ harvest::cache_key::compose("https://example.com/a", "P", 1, 0) };
  CHECK(harvest::cache_key::compose("https://example.com/a", "P", 2, 0) != a);
  CHECK(harvest::cache_key::compose("https://example.com/a", "P", 1, 1) != a);
  CHECK(harvest::cache_key::compose("https://example.com/a", "P", 2, 0).url_hash() ==
        a.url_hash());
}

TEST_CASE("cache_key rejects empty inputs") {
  CHECK_THROWS_AS(harvest::cache_key::compose("", "P", 1, 0), std::invalid_argument);
  CHECK_THROWS_AS(harvest::cache_key::compose("   ", "P", 1, 0), std::invalid_argument);
  CHECK_THROWS_AS(harvest::cache_key::compose("https://x.test", "", 1, 0),
                  std::invalid_argument);
  CHECK_THROWS_AS(harvest::cache_key::compose("https://x.test", " \t\n", 1, 0),
                  std::invalid_argument);
}

TEST_CASE("cache_key has no collisions over 10000 distinct inputs") {
  std::mt19937_64 rng{ 0x5eed };
  std::unordered_set<std::string> inputs;
  std::unordered_set<std::string> keys;

  while (inputs.size() < 10000) {
    std::string const url{ "https://" + random_token(rng, 8) + ".test/" +
                           random_token(rng, 12) };
    std::string const ns{ "Project " + random_token(rng, 6) };
    if (!inputs.insert(url + '\n' + ns).second) { continue; }
    keys.insert(harvest::cache_key::compose(url, ns, 1, 0).canonical());
  }

  CHECK(keys.size() == inputs.size());
}

TEST_CASE("cache_key::compose uses current process and installed task id") {
  auto const outside{ harvest::cache_key::compose("https://example.com/a", "ProjectX") };
  CHECK(outside.pid() == harvest::platform::get_pid());
  CHECK(outside.task_id() == harvest::cache_key_current_task());

  {
    harvest::scoped_task_id outer{ 41 };
    CHECK(harvest::cache_key::compose("https://example.com/a", "ProjectX").task_id() == 41);
    {
      harvest::scoped_task_id inner{ 42 };
      CHECK(harvest::cache_key_current_task() == 42);
    }
    CHECK(harvest::cache_key_current_task() == 41);

    // Task ids are per thread
    std::uint64_t seen_on_thread{ 99 };
    std::thread{ [&] { seen_on_thread = harvest::cache_key_current_task(); } }.join();
    CHECK(seen_on_thread == 0);
  }

  CHECK(harvest::cache_key_current_task() == outside.task_id());
}

TEST_CASE("cache_key_next_task hands out distinct non-zero ids") {
  auto const a{ harvest::cache_key_next_task() };
  auto const b{ harvest::cache_key_next_task() };
  CHECK(a != 0);
  CHECK(b != 0);
  CHECK(a != b);
}

TEST_CASE("cache_key::owner_pid reads the process id back from file names") {
  auto const key{ harvest::cache_key::compose("https://example.com/a", "ProjectX", 4242, 7) };
  CHECK(harvest::cache_key::owner_pid(key.entry_name()) == 4242);
  CHECK(harvest::cache_key::owner_pid(key.failure_marker_name()) == 4242);

  CHECK_FALSE(harvest::cache_key::owner_pid(key.canonical()).has_value());
  CHECK_FALSE(harvest::cache_key::owner_pid("checkpoint.json").has_value());
  CHECK_FALSE(harvest::cache_key::owner_pid(".cache_x.txt_AbC123.tmp").has_value());
  CHECK_FALSE(harvest::cache_key::owner_pid("cache_abc_12345678_1_1.txt").has_value());
  CHECK_FALSE(
      harvest::cache_key::owner_pid("cache_0123456789abcdef_0123abcd_12x_1.txt").has_value());
  CHECK_FALSE(
      harvest::cache_key::owner_pid("cache_0123456789abcdef_0123abcd_12_1_2.txt").has_value());
  CHECK(harvest::cache_key::owner_pid("cache_0123456789abcdef_0123abcd_12_1.txt") == 12);
}
