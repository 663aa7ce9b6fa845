#include "concurrency_limiter.h"

#include "platform.h"

#include "doctest.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

TEST_CASE("concurrency_limiter rejects zero capacity") {
  CHECK_THROWS_AS(harvest::concurrency_limiter{ 0 }, std::invalid_argument);
}

TEST_CASE("concurrency_limiter slots release on scope exit") {
  harvest::concurrency_limiter limiter{ 2 };
  {
    auto const a{ limiter.acquire() };
    auto const b{ limiter.acquire() };
    CHECK(limiter.in_use() == 2);
    CHECK_FALSE(limiter.try_acquire());
  }
  CHECK(limiter.in_use() == 0);
  CHECK(limiter.high_water() == 2);
}

TEST_CASE("concurrency_limiter slot move transfers ownership") {
  harvest::concurrency_limiter limiter{ 1 };
  auto first{ limiter.acquire() };
  REQUIRE(first);

  auto second{ std::move(first) };
  CHECK_FALSE(first);
  CHECK(second);
  CHECK(limiter.in_use() == 1);

  second.reset();
  CHECK(limiter.in_use() == 0);
  second.reset();
  CHECK(limiter.in_use() == 0);
}

TEST_CASE("concurrency_limiter rejects release without acquire") {
  harvest::concurrency_limiter limiter{ 3 };
  CHECK_THROWS_AS(limiter.release(), std::logic_error);
}

TEST_CASE("concurrency_limiter bounds concurrent holders") {
  constexpr std::size_t kCapacity{ 3 };
  constexpr int kTasks{ 24 };

  harvest::concurrency_limiter limiter{ kCapacity };
  std::atomic_int active{ 0 };
  std::atomic_int peak{ 0 };
  std::atomic_int finished{ 0 };

  std::vector<std::thread> threads;
  for (int i{ 0 }; i < kTasks; ++i) {
    threads.emplace_back([&, i] {
      try {
        auto const held{ limiter.acquire() };
        int const now{ ++active };
        int seen{ peak.load() };
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds{ 5 });
        --active;
        ++finished;
        if (i % 4 == 0) { throw std::runtime_error("task failed"); }
      } catch (std::runtime_error const &) {}
    });
  }
  for (auto &t : threads) { t.join(); }

  CHECK(finished == kTasks);
  CHECK(peak <= static_cast<int>(kCapacity));
  CHECK(limiter.high_water() <= kCapacity);
  CHECK(limiter.in_use() == 0);
}

TEST_CASE("concurrency_limiter acquire blocks until a slot frees") {
  harvest::concurrency_limiter limiter{ 1 };
  auto held{ limiter.acquire() };

  std::atomic_bool acquired{ false };
  std::thread waiter{ [&] {
    auto const s{ limiter.acquire() };
    acquired = true;
  } };

  std::this_thread::sleep_for(std::chrono::milliseconds{ 30 });
  CHECK_FALSE(acquired);

  held.reset();
  waiter.join();
  CHECK(acquired);
  CHECK(limiter.in_use() == 0);
}

TEST_CASE("concurrency_limiter default capacity stays within bounds") {
  auto const upper{ 4 * static_cast<std::size_t>(harvest::platform::hardware_threads()) };

  auto const huge_budget{ harvest::concurrency_limiter::default_capacity(~0ull) };
  CHECK(huge_budget >= 1);
  CHECK(huge_budget <= upper);

  auto const tiny_budget{ harvest::concurrency_limiter::default_capacity(1) };
  CHECK(tiny_budget >= 1);
  CHECK(tiny_budget <= upper);
}
