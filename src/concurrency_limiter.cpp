#include "concurrency_limiter.h"

#include "platform.h"
#include "tui.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace harvest {

concurrency_limiter::concurrency_limiter(std::size_t capacity) : capacity_{ capacity } {
  if (capacity_ < 1) {
    throw std::invalid_argument("concurrency_limiter: capacity must be at least 1");
  }
}

concurrency_limiter::slot concurrency_limiter::acquire() {
  std::unique_lock<std::mutex> lock{ mutex_ };
  cv_.wait(lock, [this] { return in_use_ < capacity_; });
  high_water_ = std::max(high_water_, ++in_use_);
  return slot{ *this };
}

concurrency_limiter::slot concurrency_limiter::try_acquire() {
  std::lock_guard<std::mutex> lock{ mutex_ };
  if (in_use_ >= capacity_) { return slot{}; }
  high_water_ = std::max(high_water_, ++in_use_);
  return slot{ *this };
}

void concurrency_limiter::release() {
  {
    std::lock_guard<std::mutex> lock{ mutex_ };
    if (in_use_ == 0) {
      throw std::logic_error("concurrency_limiter: release without matching acquire");
    }
    --in_use_;
  }
  cv_.notify_one();
}

std::size_t concurrency_limiter::in_use() const {
  std::lock_guard<std::mutex> lock{ mutex_ };
  return in_use_;
}

std::size_t concurrency_limiter::high_water() const {
  std::lock_guard<std::mutex> lock{ mutex_ };
  return high_water_;
}

std::size_t concurrency_limiter::default_capacity(std::uint64_t per_unit_bytes) {
  std::size_t const threads{ platform::hardware_threads() };
  std::size_t const upper{ 4 * threads };

  auto const available{ platform::available_memory_bytes() };
  if (!available || per_unit_bytes == 0) {
    tui::debug("Available memory unknown, defaulting to %zu concurrent units", threads);
    return threads;
  }

  std::size_t const by_memory{ static_cast<std::size_t>(*available / per_unit_bytes) };
  std::size_t const capacity{ std::clamp<std::size_t>(by_memory, 1, upper) };
  tui::debug("Concurrency limit %zu (%s free, %s per unit, ceiling %zu)",
             capacity,
             util_format_bytes(*available).c_str(),
             util_format_bytes(per_unit_bytes).c_str(),
             upper);
  return capacity;
}

concurrency_limiter::slot::~slot() { reset(); }

concurrency_limiter::slot &concurrency_limiter::slot::operator=(slot &&other) noexcept {
  if (this != &other) {
    reset();
    owner_ = other.owner_;
    other.owner_ = nullptr;
  }
  return *this;
}

void concurrency_limiter::slot::reset() {
  if (!owner_) { return; }
  auto *const owner{ owner_ };
  owner_ = nullptr;
  try {
    owner->release();
  } catch (std::logic_error const &e) {
    tui::error("Slot release failed: %s", e.what());
  }
}

}  // namespace harvest
