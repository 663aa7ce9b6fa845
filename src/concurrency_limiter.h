#pragma once

#include "util.h"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

namespace harvest {

// Counting admission gate. At no instant are more than capacity() slots held. Waiters
// are not served in FIFO order.
class concurrency_limiter : unmovable {
 public:
  // RAII holder for one slot; release happens on destruction unless moved from.
  class slot {
   public:
    slot() = default;
    ~slot();

    slot(slot const &) = delete;
    slot &operator=(slot const &) = delete;
    slot(slot &&other) noexcept : owner_{ other.owner_ } { other.owner_ = nullptr; }
    slot &operator=(slot &&other) noexcept;

    explicit operator bool() const { return owner_ != nullptr; }
    void reset();

   private:
    friend class concurrency_limiter;
    explicit slot(concurrency_limiter &owner) : owner_{ &owner } {}

    concurrency_limiter *owner_{ nullptr };
  };

  // Throws std::invalid_argument if capacity < 1.
  explicit concurrency_limiter(std::size_t capacity);

  slot acquire();
  slot try_acquire();  // empty slot if none is free

  // Manual counterpart of a slot's destructor. Throws std::logic_error if nothing is held.
  void release();

  std::size_t capacity() const { return capacity_; }
  std::size_t in_use() const;
  std::size_t high_water() const;

  // Free physical memory divided by the per-unit budget, clamped to
  // [1, 4 * hardware threads]. Falls back to the hardware thread count when the OS
  // does not report available memory.
  static std::size_t default_capacity(std::uint64_t per_unit_bytes);

 private:
  std::size_t const capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::size_t in_use_{ 0 };
  std::size_t high_water_{ 0 };
};

}  // namespace harvest
