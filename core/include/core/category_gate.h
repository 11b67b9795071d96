#pragma once

#include "core/cancel_token.h"
#include "core/result.h"
#include "core/task.h"
#include "core/task_error.h"

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>

namespace opg::core {

/// Per-category concurrency ceilings.
struct GateConfig {
  std::array<int, kCategoryCount> capacity{};

  /// desktop = 1, file = 3, query = 5, shell = 2, network = 3.
  static GateConfig defaults();

  [[nodiscard]] int capacity_of(TaskCategory category) const {
    return capacity[index_of(category)];
  }
  void set_capacity(TaskCategory category, int value) {
    capacity[index_of(category)] = value;
  }
};

class CategoryGate;

/// Move-only admission permit. Releases its slot exactly once: on release()
/// or destruction, whichever comes first.
class GatePermit {
public:
  GatePermit() = default;
  ~GatePermit();

  GatePermit(GatePermit &&other) noexcept;
  GatePermit &operator=(GatePermit &&other) noexcept;
  GatePermit(const GatePermit &) = delete;
  GatePermit &operator=(const GatePermit &) = delete;

  [[nodiscard]] bool valid() const noexcept { return gate_ != nullptr; }
  [[nodiscard]] TaskCategory category() const noexcept { return category_; }

  void release() noexcept;

private:
  friend class CategoryGate;
  GatePermit(CategoryGate *gate, TaskCategory category)
      : gate_(gate), category_(category) {}

  CategoryGate *gate_ = nullptr;
  TaskCategory category_ = TaskCategory::Query;
};

/// Admission control: one bounded counting semaphore per category.
///
/// Waiters within a category are admitted in arrival order (ticket queue).
/// A waiter leaves the queue without a slot when its cancel token fires or
/// its timeout expires.
class CategoryGate {
public:
  /// Throws std::invalid_argument if any capacity is <= 0.
  explicit CategoryGate(GateConfig config = GateConfig::defaults());
  ~CategoryGate() = default;

  CategoryGate(const CategoryGate &) = delete;
  CategoryGate &operator=(const CategoryGate &) = delete;

  /// Block until a slot in `category` is free.
  /// Err(Cancelled) if `token` fires first, Err(Timeout) if `timeout` (> 0)
  /// elapses first. A zero timeout, or one too large for the steady clock to
  /// represent as a deadline, waits indefinitely.
  Result<GatePermit, TaskError>
  acquire(TaskCategory category,
          const std::shared_ptr<CancelToken> &token = nullptr,
          std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

  [[nodiscard]] int capacity(TaskCategory category) const;
  [[nodiscard]] int in_use(TaskCategory category) const;
  [[nodiscard]] int waiting(TaskCategory category) const;

private:
  friend class GatePermit;
  void release(TaskCategory category) noexcept;

  struct Slot {
    int capacity = 0;
    int in_use = 0;
    std::uint64_t next_ticket = 0;
    std::deque<std::uint64_t> queue; // Tickets of waiters, arrival order
  };

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::array<Slot, kCategoryCount> slots_;
};

} // namespace opg::core
