#include "core/category_gate.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace opg::core {

GateConfig GateConfig::defaults() {
  GateConfig config;
  config.set_capacity(TaskCategory::Desktop, 1);
  config.set_capacity(TaskCategory::File, 3);
  config.set_capacity(TaskCategory::Query, 5);
  config.set_capacity(TaskCategory::Shell, 2);
  config.set_capacity(TaskCategory::Network, 3);
  return config;
}

// ---- GatePermit ----

GatePermit::~GatePermit() { release(); }

GatePermit::GatePermit(GatePermit &&other) noexcept
    : gate_(other.gate_), category_(other.category_) {
  other.gate_ = nullptr;
}

GatePermit &GatePermit::operator=(GatePermit &&other) noexcept {
  if (this != &other) {
    release();
    gate_ = other.gate_;
    category_ = other.category_;
    other.gate_ = nullptr;
  }
  return *this;
}

void GatePermit::release() noexcept {
  if (gate_) {
    gate_->release(category_);
    gate_ = nullptr;
  }
}

// ---- CategoryGate ----

CategoryGate::CategoryGate(GateConfig config) {
  for (const auto category : kAllCategories) {
    const int capacity = config.capacity_of(category);
    if (capacity <= 0) {
      throw std::invalid_argument(
          std::string("CategoryGate: capacity for '") + to_string(category) +
          "' must be > 0, got " + std::to_string(capacity));
    }
    slots_[index_of(category)].capacity = capacity;
  }
}

Result<GatePermit, TaskError>
CategoryGate::acquire(TaskCategory category,
                      const std::shared_ptr<CancelToken> &token,
                      std::chrono::milliseconds timeout) {
  if (token && token->is_cancelled()) {
    return Result<GatePermit, TaskError>::Err(
        TaskError::Cancelled("Cancelled before execution"));
  }

  // Registered before taking mutex_: the callback locks mutex_ itself, and
  // on_cancel() may run it inline.
  CancelToken::CallbackId callback_id = 0;
  if (token) {
    callback_id = token->on_cancel([this]() {
      { std::lock_guard<std::mutex> lock(mutex_); }
      cv_.notify_all();
    });
  }

  bool admitted = false;
  bool cancelled = false;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    Slot &slot = slots_[index_of(category)];
    const std::uint64_t ticket = slot.next_ticket++;
    slot.queue.push_back(ticket);

    auto is_cancelled = [&token]() { return token && token->is_cancelled(); };
    auto can_enter = [&slot, ticket]() {
      return slot.queue.front() == ticket && slot.in_use < slot.capacity;
    };
    auto ready = [&]() { return is_cancelled() || can_enter(); };

    // A timeout past the clock's range is an unbounded wait; now + timeout
    // would overflow into the past.
    using Clock = std::chrono::steady_clock;
    const auto now = Clock::now();
    const auto headroom =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::time_point::max() - now);
    if (timeout > std::chrono::milliseconds::zero() && timeout < headroom) {
      cv_.wait_until(lock, now + timeout, ready);
    } else {
      cv_.wait(lock, ready);
    }

    cancelled = is_cancelled();
    admitted = !cancelled && can_enter();

    slot.queue.erase(std::find(slot.queue.begin(), slot.queue.end(), ticket));
    if (admitted) {
      slot.in_use++;
    }
  }
  // The next ticket may now be at the front of the queue.
  cv_.notify_all();

  if (token) {
    token->remove_callback(callback_id);
  }

  if (admitted) {
    return Result<GatePermit, TaskError>::Ok(GatePermit(this, category));
  }
  if (cancelled) {
    return Result<GatePermit, TaskError>::Err(
        TaskError::Cancelled("Cancelled while waiting for a slot"));
  }
  return Result<GatePermit, TaskError>::Err(TaskError::Timeout(
      std::string("Timeout waiting for ") + to_string(category) +
      " slot (another " + to_string(category) + " task is running)"));
}

int CategoryGate::capacity(TaskCategory category) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_[index_of(category)].capacity;
}

int CategoryGate::in_use(TaskCategory category) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_[index_of(category)].in_use;
}

int CategoryGate::waiting(TaskCategory category) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(slots_[index_of(category)].queue.size());
}

void CategoryGate::release(TaskCategory category) noexcept {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot &slot = slots_[index_of(category)];
    slot.in_use = std::max(0, slot.in_use - 1);
  }
  cv_.notify_all();
}

} // namespace opg::core
