#include "core/cancel_token.h"

#include <algorithm>

namespace opg::core {

void CancelToken::request_cancel() noexcept {
  bool expected = false;
  if (!cancelled_.compare_exchange_strong(expected, true,
                                          std::memory_order_release,
                                          std::memory_order_relaxed)) {
    return;
  }

  std::vector<std::pair<CallbackId, Callback>> pending;
  {
    std::lock_guard<std::mutex> lock(cb_mutex_);
    pending.swap(callbacks_);
  }
  for (auto &[id, cb] : pending) {
    if (cb) {
      cb();
    }
  }
}

bool CancelToken::is_cancelled() const noexcept {
  return cancelled_.load(std::memory_order_acquire);
}

void CancelToken::throw_if_cancelled() const {
  if (is_cancelled()) {
    throw CancelledError("Operation cancelled");
  }
}

CancelToken::CallbackId CancelToken::on_cancel(Callback cb) {
  {
    std::lock_guard<std::mutex> lock(cb_mutex_);
    // request_cancel() sets the flag before draining under this lock, so a
    // registration made here is either drained or sees the flag.
    if (!is_cancelled()) {
      const CallbackId id = next_id_++;
      callbacks_.emplace_back(id, std::move(cb));
      return id;
    }
  }
  if (cb) {
    cb();
  }
  return 0;
}

void CancelToken::remove_callback(CallbackId id) {
  if (id == 0) {
    return;
  }
  std::lock_guard<std::mutex> lock(cb_mutex_);
  callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
                                  [id](const auto &entry) {
                                    return entry.first == id;
                                  }),
                   callbacks_.end());
}

std::shared_ptr<CancelToken> CancelToken::create() {
  return std::make_shared<CancelToken>();
}

} // namespace opg::core
