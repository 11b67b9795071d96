#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace opg::core {

/// Thrown by CancelToken::throw_if_cancelled(). The operation wrapper maps it
/// to the Cancelled terminal state instead of Failed.
class CancelledError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Thread-safe, advisory cancellation token. One per task.
///
/// The flag is an atomic<bool> with acquire/release semantics; the callback
/// list is guarded by its own mutex. Cancellation never interrupts a running
/// native call, it only becomes visible at checkpoints:
///   - the gate wait (via on_cancel callbacks),
///   - the Running transition,
///   - wherever a cooperating operation polls is_cancelled().
class CancelToken {
public:
  using Callback = std::function<void()>;
  using CallbackId = std::uint64_t;

  CancelToken() = default;
  CancelToken(const CancelToken &) = delete;
  CancelToken &operator=(const CancelToken &) = delete;

  /// Request cancellation. Thread-safe, idempotent. Callbacks run once, on
  /// the first call, outside the callback lock. Callbacks must not throw.
  void request_cancel() noexcept;

  [[nodiscard]] bool is_cancelled() const noexcept;

  /// Throw CancelledError if cancellation was requested.
  void throw_if_cancelled() const;

  /// Register a callback for cancellation. If the token is already
  /// cancelled the callback runs immediately and 0 is returned.
  CallbackId on_cancel(Callback cb);

  /// Drop a callback registered with on_cancel(). Unknown ids are ignored.
  void remove_callback(CallbackId id);

  static std::shared_ptr<CancelToken> create();

private:
  std::atomic<bool> cancelled_{false};
  std::mutex cb_mutex_;
  CallbackId next_id_ = 1;
  std::vector<std::pair<CallbackId, Callback>> callbacks_;
};

} // namespace opg::core
