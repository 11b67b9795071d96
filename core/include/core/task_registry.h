#pragma once

#include "core/cancel_token.h"
#include "core/result.h"
#include "core/task.h"
#include "core/task_error.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace opg::core {

class ILogger;

/// State the task was in when a cancel request was accepted.
/// Pending means the operation will never run; Running means the request is
/// advisory and the operation may still finish normally.
enum class CancelDisposition { Pending, Running };

const char *to_string(CancelDisposition disposition);

/// Single source of truth for task state.
///
/// Every mutation runs in one critical section. Reads return value copies, so
/// callers can iterate them while other threads keep mutating the registry.
/// Terminal records move into a bounded FIFO history; the oldest entry is
/// evicted once the history exceeds its capacity.
class TaskRegistry {
public:
  static constexpr std::size_t kDefaultHistoryCapacity = 100;

  /// Throws std::invalid_argument if history_capacity is 0.
  explicit TaskRegistry(std::size_t history_capacity = kDefaultHistoryCapacity,
                        std::shared_ptr<ILogger> logger = nullptr);

  TaskRegistry(const TaskRegistry &) = delete;
  TaskRegistry &operator=(const TaskRegistry &) = delete;

  /// Register a new Pending task and return a snapshot of it.
  TaskRecord create(TaskCategory category, std::string tool_name = {});

  /// Pending -> Running. If a cancel request arrived while the task was
  /// queued, the task moves to Cancelled instead and Err(Cancelled) is
  /// returned. Both happen under the registry lock.
  Result<void, TaskError> mark_running(const std::string &id);

  Result<void, TaskError> mark_succeeded(const std::string &id,
                                         std::string result);

  Result<void, TaskError> mark_failed(const std::string &id, TaskError error);

  Result<void, TaskError>
  mark_cancelled(const std::string &id,
                 TaskError reason = TaskError::Cancelled());

  /// Flag a Pending or Running task for cancellation and fire its token.
  /// NotFound for unknown ids, AlreadyTerminal for finished tasks.
  Result<CancelDisposition, TaskError> request_cancel(const std::string &id);

  [[nodiscard]] Result<TaskRecord, TaskError> get(const std::string &id) const;

  [[nodiscard]] bool cancel_requested(const std::string &id) const;

  /// Token for a held task, nullptr if unknown.
  [[nodiscard]] std::shared_ptr<CancelToken>
  token(const std::string &id) const;

  /// Pending and Running records, oldest submission first.
  [[nodiscard]] std::vector<TaskRecord> list_active() const;

  /// Up to n terminal records, newest first.
  [[nodiscard]] std::vector<TaskRecord>
  list_recent_history(std::size_t n) const;

  /// Every held record, newest first, optionally filtered by state.
  /// limit == 0 means no limit.
  [[nodiscard]] std::vector<TaskRecord>
  list(std::optional<TaskState> state = std::nullopt,
       std::size_t limit = 0) const;

  [[nodiscard]] std::size_t active_count() const;
  [[nodiscard]] std::size_t history_size() const;
  [[nodiscard]] std::size_t history_capacity() const noexcept {
    return history_capacity_;
  }

private:
  struct Entry {
    TaskRecord record;
    std::shared_ptr<CancelToken> token;
  };

  Result<void, TaskError> finish_locked(const std::string &id,
                                        TaskState target,
                                        std::optional<TaskError> error,
                                        std::string result,
                                        std::vector<std::string> &evicted);
  void log_finish(const std::string &id, TaskState target,
                  const std::vector<std::string> &evicted) const;
  std::string generate_id_locked();

  const std::size_t history_capacity_;
  std::shared_ptr<ILogger> logger_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  std::deque<std::string> history_; // Terminal ids, oldest at the front
  std::uint64_t next_sequence_ = 1;
  std::mt19937_64 rng_;
};

} // namespace opg::core
