#include "core/task_registry.h"

#include "core/logger.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace opg::core {

const char *to_string(CancelDisposition disposition) {
  switch (disposition) {
  case CancelDisposition::Pending:
    return "pending";
  case CancelDisposition::Running:
    return "running";
  }
  return "unknown";
}

TaskRegistry::TaskRegistry(std::size_t history_capacity,
                           std::shared_ptr<ILogger> logger)
    : history_capacity_(history_capacity), logger_(std::move(logger)),
      rng_(std::random_device{}()) {
  if (history_capacity_ == 0) {
    throw std::invalid_argument("TaskRegistry: history capacity must be > 0");
  }
}

TaskRecord TaskRegistry::create(TaskCategory category, std::string tool_name) {
  TaskRecord snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry entry;
    entry.record.id = generate_id_locked();
    entry.record.tool_name = std::move(tool_name);
    entry.record.category = category;
    entry.record.sequence = next_sequence_++;
    entry.token = CancelToken::create();
    snapshot = entry.record;
    entries_.emplace(snapshot.id, std::move(entry));
  }

  if (logger_) {
    logger_->info(snapshot.id, "registry", "task_created",
                  "tool=" + snapshot.tool_name +
                      " category=" + to_string(snapshot.category));
  }
  return snapshot;
}

Result<void, TaskError> TaskRegistry::mark_running(const std::string &id) {
  std::vector<std::string> evicted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      return Result<void, TaskError>::Err(TaskError::NotFound(id));
    }

    // Cancel arrived while the task was queued: it never starts.
    if (it->second.record.cancel_requested) {
      auto cancelled =
          finish_locked(id, TaskState::Cancelled,
                        TaskError::Cancelled("Cancelled before execution"), {},
                        evicted);
      if (cancelled.is_err()) {
        return cancelled;
      }
    } else {
      return it->second.record.transition_to(TaskState::Running);
    }
  }

  log_finish(id, TaskState::Cancelled, evicted);
  return Result<void, TaskError>::Err(
      TaskError::Cancelled("Cancelled before execution"));
}

Result<void, TaskError> TaskRegistry::mark_succeeded(const std::string &id,
                                                     std::string result) {
  std::vector<std::string> evicted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto finished = finish_locked(id, TaskState::Succeeded, std::nullopt,
                                  std::move(result), evicted);
    if (finished.is_err()) {
      return finished;
    }
  }
  log_finish(id, TaskState::Succeeded, evicted);
  return Result<void, TaskError>::Ok();
}

Result<void, TaskError> TaskRegistry::mark_failed(const std::string &id,
                                                  TaskError error) {
  std::vector<std::string> evicted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto finished =
        finish_locked(id, TaskState::Failed, std::move(error), {}, evicted);
    if (finished.is_err()) {
      return finished;
    }
  }
  log_finish(id, TaskState::Failed, evicted);
  return Result<void, TaskError>::Ok();
}

Result<void, TaskError> TaskRegistry::mark_cancelled(const std::string &id,
                                                     TaskError reason) {
  std::vector<std::string> evicted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto finished = finish_locked(id, TaskState::Cancelled, std::move(reason),
                                  {}, evicted);
    if (finished.is_err()) {
      return finished;
    }
  }
  log_finish(id, TaskState::Cancelled, evicted);
  return Result<void, TaskError>::Ok();
}

Result<CancelDisposition, TaskError>
TaskRegistry::request_cancel(const std::string &id) {
  std::shared_ptr<CancelToken> token;
  CancelDisposition disposition = CancelDisposition::Pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      return Result<CancelDisposition, TaskError>::Err(TaskError::NotFound(id));
    }

    auto &record = it->second.record;
    if (is_terminal(record.state)) {
      return Result<CancelDisposition, TaskError>::Err(
          TaskError::AlreadyTerminal(id, to_string(record.state)));
    }

    record.cancel_requested = true;
    disposition = record.state == TaskState::Running
                      ? CancelDisposition::Running
                      : CancelDisposition::Pending;
    token = it->second.token;
  }

  // Fired outside the registry lock: token callbacks wake gate waiters and
  // take the gate mutex.
  if (token) {
    token->request_cancel();
  }

  if (logger_) {
    logger_->info(id, "registry", "cancel_requested",
                  std::string("state=") + to_string(disposition) +
                      (disposition == CancelDisposition::Running
                           ? " (advisory)"
                           : ""));
  }
  return Result<CancelDisposition, TaskError>::Ok(disposition);
}

Result<TaskRecord, TaskError> TaskRegistry::get(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return Result<TaskRecord, TaskError>::Err(TaskError::NotFound(id));
  }
  return Result<TaskRecord, TaskError>::Ok(it->second.record);
}

bool TaskRegistry::cancel_requested(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  return it != entries_.end() && it->second.record.cancel_requested;
}

std::shared_ptr<CancelToken>
TaskRegistry::token(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return nullptr;
  }
  return it->second.token;
}

std::vector<TaskRecord> TaskRegistry::list_active() const {
  std::vector<TaskRecord> active;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, entry] : entries_) {
      if (!is_terminal(entry.record.state)) {
        active.push_back(entry.record);
      }
    }
  }
  std::sort(active.begin(), active.end(),
            [](const TaskRecord &lhs, const TaskRecord &rhs) {
              return lhs.sequence < rhs.sequence;
            });
  return active;
}

std::vector<TaskRecord>
TaskRegistry::list_recent_history(std::size_t n) const {
  std::vector<TaskRecord> recent;
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t count = std::min(n, history_.size());
  recent.reserve(count);
  for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
    if (recent.size() == count) {
      break;
    }
    auto entry_it = entries_.find(*it);
    if (entry_it != entries_.end()) {
      recent.push_back(entry_it->second.record);
    }
  }
  return recent;
}

std::vector<TaskRecord> TaskRegistry::list(std::optional<TaskState> state,
                                           std::size_t limit) const {
  std::vector<TaskRecord> records;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    records.reserve(entries_.size());
    for (const auto &[id, entry] : entries_) {
      if (!state.has_value() || entry.record.state == *state) {
        records.push_back(entry.record);
      }
    }
  }
  std::sort(records.begin(), records.end(),
            [](const TaskRecord &lhs, const TaskRecord &rhs) {
              return lhs.sequence > rhs.sequence;
            });
  if (limit > 0 && records.size() > limit) {
    records.resize(limit);
  }
  return records;
}

std::size_t TaskRegistry::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size() - history_.size();
}

std::size_t TaskRegistry::history_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return history_.size();
}

Result<void, TaskError>
TaskRegistry::finish_locked(const std::string &id, TaskState target,
                            std::optional<TaskError> error, std::string result,
                            std::vector<std::string> &evicted) {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return Result<void, TaskError>::Err(TaskError::NotFound(id));
  }

  auto &record = it->second.record;
  auto transitioned = record.transition_to(target);
  if (transitioned.is_err()) {
    return transitioned;
  }
  record.error = std::move(error);
  record.result = std::move(result);

  history_.push_back(id);
  while (history_.size() > history_capacity_) {
    const std::string oldest = history_.front();
    history_.pop_front();
    entries_.erase(oldest);
    evicted.push_back(oldest);
  }
  return Result<void, TaskError>::Ok();
}

void TaskRegistry::log_finish(const std::string &id, TaskState target,
                              const std::vector<std::string> &evicted) const {
  if (!logger_) {
    return;
  }
  const std::string event = std::string("task_") + to_string(target);
  if (target == TaskState::Succeeded) {
    logger_->info(id, "registry", event, "terminal");
  } else {
    logger_->warn(id, "registry", event, "terminal");
  }
  for (const auto &old_id : evicted) {
    logger_->info(old_id, "registry", "history_evicted",
                  "capacity=" + std::to_string(history_capacity_));
  }
}

std::string TaskRegistry::generate_id_locked() {
  std::string id;
  do {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(12)
       << (rng_() & 0xFFFFFFFFFFFFULL);
    id = ss.str();
  } while (entries_.count(id) != 0);
  return id;
}

} // namespace opg::core
