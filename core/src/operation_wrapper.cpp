#include "core/operation_wrapper.h"

#include "core/logger.h"

#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace opg::core {
namespace {

struct CurrentTask {
  std::string id;
  std::shared_ptr<CancelToken> token;
};

thread_local const CurrentTask *t_current_task = nullptr;

/// Installs the running task for this_task::* on the invoking thread.
class CurrentTaskScope {
public:
  CurrentTaskScope(std::string id, std::shared_ptr<CancelToken> token)
      : task_{std::move(id), std::move(token)}, previous_(t_current_task) {
    t_current_task = &task_;
  }
  ~CurrentTaskScope() { t_current_task = previous_; }

  CurrentTaskScope(const CurrentTaskScope &) = delete;
  CurrentTaskScope &operator=(const CurrentTaskScope &) = delete;

private:
  CurrentTask task_;
  const CurrentTask *previous_;
};

TaskOutcome make_outcome(const TaskRecord &record, TaskState state) {
  TaskOutcome outcome;
  outcome.task_id = record.id;
  outcome.state = state;
  return outcome;
}

} // namespace

namespace this_task {

bool cancel_requested() noexcept {
  return t_current_task && t_current_task->token &&
         t_current_task->token->is_cancelled();
}

void check_cancelled() {
  if (cancel_requested()) {
    throw CancelledError("Cancelled during execution");
  }
}

std::string id() { return t_current_task ? t_current_task->id : std::string(); }

} // namespace this_task

OperationWrapper::OperationWrapper(std::shared_ptr<TaskRegistry> registry,
                                   std::shared_ptr<CategoryGate> gate,
                                   std::chrono::milliseconds acquire_timeout,
                                   std::shared_ptr<ILogger> logger,
                                   std::size_t max_launched)
    : registry_(std::move(registry)), gate_(std::move(gate)),
      acquire_timeout_(acquire_timeout), logger_(std::move(logger)),
      max_launched_(max_launched) {
  if (max_launched_ == 0) {
    throw std::invalid_argument("OperationWrapper: max_launched must be > 0");
  }
}

TaskOutcome OperationWrapper::execute(TaskCategory category,
                                      std::string tool_name, Operation op) {
  if (!op) {
    TaskOutcome outcome;
    outcome.error = TaskError::SubmissionRejected("Operation must not be empty");
    return outcome;
  }

  const TaskRecord record = registry_->create(category, std::move(tool_name));
  return run(record, op);
}

Result<TaskHandle, TaskError>
OperationWrapper::launch(TaskCategory category, std::string tool_name,
                         Operation op) {
  if (!op) {
    return Result<TaskHandle, TaskError>::Err(
        TaskError::SubmissionRejected("Operation must not be empty"));
  }

  auto self = weak_from_this().lock();
  if (!self) {
    return Result<TaskHandle, TaskError>::Err(TaskError::Internal(
        "OperationWrapper::launch requires shared ownership"));
  }

  if (launched_.fetch_add(1) >= max_launched_) {
    launched_.fetch_sub(1);
    if (logger_) {
      logger_->warn("dispatch", "wrapper", "launch_rejected",
                    "tool=" + tool_name + " limit=" +
                        std::to_string(max_launched_));
    }
    return Result<TaskHandle, TaskError>::Err(TaskError::SubmissionRejected(
        "Too many launched tasks in flight (limit " +
        std::to_string(max_launched_) + ")"));
  }

  const TaskRecord record = registry_->create(category, std::move(tool_name));
  auto promise = std::make_shared<std::promise<TaskOutcome>>();

  TaskHandle handle;
  handle.task_id = record.id;
  handle.outcome = promise->get_future();

  try {
    std::thread([self, record, op = std::move(op), promise]() {
      TaskOutcome outcome = self->run(record, op);
      // Freed before the outcome is published so a waiter can launch again.
      self->launched_.fetch_sub(1);
      promise->set_value(std::move(outcome));
    }).detach();
  } catch (const std::system_error &e) {
    launched_.fetch_sub(1);
    auto error = TaskError::Internal(std::string("Failed to start task thread: ") +
                                     e.what());
    auto marked = registry_->mark_failed(record.id, error);
    if (marked.is_err() && logger_) {
      logger_->error(record.id, "wrapper", "mark_failed_error",
                     marked.error().message);
    }
    return Result<TaskHandle, TaskError>::Err(std::move(error));
  }

  return Result<TaskHandle, TaskError>::Ok(std::move(handle));
}

TaskOutcome OperationWrapper::run(const TaskRecord &record,
                                  const Operation &op) {
  try {
    return admit_and_invoke(record, op);
  } catch (const std::exception &e) {
    // Bookkeeping itself failed (allocation, thread resources). The
    // operation's own exceptions never reach here.
    if (logger_) {
      logger_->error(record.id, "wrapper", "bookkeeping_failed", e.what());
    }
    auto outcome = make_outcome(record, TaskState::Failed);
    outcome.error = TaskError::Internal(e.what());
    auto marked = registry_->mark_failed(record.id, *outcome.error);
    if (marked.is_err() && logger_) {
      logger_->error(record.id, "wrapper", "mark_failed_error",
                     marked.error().message);
    }
    return outcome;
  }
}

TaskOutcome OperationWrapper::admit_and_invoke(const TaskRecord &record,
                                               const Operation &op) {
  // Cancel raced ahead of execution.
  if (registry_->cancel_requested(record.id)) {
    return finish_cancelled(
        record, TaskError::Cancelled("Cancelled before execution"), false);
  }

  auto token = registry_->token(record.id);
  auto acquired = gate_->acquire(record.category, token, acquire_timeout_);
  if (acquired.is_err()) {
    TaskError error = std::move(acquired).error();
    if (error.category == ErrorCategory::Cancelled) {
      return finish_cancelled(record, std::move(error), false);
    }
    if (logger_) {
      logger_->warn(record.id, "wrapper", "admission_timeout", error.message);
    }
    return finish_failure(record, std::move(error));
  }
  // Released when this scope exits, after the terminal transition below.
  GatePermit permit = std::move(acquired).value();

  auto running = registry_->mark_running(record.id);
  if (running.is_err()) {
    if (running.error().category == ErrorCategory::Cancelled) {
      return finish_cancelled(record, running.error(), true);
    }
    if (logger_) {
      logger_->error(record.id, "wrapper", "start_rejected",
                     running.error().message);
    }
    return finish_internal(record, running.error());
  }

  if (logger_) {
    logger_->info(record.id, "wrapper", "task_admitted",
                  std::string("tool=") + record.tool_name + " category=" +
                      to_string(record.category));
  }

  OperationResult result = invoke(record, token, op);
  if (result.is_ok()) {
    return finish_success(record, std::move(result).value());
  }

  TaskError error = std::move(result).error();
  if (error.category == ErrorCategory::Cancelled) {
    return finish_cancelled(record, std::move(error), false);
  }
  if (error.category != ErrorCategory::OperationFailed) {
    error.details["source_category"] = to_string(error.category);
    error.category = ErrorCategory::OperationFailed;
  }
  return finish_failure(record, std::move(error));
}

OperationResult
OperationWrapper::invoke(const TaskRecord &record,
                         const std::shared_ptr<CancelToken> &token,
                         const Operation &op) {
  CurrentTaskScope scope(record.id, token);
  try {
    return op();
  } catch (const CancelledError &e) {
    return OperationResult::Err(TaskError::Cancelled(e.what()));
  } catch (const std::exception &e) {
    if (logger_) {
      logger_->error(record.id, "wrapper", "operation_threw",
                     "tool=" + record.tool_name + " what=" + e.what());
    }
    return OperationResult::Err(TaskError::OperationFailed(e.what()));
  } catch (...) {
    if (logger_) {
      logger_->error(record.id, "wrapper", "operation_threw",
                     "tool=" + record.tool_name + " non-standard exception");
    }
    return OperationResult::Err(
        TaskError::OperationFailed("Unknown exception in operation"));
  }
}

TaskOutcome OperationWrapper::finish_success(const TaskRecord &record,
                                             std::string payload) {
  auto marked = registry_->mark_succeeded(record.id, payload);
  if (marked.is_err()) {
    if (logger_) {
      logger_->error(record.id, "wrapper", "mark_succeeded_error",
                     marked.error().message);
    }
    return finish_internal(record, marked.error());
  }

  auto outcome = make_outcome(record, TaskState::Succeeded);
  outcome.success = true;
  outcome.result = std::move(payload);
  return outcome;
}

TaskOutcome OperationWrapper::finish_failure(const TaskRecord &record,
                                             TaskError error) {
  if (logger_) {
    logger_->error(record.id, "wrapper", "task_failed",
                   "tool=" + record.tool_name + " error=" + error.message);
  }
  auto marked = registry_->mark_failed(record.id, error);
  if (marked.is_err() && logger_) {
    logger_->error(record.id, "wrapper", "mark_failed_error",
                   marked.error().message);
  }

  auto outcome = make_outcome(record, TaskState::Failed);
  outcome.error = std::move(error);
  return outcome;
}

TaskOutcome OperationWrapper::finish_internal(const TaskRecord &record,
                                              TaskError error) {
  error.category = ErrorCategory::Internal;
  // The record may already be terminal; the caller still gets a terminal
  // outcome.
  auto marked = registry_->mark_failed(record.id, error);
  if (marked.is_err() && logger_) {
    logger_->error(record.id, "wrapper", "mark_failed_error",
                   marked.error().message);
  }

  auto outcome = make_outcome(record, TaskState::Failed);
  outcome.error = std::move(error);
  return outcome;
}

TaskOutcome OperationWrapper::finish_cancelled(const TaskRecord &record,
                                               TaskError reason,
                                               bool already_recorded) {
  if (!already_recorded) {
    auto marked = registry_->mark_cancelled(record.id, reason);
    if (marked.is_err() && logger_) {
      logger_->error(record.id, "wrapper", "mark_cancelled_error",
                     marked.error().message);
    }
  }
  if (logger_) {
    logger_->info(record.id, "wrapper", "task_cancelled", reason.message);
  }

  auto outcome = make_outcome(record, TaskState::Cancelled);
  outcome.error = std::move(reason);
  return outcome;
}

} // namespace opg::core
