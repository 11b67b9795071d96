#pragma once

#include "core/category_gate.h"
#include "core/result.h"
#include "core/task.h"
#include "core/task_error.h"
#include "core/task_registry.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace opg::core {

class ILogger;

/// What a wrapped operation produces: a text payload or a structured error.
using OperationResult = Result<std::string, TaskError>;

/// The only accepted operation shape: a zero-argument callable. It may also
/// throw; the wrapper converts anything thrown into a Failed task.
using Operation = std::function<OperationResult()>;

/// Reported back to the submitting caller for every terminal outcome.
/// task_id is always set once a record was created.
struct TaskOutcome {
  bool success = false;
  std::string task_id;
  TaskState state = TaskState::Pending;
  std::string result;             // Payload when success
  std::optional<TaskError> error; // Set when !success
};

/// A task started with launch(): the id is known immediately, the outcome
/// arrives later.
struct TaskHandle {
  std::string task_id;
  std::future<TaskOutcome> outcome;
};

/// Access to the running task from inside an operation. Valid only on the
/// thread that is executing the operation; outside of one, cancel_requested()
/// is false and id() is empty.
namespace this_task {

[[nodiscard]] bool cancel_requested() noexcept;

/// Throws CancelledError if the current task was asked to cancel. The
/// wrapper records that as Cancelled, not Failed.
void check_cancelled();

[[nodiscard]] std::string id();

} // namespace this_task

/// The uniform envelope every submitted operation passes through:
///   create record -> cancel short-circuit -> gate admission ->
///   Running (atomic cancel re-check) -> invoke -> terminal state -> release.
///
/// Nothing an operation does escapes execute(): failures become Failed
/// records and failed outcomes.
class OperationWrapper : public std::enable_shared_from_this<OperationWrapper> {
public:
  static constexpr std::size_t kDefaultMaxLaunched = 64;

  /// Throws std::invalid_argument if max_launched is 0.
  OperationWrapper(std::shared_ptr<TaskRegistry> registry,
                   std::shared_ptr<CategoryGate> gate,
                   std::chrono::milliseconds acquire_timeout =
                       std::chrono::milliseconds::zero(),
                   std::shared_ptr<ILogger> logger = nullptr,
                   std::size_t max_launched = kDefaultMaxLaunched);

  /// Run `op` to completion on the calling thread. Blocks while waiting for
  /// a gate slot.
  TaskOutcome execute(TaskCategory category, std::string tool_name,
                      Operation op);

  /// Create the record now and run the rest on a new thread. The wrapper
  /// must be owned by a shared_ptr; the thread keeps it alive.
  ///
  /// At most max_launched threads exist at once, queued or running. Past
  /// that the submission is rejected (no record is created); callers with
  /// bursty load should use execute() from their own workers.
  Result<TaskHandle, TaskError> launch(TaskCategory category,
                                       std::string tool_name, Operation op);

  [[nodiscard]] std::chrono::milliseconds acquire_timeout() const noexcept {
    return acquire_timeout_;
  }
  [[nodiscard]] std::size_t max_launched() const noexcept {
    return max_launched_;
  }
  /// Launched tasks whose thread has not finished yet.
  [[nodiscard]] std::size_t launched() const noexcept {
    return launched_.load();
  }

private:
  TaskOutcome run(const TaskRecord &record, const Operation &op);
  TaskOutcome admit_and_invoke(const TaskRecord &record, const Operation &op);
  OperationResult invoke(const TaskRecord &record,
                         const std::shared_ptr<CancelToken> &token,
                         const Operation &op);

  TaskOutcome finish_success(const TaskRecord &record, std::string payload);
  TaskOutcome finish_failure(const TaskRecord &record, TaskError error);
  /// Bookkeeping refused a transition: fail the task as Internal.
  TaskOutcome finish_internal(const TaskRecord &record, TaskError error);
  TaskOutcome finish_cancelled(const TaskRecord &record, TaskError reason,
                               bool already_recorded);

  std::shared_ptr<TaskRegistry> registry_;
  std::shared_ptr<CategoryGate> gate_;
  std::chrono::milliseconds acquire_timeout_;
  std::shared_ptr<ILogger> logger_;
  std::size_t max_launched_;
  std::atomic<std::size_t> launched_{0};
};

} // namespace opg::core
