#include "core/task.h"

#include <algorithm>
#include <cctype>

namespace opg::core {

const char *to_string(TaskState state) {
  switch (state) {
  case TaskState::Pending:
    return "pending";
  case TaskState::Running:
    return "running";
  case TaskState::Succeeded:
    return "succeeded";
  case TaskState::Failed:
    return "failed";
  case TaskState::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

bool is_terminal(TaskState state) {
  switch (state) {
  case TaskState::Succeeded:
  case TaskState::Failed:
  case TaskState::Cancelled:
    return true;
  default:
    return false;
  }
}

const char *to_string(TaskCategory category) {
  switch (category) {
  case TaskCategory::Desktop:
    return "desktop";
  case TaskCategory::File:
    return "file";
  case TaskCategory::Query:
    return "query";
  case TaskCategory::Shell:
    return "shell";
  case TaskCategory::Network:
    return "network";
  }
  return "unknown";
}

Result<TaskCategory, TaskError> parse_category(const std::string &name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  for (const auto category : kAllCategories) {
    if (lowered == to_string(category)) {
      return Result<TaskCategory, TaskError>::Ok(category);
    }
  }
  return Result<TaskCategory, TaskError>::Err(TaskError::SubmissionRejected(
      "Unknown task category: '" + name + "'"));
}

Result<void, TaskError> TaskRecord::transition_to(TaskState new_state) {
  bool legal = false;

  switch (state) {
  case TaskState::Pending:
    // Failed only when admission timed out
    legal = (new_state == TaskState::Running ||
             new_state == TaskState::Failed ||
             new_state == TaskState::Cancelled);
    break;
  case TaskState::Running:
    legal = (new_state == TaskState::Succeeded ||
             new_state == TaskState::Failed ||
             new_state == TaskState::Cancelled);
    break;
  case TaskState::Succeeded:
  case TaskState::Failed:
  case TaskState::Cancelled:
    // Terminal states: no transitions allowed
    legal = false;
    break;
  }

  if (!legal) {
    return Result<void, TaskError>::Err(TaskError::Internal(
        std::string("Illegal state transition: ") + to_string(state) + " -> " +
        to_string(new_state) + " (task_id=" + id + ")"));
  }

  state = new_state;

  if (new_state == TaskState::Running) {
    started_at = Clock::now();
  }
  if (is_terminal(new_state)) {
    completed_at = Clock::now();
  }

  return Result<void, TaskError>::Ok();
}

std::optional<std::chrono::milliseconds>
TaskRecord::duration(TimePoint now) const {
  if (!started_at.has_value()) {
    return std::nullopt;
  }
  const TimePoint end = completed_at.value_or(now);
  return std::chrono::duration_cast<std::chrono::milliseconds>(end -
                                                               *started_at);
}

} // namespace opg::core
