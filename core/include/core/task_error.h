#pragma once

#include <map>
#include <string>

namespace opg::core {

/// Error categories. Lets the dispatch layer branch on the kind of failure
/// without string parsing.
enum class ErrorCategory {
  SubmissionRejected, // Unknown tool/category or malformed submission
  NotFound,           // Unknown task id
  AlreadyTerminal,    // Cancel on a finished task
  OperationFailed,    // Wrapped operation raised or returned an error
  Cancelled,          // Task ended through cancellation
  Timeout,            // Admission wait expired
  Internal            // Illegal transition / invariant violation
};

/// Structured error type for every task-core operation.
struct TaskError {
  ErrorCategory category = ErrorCategory::Internal;
  int code = 0;        // Numeric code for telemetry aggregation
  std::string message; // Human-readable detail, surfaced to callers verbatim
  std::map<std::string, std::string> details; // Additional context

  TaskError() = default;

  TaskError(ErrorCategory cat, int c, std::string msg,
            std::map<std::string, std::string> dets = {})
      : category(cat), code(c), message(std::move(msg)),
        details(std::move(dets)) {}

  static TaskError SubmissionRejected(std::string msg) {
    return {ErrorCategory::SubmissionRejected, 1, std::move(msg)};
  }
  static TaskError NotFound(const std::string &task_id) {
    return {ErrorCategory::NotFound, 2, "Task " + task_id + " not found",
            {{"task_id", task_id}}};
  }
  static TaskError AlreadyTerminal(const std::string &task_id,
                                   const std::string &state) {
    return {ErrorCategory::AlreadyTerminal, 3,
            "Task " + task_id + " is already " + state,
            {{"task_id", task_id}, {"state", state}}};
  }
  static TaskError OperationFailed(std::string msg) {
    return {ErrorCategory::OperationFailed, 4, std::move(msg)};
  }
  static TaskError Cancelled(std::string msg = "Operation cancelled") {
    return {ErrorCategory::Cancelled, 5, std::move(msg)};
  }
  static TaskError Timeout(std::string msg = "Deadline exceeded") {
    return {ErrorCategory::Timeout, 6, std::move(msg)};
  }
  static TaskError Internal(std::string msg) {
    return {ErrorCategory::Internal, 7, std::move(msg)};
  }
};

inline const char *to_string(ErrorCategory cat) {
  switch (cat) {
  case ErrorCategory::SubmissionRejected:
    return "SubmissionRejected";
  case ErrorCategory::NotFound:
    return "NotFound";
  case ErrorCategory::AlreadyTerminal:
    return "AlreadyTerminal";
  case ErrorCategory::OperationFailed:
    return "OperationFailed";
  case ErrorCategory::Cancelled:
    return "Cancelled";
  case ErrorCategory::Timeout:
    return "Timeout";
  case ErrorCategory::Internal:
    return "Internal";
  }
  return "Unknown";
}

} // namespace opg::core
