#pragma once

#include "core/result.h"
#include "core/task_error.h"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace opg::core {

// ---- Task State Enum ----

enum class TaskState {
  Pending,   // Created, waiting for admission
  Running,   // Admitted by the gate, operation invoked
  Succeeded, // Operation returned a result (terminal)
  Failed,    // Operation raised or returned an error (terminal)
  Cancelled  // Cancelled before start, or cooperatively while running (terminal)
};

/// Lower-case name, as reported to callers ("pending", "running", ...).
const char *to_string(TaskState state);

bool is_terminal(TaskState state);

// ---- Task Category Enum ----

/// Closed set of operation categories. Each has its own concurrency ceiling.
enum class TaskCategory {
  Desktop, // Pointer/keyboard/screen: one physical input stream
  File,    // File system reads and writes
  Query,   // Read-mostly system queries (processes, registry, services)
  Shell,   // Subprocess execution
  Network  // Ping, port checks, connection listing
};

inline constexpr std::size_t kCategoryCount = 5;

inline constexpr std::array<TaskCategory, kCategoryCount> kAllCategories = {
    TaskCategory::Desktop, TaskCategory::File, TaskCategory::Query,
    TaskCategory::Shell, TaskCategory::Network};

inline constexpr std::size_t index_of(TaskCategory category) {
  return static_cast<std::size_t>(category);
}

const char *to_string(TaskCategory category);

/// Parse a category name (case-insensitive). Unknown names are rejected with
/// SubmissionRejected; there is no default category.
Result<TaskCategory, TaskError> parse_category(const std::string &name);

// ---- Task Record ----

/// Metadata and state of one submitted operation.
/// Owns its state machine; transitions are validated via transition_to().
struct TaskRecord {
  std::string id;        // 12 hex chars, unique while held by the registry
  std::string tool_name; // Capability name, empty for anonymous submissions
  TaskCategory category = TaskCategory::Query;
  TaskState state = TaskState::Pending;
  std::uint64_t sequence = 0; // Creation order

  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  TimePoint created_at = Clock::now();
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;

  std::string result;             // Success payload
  std::optional<TaskError> error; // Set for Failed and Cancelled
  bool cancel_requested = false;

  /// Attempt a state transition. Returns Err (Internal) if illegal and leaves
  /// the record untouched. Legal transitions:
  ///   Pending -> Running, Failed (admission timeout), Cancelled
  ///   Running -> Succeeded, Failed, Cancelled
  Result<void, TaskError> transition_to(TaskState new_state);

  /// Time spent running: started -> completed, or started -> now while still
  /// running. Empty if the task never started.
  [[nodiscard]] std::optional<std::chrono::milliseconds>
  duration(TimePoint now = Clock::now()) const;
};

} // namespace opg::core
