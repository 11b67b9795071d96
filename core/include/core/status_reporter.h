#pragma once

#include "core/result.h"
#include "core/task.h"
#include "core/task_error.h"
#include "core/task_registry.h"

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace opg::core {

/// Point-in-time counters over the registry.
struct StatusSummary {
  std::size_t pending = 0;
  std::size_t running = 0;
  std::size_t history = 0;
  std::size_t history_capacity = 0;
  std::array<std::size_t, kCategoryCount> running_by_category{};
};

/// Read-only queries over the task registry. Never mutates task state.
class StatusReporter {
public:
  explicit StatusReporter(std::shared_ptr<const TaskRegistry> registry);

  /// Single record projection, NotFound for unknown (or evicted) ids.
  [[nodiscard]] Result<TaskRecord, TaskError>
  get_task_status(const std::string &task_id) const;

  /// Recent history, newest first, at most the history capacity.
  [[nodiscard]] std::vector<TaskRecord> get_task_status() const;

  /// Pending and Running records, oldest submission first.
  [[nodiscard]] std::vector<TaskRecord> get_running_tasks() const;

  /// Held records filtered by state, newest first. limit == 0: no limit.
  [[nodiscard]] std::vector<TaskRecord>
  list_tasks(std::optional<TaskState> state, std::size_t limit = 0) const;

  [[nodiscard]] StatusSummary summary() const;

private:
  std::shared_ptr<const TaskRegistry> registry_;
};

} // namespace opg::core
