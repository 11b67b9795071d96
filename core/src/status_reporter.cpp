#include "core/status_reporter.h"

#include <algorithm>
#include <utility>

namespace opg::core {

StatusReporter::StatusReporter(std::shared_ptr<const TaskRegistry> registry)
    : registry_(std::move(registry)) {}

Result<TaskRecord, TaskError>
StatusReporter::get_task_status(const std::string &task_id) const {
  if (task_id.empty()) {
    return Result<TaskRecord, TaskError>::Err(TaskError::NotFound(task_id));
  }
  return registry_->get(task_id);
}

std::vector<TaskRecord> StatusReporter::get_task_status() const {
  return registry_->list_recent_history(registry_->history_capacity());
}

std::vector<TaskRecord> StatusReporter::get_running_tasks() const {
  auto active = registry_->list_active();
  // list_active() is a single snapshot, but keep the guarantee local.
  active.erase(std::remove_if(active.begin(), active.end(),
                              [](const TaskRecord &record) {
                                return is_terminal(record.state);
                              }),
               active.end());
  return active;
}

std::vector<TaskRecord>
StatusReporter::list_tasks(std::optional<TaskState> state,
                           std::size_t limit) const {
  return registry_->list(state, limit);
}

StatusSummary StatusReporter::summary() const {
  StatusSummary summary;
  for (const auto &record : registry_->list_active()) {
    if (record.state == TaskState::Running) {
      summary.running++;
      summary.running_by_category[index_of(record.category)]++;
    } else {
      summary.pending++;
    }
  }
  summary.history = registry_->history_size();
  summary.history_capacity = registry_->history_capacity();
  return summary;
}

} // namespace opg::core
