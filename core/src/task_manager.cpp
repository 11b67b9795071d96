#include "core/task_manager.h"

#include "core/logger.h"

#include <utility>

namespace opg::core {
namespace {

TaskOutcome rejected(TaskError error) {
  TaskOutcome outcome;
  outcome.error = std::move(error);
  return outcome;
}

} // namespace

TaskManager::TaskManager(ManagerConfig config, std::shared_ptr<ILogger> logger,
                         ToolCatalog catalog)
    : config_(std::move(config)), logger_(std::move(logger)),
      catalog_(std::move(catalog)),
      registry_(std::make_shared<TaskRegistry>(config_.history_capacity,
                                               logger_)),
      gate_(std::make_shared<CategoryGate>(config_.gate)),
      wrapper_(std::make_shared<OperationWrapper>(
          registry_, gate_, config_.acquire_timeout, logger_,
          config_.max_launched)),
      reporter_(registry_) {
  if (logger_) {
    std::string limits;
    for (const auto category : kAllCategories) {
      if (!limits.empty()) {
        limits += " ";
      }
      limits += std::string(to_string(category)) + "=" +
                std::to_string(config_.gate.capacity_of(category));
    }
    logger_->info("startup", "manager", "task_core_ready",
                  "limits: " + limits +
                      " history=" + std::to_string(config_.history_capacity) +
                      " acquire_timeout_ms=" +
                      std::to_string(config_.acquire_timeout.count()) +
                      " max_launched=" + std::to_string(config_.max_launched) +
                      " tools=" + std::to_string(catalog_.size()));
  }
}

TaskOutcome TaskManager::execute(TaskCategory category, std::string tool_name,
                                 Operation op) {
  return wrapper_->execute(category, std::move(tool_name), std::move(op));
}

TaskOutcome TaskManager::execute_tool(const std::string &tool_name,
                                      Operation op) {
  auto category = catalog_.lookup(tool_name);
  if (category.is_err()) {
    if (logger_) {
      logger_->warn("dispatch", "manager", "submission_rejected",
                    category.error().message);
    }
    return rejected(category.error());
  }
  return wrapper_->execute(category.value(), tool_name, std::move(op));
}

TaskOutcome TaskManager::execute_in(const std::string &category_name,
                                    std::string tool_name, Operation op) {
  auto category = parse_category(category_name);
  if (category.is_err()) {
    if (logger_) {
      logger_->warn("dispatch", "manager", "submission_rejected",
                    category.error().message);
    }
    return rejected(category.error());
  }
  return wrapper_->execute(category.value(), std::move(tool_name),
                           std::move(op));
}

Result<TaskHandle, TaskError> TaskManager::launch(TaskCategory category,
                                                  std::string tool_name,
                                                  Operation op) {
  return wrapper_->launch(category, std::move(tool_name), std::move(op));
}

Result<TaskHandle, TaskError>
TaskManager::launch_tool(const std::string &tool_name, Operation op) {
  auto category = catalog_.lookup(tool_name);
  if (category.is_err()) {
    return Result<TaskHandle, TaskError>::Err(category.error());
  }
  return wrapper_->launch(category.value(), tool_name, std::move(op));
}

Result<WrappedTool, TaskError>
TaskManager::wrap_tool(const std::string &tool_name, Operation op) {
  if (ToolCatalog::is_control_tool(tool_name)) {
    return Result<WrappedTool, TaskError>::Err(TaskError::SubmissionRejected(
        "Tool " + tool_name + " is handled by the task core"));
  }
  if (!op) {
    return Result<WrappedTool, TaskError>::Err(
        TaskError::SubmissionRejected("Operation must not be empty"));
  }
  auto category = catalog_.lookup(tool_name);
  if (category.is_err()) {
    return Result<WrappedTool, TaskError>::Err(category.error());
  }

  std::weak_ptr<OperationWrapper> weak = wrapper_;
  const TaskCategory resolved = category.value();
  WrappedTool wrapped = [weak, resolved, tool_name, op = std::move(op)]() {
    auto wrapper = weak.lock();
    if (!wrapper) {
      return rejected(TaskError::Internal("Task core is shut down"));
    }
    return wrapper->execute(resolved, tool_name, op);
  };
  return Result<WrappedTool, TaskError>::Ok(std::move(wrapped));
}

Result<void, TaskError> TaskManager::register_tool(const std::string &tool_name,
                                                   TaskCategory category) {
  auto added = catalog_.add(tool_name, category);
  if (added.is_ok() && logger_) {
    logger_->info("startup", "manager", "tool_registered",
                  tool_name + " -> " + to_string(category));
  }
  return added;
}

Result<CancelReceipt, TaskError>
TaskManager::cancel_task(const std::string &task_id) {
  auto record = registry_->get(task_id);
  if (record.is_err()) {
    return Result<CancelReceipt, TaskError>::Err(record.error());
  }

  auto disposition = registry_->request_cancel(task_id);
  if (disposition.is_err()) {
    return Result<CancelReceipt, TaskError>::Err(disposition.error());
  }

  CancelReceipt receipt;
  receipt.task_id = task_id;
  receipt.tool_name = record.value().tool_name;
  receipt.disposition = disposition.value();
  return Result<CancelReceipt, TaskError>::Ok(std::move(receipt));
}

Result<TaskRecord, TaskError>
TaskManager::get_task_status(const std::string &task_id) const {
  return reporter_.get_task_status(task_id);
}

std::vector<TaskRecord> TaskManager::get_task_status() const {
  return reporter_.get_task_status();
}

std::vector<TaskRecord> TaskManager::get_running_tasks() const {
  return reporter_.get_running_tasks();
}

} // namespace opg::core
