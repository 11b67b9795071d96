#pragma once

#include "core/category_gate.h"
#include "core/operation_wrapper.h"
#include "core/result.h"
#include "core/status_reporter.h"
#include "core/task.h"
#include "core/task_error.h"
#include "core/task_registry.h"
#include "core/tool_catalog.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace opg::core {

class ILogger;

/// Task core runtime configuration.
struct ManagerConfig {
  GateConfig gate = GateConfig::defaults();
  std::size_t history_capacity = TaskRegistry::kDefaultHistoryCapacity;
  /// Longest a submission waits for a gate slot. 0 = wait indefinitely.
  std::chrono::milliseconds acquire_timeout{30000};
  /// Most launch() threads alive at once; further launches are rejected.
  std::size_t max_launched = OperationWrapper::kDefaultMaxLaunched;
};

/// Returned by a successful cancel_task().
struct CancelReceipt {
  std::string task_id;
  std::string tool_name;
  CancelDisposition disposition = CancelDisposition::Pending;
};

/// What the registration layer gets back for a wrapped tool.
using WrappedTool = std::function<TaskOutcome()>;

/// Owning facade over the task core: registry, gate, wrapper, reporter and
/// tool catalog. One instance per server, injected where needed.
class TaskManager {
public:
  /// Throws std::invalid_argument for a gate capacity <= 0, a zero history
  /// capacity or a zero max_launched. Treat that as a fatal startup error.
  explicit TaskManager(ManagerConfig config = {},
                       std::shared_ptr<ILogger> logger = nullptr,
                       ToolCatalog catalog = ToolCatalog::with_defaults());

  TaskManager(const TaskManager &) = delete;
  TaskManager &operator=(const TaskManager &) = delete;

  // ---- Submission ----

  TaskOutcome execute(TaskCategory category, std::string tool_name,
                      Operation op);

  /// Category looked up in the catalog; unknown tools are rejected.
  TaskOutcome execute_tool(const std::string &tool_name, Operation op);

  /// Category given by name (case-insensitive); unknown names are rejected.
  TaskOutcome execute_in(const std::string &category_name,
                         std::string tool_name, Operation op);

  Result<TaskHandle, TaskError> launch(TaskCategory category,
                                       std::string tool_name, Operation op);

  Result<TaskHandle, TaskError> launch_tool(const std::string &tool_name,
                                            Operation op);

  /// Bind `op` to `tool_name` once; every call of the result runs through
  /// the wrapper. Rejects unknown tools and the control tools.
  Result<WrappedTool, TaskError> wrap_tool(const std::string &tool_name,
                                           Operation op);

  Result<void, TaskError> register_tool(const std::string &tool_name,
                                        TaskCategory category);

  // ---- Control operations ----

  Result<CancelReceipt, TaskError> cancel_task(const std::string &task_id);

  [[nodiscard]] Result<TaskRecord, TaskError>
  get_task_status(const std::string &task_id) const;

  [[nodiscard]] std::vector<TaskRecord> get_task_status() const;

  [[nodiscard]] std::vector<TaskRecord> get_running_tasks() const;

  // ---- Accessors ----

  [[nodiscard]] const StatusReporter &status() const { return reporter_; }
  [[nodiscard]] const CategoryGate &gate() const { return *gate_; }
  [[nodiscard]] const TaskRegistry &registry() const { return *registry_; }
  [[nodiscard]] const ToolCatalog &catalog() const { return catalog_; }
  [[nodiscard]] const ManagerConfig &config() const { return config_; }

private:
  ManagerConfig config_;
  std::shared_ptr<ILogger> logger_;
  ToolCatalog catalog_;
  std::shared_ptr<TaskRegistry> registry_;
  std::shared_ptr<CategoryGate> gate_;
  std::shared_ptr<OperationWrapper> wrapper_;
  StatusReporter reporter_;
};

} // namespace opg::core
