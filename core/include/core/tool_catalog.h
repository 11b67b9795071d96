#pragma once

#include "core/result.h"
#include "core/task.h"
#include "core/task_error.h"

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace opg::core {

/// Closed mapping from tool name to operation category.
///
/// Tools are validated when registered; lookups for unknown names are
/// rejected instead of falling back to a default category.
class ToolCatalog {
public:
  ToolCatalog() = default;
  ToolCatalog(const ToolCatalog &other);
  ToolCatalog &operator=(const ToolCatalog &other);

  /// Catalog of the stock remote-control tools (Click, FileRead, Shell, ...).
  static ToolCatalog with_defaults();

  /// Names handled by the task core itself; they are never wrapped.
  static bool is_control_tool(const std::string &tool_name);

  /// Rejects empty names, control tools and duplicates.
  Result<void, TaskError> add(const std::string &tool_name,
                              TaskCategory category);

  [[nodiscard]] Result<TaskCategory, TaskError>
  lookup(const std::string &tool_name) const;

  [[nodiscard]] bool contains(const std::string &tool_name) const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::vector<std::string> tools_in(TaskCategory category) const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, TaskCategory> tools_;
};

} // namespace opg::core
