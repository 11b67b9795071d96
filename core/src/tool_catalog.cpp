#include "core/tool_catalog.h"

#include <array>
#include <utility>

namespace opg::core {
namespace {

struct DefaultTool {
  const char *name;
  TaskCategory category;
};

// Desktop tools share one physical input stream and run exclusively.
constexpr std::array<DefaultTool, 40> kDefaultTools = {{
    {"Snapshot", TaskCategory::Desktop},
    {"AnnotatedSnapshot", TaskCategory::Desktop},
    {"Click", TaskCategory::Desktop},
    {"Type", TaskCategory::Desktop},
    {"Scroll", TaskCategory::Desktop},
    {"Move", TaskCategory::Desktop},
    {"Shortcut", TaskCategory::Desktop},
    {"FocusWindow", TaskCategory::Desktop},
    {"MinimizeAll", TaskCategory::Desktop},
    {"App", TaskCategory::Desktop},
    {"OCR", TaskCategory::Desktop},
    {"ScreenRecord", TaskCategory::Desktop},
    {"LockScreen", TaskCategory::Desktop},
    {"Wait", TaskCategory::Desktop},
    {"FileRead", TaskCategory::File},
    {"FileWrite", TaskCategory::File},
    {"FileList", TaskCategory::File},
    {"FileSearch", TaskCategory::File},
    {"FileDownload", TaskCategory::File},
    {"FileUpload", TaskCategory::File},
    {"GetSystemInfo", TaskCategory::Query},
    {"GetClipboard", TaskCategory::Query},
    {"SetClipboard", TaskCategory::Query},
    {"ListProcesses", TaskCategory::Query},
    {"KillProcess", TaskCategory::Query},
    {"Notification", TaskCategory::Query},
    {"RegRead", TaskCategory::Query},
    {"RegWrite", TaskCategory::Query},
    {"ServiceList", TaskCategory::Query},
    {"ServiceStart", TaskCategory::Query},
    {"ServiceStop", TaskCategory::Query},
    {"TaskList", TaskCategory::Query},
    {"TaskCreate", TaskCategory::Query},
    {"TaskDelete", TaskCategory::Query},
    {"EventLog", TaskCategory::Query},
    {"Shell", TaskCategory::Shell},
    {"Scrape", TaskCategory::Shell},
    {"Ping", TaskCategory::Network},
    {"PortCheck", TaskCategory::Network},
    {"NetConnections", TaskCategory::Network},
}};

constexpr std::array<const char *, 3> kControlTools = {
    "CancelTask", "GetTaskStatus", "GetRunningTasks"};

} // namespace

ToolCatalog::ToolCatalog(const ToolCatalog &other) {
  std::lock_guard<std::mutex> lock(other.mutex_);
  tools_ = other.tools_;
}

ToolCatalog &ToolCatalog::operator=(const ToolCatalog &other) {
  if (this != &other) {
    std::map<std::string, TaskCategory> copy;
    {
      std::lock_guard<std::mutex> lock(other.mutex_);
      copy = other.tools_;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    tools_ = std::move(copy);
  }
  return *this;
}

ToolCatalog ToolCatalog::with_defaults() {
  ToolCatalog catalog;
  for (const auto &tool : kDefaultTools) {
    catalog.tools_.emplace(tool.name, tool.category);
  }
  return catalog;
}

bool ToolCatalog::is_control_tool(const std::string &tool_name) {
  for (const auto *name : kControlTools) {
    if (tool_name == name) {
      return true;
    }
  }
  return false;
}

Result<void, TaskError> ToolCatalog::add(const std::string &tool_name,
                                         TaskCategory category) {
  if (tool_name.empty()) {
    return Result<void, TaskError>::Err(
        TaskError::SubmissionRejected("Tool name must not be empty"));
  }
  if (is_control_tool(tool_name)) {
    return Result<void, TaskError>::Err(TaskError::SubmissionRejected(
        "Tool " + tool_name + " is handled by the task core"));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!tools_.emplace(tool_name, category).second) {
    return Result<void, TaskError>::Err(TaskError::SubmissionRejected(
        "Tool " + tool_name + " is already registered"));
  }
  return Result<void, TaskError>::Ok();
}

Result<TaskCategory, TaskError>
ToolCatalog::lookup(const std::string &tool_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tools_.find(tool_name);
  if (it == tools_.end()) {
    return Result<TaskCategory, TaskError>::Err(TaskError::SubmissionRejected(
        "Unknown tool: '" + tool_name + "'"));
  }
  return Result<TaskCategory, TaskError>::Ok(it->second);
}

bool ToolCatalog::contains(const std::string &tool_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tools_.count(tool_name) != 0;
}

std::size_t ToolCatalog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tools_.size();
}

std::vector<std::string> ToolCatalog::tools_in(TaskCategory category) const {
  std::vector<std::string> names;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[name, cat] : tools_) {
    if (cat == category) {
      names.push_back(name);
    }
  }
  return names;
}

} // namespace opg::core
