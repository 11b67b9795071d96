#include "infra/task_format.h"

#include <iomanip>
#include <sstream>

namespace opg::infra {
namespace {

std::string display_name(const core::TaskRecord &record) {
  return record.tool_name.empty() ? std::string("<anonymous>")
                                  : record.tool_name;
}

} // namespace

std::string
format_duration(std::optional<std::chrono::milliseconds> duration) {
  if (!duration.has_value()) {
    return {};
  }
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2)
     << static_cast<double>(duration->count()) / 1000.0;
  return ss.str();
}

std::string format_outcome(const core::TaskOutcome &outcome,
                           const std::string &tool_name) {
  std::ostringstream ss;
  if (!outcome.task_id.empty()) {
    ss << "[task:" << outcome.task_id << "] ";
  }

  if (outcome.success) {
    ss << outcome.result;
    return ss.str();
  }

  const std::string message =
      outcome.error.has_value() ? outcome.error->message : "unknown error";
  if (outcome.state == core::TaskState::Cancelled) {
    ss << message;
  } else if (outcome.task_id.empty()) {
    ss << "Rejected: " << message;
  } else {
    ss << "Error in " << (tool_name.empty() ? "operation" : tool_name) << ": "
       << message;
  }
  return ss.str();
}

std::string format_record(const core::TaskRecord &record) {
  std::ostringstream ss;
  ss << "task_id: " << record.id << "\n"
     << "tool_name: " << display_name(record) << "\n"
     << "category: " << core::to_string(record.category) << "\n"
     << "status: " << core::to_string(record.state) << "\n";

  const std::string duration = format_duration(record.duration());
  ss << "duration: " << (duration.empty() ? "-" : duration + "s") << "\n";

  if (record.cancel_requested && !core::is_terminal(record.state)) {
    ss << "cancel_requested: true\n";
  }
  ss << "error: " << (record.error.has_value() ? record.error->message : "-");
  return ss.str();
}

std::string format_history(const std::vector<core::TaskRecord> &records,
                           std::size_t max_lines) {
  if (records.empty()) {
    return "No tasks in history.";
  }

  std::ostringstream ss;
  ss << "Recent tasks:";
  std::size_t written = 0;
  for (const auto &record : records) {
    if (written++ == max_lines) {
      break;
    }
    ss << "\n  [" << record.id << "] " << display_name(record) << " -> "
       << core::to_string(record.state);
    const std::string duration = format_duration(record.duration());
    if (!duration.empty()) {
      ss << " (" << duration << "s)";
    }
    if (record.error.has_value()) {
      ss << " - " << record.error->message;
    }
  }
  return ss.str();
}

std::string format_running(const std::vector<core::TaskRecord> &records) {
  if (records.empty()) {
    return "No active tasks.";
  }

  std::ostringstream ss;
  ss << "Active tasks (" << records.size() << "):";
  for (const auto &record : records) {
    ss << "\n  [" << record.id << "] " << display_name(record) << " ["
       << core::to_string(record.category) << "] "
       << core::to_string(record.state);
    const std::string duration = format_duration(record.duration());
    if (!duration.empty()) {
      ss << " (" << duration << "s)";
    }
  }
  return ss.str();
}

std::string
format_cancel(const std::string &task_id,
              const core::Result<core::CancelReceipt, core::TaskError> &result) {
  if (result.is_err()) {
    return "Cancel failed: " + result.error().message;
  }

  const auto &receipt = result.value();
  std::string text = "Cancelled task " + task_id + " (" +
                     (receipt.tool_name.empty() ? std::string("<anonymous>")
                                                : receipt.tool_name) +
                     ")";
  if (receipt.disposition == core::CancelDisposition::Running) {
    text += "; already running, cancellation is advisory";
  }
  return text;
}

} // namespace opg::infra
