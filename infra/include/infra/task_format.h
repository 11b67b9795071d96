#pragma once

#include "core/operation_wrapper.h"
#include "core/result.h"
#include "core/task.h"
#include "core/task_error.h"
#include "core/task_manager.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace opg::infra {

/// Plain-text rendering of task core results for the dispatch layer.

/// "2.35" (seconds, two decimals), empty when there is no duration.
std::string format_duration(std::optional<std::chrono::milliseconds> duration);

/// "[task:<id>] <payload>", "[task:<id>] Error in <tool>: <msg>",
/// "[task:<id>] Cancelled before execution", ...
std::string format_outcome(const core::TaskOutcome &outcome,
                           const std::string &tool_name);

/// Key/value block for one record.
std::string format_record(const core::TaskRecord &record);

/// "Recent tasks:" listing, at most max_lines entries.
std::string format_history(const std::vector<core::TaskRecord> &records,
                           std::size_t max_lines = 20);

/// "Active tasks (<n>):" listing.
std::string format_running(const std::vector<core::TaskRecord> &records);

std::string
format_cancel(const std::string &task_id,
              const core::Result<core::CancelReceipt, core::TaskError> &result);

} // namespace opg::infra
