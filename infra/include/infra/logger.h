#pragma once

#include "core/logger.h"

#include <memory>
#include <string>

namespace opg::infra {

/// spdlog-backed console logger.
/// Format: [ts] [level] [trace_id] [component] event: msg
std::unique_ptr<core::ILogger> create_console_logger();

/// Same, with an explicit spdlog logger name and level ("debug", "info",
/// "warn", "error", "off"). Unknown levels keep spdlog's default.
std::unique_ptr<core::ILogger> create_console_logger(const std::string &name,
                                                     const std::string &level);

} // namespace opg::infra
