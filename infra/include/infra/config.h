#pragma once

#include "core/logger.h"
#include "core/result.h"
#include "core/task_error.h"
#include "core/task_manager.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace opg::infra {

/// Upper bound for OPG_ACQUIRE_TIMEOUT_MS (24 h).
constexpr std::chrono::milliseconds kMaxAcquireTimeout{24LL * 60 * 60 * 1000};

/// Environment lookup; returns nullptr for unset variables.
using EnvLookup = std::function<const char *(const char *name)>;

/// Build the task core configuration from the environment.
///
///   OPG_LIMIT_DESKTOP / _FILE / _QUERY / _SHELL / _NETWORK
///       Per-category ceilings. Anything but a positive integer is fatal:
///       returns Err(Internal) and the host must not start.
///   OPG_HISTORY_CAPACITY     (default 100, positive)
///   OPG_MAX_LAUNCHED         (default 64, positive)
///   OPG_ACQUIRE_TIMEOUT_MS   (default 30000, 0 = wait forever)
///       Invalid values fall back to the default with a warning. Values
///       above kMaxAcquireTimeout are clamped to it with a warning.
core::Result<core::ManagerConfig, core::TaskError>
load_manager_config(const EnvLookup &env,
                    const std::shared_ptr<core::ILogger> &logger);

core::Result<core::ManagerConfig, core::TaskError>
load_manager_config_from_environment(
    const std::shared_ptr<core::ILogger> &logger);

/// OPG_LOG_LEVEL, or "info" when unset.
std::string log_level_from_environment();

/// Name of the ceiling variable for a category, e.g. "OPG_LIMIT_SHELL".
std::string limit_variable(core::TaskCategory category);

} // namespace opg::infra
