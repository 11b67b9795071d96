#include "infra/config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <optional>
#include <utility>

namespace opg::infra {
namespace {

/// Strict integer parse: the whole string must be a base-10 number.
std::optional<long long> parse_int(const char *raw) {
  if (!raw || raw[0] == 0) {
    return std::nullopt;
  }
  errno = 0;
  char *end = nullptr;
  const long long value = std::strtoll(raw, &end, 10);
  if (errno != 0 || !end || *end != 0) {
    return std::nullopt;
  }
  return value;
}

long long parse_env_int(const EnvLookup &env, const char *name,
                        long long fallback, bool allow_zero,
                        const std::shared_ptr<core::ILogger> &logger) {
  const char *raw = env(name);
  if (!raw || raw[0] == 0) {
    return fallback;
  }

  const auto value = parse_int(raw);
  const bool valid =
      value.has_value() && (allow_zero ? *value >= 0 : *value > 0);
  if (!valid) {
    if (logger) {
      logger->warn("startup", "config", "config_invalid",
                   std::string("Invalid value for ") + name + "=" + raw +
                       ", fallback=" + std::to_string(fallback));
    }
    return fallback;
  }
  return *value;
}

} // namespace

std::string limit_variable(core::TaskCategory category) {
  std::string suffix = core::to_string(category);
  std::transform(suffix.begin(), suffix.end(), suffix.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return "OPG_LIMIT_" + suffix;
}

core::Result<core::ManagerConfig, core::TaskError>
load_manager_config(const EnvLookup &env,
                    const std::shared_ptr<core::ILogger> &logger) {
  using ConfigResult = core::Result<core::ManagerConfig, core::TaskError>;
  core::ManagerConfig config;

  // Ceilings are not recoverable: a bad value means the operator asked for
  // something the gate cannot honour.
  for (const auto category : core::kAllCategories) {
    const std::string name = limit_variable(category);
    const char *raw = env(name.c_str());
    if (!raw || raw[0] == 0) {
      continue;
    }
    const auto value = parse_int(raw);
    if (!value.has_value() || *value <= 0 ||
        *value > std::numeric_limits<int>::max()) {
      return ConfigResult::Err(core::TaskError::Internal(
          "Invalid concurrency limit " + name + "=" + raw +
          " (must be a positive integer)"));
    }
    config.gate.set_capacity(category, static_cast<int>(*value));
  }

  config.history_capacity = static_cast<std::size_t>(parse_env_int(
      env, "OPG_HISTORY_CAPACITY",
      static_cast<long long>(config.history_capacity), false, logger));

  config.max_launched = static_cast<std::size_t>(parse_env_int(
      env, "OPG_MAX_LAUNCHED", static_cast<long long>(config.max_launched),
      false, logger));

  long long timeout_ms =
      parse_env_int(env, "OPG_ACQUIRE_TIMEOUT_MS",
                    config.acquire_timeout.count(), true, logger);
  if (timeout_ms > kMaxAcquireTimeout.count()) {
    if (logger) {
      logger->warn("startup", "config", "config_invalid",
                   "OPG_ACQUIRE_TIMEOUT_MS=" + std::to_string(timeout_ms) +
                       " exceeds the maximum, clamped=" +
                       std::to_string(kMaxAcquireTimeout.count()) +
                       " (use 0 to wait forever)");
    }
    timeout_ms = kMaxAcquireTimeout.count();
  }
  config.acquire_timeout = std::chrono::milliseconds(timeout_ms);

  return ConfigResult::Ok(std::move(config));
}

core::Result<core::ManagerConfig, core::TaskError>
load_manager_config_from_environment(
    const std::shared_ptr<core::ILogger> &logger) {
  return load_manager_config(
      [](const char *name) { return std::getenv(name); }, logger);
}

std::string log_level_from_environment() {
  const char *raw = std::getenv("OPG_LOG_LEVEL");
  if (!raw || raw[0] == 0) {
    return "info";
  }
  return raw;
}

} // namespace opg::infra
