#pragma once

#include <string>

namespace opg::core {

/// Logger interface used by the task core. Concrete implementations live in
/// infra. trace_id carries the task id (or a fixed tag such as "startup").
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual void info(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void warn(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void error(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;
};

} // namespace opg::core
