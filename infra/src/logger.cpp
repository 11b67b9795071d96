#include "infra/logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace opg::infra {
namespace {

/// ConsoleLogger: spdlog-based structured logger.
/// The task id travels as trace_id so every line of one task can be grepped.
class ConsoleLogger : public core::ILogger {
public:
  ConsoleLogger(const std::string &name, const std::string &level) {
    logger_ = spdlog::get(name);
    if (!logger_) {
      logger_ = spdlog::stdout_color_mt(name);
    }
    logger_->set_pattern("[%Y-%m-%dT%H:%M:%S.%e%z] [%^%l%$] %v");
    if (!level.empty()) {
      const auto parsed = spdlog::level::from_str(level);
      // from_str() maps unknown names to "off"; only honour an explicit off.
      if (parsed != spdlog::level::off || level == "off") {
        logger_->set_level(parsed);
      }
    }
  }

  void info(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->info("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void warn(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->warn("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void error(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->error("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

std::unique_ptr<core::ILogger> create_console_logger() {
  return create_console_logger("opgate", "");
}

std::unique_ptr<core::ILogger> create_console_logger(const std::string &name,
                                                     const std::string &level) {
  return std::make_unique<ConsoleLogger>(name, level);
}

} // namespace opg::infra
