#include "app/task_presenter.h"
#include "core/logger.h"
#include "core/operation_wrapper.h"
#include "core/task_manager.h"
#include "infra/config.h"
#include "infra/logger.h"
#include "infra/task_format.h"

#include <QCoreApplication>
#include <QStringList>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

/// Sleeps in small steps so a cancel request ends the wait early.
opg::core::Operation make_wait(std::chrono::milliseconds total) {
  return [total]() -> opg::core::OperationResult {
    const auto step = std::chrono::milliseconds(20);
    auto waited = std::chrono::milliseconds::zero();
    while (waited < total) {
      opg::core::this_task::check_cancelled();
      std::this_thread::sleep_for(step);
      waited += step;
    }
    return opg::core::OperationResult::Ok("Waited " +
                                          std::to_string(total.count()) +
                                          " ms");
  };
}

opg::core::Operation make_file_read(std::string path) {
  return [path = std::move(path)]() -> opg::core::OperationResult {
    std::ifstream in(path);
    if (!in) {
      return opg::core::OperationResult::Err(
          opg::core::TaskError::OperationFailed("Cannot open " + path));
    }
    std::ostringstream content;
    content << in.rdbuf();
    return opg::core::OperationResult::Ok(content.str());
  };
}

struct Submission {
  std::string tool_name;
  opg::core::TaskHandle handle;
};

} // namespace

int main(int argc, char *argv[]) {
  QCoreApplication qtapp(argc, argv);

  auto logger = opg::infra::create_console_logger(
      "opgate", opg::infra::log_level_from_environment());
  auto logger_ptr = std::shared_ptr<opg::core::ILogger>(logger.release());

  auto config = opg::infra::load_manager_config_from_environment(logger_ptr);
  if (config.is_err()) {
    logger_ptr->error("startup", "app", "config_invalid",
                      config.error().message);
    return 1;
  }

  std::shared_ptr<opg::core::TaskManager> manager;
  try {
    manager = std::make_shared<opg::core::TaskManager>(config.value(),
                                                       logger_ptr);
  } catch (const std::invalid_argument &e) {
    logger_ptr->error("startup", "app", "task_core_invalid", e.what());
    return 1;
  }

  const QStringList args = QCoreApplication::arguments();
  const std::string read_path = args.size() > 1
                                    ? args.at(1).toStdString()
                                    : std::string("/etc/hostname");

  // Two desktop waits contend for the single desktop slot; the second is
  // cancelled while it queues.
  std::vector<Submission> submissions;
  auto submit = [&](const std::string &tool, opg::core::Operation op) {
    auto handle = manager->launch_tool(tool, std::move(op));
    if (handle.is_err()) {
      std::cout << "Rejected: " << handle.error().message << std::endl;
      return std::string();
    }
    const std::string id = handle.value().task_id;
    submissions.push_back(Submission{tool, std::move(handle).value()});
    return id;
  };

  submit("Wait", make_wait(std::chrono::milliseconds(400)));
  const std::string queued = submit("Wait", make_wait(std::chrono::seconds(5)));
  submit("FileRead", make_file_read(read_path));
  submit("FileRead", make_file_read("/nonexistent/opgate-demo"));
  submit("NoSuchTool", make_wait(std::chrono::milliseconds(1)));

  auto *presenter = new opg::app::TaskPresenter(manager, logger_ptr, &qtapp);
  QObject::connect(presenter, &opg::app::TaskPresenter::statusTextChanged,
                   presenter, [presenter]() {
                     std::cout << presenter->statusText().toStdString()
                               << std::endl;
                   });
  QObject::connect(presenter, &opg::app::TaskPresenter::idle, &qtapp,
                   [&qtapp]() { qtapp.quit(); });

  if (!queued.empty()) {
    std::cout << presenter->cancelTask(QString::fromStdString(queued))
                     .toStdString()
              << std::endl;
  }
  presenter->start(100);

  const int rc = qtapp.exec();

  for (auto &submission : submissions) {
    const auto outcome = submission.handle.outcome.get();
    std::cout << opg::infra::format_outcome(outcome, submission.tool_name)
              << std::endl;
  }
  std::cout << opg::infra::format_history(manager->get_task_status())
            << std::endl;
  return rc;
}
