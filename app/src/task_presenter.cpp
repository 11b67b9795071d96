#include "app/task_presenter.h"

#include "core/logger.h"
#include "core/task_manager.h"
#include "infra/task_format.h"

#include <utility>

namespace opg::app {

TaskPresenter::TaskPresenter(std::shared_ptr<opg::core::TaskManager> manager,
                             std::shared_ptr<opg::core::ILogger> logger,
                             QObject *parent)
    : QObject(parent), manager_(std::move(manager)),
      logger_(std::move(logger)), refresh_timer_(new QTimer(this)) {
  connect(refresh_timer_, &QTimer::timeout, this, &TaskPresenter::onRefresh);
}

void TaskPresenter::start(int interval_ms) {
  refresh_timer_->setInterval(interval_ms);
  refresh_timer_->start();
}

QString TaskPresenter::cancelTask(const QString &taskId) {
  const std::string id = taskId.toStdString();
  const auto result = manager_->cancel_task(id);
  if (result.is_err() && logger_) {
    logger_->warn(id, "presenter", "cancel_failed", result.error().message);
  }
  onRefresh();
  return QString::fromStdString(opg::infra::format_cancel(id, result));
}

QVariantMap TaskPresenter::taskStatus(const QString &taskId) const {
  const auto record = manager_->get_task_status(taskId.toStdString());
  if (record.is_err()) {
    QVariantMap missing;
    missing.insert("task_id", taskId);
    missing.insert("error", QString::fromStdString(record.error().message));
    return missing;
  }
  return toVariant(record.value());
}

QVariantList TaskPresenter::recentTasks() const {
  QVariantList list;
  for (const auto &record : manager_->get_task_status()) {
    list.append(toVariant(record));
  }
  return list;
}

QVariantList TaskPresenter::runningTasks() const {
  QVariantList list;
  for (const auto &record : manager_->get_running_tasks()) {
    list.append(toVariant(record));
  }
  return list;
}

void TaskPresenter::onRefresh() {
  const auto summary = manager_->status().summary();
  const int pending = static_cast<int>(summary.pending);
  const int running = static_cast<int>(summary.running);
  const int history = static_cast<int>(summary.history);

  if (pending != pending_count_ || running != running_count_ ||
      history != history_count_) {
    pending_count_ = pending;
    running_count_ = running;
    history_count_ = history;
    emit countsChanged();
    setStatusText(QString::fromStdString(
        opg::infra::format_running(manager_->get_running_tasks())));
  }

  if (pending == 0 && running == 0) {
    emit idle();
  }
}

QVariantMap TaskPresenter::toVariant(const opg::core::TaskRecord &record) {
  QVariantMap map;
  map.insert("task_id", QString::fromStdString(record.id));
  map.insert("tool_name", QString::fromStdString(record.tool_name));
  map.insert("category",
             QString::fromLatin1(opg::core::to_string(record.category)));
  map.insert("status", QString::fromLatin1(opg::core::to_string(record.state)));
  map.insert("cancel_requested", record.cancel_requested);

  const auto duration = record.duration();
  if (duration.has_value()) {
    map.insert("duration", static_cast<double>(duration->count()) / 1000.0);
  }
  if (record.error.has_value()) {
    map.insert("error", QString::fromStdString(record.error->message));
  }
  return map;
}

void TaskPresenter::setStatusText(const QString &text) {
  if (text == status_text_) {
    return;
  }
  status_text_ = text;
  emit statusTextChanged();
}

} // namespace opg::app
