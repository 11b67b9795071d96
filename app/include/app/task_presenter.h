#pragma once

#include <QObject>
#include <QString>
#include <QTimer>
#include <QVariantList>
#include <QVariantMap>

#include <memory>

namespace opg::core {
class ILogger;
class TaskManager;
struct TaskRecord;
} // namespace opg::core

namespace opg::app {

/// TaskPresenter: thin QObject bridge between a monitoring front end and
/// the task core's control operations.
///
/// Responsibilities:
///   - Expose CancelTask / GetTaskStatus / GetRunningTasks as invokables
///   - Poll the status reporter on a QTimer and publish counters
///
/// Does NOT contain task logic; that lives in core.
class TaskPresenter : public QObject {
  Q_OBJECT

  Q_PROPERTY(int pendingCount READ pendingCount NOTIFY countsChanged)
  Q_PROPERTY(int runningCount READ runningCount NOTIFY countsChanged)
  Q_PROPERTY(int historyCount READ historyCount NOTIFY countsChanged)
  Q_PROPERTY(QString statusText READ statusText NOTIFY statusTextChanged)

public:
  explicit TaskPresenter(std::shared_ptr<opg::core::TaskManager> manager,
                         std::shared_ptr<opg::core::ILogger> logger,
                         QObject *parent = nullptr);

  [[nodiscard]] int pendingCount() const { return pending_count_; }
  [[nodiscard]] int runningCount() const { return running_count_; }
  [[nodiscard]] int historyCount() const { return history_count_; }
  [[nodiscard]] QString statusText() const { return status_text_; }

  /// Start polling every interval_ms milliseconds.
  void start(int interval_ms);

  // ---- Invokable control operations ----
  Q_INVOKABLE QString cancelTask(const QString &taskId);
  Q_INVOKABLE QVariantMap taskStatus(const QString &taskId) const;
  Q_INVOKABLE QVariantList recentTasks() const;
  Q_INVOKABLE QVariantList runningTasks() const;

signals:
  void countsChanged();
  void statusTextChanged();
  /// Emitted on a refresh that finds no Pending or Running task.
  void idle();

private slots:
  void onRefresh();

private:
  static QVariantMap toVariant(const opg::core::TaskRecord &record);
  void setStatusText(const QString &text);

  std::shared_ptr<opg::core::TaskManager> manager_;
  std::shared_ptr<opg::core::ILogger> logger_;
  QTimer *refresh_timer_;

  int pending_count_ = 0;
  int running_count_ = 0;
  int history_count_ = 0;
  QString status_text_;
};

} // namespace opg::app
