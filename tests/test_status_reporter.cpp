#include <gtest/gtest.h>

#include "core/status_reporter.h"
#include "core/task_registry.h"

#include <memory>
#include <string>

using namespace opg::core;

namespace {

class StatusReporterTest : public ::testing::Test {
protected:
  StatusReporterTest()
      : registry_(std::make_shared<TaskRegistry>(4)), reporter_(registry_) {}

  std::string finished(TaskState terminal, const std::string &tool) {
    const auto record = registry_->create(TaskCategory::File, tool);
    EXPECT_TRUE(registry_->mark_running(record.id).is_ok());
    switch (terminal) {
    case TaskState::Failed:
      EXPECT_TRUE(registry_
                      ->mark_failed(record.id,
                                    TaskError::OperationFailed("denied"))
                      .is_ok());
      break;
    case TaskState::Cancelled:
      EXPECT_TRUE(registry_->mark_cancelled(record.id).is_ok());
      break;
    default:
      EXPECT_TRUE(registry_->mark_succeeded(record.id, "ok").is_ok());
      break;
    }
    return record.id;
  }

  std::shared_ptr<TaskRegistry> registry_;
  StatusReporter reporter_;
};

} // namespace

TEST_F(StatusReporterTest, SingleTaskProjection) {
  const auto id = finished(TaskState::Failed, "FileWrite");

  auto status = reporter_.get_task_status(id);
  ASSERT_TRUE(status.is_ok());
  EXPECT_EQ(status.value().tool_name, "FileWrite");
  EXPECT_EQ(status.value().state, TaskState::Failed);
  EXPECT_EQ(status.value().error->message, "denied");
  EXPECT_TRUE(status.value().duration().has_value());
}

TEST_F(StatusReporterTest, UnknownAndEmptyIdsAreNotFound) {
  auto unknown = reporter_.get_task_status("ffffffffffff");
  ASSERT_TRUE(unknown.is_err());
  EXPECT_EQ(unknown.error().category, ErrorCategory::NotFound);

  auto empty = reporter_.get_task_status(std::string());
  ASSERT_TRUE(empty.is_err());
  EXPECT_EQ(empty.error().category, ErrorCategory::NotFound);
}

TEST_F(StatusReporterTest, EvictedTaskIsNotFound) {
  const auto first = finished(TaskState::Succeeded, "a");
  for (int i = 0; i < 4; ++i) {
    finished(TaskState::Succeeded, "b");
  }
  EXPECT_TRUE(reporter_.get_task_status(first).is_err());
}

TEST_F(StatusReporterTest, RecentHistoryIsNewestFirstAndBounded) {
  std::string last;
  for (int i = 0; i < 6; ++i) {
    last = finished(TaskState::Succeeded, "t" + std::to_string(i));
  }
  registry_->create(TaskCategory::Query, "still-pending");

  const auto history = reporter_.get_task_status();
  ASSERT_EQ(history.size(), 4u);
  EXPECT_EQ(history.front().id, last);
  EXPECT_EQ(history.back().tool_name, "t2");
  for (const auto &record : history) {
    EXPECT_TRUE(is_terminal(record.state));
  }
}

TEST_F(StatusReporterTest, RunningTasksNeverIncludeTerminal) {
  const auto pending = registry_->create(TaskCategory::Desktop, "Click");
  const auto running = registry_->create(TaskCategory::Shell, "Shell");
  ASSERT_TRUE(registry_->mark_running(running.id).is_ok());
  finished(TaskState::Cancelled, "gone");

  const auto active = reporter_.get_running_tasks();
  ASSERT_EQ(active.size(), 2u);
  EXPECT_EQ(active[0].id, pending.id);
  EXPECT_EQ(active[0].state, TaskState::Pending);
  EXPECT_EQ(active[1].id, running.id);
  EXPECT_EQ(active[1].state, TaskState::Running);
}

TEST_F(StatusReporterTest, ListTasksByState) {
  finished(TaskState::Failed, "f1");
  finished(TaskState::Succeeded, "s1");
  finished(TaskState::Failed, "f2");

  const auto failed = reporter_.list_tasks(TaskState::Failed);
  ASSERT_EQ(failed.size(), 2u);
  EXPECT_EQ(failed[0].tool_name, "f2");
  EXPECT_EQ(failed[1].tool_name, "f1");

  EXPECT_EQ(reporter_.list_tasks(std::nullopt, 1).size(), 1u);
}

TEST_F(StatusReporterTest, SummaryCountsByCategory) {
  registry_->create(TaskCategory::Desktop, "Click");
  const auto shell = registry_->create(TaskCategory::Shell, "Shell");
  ASSERT_TRUE(registry_->mark_running(shell.id).is_ok());
  finished(TaskState::Succeeded, "done");

  const auto summary = reporter_.summary();
  EXPECT_EQ(summary.pending, 1u);
  EXPECT_EQ(summary.running, 1u);
  EXPECT_EQ(summary.history, 1u);
  EXPECT_EQ(summary.history_capacity, 4u);
  EXPECT_EQ(summary.running_by_category[index_of(TaskCategory::Shell)], 1u);
  EXPECT_EQ(summary.running_by_category[index_of(TaskCategory::Desktop)], 0u);
}
