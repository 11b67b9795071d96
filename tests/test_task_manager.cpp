#include <gtest/gtest.h>

#include "core/operation_wrapper.h"
#include "core/task_manager.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace opg::core;

namespace {

using Clock = std::chrono::steady_clock;

/// Tracks concurrent executions and the peak seen.
class RunningGuard {
public:
  RunningGuard(std::atomic<int> &running, std::atomic<int> &max_running)
      : running_(running) {
    const int now = running_.fetch_add(1) + 1;
    int observed = max_running.load();
    while (observed < now && !max_running.compare_exchange_weak(observed, now)) {
    }
  }
  ~RunningGuard() { running_.fetch_sub(1); }

private:
  std::atomic<int> &running_;
};

bool wait_until(const std::function<bool()> &predicate,
                std::chrono::milliseconds timeout) {
  const auto deadline = Clock::now() + timeout;
  while (Clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return predicate();
}

Operation timed_op(std::chrono::milliseconds duration, std::string payload,
                    std::atomic<int> *running = nullptr,
                    std::atomic<int> *max_running = nullptr) {
  return [=]() {
    if (running && max_running) {
      RunningGuard guard(*running, *max_running);
      std::this_thread::sleep_for(duration);
    } else {
      std::this_thread::sleep_for(duration);
    }
    return OperationResult::Ok(payload);
  };
}

ManagerConfig no_timeout() {
  ManagerConfig config;
  config.acquire_timeout = std::chrono::milliseconds::zero();
  return config;
}

} // namespace

// ============================================================
// Test: Category ceilings
// ============================================================

TEST(TaskManager, DesktopOperationsRunOneAtATime) {
  TaskManager manager(no_timeout());
  std::atomic<int> running{0};
  std::atomic<int> max_running{0};
  std::atomic<bool> first_started{false};
  std::atomic<bool> release{false};

  auto first = manager.launch_tool("Click", [&]() {
    RunningGuard guard(running, max_running);
    first_started = true;
    while (!release.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return OperationResult::Ok("a");
  });
  ASSERT_TRUE(first.is_ok());
  ASSERT_TRUE(wait_until([&]() { return first_started.load(); },
                         std::chrono::seconds(2)));

  auto second = manager.launch_tool(
      "Type", timed_op(std::chrono::milliseconds(20), "b", &running,
                        &max_running));
  ASSERT_TRUE(second.is_ok());
  const std::string first_id = first.value().task_id;
  const std::string second_id = second.value().task_id;
  ASSERT_TRUE(wait_until(
      [&]() { return manager.gate().waiting(TaskCategory::Desktop) == 1; },
      std::chrono::seconds(2)));

  // Registry view while the first body is still executing.
  const auto active = manager.get_running_tasks();
  const auto summary = manager.status().summary();
  release = true;

  EXPECT_TRUE(std::move(first).value().outcome.get().success);
  EXPECT_TRUE(std::move(second).value().outcome.get().success);

  ASSERT_EQ(active.size(), 2u);
  EXPECT_EQ(active[0].id, first_id);
  EXPECT_EQ(active[0].state, TaskState::Running);
  EXPECT_EQ(active[1].id, second_id);
  EXPECT_EQ(active[1].state, TaskState::Pending);
  EXPECT_EQ(summary.running_by_category[index_of(TaskCategory::Desktop)], 1u);
  EXPECT_EQ(max_running.load(), 1);

  // The second record entered Running only after the first was terminal.
  const auto first_record = manager.get_task_status(first_id).value();
  const auto second_record = manager.get_task_status(second_id).value();
  ASSERT_TRUE(first_record.completed_at.has_value());
  ASSERT_TRUE(second_record.started_at.has_value());
  EXPECT_LE(*first_record.completed_at, *second_record.started_at);
}

TEST(TaskManager, QueryOperationsRunTogether) {
  TaskManager manager(no_timeout());
  std::atomic<int> running{0};
  std::atomic<int> max_running{0};
  std::atomic<int> arrived{0};
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();

  std::vector<TaskHandle> handles;
  for (int i = 0; i < 5; ++i) {
    auto launched = manager.launch(TaskCategory::Query, "ListProcesses",
                                   [&running, &max_running, &arrived, released]() {
      RunningGuard guard(running, max_running);
      arrived.fetch_add(1);
      released.wait();
      return OperationResult::Ok("ok");
    });
    ASSERT_TRUE(launched.is_ok());
    handles.push_back(std::move(launched).value());
  }

  // All five are admitted without any of them finishing.
  const bool all_in = wait_until([&]() { return arrived.load() == 5; },
                                 std::chrono::seconds(3));
  const auto active = manager.get_running_tasks();
  release.set_value();
  for (auto &handle : handles) {
    handle.outcome.wait();
  }

  ASSERT_TRUE(all_in);
  EXPECT_EQ(max_running.load(), 5);
  ASSERT_EQ(active.size(), 5u);
  for (const auto &record : active) {
    EXPECT_EQ(record.state, TaskState::Running);
  }
}

TEST(TaskManager, CeilingHoldsUnderLoad) {
  TaskManager manager(no_timeout());
  std::atomic<int> running{0};
  std::atomic<int> max_running{0};
  std::atomic<bool> stop{false};
  std::atomic<std::size_t> max_recorded{0};
  std::atomic<int> samples{0};

  // Samples the registry's Running records for the category.
  std::thread observer([&]() {
    while (!stop.load()) {
      const auto summary = manager.status().summary();
      const std::size_t now =
          summary.running_by_category[index_of(TaskCategory::Shell)];
      std::size_t seen = max_recorded.load();
      while (seen < now && !max_recorded.compare_exchange_weak(seen, now)) {
      }
      samples.fetch_add(1);
    }
  });

  std::vector<std::thread> callers;
  for (int i = 0; i < 10; ++i) {
    callers.emplace_back([&]() {
      auto outcome = manager.execute_tool(
          "Shell", timed_op(std::chrono::milliseconds(20), "done", &running,
                             &max_running));
      EXPECT_TRUE(outcome.success);
    });
  }
  for (auto &t : callers) {
    t.join();
  }
  stop = true;
  observer.join();

  EXPECT_LE(max_running.load(), 2);
  EXPECT_GT(samples.load(), 0);
  EXPECT_GE(max_recorded.load(), 1u);
  EXPECT_LE(max_recorded.load(), 2u);
  EXPECT_EQ(manager.gate().in_use(TaskCategory::Shell), 0);
  EXPECT_EQ(manager.registry().active_count(), 0u);
}

// ============================================================
// Test: Failure isolation
// ============================================================

TEST(TaskManager, ThrowingOperationReportsFailureAndKeepsServing) {
  TaskManager manager(no_timeout());
  auto outcome = manager.execute_tool("FileRead", []() -> OperationResult {
    throw std::runtime_error("Permission denied: C:\\secret.txt");
  });

  EXPECT_FALSE(outcome.success);
  ASSERT_FALSE(outcome.task_id.empty());
  ASSERT_TRUE(outcome.error.has_value());
  EXPECT_EQ(outcome.error->message, "Permission denied: C:\\secret.txt");

  auto status = manager.get_task_status(outcome.task_id);
  ASSERT_TRUE(status.is_ok());
  EXPECT_EQ(status.value().state, TaskState::Failed);

  // Next submission is unaffected.
  auto next = manager.execute_tool("FileList",
                                   []() { return OperationResult::Ok("a\nb"); });
  EXPECT_TRUE(next.success);
  EXPECT_EQ(next.result, "a\nb");
}

TEST(TaskManager, UnknownToolIsRejectedWithoutRecord) {
  TaskManager manager;
  auto outcome = manager.execute_tool(
      "Teleport", []() { return OperationResult::Ok("never"); });

  EXPECT_FALSE(outcome.success);
  EXPECT_TRUE(outcome.task_id.empty());
  EXPECT_EQ(outcome.error->category, ErrorCategory::SubmissionRejected);
  EXPECT_TRUE(manager.get_task_status().empty());
  EXPECT_TRUE(manager.get_running_tasks().empty());
}

TEST(TaskManager, UnknownCategoryNameIsRejected) {
  TaskManager manager;
  auto outcome = manager.execute_in(
      "printer", "Print", []() { return OperationResult::Ok("never"); });
  EXPECT_EQ(outcome.error->category, ErrorCategory::SubmissionRejected);

  auto accepted = manager.execute_in(
      "Network", "Ping", []() { return OperationResult::Ok("pong"); });
  EXPECT_TRUE(accepted.success);
  EXPECT_EQ(manager.get_task_status(accepted.task_id).value().category,
            TaskCategory::Network);
}

// ============================================================
// Test: Cancellation
// ============================================================

TEST(TaskManager, CancelPendingTaskNeverInvokesOperation) {
  TaskManager manager(no_timeout());
  std::atomic<bool> release{false};
  std::atomic<int> side_effects{0};

  auto blocker = manager.launch_tool("Click", [&]() {
    while (!release.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return OperationResult::Ok("clicked");
  });
  ASSERT_TRUE(blocker.is_ok());
  ASSERT_TRUE(wait_until(
      [&]() { return manager.gate().in_use(TaskCategory::Desktop) == 1; },
      std::chrono::seconds(2)));

  auto queued = manager.launch_tool("Type", [&]() {
    side_effects.fetch_add(1);
    return OperationResult::Ok("typed");
  });
  ASSERT_TRUE(queued.is_ok());
  auto handle = std::move(queued).value();

  auto receipt = manager.cancel_task(handle.task_id);
  ASSERT_TRUE(receipt.is_ok());
  EXPECT_EQ(receipt.value().tool_name, "Type");
  EXPECT_EQ(receipt.value().disposition, CancelDisposition::Pending);

  const auto outcome = handle.outcome.get();
  release = true;
  std::move(blocker).value().outcome.wait();

  EXPECT_EQ(outcome.state, TaskState::Cancelled);
  EXPECT_EQ(side_effects.load(), 0);
  EXPECT_EQ(manager.get_task_status(handle.task_id).value().state,
            TaskState::Cancelled);
}

TEST(TaskManager, CancelFinishedTaskIsAlreadyTerminal) {
  TaskManager manager;
  auto outcome = manager.execute_tool(
      "GetClipboard", []() { return OperationResult::Ok("text"); });

  auto receipt = manager.cancel_task(outcome.task_id);
  ASSERT_TRUE(receipt.is_err());
  EXPECT_EQ(receipt.error().category, ErrorCategory::AlreadyTerminal);
  EXPECT_EQ(manager.get_task_status(outcome.task_id).value().state,
            TaskState::Succeeded);
}

TEST(TaskManager, CancelUnknownTaskIsNotFound) {
  TaskManager manager;
  auto receipt = manager.cancel_task("0123456789ab");
  ASSERT_TRUE(receipt.is_err());
  EXPECT_EQ(receipt.error().category, ErrorCategory::NotFound);
}

// ============================================================
// Test: Status queries
// ============================================================

TEST(TaskManager, HistoryKeepsNewestWithinCapacity) {
  ManagerConfig config = no_timeout();
  config.history_capacity = 3;
  TaskManager manager(config);

  std::vector<std::string> ids;
  for (int i = 0; i < 5; ++i) {
    ids.push_back(manager
                      .execute_tool("Ping",
                                    [i]() {
                                      return OperationResult::Ok(
                                          std::to_string(i));
                                    })
                      .task_id);
  }

  const auto history = manager.get_task_status();
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[0].id, ids[4]);
  EXPECT_EQ(history[1].id, ids[3]);
  EXPECT_EQ(history[2].id, ids[2]);
  EXPECT_TRUE(manager.get_task_status(ids[0]).is_err());
}

TEST(TaskManager, RunningTasksNeverReportTerminalRecords) {
  TaskManager manager(no_timeout());
  std::atomic<bool> stop{false};
  std::atomic<int> violations{0};

  std::thread observer([&]() {
    while (!stop.load()) {
      for (const auto &record : manager.get_running_tasks()) {
        if (is_terminal(record.state)) {
          violations.fetch_add(1);
        }
      }
    }
  });

  std::vector<std::thread> callers;
  for (int i = 0; i < 6; ++i) {
    callers.emplace_back([&manager, i]() {
      for (int j = 0; j < 10; ++j) {
        manager.execute_tool("FileSearch", [i, j]() -> OperationResult {
          if ((i + j) % 3 == 0) {
            throw std::runtime_error("search failed");
          }
          return OperationResult::Ok("found");
        });
      }
    });
  }
  for (auto &t : callers) {
    t.join();
  }
  stop = true;
  observer.join();

  EXPECT_EQ(violations.load(), 0);
  EXPECT_TRUE(manager.get_running_tasks().empty());
}

TEST(TaskManager, EveryTaskReachesExactlyOneTerminalState) {
  TaskManager manager(no_timeout());
  std::vector<TaskHandle> handles;
  for (int i = 0; i < 20; ++i) {
    auto launched = manager.launch_tool("PortCheck", [i]() -> OperationResult {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      if (i % 4 == 0) {
        return OperationResult::Err(TaskError::OperationFailed("closed"));
      }
      if (i % 4 == 1) {
        this_task::check_cancelled();
      }
      return OperationResult::Ok("open");
    });
    ASSERT_TRUE(launched.is_ok());
    handles.push_back(std::move(launched).value());
  }
  // Cancel a few while they are still queued or running.
  for (std::size_t i = 1; i < handles.size(); i += 4) {
    (void)manager.cancel_task(handles[i].task_id);
  }

  std::set<std::string> seen;
  for (auto &handle : handles) {
    const auto outcome = handle.outcome.get();
    EXPECT_TRUE(is_terminal(outcome.state));
    EXPECT_TRUE(seen.insert(outcome.task_id).second);

    auto record = manager.get_task_status(outcome.task_id);
    ASSERT_TRUE(record.is_ok());
    EXPECT_EQ(record.value().state, outcome.state);
  }
  EXPECT_EQ(manager.registry().history_size(), handles.size());
  EXPECT_EQ(manager.registry().active_count(), 0u);
}

// ============================================================
// Test: Registration surface
// ============================================================

TEST(TaskManager, WrapToolRunsThroughWrapper) {
  TaskManager manager;
  auto wrapped = manager.wrap_tool(
      "GetSystemInfo", []() { return OperationResult::Ok("cpu=8"); });
  ASSERT_TRUE(wrapped.is_ok());

  const auto outcome = wrapped.value()();
  EXPECT_TRUE(outcome.success);
  EXPECT_EQ(manager.get_task_status(outcome.task_id).value().tool_name,
            "GetSystemInfo");
}

TEST(TaskManager, ControlToolsAreNeverWrapped) {
  TaskManager manager;
  auto wrapped = manager.wrap_tool(
      "CancelTask", []() { return OperationResult::Ok("never"); });
  ASSERT_TRUE(wrapped.is_err());
  EXPECT_EQ(wrapped.error().category, ErrorCategory::SubmissionRejected);
}

TEST(TaskManager, RegisteredToolUsesItsCategory) {
  TaskManager manager;
  ASSERT_TRUE(manager.register_tool("Beep", TaskCategory::Desktop).is_ok());
  auto outcome =
      manager.execute_tool("Beep", []() { return OperationResult::Ok("beep"); });
  EXPECT_TRUE(outcome.success);
  EXPECT_EQ(manager.get_task_status(outcome.task_id).value().category,
            TaskCategory::Desktop);
}

TEST(TaskManager, InvalidCeilingIsFatal) {
  ManagerConfig config;
  config.gate.set_capacity(TaskCategory::File, 0);
  EXPECT_THROW(TaskManager{config}, std::invalid_argument);
}
