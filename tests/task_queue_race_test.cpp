#include "tamma/queue/task_queue.hpp"
#include "tamma/storage/database.hpp"

#include "test_utils.hpp"

#include <atomic>
#include <format>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace tamma;

// Each claimant gets its own pool and queue over the same file, like separate
// orchestrator processes sharing one store.
class TaskQueueRaceTest : public ::testing::Test {
protected:
  static constexpr int kClaimants = 12;
  static constexpr int kTasks = 60;

  void SetUp() override {
    test_db_path_ = test::make_temp_db_path();
    ASSERT_FALSE(test_db_path_.empty());
    config_ = test::test_config(test_db_path_);
    config_.storage.pool_size = 2;
    config_.storage.max_retries = 50;
  }

  void TearDown() override { test::remove_db_files(test_db_path_); }

  std::string test_db_path_;
  SystemConfig config_;
  SystemClock clock_;
  test::RecordingEventSink events_;
};

TEST_F(TaskQueueRaceTest, ConcurrentClaims_NeverDoubleClaim) {
  {
    Database db(config_.storage);
    ASSERT_TRUE(db.open().has_value());
    TaskQueue queue(db, config_.queue, clock_, events_);
    ASSERT_TRUE(queue.init().has_value());
    for (int i = 0; i < kTasks; ++i) {
      NewTask t;
      t.id = TaskId{std::format("task-{}", i)};
      t.priority = i % 5;
      ASSERT_TRUE(queue.enqueue(std::move(t)).has_value());
    }
  }

  test::Barrier barrier(kClaimants);
  std::mutex mu;
  std::vector<std::string> claimed;
  std::atomic<int> errors{0};

  std::vector<std::thread> threads;
  for (int c = 0; c < kClaimants; ++c) {
    threads.emplace_back([&, c] {
      Database db(config_.storage);
      if (!db.open()) {
        errors.fetch_add(1);
        barrier.arrive_and_wait();
        return;
      }
      TaskQueue queue(db, config_.queue, clock_, events_);
      WorkerId worker{std::format("worker-{}", c)};
      std::vector<std::string> caps{"workflow-step"};

      barrier.arrive_and_wait();
      while (true) {
        auto task = queue.claim(worker, caps);
        if (!task) {
          errors.fetch_add(1);
          break;
        }
        if (!*task) {
          break;
        }
        std::lock_guard lock(mu);
        claimed.push_back((*task)->id.str());
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(errors.load(), 0);
  ASSERT_EQ(claimed.size(), static_cast<std::size_t>(kTasks));
  std::set<std::string> unique(claimed.begin(), claimed.end());
  EXPECT_EQ(unique.size(), claimed.size());

  Database db(config_.storage);
  ASSERT_TRUE(db.open().has_value());
  TaskQueue queue(db, config_.queue, clock_, events_);
  auto stats = queue.stats();
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->running, kTasks);
  EXPECT_EQ(stats->pending, 0);

  auto running = queue.list_tasks({.status = TaskStatus::Running,
                                   .limit = kTasks});
  ASSERT_TRUE(running.has_value());
  for (const auto& task : *running) {
    EXPECT_TRUE(task.assigned_worker.has_value());
  }
}

TEST_F(TaskQueueRaceTest, ConcurrentClaimsForOneWorker_RespectRunningLimit) {
  constexpr int kLimit = 2;
  {
    Database db(config_.storage);
    ASSERT_TRUE(db.open().has_value());
    TaskQueue queue(db, config_.queue, clock_, events_);
    ASSERT_TRUE(queue.init().has_value());
    for (int i = 0; i < 20; ++i) {
      ASSERT_TRUE(queue.enqueue(NewTask{}).has_value());
    }
  }

  test::Barrier barrier(kClaimants);
  std::atomic<int> granted{0};
  std::atomic<int> errors{0};

  std::vector<std::thread> threads;
  for (int c = 0; c < kClaimants; ++c) {
    threads.emplace_back([&] {
      Database db(config_.storage);
      if (!db.open()) {
        errors.fetch_add(1);
        barrier.arrive_and_wait();
        return;
      }
      TaskQueue queue(db, config_.queue, clock_, events_);

      barrier.arrive_and_wait();
      auto task = queue.claim(WorkerId{"shared"}, {"workflow-step"}, kLimit);
      if (!task) {
        errors.fetch_add(1);
      } else if (*task) {
        granted.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(errors.load(), 0);
  EXPECT_EQ(granted.load(), kLimit);

  Database db(config_.storage);
  ASSERT_TRUE(db.open().has_value());
  TaskQueue queue(db, config_.queue, clock_, events_);
  auto stats = queue.stats();
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->running, kLimit);
  EXPECT_EQ(stats->pending, 20 - kLimit);
}

TEST_F(TaskQueueRaceTest, ConcurrentCompleteAndCancel_ExactlyOneWins) {
  Database db(config_.storage);
  ASSERT_TRUE(db.open().has_value());
  TaskQueue queue(db, config_.queue, clock_, events_);
  ASSERT_TRUE(queue.init().has_value());

  constexpr int kRounds = 20;
  for (int round = 0; round < kRounds; ++round) {
    NewTask t;
    t.id = TaskId{std::format("contested-{}", round)};
    ASSERT_TRUE(queue.enqueue(std::move(t)).has_value());
    auto task = queue.claim(WorkerId{"w"}, {"workflow-step"});
    ASSERT_TRUE(task.has_value() && task->has_value());
    auto id = (*task)->id;

    test::Barrier barrier(2);
    Result<TaskOutcome> completed = fail(Error::Unknown);
    Result<void> cancelled = fail(Error::Unknown);
    std::thread completer([&] {
      barrier.arrive_and_wait();
      completed = queue.complete(id);
    });
    std::thread canceller([&] {
      barrier.arrive_and_wait();
      cancelled = queue.cancel(id);
    });
    completer.join();
    canceller.join();

    auto final_task = queue.get_task(id);
    ASSERT_TRUE(final_task.has_value());
    if (completed) {
      EXPECT_EQ(final_task->status, TaskStatus::Completed);
      ASSERT_FALSE(cancelled.has_value());
      EXPECT_EQ(cancelled.error(), Error::InvalidState);
    } else {
      EXPECT_EQ(completed.error(), Error::InvalidState);
      EXPECT_TRUE(cancelled.has_value());
      EXPECT_EQ(final_task->status, TaskStatus::Cancelled);
    }
  }
}
