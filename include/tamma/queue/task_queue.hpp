#pragma once

#include "tamma/config/system_config.hpp"
#include "tamma/core/error.hpp"
#include "tamma/core/health.hpp"
#include "tamma/events/event_sink.hpp"
#include "tamma/queue/task.hpp"
#include "tamma/storage/database.hpp"
#include "tamma/util/clock.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tamma {

class WorkerPool;

// Owns the task lifecycle: pending -> running -> completed | failed, with
// failed attempts rewritten to pending until the retry budget is spent.
// Every transition is a transaction on the store; no in-process lock is held
// across I/O.
class TaskQueue {
public:
  // `workers` receives assignment bookkeeping when set.
  TaskQueue(Database& db, QueueConfig config, Clock& clock, EventSink& events,
            WorkerPool* workers = nullptr);

  TaskQueue(const TaskQueue&) = delete;
  auto operator=(const TaskQueue&) -> TaskQueue& = delete;

  [[nodiscard]] auto init() -> Result<void>;

  [[nodiscard]] auto enqueue(NewTask task) -> Result<TaskId>;

  // Never blocks. Returns none when paused, when nothing is eligible, or when
  // the worker already runs `max_running` tasks.
  [[nodiscard]] auto claim(const WorkerId& worker,
                           const std::vector<std::string>& capabilities,
                           std::optional<int> max_running = std::nullopt)
      -> Result<std::optional<Task>>;

  [[nodiscard]] auto complete(const TaskId& id, nlohmann::json result = {})
      -> Result<TaskOutcome>;
  [[nodiscard]] auto fail(const TaskId& id, std::string_view error)
      -> Result<TaskResolution>;

  // Idempotent on cancelled tasks. A running task is only marked; its worker
  // is expected to notice and stop.
  [[nodiscard]] auto cancel(const TaskId& id) -> Result<void>;

  [[nodiscard]] auto get_task(const TaskId& id) -> Result<Task>;
  [[nodiscard]] auto list_tasks(const TaskFilter& filter = {})
      -> Result<std::vector<Task>>;
  [[nodiscard]] auto stats() -> Result<QueueStats>;

  auto pause() noexcept -> void;
  auto resume() noexcept -> void;
  [[nodiscard]] auto is_paused() const noexcept -> bool;

  // Delay for a task rescheduled with `retry_count` retries consumed:
  // min(base * 2^retry_count, max). Non-decreasing in retry_count.
  [[nodiscard]] auto backoff_delay(int retry_count) const
      -> std::chrono::milliseconds;

  [[nodiscard]] auto health() -> ComponentHealth;

  [[nodiscard]] auto config() const noexcept -> const QueueConfig& {
    return config_;
  }

private:
  [[nodiscard]] auto emit(std::string_view type, const Task& task,
                          Delivery delivery, nlohmann::json payload = {})
      -> Result<void>;

  Database& db_;
  QueueConfig config_;
  Clock& clock_;
  EventSink& events_;
  WorkerPool* workers_;
  std::atomic<bool> paused_{false};
};

}  // namespace tamma
