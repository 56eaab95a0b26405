#include "tamma/queue/task_queue.hpp"

#include "tamma/storage/state_strings.hpp"
#include "tamma/storage/task_store.hpp"
#include "tamma/util/log.hpp"
#include "tamma/workers/worker_pool.hpp"

#include <algorithm>
#include <format>

namespace tamma {

namespace {

auto log_bookkeeping(const Result<void>& r, std::string_view what,
                     const TaskId& task) -> void {
  if (!r) {
    log::warn("Worker bookkeeping '{}' for task {} failed: {}", what, task,
              r.error().message());
  }
}

}  // namespace

TaskQueue::TaskQueue(Database& db, QueueConfig config, Clock& clock,
                     EventSink& events, WorkerPool* workers)
    : db_(db),
      config_(config),
      clock_(clock),
      events_(events),
      workers_(workers) {}

auto TaskQueue::init() -> Result<void> {
  return db_.with_retry("tasks.schema", [](auto& conn) {
    return TaskStore::create_schema(conn);
  });
}

auto TaskQueue::enqueue(NewTask request) -> Result<TaskId> {
  if (request.max_retries && *request.max_retries < 0) {
    log::warn("Rejected task submission: negative max_retries");
    return tamma::fail(Error::ValidationFailed);
  }
  if (request.id && request.id->empty()) {
    return tamma::fail(Error::ValidationFailed);
  }
  if (std::ranges::any_of(request.required_tags,
                          [](const auto& t) { return t.empty(); })) {
    log::warn("Rejected task submission: empty required tag");
    return tamma::fail(Error::ValidationFailed);
  }

  Task task;
  task.id = request.id ? std::move(*request.id) : generate_task_id();
  task.type = request.type;
  task.priority = request.priority;
  task.payload = std::move(request.payload);
  task.status = TaskStatus::Pending;
  task.retry_count = 0;
  task.max_retries = request.max_retries.value_or(config_.default_max_retries);
  task.required_tags = std::move(request.required_tags);
  task.scheduled_at = request.scheduled_at;
  task.workflow_id = std::move(request.workflow_id);
  task.step = request.step;
  task.metadata = std::move(request.metadata);
  task.created_at = clock_.now();

  auto inserted = db_.with_retry("tasks.enqueue", [&](auto& conn) {
    return TaskStore::insert(conn, task);
  });
  if (!inserted) {
    return tamma::fail(inserted.error());
  }

  log::debug("Enqueued task {} type={} priority={}", task.id,
             task_type_name(task.type), task.priority);
  if (auto r = emit("task.enqueued", task, Delivery::BestEffort); !r) {
    return tamma::fail(r.error());
  }
  return task.id;
}

auto TaskQueue::claim(const WorkerId& worker,
                      const std::vector<std::string>& capabilities,
                      std::optional<int> max_running)
    -> Result<std::optional<Task>> {
  if (worker.empty()) {
    return tamma::fail(Error::ValidationFailed);
  }
  if (paused_.load(std::memory_order_acquire)) {
    return std::optional<Task>{};
  }

  auto caps = nlohmann::json(capabilities).dump();
  auto now = clock_.now();

  auto claimed = db_.with_retry(
      "tasks.claim", [&](auto& conn) -> Result<std::optional<Task>> {
        auto txn = Transaction::begin(conn);
        if (!txn) {
          return tamma::fail(txn.error());
        }
        auto task = TaskStore::claim_next(conn, worker, caps, now,
                                           max_running);
        if (!task || !*task) {
          return task;
        }
        if (auto r = txn->commit(); !r) {
          return tamma::fail(r.error());
        }
        return task;
      });
  if (!claimed || !*claimed) {
    return claimed;
  }

  const auto& task = **claimed;
  log::debug("Worker {} claimed task {} (attempt {})", worker, task.id,
             task.retry_count + 1);
  if (workers_ != nullptr) {
    log_bookkeeping(workers_->assign_task(worker, task.id), "assign",
                    task.id);
  }
  if (auto r = emit("task.claimed", task, Delivery::BestEffort); !r) {
    return tamma::fail(r.error());
  }
  return claimed;
}

auto TaskQueue::complete(const TaskId& id, nlohmann::json result)
    -> Result<TaskOutcome> {
  auto now = clock_.now();
  std::optional<WorkerId> worker;

  auto done = db_.with_retry("tasks.complete", [&](auto& conn) -> Result<Task> {
    auto txn = Transaction::begin(conn);
    if (!txn) {
      return tamma::fail(txn.error());
    }
    auto task = TaskStore::find(conn, id);
    if (!task) {
      return tamma::fail(task.error());
    }
    if (task->status != TaskStatus::Running) {
      return tamma::fail(Error::InvalidState);
    }
    worker = task->assigned_worker;
    task->status = TaskStatus::Completed;
    task->completed_at = now;
    task->result = result;
    task->assigned_worker.reset();
    if (auto r = TaskStore::update(conn, *task); !r) {
      return tamma::fail(r.error());
    }
    if (auto r = txn->commit(); !r) {
      return tamma::fail(r.error());
    }
    return task;
  });
  if (!done) {
    if (done.error() == Error::InvalidState) {
      log::warn("Complete rejected for task {}: not running", id);
    }
    return tamma::fail(done.error());
  }

  log::debug("Task {} completed", id);
  if (workers_ != nullptr && worker) {
    log_bookkeeping(workers_->complete_task(*worker, id), "complete", id);
  }

  nlohmann::json payload{{"worker_id", worker ? worker->str() : ""}};
  if (auto r = emit("task.completed", *done, Delivery::Critical,
                    std::move(payload));
      !r) {
    return tamma::fail(r.error());
  }
  return TaskOutcome::Completed;
}

auto TaskQueue::fail(const TaskId& id, std::string_view error)
    -> Result<TaskResolution> {
  auto now = clock_.now();
  std::optional<WorkerId> worker;

  auto done = db_.with_retry("tasks.fail", [&](auto& conn) -> Result<Task> {
    auto txn = Transaction::begin(conn);
    if (!txn) {
      return tamma::fail(txn.error());
    }
    auto task = TaskStore::find(conn, id);
    if (!task) {
      return tamma::fail(task.error());
    }
    if (task->status != TaskStatus::Running) {
      return tamma::fail(Error::InvalidState);
    }
    worker = task->assigned_worker;
    task->last_error = std::string(error);
    task->assigned_worker.reset();
    if (task->retry_count < task->max_retries) {
      ++task->retry_count;
      task->status = TaskStatus::Pending;
      task->scheduled_at = now + backoff_delay(task->retry_count);
    } else {
      task->status = TaskStatus::Failed;
      task->failed_at = now;
    }
    if (auto r = TaskStore::update(conn, *task); !r) {
      return tamma::fail(r.error());
    }
    if (auto r = txn->commit(); !r) {
      return tamma::fail(r.error());
    }
    return task;
  });
  if (!done) {
    return tamma::fail(done.error());
  }

  const auto& task = *done;
  TaskResolution resolution;
  resolution.retry_count = task.retry_count;

  if (workers_ != nullptr && worker) {
    log_bookkeeping(workers_->fail_task(*worker, id), "fail", id);
  }

  nlohmann::json payload{{"error", std::string(error)},
                         {"worker_id", worker ? worker->str() : ""},
                         {"retry_count", task.retry_count},
                         {"max_retries", task.max_retries}};

  if (task.status == TaskStatus::Pending) {
    resolution.outcome = TaskOutcome::RetryScheduled;
    resolution.retry_at = task.scheduled_at;
    payload["retry_at"] = to_millis(*task.scheduled_at);
    log::info("Task {} failed, retry {}/{} at +{}ms: {}", id, task.retry_count,
              task.max_retries,
              backoff_delay(task.retry_count).count(), error);
    if (auto r = emit("task.retry_scheduled", task, Delivery::Critical,
                      std::move(payload));
        !r) {
      return tamma::fail(r.error());
    }
  } else {
    resolution.outcome = TaskOutcome::FailedPermanently;
    log::info("Task {} failed permanently after {} attempts: {}", id,
              task.retry_count + 1, error);
    if (auto r = emit("task.failed", task, Delivery::Critical,
                      std::move(payload));
        !r) {
      return tamma::fail(r.error());
    }
  }
  return resolution;
}

auto TaskQueue::cancel(const TaskId& id) -> Result<void> {
  auto now = clock_.now();
  bool was_running = false;

  auto done = db_.with_retry(
      "tasks.cancel", [&](auto& conn) -> Result<std::optional<Task>> {
        auto txn = Transaction::begin(conn);
        if (!txn) {
          return tamma::fail(txn.error());
        }
        auto task = TaskStore::find(conn, id);
        if (!task) {
          return tamma::fail(task.error());
        }
        switch (task->status) {
          case TaskStatus::Cancelled:
            return std::optional<Task>{};
          case TaskStatus::Completed:
          case TaskStatus::Failed:
            return tamma::fail(Error::InvalidState);
          case TaskStatus::Pending:
          case TaskStatus::Running:
            break;
        }
        was_running = task->status == TaskStatus::Running;
        task->status = TaskStatus::Cancelled;
        task->cancelled_at = now;
        if (auto r = TaskStore::update(conn, *task); !r) {
          return tamma::fail(r.error());
        }
        if (auto r = txn->commit(); !r) {
          return tamma::fail(r.error());
        }
        return std::optional<Task>{std::move(*task)};
      });
  if (!done) {
    return tamma::fail(done.error());
  }
  if (!*done) {
    log::debug("Task {} already cancelled", id);
    return ok();
  }

  const auto& task = **done;
  log::info("Task {} cancelled{}", id, was_running ? " while running" : "");
  if (was_running && workers_ != nullptr && task.assigned_worker) {
    log_bookkeeping(workers_->release_task(*task.assigned_worker, id),
                    "release", id);
  }
  return emit("task.cancelled", task, Delivery::Critical,
              {{"was_running", was_running}});
}

auto TaskQueue::get_task(const TaskId& id) -> Result<Task> {
  return db_.with_retry("tasks.get",
                        [&](auto& conn) { return TaskStore::find(conn, id); });
}

auto TaskQueue::list_tasks(const TaskFilter& filter)
    -> Result<std::vector<Task>> {
  return db_.with_retry("tasks.list", [&](auto& conn) {
    return TaskStore::list(conn, filter);
  });
}

auto TaskQueue::stats() -> Result<QueueStats> {
  return db_.with_retry("tasks.stats", [&](auto& conn) -> Result<QueueStats> {
    auto stats = TaskStore::count_by_status(conn);
    if (!stats) {
      return stats;
    }
    auto avg = TaskStore::average_duration_ms(conn, config_.stats_window);
    if (!avg) {
      return tamma::fail(avg.error());
    }
    stats->avg_duration_ms = *avg;
    return stats;
  });
}

auto TaskQueue::pause() noexcept -> void {
  if (!paused_.exchange(true, std::memory_order_acq_rel)) {
    log::info("Task queue paused");
  }
}

auto TaskQueue::resume() noexcept -> void {
  if (paused_.exchange(false, std::memory_order_acq_rel)) {
    log::info("Task queue resumed");
  }
}

auto TaskQueue::is_paused() const noexcept -> bool {
  return paused_.load(std::memory_order_acquire);
}

auto TaskQueue::backoff_delay(int retry_count) const
    -> std::chrono::milliseconds {
  auto cap = config_.retry_max_delay_ms;
  auto delay = config_.retry_base_delay_ms;
  for (int i = 0; i < retry_count && delay < cap; ++i) {
    delay *= 2;
  }
  return std::chrono::milliseconds(std::min(delay, cap));
}

auto TaskQueue::health() -> ComponentHealth {
  ComponentHealth h{.name = "task_queue"};
  auto s = stats();
  if (!s) {
    h.detail = s.error().message();
    return h;
  }
  h.healthy = true;
  h.detail = std::format("pending={} running={}{}", s->pending, s->running,
                         is_paused() ? " (paused)" : "");
  return h;
}

auto TaskQueue::emit(std::string_view type, const Task& task,
                     Delivery delivery, nlohmann::json payload)
    -> Result<void> {
  Event event;
  event.type = std::string(type);
  event.delivery = delivery;
  event.tags["task_id"] = task.id.str();
  event.tags["task_type"] = std::string(task_type_name(task.type));
  if (task.workflow_id) {
    event.tags["workflow_id"] = task.workflow_id->str();
  }
  if (task.step) {
    event.tags["step"] = std::to_string(*task.step);
  }
  if (task.assigned_worker) {
    event.tags["worker_id"] = task.assigned_worker->str();
  }
  event.payload = payload.is_object() ? std::move(payload)
                                      : nlohmann::json::object();
  event.payload["status"] = std::string(task_status_name(task.status));
  event.payload["priority"] = task.priority;
  return emit_event(events_, std::move(event));
}

}  // namespace tamma
