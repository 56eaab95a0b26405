#include "tamma/workers/worker_pool.hpp"

#include "tamma/storage/worker_store.hpp"
#include "tamma/util/log.hpp"

#include <algorithm>
#include <format>

namespace tamma {

auto worker_to_json(const Worker& worker) -> nlohmann::json {
  auto tasks = nlohmann::json::array();
  for (const auto& id : worker.current_tasks) {
    tasks.push_back(id.str());
  }
  return {
      {"id", worker.id.str()},
      {"capabilities", worker.capabilities},
      {"max_concurrency", worker.max_concurrency},
      {"current_tasks", std::move(tasks)},
      {"registered_at", to_millis(worker.registered_at)},
      {"last_heartbeat_at", to_millis(worker.last_heartbeat_at)},
      {"tasks_completed", worker.tasks_completed},
      {"tasks_failed", worker.tasks_failed},
  };
}

WorkerPool::WorkerPool(Database& db, WorkerConfig config, Clock& clock)
    : db_(db), config_(config), clock_(clock) {}

auto WorkerPool::init() -> Result<void> {
  return db_.with_retry("workers.schema", [](auto& conn) {
    return WorkerStore::create_schema(conn);
  });
}

auto WorkerPool::register_worker(const WorkerId& id,
                                 std::vector<std::string> capabilities,
                                 std::optional<int> max_concurrency)
    -> Result<Worker> {
  if (id.empty()) {
    return fail(Error::ValidationFailed);
  }
  if (std::ranges::any_of(capabilities,
                          [](const auto& c) { return c.empty(); })) {
    log::warn("Worker {} registered with an empty capability", id);
    return fail(Error::ValidationFailed);
  }
  int limit = max_concurrency.value_or(config_.default_concurrency);
  if (limit < 1) {
    return fail(Error::ValidationFailed);
  }

  std::ranges::sort(capabilities);
  auto [first, last] = std::ranges::unique(capabilities);
  capabilities.erase(first, last);

  Worker worker;
  worker.id = id;
  worker.capabilities = std::move(capabilities);
  worker.max_concurrency = limit;
  worker.registered_at = clock_.now();
  worker.last_heartbeat_at = worker.registered_at;

  auto stored = db_.with_retry("workers.register",
                               [&](auto& conn) -> Result<Worker> {
    auto txn = Transaction::begin(conn);
    if (!txn) {
      return fail(txn.error());
    }
    if (auto r = WorkerStore::upsert(conn, worker); !r) {
      return fail(r.error());
    }
    auto current = WorkerStore::find(conn, worker.id);
    if (!current) {
      return fail(current.error());
    }
    if (auto r = txn->commit(); !r) {
      return fail(r.error());
    }
    return current;
  });
  if (stored) {
    log::info("Worker {} registered with capabilities [{}]", id,
              nlohmann::json(stored->capabilities).dump());
  }
  return stored;
}

auto WorkerPool::unregister_worker(const WorkerId& id) -> Result<void> {
  auto r = db_.with_retry("workers.unregister", [&](auto& conn) {
    return WorkerStore::remove(conn, id);
  });
  if (r) {
    log::info("Worker {} unregistered", id);
  }
  return r;
}

auto WorkerPool::heartbeat(const WorkerId& id) -> Result<void> {
  auto now = clock_.now();
  return db_.with_retry("workers.heartbeat", [&](auto& conn) {
    return WorkerStore::touch(conn, id, now);
  });
}

auto WorkerPool::get_available_workers(const std::vector<std::string>& required)
    -> Result<std::vector<Worker>> {
  auto all = list_workers();
  if (!all) {
    return fail(all.error());
  }
  std::vector<Worker> available;
  for (auto& w : *all) {
    if (is_stale(w) || !w.has_capacity()) {
      continue;
    }
    bool capable = std::ranges::all_of(
        required, [&](const auto& tag) { return w.has_capability(tag); });
    if (capable) {
      available.push_back(std::move(w));
    }
  }
  return available;
}

auto WorkerPool::get_worker(const WorkerId& id) -> Result<Worker> {
  return db_.with_retry("workers.get", [&](auto& conn) {
    return WorkerStore::find(conn, id);
  });
}

auto WorkerPool::list_workers() -> Result<std::vector<Worker>> {
  return db_.with_retry("workers.list",
                        [](auto& conn) { return WorkerStore::list(conn); });
}

auto WorkerPool::is_stale(const Worker& worker) const -> bool {
  auto age = clock_.now() - worker.last_heartbeat_at;
  return age > std::chrono::milliseconds(config_.heartbeat_timeout_ms);
}

auto WorkerPool::assign_task(const WorkerId& worker, const TaskId& task)
    -> Result<void> {
  return record(worker, task, Outcome::Assigned);
}

auto WorkerPool::complete_task(const WorkerId& worker, const TaskId& task)
    -> Result<void> {
  return record(worker, task, Outcome::Completed);
}

auto WorkerPool::fail_task(const WorkerId& worker, const TaskId& task)
    -> Result<void> {
  return record(worker, task, Outcome::Failed);
}

auto WorkerPool::release_task(const WorkerId& worker, const TaskId& task)
    -> Result<void> {
  return record(worker, task, Outcome::Released);
}

auto WorkerPool::record(const WorkerId& worker, const TaskId& task,
                        Outcome outcome) -> Result<void> {
  return db_.with_retry("workers.bookkeeping", [&](auto& conn) -> Result<void> {
    auto txn = Transaction::begin(conn);
    if (!txn) {
      return fail(txn.error());
    }
    auto w = WorkerStore::find(conn, worker);
    if (!w) {
      return fail(w.error());
    }
    auto& tasks = w->current_tasks;
    auto it = std::ranges::find(tasks, task);
    if (outcome == Outcome::Assigned) {
      if (it == tasks.end()) {
        tasks.push_back(task);
      }
    } else if (it != tasks.end()) {
      tasks.erase(it);
    }
    if (outcome == Outcome::Completed) {
      ++w->tasks_completed;
    } else if (outcome == Outcome::Failed) {
      ++w->tasks_failed;
    }
    if (auto r = WorkerStore::save_assignments(conn, *w); !r) {
      return r;
    }
    return txn->commit();
  });
}

auto WorkerPool::health() -> ComponentHealth {
  ComponentHealth h{.name = "worker_pool"};
  auto all = list_workers();
  if (!all) {
    h.detail = all.error().message();
    return h;
  }
  auto fresh = std::ranges::count_if(
      *all, [this](const auto& w) { return !is_stale(w); });
  h.healthy = true;
  h.detail = std::format("{} registered, {} fresh", all->size(), fresh);
  return h;
}

}  // namespace tamma
