#pragma once

#include "tamma/config/system_config.hpp"
#include "tamma/core/error.hpp"
#include "tamma/core/health.hpp"
#include "tamma/storage/database.hpp"
#include "tamma/util/clock.hpp"
#include "tamma/workers/worker.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tamma {

// Registration, heartbeats and assignment bookkeeping for workers. Task
// records are never touched here; TaskQueue reports lifecycle points through
// the *_task hooks.
class WorkerPool {
public:
  WorkerPool(Database& db, WorkerConfig config, Clock& clock);

  WorkerPool(const WorkerPool&) = delete;
  auto operator=(const WorkerPool&) -> WorkerPool& = delete;

  [[nodiscard]] auto init() -> Result<void>;

  // Idempotent. Re-registering refreshes capabilities, concurrency and
  // heartbeat; current assignments and counters are kept.
  [[nodiscard]] auto register_worker(const WorkerId& id,
                                     std::vector<std::string> capabilities,
                                     std::optional<int> max_concurrency =
                                         std::nullopt) -> Result<Worker>;

  // Running tasks of the worker are left as they are.
  [[nodiscard]] auto unregister_worker(const WorkerId& id) -> Result<void>;
  [[nodiscard]] auto heartbeat(const WorkerId& id) -> Result<void>;

  // Fresh workers with spare capacity holding every tag in `required`.
  [[nodiscard]] auto get_available_workers(
      const std::vector<std::string>& required = {})
      -> Result<std::vector<Worker>>;
  [[nodiscard]] auto get_worker(const WorkerId& id) -> Result<Worker>;
  [[nodiscard]] auto list_workers() -> Result<std::vector<Worker>>;

  [[nodiscard]] auto is_stale(const Worker& worker) const -> bool;

  [[nodiscard]] auto assign_task(const WorkerId& worker, const TaskId& task)
      -> Result<void>;
  [[nodiscard]] auto complete_task(const WorkerId& worker, const TaskId& task)
      -> Result<void>;
  [[nodiscard]] auto fail_task(const WorkerId& worker, const TaskId& task)
      -> Result<void>;
  // Drops the assignment without touching the counters (cancellation).
  [[nodiscard]] auto release_task(const WorkerId& worker, const TaskId& task)
      -> Result<void>;

  [[nodiscard]] auto health() -> ComponentHealth;

  [[nodiscard]] auto config() const noexcept -> const WorkerConfig& {
    return config_;
  }

private:
  enum class Outcome { Assigned, Completed, Failed, Released };

  [[nodiscard]] auto record(const WorkerId& worker, const TaskId& task,
                            Outcome outcome) -> Result<void>;

  Database& db_;
  WorkerConfig config_;
  Clock& clock_;
};

}  // namespace tamma
