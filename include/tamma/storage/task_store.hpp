#pragma once

#include "tamma/core/error.hpp"
#include "tamma/queue/task.hpp"
#include "tamma/storage/database.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tamma {

// SQL for the `tasks` collection. Every call runs on a connection the caller
// already holds, so several calls can share one transaction.
class TaskStore {
public:
  using Connection = Database::Connection;

  [[nodiscard]] static auto create_schema(Connection& conn) -> Result<void>;

  [[nodiscard]] static auto insert(Connection& conn, const Task& task)
      -> Result<void>;
  [[nodiscard]] static auto find(Connection& conn, const TaskId& id)
      -> Result<Task>;

  // Rewrites every mutable column of an existing row.
  [[nodiscard]] static auto update(Connection& conn, const Task& task)
      -> Result<void>;

  // Atomically moves the best eligible pending task to running for
  // `worker` and returns it. `capabilities` is a JSON array of tags. With
  // `max_running` set, nothing is claimed once the worker already runs that
  // many tasks.
  [[nodiscard]] static auto claim_next(Connection& conn, const WorkerId& worker,
                                       const std::string& capabilities,
                                       TimePoint now,
                                       std::optional<int> max_running)
      -> Result<std::optional<Task>>;

  [[nodiscard]] static auto list(Connection& conn, const TaskFilter& filter)
      -> Result<std::vector<Task>>;

  [[nodiscard]] static auto count_by_status(Connection& conn)
      -> Result<QueueStats>;

  // Mean (completed_at - started_at) over the most recent `window` completions.
  [[nodiscard]] static auto average_duration_ms(Connection& conn, int window)
      -> Result<double>;
};

}  // namespace tamma
