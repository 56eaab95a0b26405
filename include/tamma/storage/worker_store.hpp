#pragma once

#include "tamma/core/error.hpp"
#include "tamma/storage/database.hpp"
#include "tamma/workers/worker.hpp"

#include <vector>

namespace tamma {

// SQL for the `workers` collection.
class WorkerStore {
public:
  using Connection = Database::Connection;

  [[nodiscard]] static auto create_schema(Connection& conn) -> Result<void>;

  // Inserts a new worker, or refreshes capabilities, concurrency and
  // heartbeat of an existing one. Assignments and counters are kept.
  [[nodiscard]] static auto upsert(Connection& conn, const Worker& worker)
      -> Result<void>;
  [[nodiscard]] static auto remove(Connection& conn, const WorkerId& id)
      -> Result<void>;
  [[nodiscard]] static auto touch(Connection& conn, const WorkerId& id,
                                  TimePoint now) -> Result<void>;

  [[nodiscard]] static auto find(Connection& conn, const WorkerId& id)
      -> Result<Worker>;
  [[nodiscard]] static auto list(Connection& conn)
      -> Result<std::vector<Worker>>;

  // Writes current_tasks and the completion counters.
  [[nodiscard]] static auto save_assignments(Connection& conn,
                                             const Worker& worker)
      -> Result<void>;
};

}  // namespace tamma
