#pragma once

#include "tamma/core/error.hpp"
#include "tamma/storage/database.hpp"
#include "tamma/workflow/workflow_state.hpp"

#include <vector>

namespace tamma {

// SQL for `workflow_states` and the append-only `workflow_state_history`.
class WorkflowStore {
public:
  using Connection = Database::Connection;

  [[nodiscard]] static auto create_schema(Connection& conn) -> Result<void>;

  [[nodiscard]] static auto insert(Connection& conn, const WorkflowState& state)
      -> Result<void>;
  [[nodiscard]] static auto update(Connection& conn, const WorkflowState& state)
      -> Result<void>;
  [[nodiscard]] static auto remove(Connection& conn, const WorkflowId& id)
      -> Result<void>;
  [[nodiscard]] static auto find(Connection& conn, const WorkflowId& id)
      -> Result<WorkflowState>;
  [[nodiscard]] static auto list(Connection& conn, const WorkflowFilter& filter)
      -> Result<std::vector<WorkflowState>>;

  [[nodiscard]] static auto append_history(Connection& conn,
                                           const WorkflowHistoryEntry& entry)
      -> Result<void>;
  [[nodiscard]] static auto history(Connection& conn, const WorkflowId& id)
      -> Result<std::vector<WorkflowHistoryEntry>>;
};

}  // namespace tamma
