#pragma once

#include "tamma/core/error.hpp"
#include "tamma/core/health.hpp"
#include "tamma/events/event_sink.hpp"
#include "tamma/storage/database.hpp"
#include "tamma/util/clock.hpp"
#include "tamma/workflow/workflow_state.hpp"

#include <functional>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace tamma {

// Sole writer of workflow state. Every mutation writes the new record and
// its history entry in one transaction.
class StateManager {
public:
  StateManager(Database& db, Clock& clock, EventSink& events);

  StateManager(const StateManager&) = delete;
  auto operator=(const StateManager&) -> StateManager& = delete;

  [[nodiscard]] auto init() -> Result<void>;

  [[nodiscard]] auto create_workflow_state(NewWorkflow initial)
      -> Result<WorkflowId>;

  // Applies the set fields of `update` and returns the new record.
  [[nodiscard]] auto update_workflow_state(const WorkflowId& id,
                                           const WorkflowStateUpdate& update)
      -> Result<WorkflowState>;

  [[nodiscard]] auto get_workflow_state(const WorkflowId& id)
      -> Result<WorkflowState>;
  [[nodiscard]] auto list_workflow_states(const WorkflowFilter& filter = {})
      -> Result<std::vector<WorkflowState>>;

  // Chronological; for diagnosis only.
  [[nodiscard]] auto get_workflow_history(const WorkflowId& id)
      -> Result<std::vector<WorkflowHistoryEntry>>;

  // Moves the workflow to `final_status` (unless already terminal) and
  // stamps archived_at. Archiving twice is a no-op.
  [[nodiscard]] auto archive_workflow_state(
      const WorkflowId& id,
      WorkflowStatus final_status = WorkflowStatus::Completed)
      -> Result<WorkflowState>;

  // Removes the record. History is kept.
  [[nodiscard]] auto delete_workflow_state(const WorkflowId& id)
      -> Result<void>;

  [[nodiscard]] auto health() -> ComponentHealth;

private:
  using Mutation = std::function<Result<bool>(WorkflowState&, TimePoint)>;

  // Reads, mutates and writes back the record with one history entry. The
  // mutation returns false to leave the record untouched. It may run more
  // than once when the store is contended.
  [[nodiscard]] auto mutate(std::string_view op, const WorkflowId& id,
                            const Mutation& fn)
      -> Result<std::pair<WorkflowState, std::optional<WorkflowHistoryEntry>>>;

  Database& db_;
  Clock& clock_;
  EventSink& events_;
};

}  // namespace tamma
