#pragma once

#include "tamma/core/error.hpp"
#include "tamma/util/clock.hpp"
#include "tamma/util/id.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tamma {

enum class WorkflowStatus : std::uint8_t {
  Pending,
  Running,
  Completed,
  Failed,
  Paused,
};

[[nodiscard]] constexpr auto is_terminal(WorkflowStatus s) noexcept -> bool {
  return s == WorkflowStatus::Completed || s == WorkflowStatus::Failed;
}

// pending->running|failed, running->completed|failed|paused,
// paused->running|failed. Same-status "transitions" are allowed.
[[nodiscard]] constexpr auto can_transition(WorkflowStatus from,
                                            WorkflowStatus to) noexcept
    -> bool {
  if (from == to) return true;
  switch (from) {
    case WorkflowStatus::Pending:
      return to == WorkflowStatus::Running || to == WorkflowStatus::Failed;
    case WorkflowStatus::Running:
      return to == WorkflowStatus::Completed || to == WorkflowStatus::Failed ||
             to == WorkflowStatus::Paused;
    case WorkflowStatus::Paused:
      return to == WorkflowStatus::Running || to == WorkflowStatus::Failed;
    case WorkflowStatus::Completed:
    case WorkflowStatus::Failed:
      return false;
  }
  return false;
}

// Informational only; never consulted for scheduling.
struct WorkflowMetadata {
  int priority{0};
  std::vector<std::string> labels;
  std::string assignee;

  friend auto operator==(const WorkflowMetadata&, const WorkflowMetadata&)
      -> bool = default;
};

void to_json(nlohmann::json& j, const WorkflowMetadata& m);
void from_json(const nlohmann::json& j, WorkflowMetadata& m);

struct WorkflowState {
  WorkflowId id;
  std::string issue_ref;
  std::string platform_ref;
  std::string repository_ref;
  int current_step{0};
  WorkflowStatus status{WorkflowStatus::Pending};
  nlohmann::json context = nlohmann::json::object();
  WorkflowMetadata metadata;

  TimePoint created_at{};
  TimePoint updated_at{};
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;
  std::optional<TimePoint> failed_at;
  std::optional<TimePoint> archived_at;

  friend auto operator==(const WorkflowState&, const WorkflowState&)
      -> bool = default;
};

struct NewWorkflow {
  std::optional<WorkflowId> id;
  std::string issue_ref;
  std::string platform_ref;
  std::string repository_ref;
  nlohmann::json context = nlohmann::json::object();
  WorkflowMetadata metadata;
};

// Field-level partial update; unset fields are left alone.
struct WorkflowStateUpdate {
  std::optional<WorkflowStatus> status;
  std::optional<int> current_step;
  std::optional<nlohmann::json> context_patch;  // RFC 7386 merge patch
  std::optional<WorkflowMetadata> metadata;
};

struct WorkflowHistoryEntry {
  std::int64_t seq{0};
  WorkflowId workflow_id;
  TimePoint changed_at{};
  std::vector<std::string> changed_fields;
  nlohmann::json previous_values = nlohmann::json::object();
  nlohmann::json new_values = nlohmann::json::object();
};

struct WorkflowFilter {
  std::optional<WorkflowStatus> status;
  std::optional<std::string> issue_ref;
  std::optional<std::string> repository_ref;
  bool include_archived{false};
  std::size_t limit{100};
};

// The mutable part of a workflow as a JSON object keyed by field name. This is
// the vocabulary of history entries.
[[nodiscard]] auto mutable_fields(const WorkflowState& state)
    -> nlohmann::json;

// Overwrites the fields present in `values`. Unknown keys are rejected.
[[nodiscard]] auto assign_fields(WorkflowState& state,
                                 const nlohmann::json& values) -> Result<void>;

// Forward replay: state after the entry, given the state before it.
[[nodiscard]] auto apply_history(WorkflowState& state,
                                 const WorkflowHistoryEntry& entry)
    -> Result<void>;

// Backward replay: state before the entry, given the state after it.
[[nodiscard]] auto revert_history(WorkflowState& state,
                                  const WorkflowHistoryEntry& entry)
    -> Result<void>;

[[nodiscard]] auto workflow_to_json(const WorkflowState& state)
    -> nlohmann::json;

}  // namespace tamma
