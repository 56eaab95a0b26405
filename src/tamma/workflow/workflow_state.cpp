#include "tamma/workflow/workflow_state.hpp"

#include "tamma/storage/state_strings.hpp"
#include "tamma/util/log.hpp"

namespace tamma {

namespace {

auto optional_millis(const std::optional<TimePoint>& tp) -> nlohmann::json {
  return tp ? nlohmann::json(to_millis(*tp)) : nlohmann::json(nullptr);
}

auto parse_optional_millis(const nlohmann::json& v) -> std::optional<TimePoint> {
  if (v.is_null()) {
    return std::nullopt;
  }
  return from_millis(v.get<std::int64_t>());
}

auto assign_field(WorkflowState& state, const std::string& key,
                  const nlohmann::json& value) -> Result<void> {
  if (key == "status") {
    auto status = parse_workflow_status(value.get<std::string>());
    if (!status) {
      return fail(Error::ValidationFailed);
    }
    state.status = *status;
  } else if (key == "current_step") {
    state.current_step = value.get<int>();
  } else if (key == "context") {
    state.context = value;
  } else if (key == "metadata") {
    state.metadata = value.get<WorkflowMetadata>();
  } else if (key == "updated_at") {
    state.updated_at = from_millis(value.get<std::int64_t>());
  } else if (key == "started_at") {
    state.started_at = parse_optional_millis(value);
  } else if (key == "completed_at") {
    state.completed_at = parse_optional_millis(value);
  } else if (key == "failed_at") {
    state.failed_at = parse_optional_millis(value);
  } else if (key == "archived_at") {
    state.archived_at = parse_optional_millis(value);
  } else {
    return fail(Error::ValidationFailed);
  }
  return ok();
}

}  // namespace

void to_json(nlohmann::json& j, const WorkflowMetadata& m) {
  j = nlohmann::json{
      {"priority", m.priority}, {"labels", m.labels}, {"assignee", m.assignee}};
}

void from_json(const nlohmann::json& j, WorkflowMetadata& m) {
  m.priority = j.value("priority", 0);
  m.labels = j.value("labels", std::vector<std::string>{});
  m.assignee = j.value("assignee", std::string{});
}

auto mutable_fields(const WorkflowState& state) -> nlohmann::json {
  return {
      {"status", std::string(workflow_status_name(state.status))},
      {"current_step", state.current_step},
      {"context", state.context},
      {"metadata", state.metadata},
      {"updated_at", to_millis(state.updated_at)},
      {"started_at", optional_millis(state.started_at)},
      {"completed_at", optional_millis(state.completed_at)},
      {"failed_at", optional_millis(state.failed_at)},
      {"archived_at", optional_millis(state.archived_at)},
  };
}

auto assign_fields(WorkflowState& state, const nlohmann::json& values)
    -> Result<void> {
  if (!values.is_object()) {
    return fail(Error::ValidationFailed);
  }
  WorkflowState updated = state;
  try {
    for (const auto& [key, value] : values.items()) {
      if (auto r = assign_field(updated, key, value); !r) {
        log::warn("Cannot assign workflow field '{}'", key);
        return r;
      }
    }
  } catch (const nlohmann::json::exception& e) {
    log::warn("Malformed workflow field value: {}", e.what());
    return fail(Error::ValidationFailed);
  }
  state = std::move(updated);
  return ok();
}

auto apply_history(WorkflowState& state, const WorkflowHistoryEntry& entry)
    -> Result<void> {
  return assign_fields(state, entry.new_values);
}

auto revert_history(WorkflowState& state, const WorkflowHistoryEntry& entry)
    -> Result<void> {
  return assign_fields(state, entry.previous_values);
}

auto workflow_to_json(const WorkflowState& state) -> nlohmann::json {
  auto j = mutable_fields(state);
  j["id"] = state.id.str();
  j["issue_ref"] = state.issue_ref;
  j["platform_ref"] = state.platform_ref;
  j["repository_ref"] = state.repository_ref;
  j["created_at"] = to_millis(state.created_at);
  return j;
}

}  // namespace tamma
