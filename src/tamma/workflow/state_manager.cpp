#include "tamma/workflow/state_manager.hpp"

#include "tamma/storage/state_strings.hpp"
#include "tamma/storage/workflow_store.hpp"
#include "tamma/util/log.hpp"

#include <algorithm>
#include <format>

namespace tamma {

namespace {

using Mutated = std::pair<WorkflowState, std::optional<WorkflowHistoryEntry>>;

// Terminal and start timestamps are written once.
auto stamp_status(WorkflowState& st, WorkflowStatus to, TimePoint now)
    -> void {
  st.status = to;
  switch (to) {
    case WorkflowStatus::Running:
      if (!st.started_at) st.started_at = now;
      break;
    case WorkflowStatus::Completed:
      if (!st.completed_at) st.completed_at = now;
      break;
    case WorkflowStatus::Failed:
      if (!st.failed_at) st.failed_at = now;
      break;
    case WorkflowStatus::Pending:
    case WorkflowStatus::Paused:
      break;
  }
}

auto diff(const WorkflowState& before, const WorkflowState& after)
    -> WorkflowHistoryEntry {
  WorkflowHistoryEntry entry;
  entry.workflow_id = after.id;
  entry.changed_at = after.updated_at;

  auto prev = mutable_fields(before);
  auto next = mutable_fields(after);
  for (const auto& [key, value] : next.items()) {
    const auto& old = prev.at(key);
    if (old != value) {
      entry.changed_fields.push_back(key);
      entry.previous_values[key] = old;
      entry.new_values[key] = value;
    }
  }
  return entry;
}

auto workflow_event(std::string_view type, const WorkflowState& st,
                    nlohmann::json payload = nlohmann::json::object())
    -> Event {
  Event event;
  event.type = std::string(type);
  event.delivery = Delivery::Critical;
  event.tags["workflow_id"] = st.id.str();
  if (!st.issue_ref.empty()) {
    event.tags["issue_ref"] = st.issue_ref;
  }
  event.payload = std::move(payload);
  event.payload["status"] = std::string(workflow_status_name(st.status));
  event.payload["current_step"] = st.current_step;
  return event;
}

}  // namespace

StateManager::StateManager(Database& db, Clock& clock, EventSink& events)
    : db_(db), clock_(clock), events_(events) {}

auto StateManager::init() -> Result<void> {
  return db_.with_retry("workflows.schema", [](auto& conn) {
    return WorkflowStore::create_schema(conn);
  });
}

auto StateManager::create_workflow_state(NewWorkflow initial)
    -> Result<WorkflowId> {
  if (initial.id && initial.id->empty()) {
    return fail(Error::ValidationFailed);
  }
  if (!initial.context.is_object()) {
    log::warn("Rejected workflow: context must be an object");
    return fail(Error::ValidationFailed);
  }

  WorkflowState st;
  st.id = initial.id ? std::move(*initial.id) : generate_workflow_id();
  st.issue_ref = std::move(initial.issue_ref);
  st.platform_ref = std::move(initial.platform_ref);
  st.repository_ref = std::move(initial.repository_ref);
  st.status = WorkflowStatus::Pending;
  st.context = std::move(initial.context);
  st.metadata = std::move(initial.metadata);
  st.created_at = clock_.now();
  st.updated_at = st.created_at;

  auto inserted = db_.with_retry("workflows.create", [&](auto& conn) {
    return WorkflowStore::insert(conn, st);
  });
  if (!inserted) {
    return fail(inserted.error());
  }

  log::info("Workflow {} created for issue '{}'", st.id, st.issue_ref);
  if (auto r = emit_event(events_, workflow_event("workflow.created", st));
      !r) {
    return fail(r.error());
  }
  return st.id;
}

auto StateManager::update_workflow_state(const WorkflowId& id,
                                         const WorkflowStateUpdate& update)
    -> Result<WorkflowState> {
  if (update.current_step && *update.current_step < 0) {
    return fail(Error::ValidationFailed);
  }
  if (update.context_patch && !update.context_patch->is_object()) {
    return fail(Error::ValidationFailed);
  }

  auto result = mutate(
      "workflows.update", id,
      [&](WorkflowState& st, TimePoint now) -> Result<bool> {
        if (st.archived_at) {
          return fail(Error::InvalidState);
        }
        if (update.status) {
          if (!can_transition(st.status, *update.status)) {
            log::warn("Workflow {}: illegal transition {} -> {}", id,
                      workflow_status_name(st.status),
                      workflow_status_name(*update.status));
            return fail(Error::InvalidState);
          }
          stamp_status(st, *update.status, now);
        }
        if (update.current_step) {
          if (*update.current_step < st.current_step) {
            log::warn("Workflow {}: step may not go back from {} to {}", id,
                      st.current_step, *update.current_step);
            return fail(Error::InvalidState);
          }
          st.current_step = *update.current_step;
        }
        if (update.context_patch) {
          st.context.merge_patch(*update.context_patch);
        }
        if (update.metadata) {
          st.metadata = *update.metadata;
        }
        return true;
      });
  if (!result) {
    return fail(result.error());
  }

  auto& [state, entry] = *result;
  auto fields = entry ? nlohmann::json(entry->changed_fields)
                      : nlohmann::json::array();
  if (entry && std::find(entry->changed_fields.begin(),
                         entry->changed_fields.end(),
                         "status") != entry->changed_fields.end()) {
    log::info("Workflow {} is now {}", id, workflow_status_name(state.status));
  } else {
    log::debug("Workflow {} updated: {}", id, fields.dump());
  }

  if (auto r = emit_event(events_,
                          workflow_event("workflow.updated", state,
                                         {{"changed_fields", fields}}));
      !r) {
    return fail(r.error());
  }
  return state;
}

auto StateManager::get_workflow_state(const WorkflowId& id)
    -> Result<WorkflowState> {
  return db_.with_retry("workflows.get", [&](auto& conn) {
    return WorkflowStore::find(conn, id);
  });
}

auto StateManager::list_workflow_states(const WorkflowFilter& filter)
    -> Result<std::vector<WorkflowState>> {
  return db_.with_retry("workflows.list", [&](auto& conn) {
    return WorkflowStore::list(conn, filter);
  });
}

auto StateManager::get_workflow_history(const WorkflowId& id)
    -> Result<std::vector<WorkflowHistoryEntry>> {
  return db_.with_retry("workflows.history", [&](auto& conn) {
    return WorkflowStore::history(conn, id);
  });
}

auto StateManager::archive_workflow_state(const WorkflowId& id,
                                          WorkflowStatus final_status)
    -> Result<WorkflowState> {
  if (!is_terminal(final_status)) {
    return fail(Error::ValidationFailed);
  }

  auto result = mutate(
      "workflows.archive", id,
      [&](WorkflowState& st, TimePoint now) -> Result<bool> {
        if (st.archived_at) {
          return false;
        }
        if (!is_terminal(st.status)) {
          if (!can_transition(st.status, final_status)) {
            return fail(Error::InvalidState);
          }
          stamp_status(st, final_status, now);
        }
        st.archived_at = now;
        return true;
      });
  if (!result) {
    return fail(result.error());
  }

  auto& [state, entry] = *result;
  if (!entry) {
    log::debug("Workflow {} already archived", id);
    return state;
  }
  log::info("Workflow {} archived as {}", id,
            workflow_status_name(state.status));
  if (auto r = emit_event(events_, workflow_event("workflow.archived", state));
      !r) {
    return fail(r.error());
  }
  return state;
}

auto StateManager::delete_workflow_state(const WorkflowId& id)
    -> Result<void> {
  auto existing = db_.with_retry("workflows.delete",
                                 [&](auto& conn) -> Result<WorkflowState> {
    auto txn = Transaction::begin(conn);
    if (!txn) {
      return fail(txn.error());
    }
    auto st = WorkflowStore::find(conn, id);
    if (!st) {
      return st;
    }
    if (auto r = WorkflowStore::remove(conn, id); !r) {
      return fail(r.error());
    }
    if (auto r = txn->commit(); !r) {
      return fail(r.error());
    }
    return st;
  });
  if (!existing) {
    return fail(existing.error());
  }

  log::info("Workflow {} deleted", id);
  return emit_event(events_, workflow_event("workflow.deleted", *existing));
}

auto StateManager::health() -> ComponentHealth {
  ComponentHealth h{.name = "state_manager"};
  WorkflowFilter running{.status = WorkflowStatus::Running, .limit = 10000};
  auto states = list_workflow_states(running);
  if (!states) {
    h.detail = states.error().message();
    return h;
  }
  h.healthy = true;
  h.detail = std::format("{} running workflows", states->size());
  return h;
}

auto StateManager::mutate(std::string_view op, const WorkflowId& id,
                          const Mutation& fn) -> Result<Mutated> {
  auto now = clock_.now();
  return db_.with_retry(op, [&](auto& conn) -> Result<Mutated> {
    auto txn = Transaction::begin(conn);
    if (!txn) {
      return fail(txn.error());
    }
    auto current = WorkflowStore::find(conn, id);
    if (!current) {
      return fail(current.error());
    }

    WorkflowState next = *current;
    auto changed = fn(next, now);
    if (!changed) {
      return fail(changed.error());
    }
    if (!*changed) {
      return Mutated{std::move(*current), std::nullopt};
    }
    next.updated_at = std::max(now, current->updated_at);

    auto entry = diff(*current, next);
    if (auto r = WorkflowStore::update(conn, next); !r) {
      return fail(r.error());
    }
    if (auto r = WorkflowStore::append_history(conn, entry); !r) {
      return fail(r.error());
    }
    if (auto r = txn->commit(); !r) {
      return fail(r.error());
    }
    return Mutated{std::move(next), std::move(entry)};
  });
}

}  // namespace tamma
