#include "tamma/storage/workflow_store.hpp"

#include "tamma/storage/sql.hpp"
#include "tamma/storage/state_strings.hpp"

#include <sqlite3.h>

namespace tamma {

namespace {

constexpr auto kSelect = R"(
  SELECT id, issue_ref, platform_ref, repository_ref, current_step, status,
         context, metadata, created_at, updated_at, started_at, completed_at,
         failed_at, archived_at
  FROM workflow_states)";

auto read_state(sqlite3_stmt* stmt) -> WorkflowState {
  WorkflowState st;
  st.id = WorkflowId{sql::column_text(stmt, 0)};
  st.issue_ref = sql::column_text(stmt, 1);
  st.platform_ref = sql::column_text(stmt, 2);
  st.repository_ref = sql::column_text(stmt, 3);
  st.current_step = sqlite3_column_int(stmt, 4);
  st.status = parse_workflow_status(sql::column_text(stmt, 5))
                  .value_or(WorkflowStatus::Pending);
  st.context = sql::column_json(stmt, 6, nlohmann::json::object());
  auto meta = sql::column_json(stmt, 7, nlohmann::json::object());
  if (meta.is_object()) {
    try {
      st.metadata = meta.get<WorkflowMetadata>();
    } catch (const nlohmann::json::exception&) {
      st.metadata = WorkflowMetadata{};
    }
  }
  st.created_at = sql::column_time(stmt, 8);
  st.updated_at = sql::column_time(stmt, 9);
  st.started_at = sql::column_optional_time(stmt, 10);
  st.completed_at = sql::column_optional_time(stmt, 11);
  st.failed_at = sql::column_optional_time(stmt, 12);
  st.archived_at = sql::column_optional_time(stmt, 13);
  return st;
}

// Binds the mutable columns starting at `first`; returns the next index.
auto bind_mutable(sqlite3_stmt* s, int first, const WorkflowState& st) -> int {
  int i = first;
  sqlite3_bind_int(s, i++, st.current_step);
  sql::bind_text(s, i++, workflow_status_name(st.status));
  sql::bind_json(s, i++, st.context);
  sql::bind_json(s, i++, nlohmann::json(st.metadata));
  sql::bind_time(s, i++, st.updated_at);
  sql::bind_optional_time(s, i++, st.started_at);
  sql::bind_optional_time(s, i++, st.completed_at);
  sql::bind_optional_time(s, i++, st.failed_at);
  sql::bind_optional_time(s, i++, st.archived_at);
  return i;
}

}  // namespace

auto WorkflowStore::create_schema(Connection& conn) -> Result<void> {
  return conn.execute(R"(
    CREATE TABLE IF NOT EXISTS workflow_states (
      id TEXT PRIMARY KEY,
      issue_ref TEXT NOT NULL DEFAULT '',
      platform_ref TEXT NOT NULL DEFAULT '',
      repository_ref TEXT NOT NULL DEFAULT '',
      current_step INTEGER NOT NULL DEFAULT 0,
      status TEXT NOT NULL DEFAULT 'pending',
      context TEXT NOT NULL DEFAULT '{}',
      metadata TEXT NOT NULL DEFAULT '{}',
      created_at INTEGER NOT NULL,
      updated_at INTEGER NOT NULL,
      started_at INTEGER,
      completed_at INTEGER,
      failed_at INTEGER,
      archived_at INTEGER
    );

    CREATE INDEX IF NOT EXISTS idx_workflow_states_status
      ON workflow_states(status);

    CREATE TABLE IF NOT EXISTS workflow_state_history (
      seq INTEGER PRIMARY KEY AUTOINCREMENT,
      workflow_id TEXT NOT NULL,
      changed_at INTEGER NOT NULL,
      changed_fields TEXT NOT NULL,
      previous_values TEXT NOT NULL,
      new_values TEXT NOT NULL
    );

    CREATE INDEX IF NOT EXISTS idx_workflow_history_workflow
      ON workflow_state_history(workflow_id, changed_at, seq);
  )");
}

auto WorkflowStore::insert(Connection& conn, const WorkflowState& state)
    -> Result<void> {
  constexpr auto query = R"(
    INSERT INTO workflow_states
      (id, issue_ref, platform_ref, repository_ref, created_at,
       current_step, status, context, metadata, updated_at,
       started_at, completed_at, failed_at, archived_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
  )";

  auto stmt = conn.prepare(query);
  if (!stmt) {
    return fail(stmt.error());
  }
  auto* s = stmt->get();
  sql::bind_text(s, 1, state.id.value());
  sql::bind_text(s, 2, state.issue_ref);
  sql::bind_text(s, 3, state.platform_ref);
  sql::bind_text(s, 4, state.repository_ref);
  sql::bind_time(s, 5, state.created_at);
  bind_mutable(s, 6, state);

  int rc = sqlite3_step(s);
  if ((rc & 0xff) == SQLITE_CONSTRAINT) {
    return fail(Error::ValidationFailed);
  }
  if (rc != SQLITE_DONE) {
    return fail(sql::error_from(rc));
  }
  return ok();
}

auto WorkflowStore::update(Connection& conn, const WorkflowState& state)
    -> Result<void> {
  constexpr auto query = R"(
    UPDATE workflow_states SET
      current_step = ?, status = ?, context = ?, metadata = ?, updated_at = ?,
      started_at = ?, completed_at = ?, failed_at = ?, archived_at = ?
    WHERE id = ?;
  )";

  auto stmt = conn.prepare(query);
  if (!stmt) {
    return fail(stmt.error());
  }
  auto next = bind_mutable(stmt->get(), 1, state);
  sql::bind_text(stmt->get(), next, state.id.value());

  auto done = stmt->step();
  if (!done) {
    return fail(done.error());
  }
  return conn.changes() > 0 ? ok() : fail(Error::NotFound);
}

auto WorkflowStore::remove(Connection& conn, const WorkflowId& id)
    -> Result<void> {
  auto stmt = conn.prepare("DELETE FROM workflow_states WHERE id = ?;");
  if (!stmt) {
    return fail(stmt.error());
  }
  sql::bind_text(stmt->get(), 1, id.value());
  auto done = stmt->step();
  if (!done) {
    return fail(done.error());
  }
  return conn.changes() > 0 ? ok() : fail(Error::NotFound);
}

auto WorkflowStore::find(Connection& conn, const WorkflowId& id)
    -> Result<WorkflowState> {
  static const std::string query = std::string(kSelect) + " WHERE id = ?;";
  auto stmt = conn.prepare(query.c_str());
  if (!stmt) {
    return fail(stmt.error());
  }
  sql::bind_text(stmt->get(), 1, id.value());
  auto row = stmt->step();
  if (!row) {
    return fail(row.error());
  }
  if (!*row) {
    return fail(Error::NotFound);
  }
  return read_state(stmt->get());
}

auto WorkflowStore::list(Connection& conn, const WorkflowFilter& filter)
    -> Result<std::vector<WorkflowState>> {
  std::string query = std::string(kSelect) + " WHERE 1 = 1";
  if (filter.status) query += " AND status = ?";
  if (filter.issue_ref) query += " AND issue_ref = ?";
  if (filter.repository_ref) query += " AND repository_ref = ?";
  if (!filter.include_archived) query += " AND archived_at IS NULL";
  query += " ORDER BY created_at ASC, id ASC LIMIT ?;";

  auto stmt = conn.prepare(query.c_str());
  if (!stmt) {
    return fail(stmt.error());
  }
  auto* s = stmt->get();
  int idx = 1;
  if (filter.status) sql::bind_text(s, idx++, workflow_status_name(*filter.status));
  if (filter.issue_ref) sql::bind_text(s, idx++, *filter.issue_ref);
  if (filter.repository_ref) sql::bind_text(s, idx++, *filter.repository_ref);
  sqlite3_bind_int64(s, idx, static_cast<sqlite3_int64>(filter.limit));

  std::vector<WorkflowState> states;
  while (true) {
    auto row = stmt->step();
    if (!row) {
      return fail(row.error());
    }
    if (!*row) {
      break;
    }
    states.push_back(read_state(s));
  }
  return states;
}

auto WorkflowStore::append_history(Connection& conn,
                                   const WorkflowHistoryEntry& entry)
    -> Result<void> {
  constexpr auto query = R"(
    INSERT INTO workflow_state_history
      (workflow_id, changed_at, changed_fields, previous_values, new_values)
    VALUES (?, ?, ?, ?, ?);
  )";

  auto stmt = conn.prepare(query);
  if (!stmt) {
    return fail(stmt.error());
  }
  auto* s = stmt->get();
  sql::bind_text(s, 1, entry.workflow_id.value());
  sql::bind_time(s, 2, entry.changed_at);
  sql::bind_json(s, 3, nlohmann::json(entry.changed_fields));
  sql::bind_json(s, 4, entry.previous_values);
  sql::bind_json(s, 5, entry.new_values);

  auto done = stmt->step();
  if (!done) {
    return fail(done.error());
  }
  return ok();
}

auto WorkflowStore::history(Connection& conn, const WorkflowId& id)
    -> Result<std::vector<WorkflowHistoryEntry>> {
  constexpr auto query = R"(
    SELECT seq, workflow_id, changed_at, changed_fields, previous_values,
           new_values
    FROM workflow_state_history
    WHERE workflow_id = ?
    ORDER BY changed_at ASC, seq ASC;
  )";

  auto stmt = conn.prepare(query);
  if (!stmt) {
    return fail(stmt.error());
  }
  auto* s = stmt->get();
  sql::bind_text(s, 1, id.value());

  std::vector<WorkflowHistoryEntry> entries;
  while (true) {
    auto row = stmt->step();
    if (!row) {
      return fail(row.error());
    }
    if (!*row) {
      break;
    }
    WorkflowHistoryEntry e;
    e.seq = sqlite3_column_int64(s, 0);
    e.workflow_id = WorkflowId{sql::column_text(s, 1)};
    e.changed_at = sql::column_time(s, 2);
    for (const auto& f : sql::column_json(s, 3, nlohmann::json::array())) {
      if (f.is_string()) {
        e.changed_fields.push_back(f.get<std::string>());
      }
    }
    e.previous_values = sql::column_json(s, 4, nlohmann::json::object());
    e.new_values = sql::column_json(s, 5, nlohmann::json::object());
    entries.push_back(std::move(e));
  }
  return entries;
}

}  // namespace tamma
