#include "tamma/storage/task_store.hpp"

#include "tamma/storage/sql.hpp"
#include "tamma/storage/state_strings.hpp"
#include "tamma/util/log.hpp"

#include <sqlite3.h>

#include <format>

namespace tamma {

namespace {

constexpr auto kColumns = R"(
  id, type, priority, payload, status, retry_count, max_retries,
  required_tags, scheduled_at, assigned_worker, workflow_id, step, metadata,
  result, last_error, created_at, started_at, completed_at, failed_at,
  cancelled_at)";

auto read_task(sqlite3_stmt* stmt) -> Task {
  Task task;
  task.id = TaskId{sql::column_text(stmt, 0)};
  task.type = parse_task_type(sql::column_text(stmt, 1))
                  .value_or(TaskType::WorkflowStep);
  task.priority = sqlite3_column_int(stmt, 2);
  task.payload = sql::column_json(stmt, 3, nlohmann::json::object());
  task.status = parse_task_status(sql::column_text(stmt, 4))
                    .value_or(TaskStatus::Pending);
  task.retry_count = sqlite3_column_int(stmt, 5);
  task.max_retries = sqlite3_column_int(stmt, 6);
  auto tags = sql::column_json(stmt, 7, nlohmann::json::array());
  for (const auto& tag : tags) {
    if (tag.is_string()) {
      task.required_tags.push_back(tag.get<std::string>());
    }
  }
  task.scheduled_at = sql::column_optional_time(stmt, 8);
  if (auto w = sql::column_optional_text(stmt, 9)) {
    task.assigned_worker = WorkerId{std::move(*w)};
  }
  if (auto wf = sql::column_optional_text(stmt, 10)) {
    task.workflow_id = WorkflowId{std::move(*wf)};
  }
  if (sqlite3_column_type(stmt, 11) != SQLITE_NULL) {
    task.step = sqlite3_column_int(stmt, 11);
  }
  task.metadata = sql::column_json(stmt, 12, nlohmann::json::object());
  task.result = sql::column_json(stmt, 13);
  task.last_error = sql::column_optional_text(stmt, 14);
  task.created_at = sql::column_time(stmt, 15);
  task.started_at = sql::column_optional_time(stmt, 16);
  task.completed_at = sql::column_optional_time(stmt, 17);
  task.failed_at = sql::column_optional_time(stmt, 18);
  task.cancelled_at = sql::column_optional_time(stmt, 19);
  return task;
}

auto bind_optional_worker(sqlite3_stmt* stmt, int idx,
                          const std::optional<WorkerId>& w) -> void {
  if (w) {
    sql::bind_text(stmt, idx, w->value());
  } else {
    sqlite3_bind_null(stmt, idx);
  }
}

}  // namespace

auto TaskStore::create_schema(Connection& conn) -> Result<void> {
  return conn.execute(R"(
    CREATE TABLE IF NOT EXISTS tasks (
      seq INTEGER PRIMARY KEY AUTOINCREMENT,
      id TEXT NOT NULL UNIQUE,
      type TEXT NOT NULL,
      priority INTEGER NOT NULL,
      payload TEXT NOT NULL DEFAULT '{}',
      status TEXT NOT NULL DEFAULT 'pending',
      retry_count INTEGER NOT NULL DEFAULT 0,
      max_retries INTEGER NOT NULL DEFAULT 0,
      required_tags TEXT NOT NULL DEFAULT '[]',
      scheduled_at INTEGER,
      assigned_worker TEXT,
      workflow_id TEXT,
      step INTEGER,
      metadata TEXT NOT NULL DEFAULT '{}',
      result TEXT,
      last_error TEXT,
      created_at INTEGER NOT NULL,
      started_at INTEGER,
      attempt_started_at INTEGER,
      completed_at INTEGER,
      failed_at INTEGER,
      cancelled_at INTEGER
    );

    CREATE INDEX IF NOT EXISTS idx_tasks_claim
      ON tasks(status, priority DESC, created_at, seq);
    CREATE INDEX IF NOT EXISTS idx_tasks_workflow
      ON tasks(workflow_id);
    CREATE INDEX IF NOT EXISTS idx_tasks_worker
      ON tasks(assigned_worker);
  )");
}

auto TaskStore::insert(Connection& conn, const Task& task) -> Result<void> {
  static const std::string query = std::format(R"(
    INSERT INTO tasks ({})
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
  )", kColumns);

  auto stmt = conn.prepare(query.c_str());
  if (!stmt) {
    return fail(stmt.error());
  }
  auto* s = stmt->get();
  sql::bind_text(s, 1, task.id.value());
  sql::bind_text(s, 2, task_type_name(task.type));
  sqlite3_bind_int(s, 3, task.priority);
  sql::bind_json(s, 4, task.payload);
  sql::bind_text(s, 5, task_status_name(task.status));
  sqlite3_bind_int(s, 6, task.retry_count);
  sqlite3_bind_int(s, 7, task.max_retries);
  sql::bind_json(s, 8, nlohmann::json(task.required_tags));
  sql::bind_optional_time(s, 9, task.scheduled_at);
  bind_optional_worker(s, 10, task.assigned_worker);
  if (task.workflow_id) {
    sql::bind_text(s, 11, task.workflow_id->value());
  } else {
    sqlite3_bind_null(s, 11);
  }
  if (task.step) {
    sqlite3_bind_int(s, 12, *task.step);
  } else {
    sqlite3_bind_null(s, 12);
  }
  sql::bind_json(s, 13, task.metadata);
  if (task.result.is_null()) {
    sqlite3_bind_null(s, 14);
  } else {
    sql::bind_json(s, 14, task.result);
  }
  sql::bind_optional_text(s, 15, task.last_error);
  sql::bind_time(s, 16, task.created_at);
  sql::bind_optional_time(s, 17, task.started_at);
  sql::bind_optional_time(s, 18, task.completed_at);
  sql::bind_optional_time(s, 19, task.failed_at);
  sql::bind_optional_time(s, 20, task.cancelled_at);

  int rc = sqlite3_step(s);
  if ((rc & 0xff) == SQLITE_CONSTRAINT) {
    log::warn("Task {} already exists", task.id);
    return fail(Error::ValidationFailed);
  }
  if (rc != SQLITE_DONE) {
    return fail(sql::error_from(rc));
  }
  return ok();
}

auto TaskStore::find(Connection& conn, const TaskId& id) -> Result<Task> {
  static const std::string query =
      std::format("SELECT {} FROM tasks WHERE id = ?;", kColumns);

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
  return read_task(stmt->get());
}

auto TaskStore::update(Connection& conn, const Task& task) -> Result<void> {
  constexpr auto query = R"(
    UPDATE tasks SET
      status = ?, retry_count = ?, scheduled_at = ?, assigned_worker = ?,
      payload = ?, metadata = ?, result = ?, last_error = ?,
      started_at = ?, completed_at = ?, failed_at = ?, cancelled_at = ?
    WHERE id = ?;
  )";

  auto stmt = conn.prepare(query);
  if (!stmt) {
    return fail(stmt.error());
  }
  auto* s = stmt->get();
  sql::bind_text(s, 1, task_status_name(task.status));
  sqlite3_bind_int(s, 2, task.retry_count);
  sql::bind_optional_time(s, 3, task.scheduled_at);
  bind_optional_worker(s, 4, task.assigned_worker);
  sql::bind_json(s, 5, task.payload);
  sql::bind_json(s, 6, task.metadata);
  if (task.result.is_null()) {
    sqlite3_bind_null(s, 7);
  } else {
    sql::bind_json(s, 7, task.result);
  }
  sql::bind_optional_text(s, 8, task.last_error);
  sql::bind_optional_time(s, 9, task.started_at);
  sql::bind_optional_time(s, 10, task.completed_at);
  sql::bind_optional_time(s, 11, task.failed_at);
  sql::bind_optional_time(s, 12, task.cancelled_at);
  sql::bind_text(s, 13, task.id.value());

  auto done = stmt->step();
  if (!done) {
    return fail(done.error());
  }
  if (conn.changes() == 0) {
    return fail(Error::NotFound);
  }
  return ok();
}

auto TaskStore::claim_next(Connection& conn, const WorkerId& worker,
                           const std::string& capabilities, TimePoint now,
                           std::optional<int> max_running)
    -> Result<std::optional<Task>> {
  // One statement: selection and transition cannot be split by another
  // claimant, in this process or any other sharing the file.
  static const std::string query = std::format(R"(
    UPDATE tasks SET
      status = 'running',
      started_at = COALESCE(started_at, ?1),
      attempt_started_at = ?1,
      assigned_worker = ?2
    WHERE seq = (
      SELECT cand.seq FROM tasks AS cand
      WHERE cand.status = 'pending'
        AND (cand.scheduled_at IS NULL OR cand.scheduled_at <= ?1)
        AND cand.type IN (SELECT value FROM json_each(?3))
        AND NOT EXISTS (
          SELECT 1 FROM json_each(cand.required_tags) AS tag
          WHERE tag.value NOT IN (SELECT value FROM json_each(?3)))
      ORDER BY cand.priority DESC, cand.created_at ASC, cand.seq ASC
      LIMIT 1)
    AND status = 'pending'
    AND (?4 IS NULL OR (
      SELECT COUNT(*) FROM tasks AS busy
      WHERE busy.status = 'running' AND busy.assigned_worker = ?2) < ?4)
    RETURNING {};
  )", kColumns);

  auto stmt = conn.prepare(query.c_str());
  if (!stmt) {
    return fail(stmt.error());
  }
  sql::bind_time(stmt->get(), 1, now);
  sql::bind_text(stmt->get(), 2, worker.value());
  sql::bind_text(stmt->get(), 3, capabilities);
  if (max_running) {
    sqlite3_bind_int(stmt->get(), 4, *max_running);
  } else {
    sqlite3_bind_null(stmt->get(), 4);
  }

  auto row = stmt->step();
  if (!row) {
    return fail(row.error());
  }
  if (!*row) {
    return std::optional<Task>{};
  }
  auto task = read_task(stmt->get());
  // drain so the statement completes before the caller commits
  while (true) {
    auto more = stmt->step();
    if (!more) {
      return fail(more.error());
    }
    if (!*more) {
      break;
    }
  }
  return std::optional<Task>{std::move(task)};
}

auto TaskStore::list(Connection& conn, const TaskFilter& filter)
    -> Result<std::vector<Task>> {
  std::string query = std::format("SELECT {} FROM tasks WHERE 1 = 1", kColumns);
  if (filter.status) query += " AND status = ?";
  if (filter.type) query += " AND type = ?";
  if (filter.workflow_id) query += " AND workflow_id = ?";
  if (filter.assigned_worker) query += " AND assigned_worker = ?";
  query += " ORDER BY seq ASC LIMIT ?;";

  auto stmt = conn.prepare(query.c_str());
  if (!stmt) {
    return fail(stmt.error());
  }
  auto* s = stmt->get();
  int idx = 1;
  if (filter.status) sql::bind_text(s, idx++, task_status_name(*filter.status));
  if (filter.type) sql::bind_text(s, idx++, task_type_name(*filter.type));
  if (filter.workflow_id) sql::bind_text(s, idx++, filter.workflow_id->value());
  if (filter.assigned_worker)
    sql::bind_text(s, idx++, filter.assigned_worker->value());
  sqlite3_bind_int64(s, idx, static_cast<sqlite3_int64>(filter.limit));

  std::vector<Task> tasks;
  while (true) {
    auto row = stmt->step();
    if (!row) {
      return fail(row.error());
    }
    if (!*row) {
      break;
    }
    tasks.push_back(read_task(s));
  }
  return tasks;
}

auto TaskStore::count_by_status(Connection& conn) -> Result<QueueStats> {
  auto stmt =
      conn.prepare("SELECT status, COUNT(*) FROM tasks GROUP BY status;");
  if (!stmt) {
    return fail(stmt.error());
  }

  QueueStats stats;
  while (true) {
    auto row = stmt->step();
    if (!row) {
      return fail(row.error());
    }
    if (!*row) {
      break;
    }
    auto status = parse_task_status(sql::column_text(stmt->get(), 0));
    auto count = sqlite3_column_int64(stmt->get(), 1);
    if (!status) {
      continue;
    }
    switch (*status) {
      case TaskStatus::Pending: stats.pending = count; break;
      case TaskStatus::Running: stats.running = count; break;
      case TaskStatus::Completed: stats.completed = count; break;
      case TaskStatus::Failed: stats.failed = count; break;
      case TaskStatus::Cancelled: stats.cancelled = count; break;
    }
  }
  return stats;
}

auto TaskStore::average_duration_ms(Connection& conn, int window)
    -> Result<double> {
  constexpr auto query = R"(
    SELECT AVG(completed_at - attempt_started_at) FROM (
      SELECT completed_at, attempt_started_at FROM tasks
      WHERE status = 'completed' AND attempt_started_at IS NOT NULL
      ORDER BY completed_at DESC, seq DESC
      LIMIT ?);
  )";

  auto stmt = conn.prepare(query);
  if (!stmt) {
    return fail(stmt.error());
  }
  sqlite3_bind_int(stmt->get(), 1, window);

  auto row = stmt->step();
  if (!row) {
    return fail(row.error());
  }
  if (!*row || sqlite3_column_type(stmt->get(), 0) == SQLITE_NULL) {
    return 0.0;
  }
  return sqlite3_column_double(stmt->get(), 0);
}

}  // namespace tamma
