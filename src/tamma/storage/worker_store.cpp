#include "tamma/storage/worker_store.hpp"

#include "tamma/storage/sql.hpp"

#include <sqlite3.h>

namespace tamma {

namespace {

constexpr auto kSelect = R"(
  SELECT id, capabilities, max_concurrency, current_tasks, registered_at,
         last_heartbeat_at, tasks_completed, tasks_failed
  FROM workers)";

auto read_worker(sqlite3_stmt* stmt) -> Worker {
  Worker w;
  w.id = WorkerId{sql::column_text(stmt, 0)};
  for (const auto& cap : sql::column_json(stmt, 1, nlohmann::json::array())) {
    if (cap.is_string()) {
      w.capabilities.push_back(cap.get<std::string>());
    }
  }
  w.max_concurrency = sqlite3_column_int(stmt, 2);
  for (const auto& t : sql::column_json(stmt, 3, nlohmann::json::array())) {
    if (t.is_string()) {
      w.current_tasks.emplace_back(t.get<std::string>());
    }
  }
  w.registered_at = sql::column_time(stmt, 4);
  w.last_heartbeat_at = sql::column_time(stmt, 5);
  w.tasks_completed = sqlite3_column_int64(stmt, 6);
  w.tasks_failed = sqlite3_column_int64(stmt, 7);
  return w;
}

auto task_ids_json(const std::vector<TaskId>& ids) -> nlohmann::json {
  auto arr = nlohmann::json::array();
  for (const auto& id : ids) {
    arr.push_back(id.str());
  }
  return arr;
}

}  // namespace

auto WorkerStore::create_schema(Connection& conn) -> Result<void> {
  return conn.execute(R"(
    CREATE TABLE IF NOT EXISTS workers (
      id TEXT PRIMARY KEY,
      capabilities TEXT NOT NULL DEFAULT '[]',
      max_concurrency INTEGER NOT NULL DEFAULT 1,
      current_tasks TEXT NOT NULL DEFAULT '[]',
      registered_at INTEGER NOT NULL,
      last_heartbeat_at INTEGER NOT NULL,
      tasks_completed INTEGER NOT NULL DEFAULT 0,
      tasks_failed INTEGER NOT NULL DEFAULT 0
    );
  )");
}

auto WorkerStore::upsert(Connection& conn, const Worker& worker)
    -> Result<void> {
  constexpr auto query = R"(
    INSERT INTO workers (id, capabilities, max_concurrency, current_tasks,
                         registered_at, last_heartbeat_at)
    VALUES (?, ?, ?, '[]', ?, ?)
    ON CONFLICT(id) DO UPDATE SET
      capabilities = excluded.capabilities,
      max_concurrency = excluded.max_concurrency,
      last_heartbeat_at = excluded.last_heartbeat_at;
  )";

  auto stmt = conn.prepare(query);
  if (!stmt) {
    return fail(stmt.error());
  }
  auto* s = stmt->get();
  sql::bind_text(s, 1, worker.id.value());
  sql::bind_json(s, 2, nlohmann::json(worker.capabilities));
  sqlite3_bind_int(s, 3, worker.max_concurrency);
  sql::bind_time(s, 4, worker.registered_at);
  sql::bind_time(s, 5, worker.last_heartbeat_at);

  auto done = stmt->step();
  if (!done) {
    return fail(done.error());
  }
  return ok();
}

auto WorkerStore::remove(Connection& conn, const WorkerId& id) -> Result<void> {
  auto stmt = conn.prepare("DELETE FROM workers WHERE id = ?;");
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

auto WorkerStore::touch(Connection& conn, const WorkerId& id, TimePoint now)
    -> Result<void> {
  auto stmt =
      conn.prepare("UPDATE workers SET last_heartbeat_at = ? WHERE id = ?;");
  if (!stmt) {
    return fail(stmt.error());
  }
  sql::bind_time(stmt->get(), 1, now);
  sql::bind_text(stmt->get(), 2, id.value());
  auto done = stmt->step();
  if (!done) {
    return fail(done.error());
  }
  return conn.changes() > 0 ? ok() : fail(Error::NotFound);
}

auto WorkerStore::find(Connection& conn, const WorkerId& id) -> Result<Worker> {
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
  return read_worker(stmt->get());
}

auto WorkerStore::list(Connection& conn) -> Result<std::vector<Worker>> {
  static const std::string query = std::string(kSelect) + " ORDER BY id;";
  auto stmt = conn.prepare(query.c_str());
  if (!stmt) {
    return fail(stmt.error());
  }
  std::vector<Worker> workers;
  while (true) {
    auto row = stmt->step();
    if (!row) {
      return fail(row.error());
    }
    if (!*row) {
      break;
    }
    workers.push_back(read_worker(stmt->get()));
  }
  return workers;
}

auto WorkerStore::save_assignments(Connection& conn, const Worker& worker)
    -> Result<void> {
  constexpr auto query = R"(
    UPDATE workers SET current_tasks = ?, tasks_completed = ?, tasks_failed = ?
    WHERE id = ?;
  )";
  auto stmt = conn.prepare(query);
  if (!stmt) {
    return fail(stmt.error());
  }
  auto* s = stmt->get();
  sql::bind_json(s, 1, task_ids_json(worker.current_tasks));
  sqlite3_bind_int64(s, 2, worker.tasks_completed);
  sqlite3_bind_int64(s, 3, worker.tasks_failed);
  sql::bind_text(s, 4, worker.id.value());
  auto done = stmt->step();
  if (!done) {
    return fail(done.error());
  }
  return conn.changes() > 0 ? ok() : fail(Error::NotFound);
}

}  // namespace tamma
