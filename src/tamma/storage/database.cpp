#include "tamma/storage/database.hpp"

#include "tamma/storage/sql.hpp"

#include <sqlite3.h>

namespace tamma {

Statement::~Statement() {
  reset();
}

auto Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

auto Statement::step() -> Result<bool> {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  auto ec = sql::error_from(rc);
  if (ec != Error::DatabaseBusy) {
    log::error("SQL step failed: {}",
               sqlite3_errmsg(sqlite3_db_handle(stmt_)));
  }
  return fail(ec);
}

Database::Connection::~Connection() {
  if (owner_ && db_) {
    owner_->release(db_);
  }
}

auto Database::Connection::prepare(const char* sql) -> Result<Statement> {
  sqlite3_stmt* stmt = nullptr;
  int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    auto ec = sql::error_from(rc);
    if (ec != Error::DatabaseBusy) {
      log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
    }
    return fail(ec);
  }
  return Statement{stmt};
}

auto Database::Connection::execute(std::string_view sql) -> Result<void> {
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_, sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    auto ec = sql::error_from(rc);
    if (ec != Error::DatabaseBusy) {
      log::error("SQL error: {}", err_msg ? err_msg : "unknown");
    }
    sqlite3_free(err_msg);
    return fail(ec);
  }
  return ok();
}

auto Database::Connection::changes() const -> int {
  return sqlite3_changes(db_);
}

Database::Database(StorageConfig config) : config_(std::move(config)) {
  if (config_.db_file == ":memory:") {
    // every in-memory connection would be a separate database
    config_.pool_size = 1;
  }
}

Database::~Database() {
  close();
}

auto Database::open_connection() -> Result<sqlite3*> {
  sqlite3* raw = nullptr;
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
  int rc = sqlite3_open_v2(config_.db_file.c_str(), &raw, flags, nullptr);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database {}: {}", config_.db_file,
               raw ? sqlite3_errmsg(raw) : "out of memory");
    if (raw) {
      sqlite3_close(raw);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  sqlite3_busy_timeout(raw, config_.busy_timeout_ms);

  Connection conn{nullptr, raw};
  if (auto r = conn.execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = conn.execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }
  return raw;
}

auto Database::open() -> Result<void> {
  {
    std::lock_guard lock(mu_);
    if (open_) {
      return ok();
    }
  }

  std::vector<sqlite3*> opened;
  for (int i = 0; i < config_.pool_size; ++i) {
    auto db = open_connection();
    if (!db) {
      for (auto* c : opened) {
        sqlite3_close(c);
      }
      return fail(db.error());
    }
    opened.push_back(*db);
  }

  {
    std::lock_guard lock(mu_);
    idle_ = std::move(opened);
    open_ = true;
  }

  if (auto r = ping(); !r) {
    close();
    return fail(Error::DatabaseOpenFailed);
  }

  log::info("Database opened: {} ({} connections)", config_.db_file,
            config_.pool_size);
  return ok();
}

auto Database::close() -> void {
  std::vector<sqlite3*> to_close;
  {
    std::lock_guard lock(mu_);
    if (!open_) {
      return;
    }
    open_ = false;
    to_close.swap(idle_);
  }
  cv_.notify_all();
  for (auto* db : to_close) {
    sqlite3_close(db);
  }
  log::info("Database closed: {}", config_.db_file);
}

auto Database::is_open() const -> bool {
  std::lock_guard lock(mu_);
  return open_;
}

auto Database::ping() -> Result<void> {
  auto conn = acquire();
  if (!conn) {
    return fail(conn.error());
  }
  auto stmt = conn->prepare("SELECT 1;");
  if (!stmt) {
    return fail(stmt.error());
  }
  auto row = stmt->step();
  if (!row) {
    return fail(row.error());
  }
  return *row ? ok() : fail(Error::DatabaseQueryFailed);
}

auto Database::acquire() -> Result<Connection> {
  std::unique_lock lock(mu_);
  cv_.wait(lock, [this] { return !open_ || !idle_.empty(); });
  if (!open_) {
    return fail(Error::StorageFailed);
  }
  sqlite3* db = idle_.back();
  idle_.pop_back();
  return Connection{this, db};
}

auto Database::release(sqlite3* db) -> void {
  {
    std::lock_guard lock(mu_);
    if (open_) {
      idle_.push_back(db);
      cv_.notify_one();
      return;
    }
  }
  sqlite3_close(db);
}

auto Transaction::begin(Database::Connection& conn) -> Result<Transaction> {
  if (auto r = conn.execute("BEGIN IMMEDIATE;"); !r) {
    return fail(r.error());
  }
  return Transaction{conn};
}

Transaction::~Transaction() {
  if (conn_) {
    if (auto r = conn_->execute("ROLLBACK;"); !r) {
      log::warn("Rollback failed: {}", r.error().message());
    }
  }
}

auto Transaction::commit() -> Result<void> {
  auto r = conn_->execute("COMMIT;");
  if (r) {
    conn_ = nullptr;
  }
  return r;
}

}  // namespace tamma
