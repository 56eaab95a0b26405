#pragma once

#include "tamma/config/system_config.hpp"
#include "tamma/core/error.hpp"
#include "tamma/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace tamma {

class Statement {
public:
  explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {}
  ~Statement();
  Statement(Statement&& other) noexcept
      : stmt_(std::exchange(other.stmt_, nullptr)) {}
  Statement& operator=(Statement&& other) noexcept {
    if (this != &other) {
      reset();
      stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
  }
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* { return stmt_; }

  // true while rows remain, false once the statement is done.
  [[nodiscard]] auto step() -> Result<bool>;
  auto reset() -> void;

private:
  sqlite3_stmt* stmt_ = nullptr;
};

// SQLite connection pool. Each connection is used by one thread at a time;
// the pool lock only guards checkout and return, never a query.
class Database {
public:
  // A checked-out connection, returned to the pool on destruction. Leases
  // must not outlive the Database.
  class Connection {
  public:
    Connection(Database* owner, sqlite3* db) noexcept
        : owner_(owner), db_(db) {}
    ~Connection();
    Connection(Connection&& other) noexcept
        : owner_(std::exchange(other.owner_, nullptr)),
          db_(std::exchange(other.db_, nullptr)) {}
    Connection& operator=(Connection&&) = delete;
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3* { return db_; }
    [[nodiscard]] auto prepare(const char* sql) -> Result<Statement>;
    [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
    [[nodiscard]] auto changes() const -> int;

  private:
    Database* owner_;
    sqlite3* db_;
  };

  explicit Database(StorageConfig config);
  ~Database();

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const -> bool;
  [[nodiscard]] auto ping() -> Result<void>;
  [[nodiscard]] auto path() const noexcept -> const std::string& {
    return config_.db_file;
  }

  [[nodiscard]] auto acquire() -> Result<Connection>;

  // Runs fn on a pooled connection. Lock contention is retried with
  // exponential backoff up to storage.max_retries; exhaustion and any other
  // database failure become Error::StorageFailed. Domain errors returned by
  // fn pass through untouched.
  template <typename F>
  auto with_retry(std::string_view op, F&& fn)
      -> std::invoke_result_t<F&, Connection&> {
    for (int attempt = 0;; ++attempt) {
      std::error_code ec;
      {
        auto conn = acquire();
        if (!conn) {
          ec = conn.error();
        } else {
          auto result = fn(*conn);
          if (result) {
            return result;
          }
          ec = result.error();
          if (is_domain_error(ec) || ec == Error::StorageFailed) {
            return result;
          }
        }
      }
      if (!is_transient(ec)) {
        log::error("Storage operation '{}' failed: {}", op, ec.message());
        return fail(Error::StorageFailed);
      }
      if (attempt >= config_.max_retries) {
        log::error("Storage operation '{}' still contended after {} retries",
                   op, attempt);
        return fail(Error::StorageFailed);
      }
      auto delay = std::min<std::int64_t>(
          static_cast<std::int64_t>(config_.retry_base_delay_ms) << attempt,
          config_.retry_max_delay_ms);
      log::warn("Storage operation '{}' contended, retry {} in {}ms", op,
                attempt + 1, delay);
      std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }
  }

private:
  auto release(sqlite3* db) -> void;
  [[nodiscard]] auto open_connection() -> Result<sqlite3*>;

  StorageConfig config_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::vector<sqlite3*> idle_;
  bool open_{false};
};

// BEGIN IMMEDIATE on construction; rolled back unless commit() succeeds.
class Transaction {
public:
  [[nodiscard]] static auto begin(Database::Connection& conn)
      -> Result<Transaction>;

  Transaction(Transaction&& other) noexcept
      : conn_(std::exchange(other.conn_, nullptr)) {}
  Transaction& operator=(Transaction&&) = delete;
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  ~Transaction();

  [[nodiscard]] auto commit() -> Result<void>;

private:
  explicit Transaction(Database::Connection& conn) noexcept : conn_(&conn) {}

  Database::Connection* conn_;
};

}  // namespace tamma
