#pragma once

// Binding and column helpers shared by the repository classes. Only storage
// sources include this header.

#include "tamma/core/error.hpp"
#include "tamma/util/clock.hpp"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tamma::sql {

[[nodiscard]] inline auto error_from(int rc) -> std::error_code {
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return make_error_code(Error::DatabaseBusy);
    default:
      return make_error_code(Error::DatabaseQueryFailed);
  }
}

inline auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view value)
    -> void {
  sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

inline auto bind_optional_text(sqlite3_stmt* stmt, int idx,
                               const std::optional<std::string>& value)
    -> void {
  if (value) {
    bind_text(stmt, idx, *value);
  } else {
    sqlite3_bind_null(stmt, idx);
  }
}

inline auto bind_json(sqlite3_stmt* stmt, int idx, const nlohmann::json& value)
    -> void {
  bind_text(stmt, idx, value.dump());
}

inline auto bind_time(sqlite3_stmt* stmt, int idx, TimePoint tp) -> void {
  sqlite3_bind_int64(stmt, idx, to_millis(tp));
}

inline auto bind_optional_time(sqlite3_stmt* stmt, int idx,
                               const std::optional<TimePoint>& tp) -> void {
  if (tp) {
    bind_time(stmt, idx, *tp);
  } else {
    sqlite3_bind_null(stmt, idx);
  }
}

[[nodiscard]] inline auto column_text(sqlite3_stmt* stmt, int col)
    -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

[[nodiscard]] inline auto column_optional_text(sqlite3_stmt* stmt, int col)
    -> std::optional<std::string> {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(stmt, col);
}

[[nodiscard]] inline auto column_time(sqlite3_stmt* stmt, int col)
    -> TimePoint {
  return from_millis(sqlite3_column_int64(stmt, col));
}

[[nodiscard]] inline auto column_optional_time(sqlite3_stmt* stmt, int col)
    -> std::optional<TimePoint> {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_time(stmt, col);
}

// Rows are only ever written by this library, so malformed JSON means the
// file was edited by hand; fall back to the given default rather than fail
// the whole read.
[[nodiscard]] inline auto column_json(sqlite3_stmt* stmt, int col,
                                      nlohmann::json fallback = nullptr)
    -> nlohmann::json {
  auto text = column_text(stmt, col);
  if (text.empty()) {
    return fallback;
  }
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  return parsed.is_discarded() ? fallback : parsed;
}

}  // namespace tamma::sql
