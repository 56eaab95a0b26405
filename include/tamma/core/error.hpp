#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace tamma {

enum class Error : int {
  Success,
  NotFound,
  InvalidState,
  ValidationFailed,
  StorageFailed,
  DatabaseBusy,
  DatabaseOpenFailed,
  DatabaseQueryFailed,
  FileNotFound,
  ParseError,
  AuditFailed,
  NotAccepting,
  Timeout,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::string_view messages[] = {
      "success",
      "not found",
      "invalid state for operation",
      "validation failed",
      "storage operation failed",
      "database busy",
      "failed to open database",
      "database query failed",
      "file not found",
      "parse error",
      "audit event could not be recorded",
      "not accepting requests",
      "timeout",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "tamma";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages[idx]};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

}  // namespace tamma

template <>
struct std::is_error_code_enum<tamma::Error> : std::true_type {};

namespace tamma {

// Lock contention on the store; the only class of error retried internally.
[[nodiscard]] inline auto is_transient(std::error_code ec) noexcept -> bool {
  return ec == Error::DatabaseBusy;
}

// Errors the caller is expected to handle; these are never retried.
[[nodiscard]] inline auto is_domain_error(std::error_code ec) noexcept
    -> bool {
  return ec == Error::NotFound || ec == Error::InvalidState ||
         ec == Error::ValidationFailed || ec == Error::NotAccepting;
}

}  // namespace tamma
