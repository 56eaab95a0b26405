#pragma once

#include <compare>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

namespace tamma {

struct TaskTag {};
struct WorkerTag {};
struct WorkflowTag {};

// Phantom-typed identifier; a TaskId cannot be passed where a WorkerId is
// expected.
template <typename Tag>
class TypedId {
public:
  TypedId() = default;
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }
  [[nodiscard]] auto c_str() const -> const char* { return value_.c_str(); }
  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId&, const TypedId&) = default;
  [[nodiscard]] friend auto operator==(const TypedId&, const TypedId&) -> bool = default;

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;
using WorkerId = TypedId<WorkerTag>;
using WorkflowId = TypedId<WorkflowTag>;

inline auto generate_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint64_t> dis;

  std::uint64_t a = dis(gen);
  std::uint64_t b = dis(gen);

  return std::format(
      "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
      static_cast<std::uint32_t>(a >> 32), static_cast<std::uint16_t>(a >> 16),
      static_cast<std::uint16_t>(a), static_cast<std::uint16_t>(b >> 48),
      b & 0xFFFFFFFFFFFFULL);
}

inline auto generate_task_id() -> TaskId {
  return TaskId{std::format("task_{}", generate_uuid())};
}

inline auto generate_workflow_id() -> WorkflowId {
  return WorkflowId{std::format("wf_{}", generate_uuid())};
}

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id)
    -> std::ostream& {
  return os << id.value();
}

}  // namespace tamma

template <typename Tag>
struct std::hash<tamma::TypedId<Tag>> {
  auto operator()(const tamma::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<tamma::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const tamma::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
