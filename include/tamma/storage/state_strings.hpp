#pragma once

#include "tamma/queue/task.hpp"
#include "tamma/workflow/workflow_state.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <ranges>
#include <string_view>
#include <utility>

namespace tamma {

namespace detail {

constexpr std::array<std::string_view, 3> kTaskTypeNames = {
    "workflow-step",
    "quality-gate",
    "git-operation",
};

constexpr std::array<std::string_view, 5> kTaskStatusNames = {
    "pending", "running", "completed", "failed", "cancelled",
};

constexpr std::array<std::string_view, 3> kTaskOutcomeNames = {
    "completed",
    "retry_scheduled",
    "failed_permanently",
};

constexpr std::array<std::string_view, 5> kWorkflowStatusNames = {
    "pending", "running", "completed", "failed", "paused",
};

template <typename E, std::size_t N>
constexpr auto name_of(const std::array<std::string_view, N>& names, E value)
    -> std::string_view {
  auto idx = static_cast<std::size_t>(std::to_underlying(value));
  return idx < N ? names[idx] : std::string_view{"unknown"};
}

template <typename E, std::size_t N>
constexpr auto parse_name(const std::array<std::string_view, N>& names,
                          std::string_view name) -> std::optional<E> {
  auto it = std::ranges::find(names, name);
  if (it == names.end()) {
    return std::nullopt;
  }
  return static_cast<E>(std::ranges::distance(names.begin(), it));
}

}  // namespace detail

[[nodiscard]] constexpr auto task_type_name(TaskType t) -> std::string_view {
  return detail::name_of(detail::kTaskTypeNames, t);
}

[[nodiscard]] constexpr auto parse_task_type(std::string_view name)
    -> std::optional<TaskType> {
  return detail::parse_name<TaskType>(detail::kTaskTypeNames, name);
}

[[nodiscard]] constexpr auto task_status_name(TaskStatus s)
    -> std::string_view {
  return detail::name_of(detail::kTaskStatusNames, s);
}

[[nodiscard]] constexpr auto parse_task_status(std::string_view name)
    -> std::optional<TaskStatus> {
  return detail::parse_name<TaskStatus>(detail::kTaskStatusNames, name);
}

[[nodiscard]] constexpr auto task_outcome_name(TaskOutcome o)
    -> std::string_view {
  return detail::name_of(detail::kTaskOutcomeNames, o);
}

[[nodiscard]] constexpr auto workflow_status_name(WorkflowStatus s)
    -> std::string_view {
  return detail::name_of(detail::kWorkflowStatusNames, s);
}

[[nodiscard]] constexpr auto parse_workflow_status(std::string_view name)
    -> std::optional<WorkflowStatus> {
  return detail::parse_name<WorkflowStatus>(detail::kWorkflowStatusNames,
                                            name);
}

}  // namespace tamma
