#pragma once

#include "tamma/core/error.hpp"
#include "tamma/util/clock.hpp"
#include "tamma/util/id.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tamma {

// Closed set; a worker capability with the same name makes it eligible.
enum class TaskType : std::uint8_t {
  WorkflowStep,
  QualityGate,
  GitOperation,
};

enum class TaskStatus : std::uint8_t {
  Pending,
  Running,
  Completed,
  Failed,
  Cancelled,
};

enum class TaskOutcome : std::uint8_t {
  Completed,
  RetryScheduled,
  FailedPermanently,
};

struct Task {
  TaskId id;
  TaskType type{TaskType::WorkflowStep};
  int priority{0};
  nlohmann::json payload = nlohmann::json::object();
  TaskStatus status{TaskStatus::Pending};
  int retry_count{0};
  int max_retries{0};
  std::vector<std::string> required_tags;
  std::optional<TimePoint> scheduled_at;
  std::optional<WorkerId> assigned_worker;

  // Correlation for audit linkage
  std::optional<WorkflowId> workflow_id;
  std::optional<int> step;
  nlohmann::json metadata = nlohmann::json::object();

  nlohmann::json result;
  std::optional<std::string> last_error;

  TimePoint created_at{};
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;
  std::optional<TimePoint> failed_at;
  std::optional<TimePoint> cancelled_at;

  [[nodiscard]] auto is_terminal() const noexcept -> bool {
    return status == TaskStatus::Completed || status == TaskStatus::Failed ||
           status == TaskStatus::Cancelled;
  }
};

// Submission request. Fields the queue owns (status, retry count,
// timestamps) are not settable here.
struct NewTask {
  std::optional<TaskId> id;
  TaskType type{TaskType::WorkflowStep};
  int priority{0};
  nlohmann::json payload = nlohmann::json::object();
  std::optional<int> max_retries;
  std::vector<std::string> required_tags;
  std::optional<TimePoint> scheduled_at;
  std::optional<WorkflowId> workflow_id;
  std::optional<int> step;
  nlohmann::json metadata = nlohmann::json::object();

  // For submissions arriving as JSON; "type" and "priority" are mandatory.
  [[nodiscard]] static auto from_json(const nlohmann::json& j)
      -> Result<NewTask>;
};

struct TaskFilter {
  std::optional<TaskStatus> status;
  std::optional<TaskType> type;
  std::optional<WorkflowId> workflow_id;
  std::optional<WorkerId> assigned_worker;
  std::size_t limit{100};
};

struct QueueStats {
  std::int64_t pending{0};
  std::int64_t running{0};
  std::int64_t completed{0};
  std::int64_t failed{0};
  std::int64_t cancelled{0};
  double avg_duration_ms{0.0};

  [[nodiscard]] auto total() const noexcept -> std::int64_t {
    return pending + running + completed + failed + cancelled;
  }
};

struct TaskResolution {
  TaskOutcome outcome{TaskOutcome::Completed};
  int retry_count{0};
  std::optional<TimePoint> retry_at;
};

[[nodiscard]] auto task_to_json(const Task& task) -> nlohmann::json;

}  // namespace tamma
