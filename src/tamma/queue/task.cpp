#include "tamma/queue/task.hpp"

#include "tamma/storage/state_strings.hpp"
#include "tamma/util/log.hpp"

#include <cstdint>
#include <limits>
#include <optional>

namespace tamma {

namespace {

auto reject(std::string_view why) -> std::unexpected<std::error_code> {
  log::warn("Rejected task submission: {}", why);
  return fail(Error::ValidationFailed);
}

// Integer that fits in an int; JSON numbers may not.
auto as_int(const nlohmann::json& value) -> std::optional<int> {
  if (!value.is_number_integer()) {
    return std::nullopt;
  }
  if (value.is_number_unsigned()) {
    auto v = value.get<std::uint64_t>();
    if (v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      return std::nullopt;
    }
    return static_cast<int>(v);
  }
  auto v = value.get<std::int64_t>();
  if (v < std::numeric_limits<int>::min() ||
      v > std::numeric_limits<int>::max()) {
    return std::nullopt;
  }
  return static_cast<int>(v);
}

auto optional_millis(const std::optional<TimePoint>& tp) -> nlohmann::json {
  return tp ? nlohmann::json(to_millis(*tp)) : nlohmann::json(nullptr);
}

}  // namespace

auto NewTask::from_json(const nlohmann::json& j) -> Result<NewTask> {
  if (!j.is_object()) {
    return reject("submission is not an object");
  }

  NewTask task;

  auto type_it = j.find("type");
  if (type_it == j.end() || !type_it->is_string()) {
    return reject("missing type");
  }
  auto type = parse_task_type(type_it->get<std::string>());
  if (!type) {
    return reject("unknown task type");
  }
  task.type = *type;

  auto prio_it = j.find("priority");
  if (prio_it == j.end()) {
    return reject("missing priority");
  }
  auto priority = as_int(*prio_it);
  if (!priority) {
    return reject("priority must be an integer in int range");
  }
  task.priority = *priority;

  if (auto it = j.find("id"); it != j.end()) {
    if (!it->is_string() || it->get<std::string>().empty()) {
      return reject("id must be a non-empty string");
    }
    task.id = TaskId{it->get<std::string>()};
  }
  if (auto it = j.find("payload"); it != j.end()) {
    task.payload = *it;
  }
  if (auto it = j.find("max_retries"); it != j.end()) {
    auto retries = as_int(*it);
    if (!retries) {
      return reject("max_retries must be an integer in int range");
    }
    task.max_retries = *retries;
  }
  if (auto it = j.find("required_tags"); it != j.end()) {
    if (!it->is_array()) {
      return reject("required_tags must be an array");
    }
    for (const auto& tag : *it) {
      if (!tag.is_string()) {
        return reject("required_tags must contain strings");
      }
      task.required_tags.push_back(tag.get<std::string>());
    }
  }
  if (auto it = j.find("scheduled_at"); it != j.end() && !it->is_null()) {
    if (!it->is_number_integer()) {
      return reject("scheduled_at must be epoch milliseconds");
    }
    task.scheduled_at = from_millis(it->get<std::int64_t>());
  }
  if (auto it = j.find("workflow_id"); it != j.end() && !it->is_null()) {
    if (!it->is_string()) {
      return reject("workflow_id must be a string");
    }
    task.workflow_id = WorkflowId{it->get<std::string>()};
  }
  if (auto it = j.find("step"); it != j.end() && !it->is_null()) {
    auto step = as_int(*it);
    if (!step) {
      return reject("step must be an integer in int range");
    }
    task.step = *step;
  }
  if (auto it = j.find("metadata"); it != j.end()) {
    if (!it->is_object()) {
      return reject("metadata must be an object");
    }
    task.metadata = *it;
  }
  return task;
}

auto task_to_json(const Task& task) -> nlohmann::json {
  return {
      {"id", task.id.str()},
      {"type", std::string(task_type_name(task.type))},
      {"priority", task.priority},
      {"payload", task.payload},
      {"status", std::string(task_status_name(task.status))},
      {"retry_count", task.retry_count},
      {"max_retries", task.max_retries},
      {"required_tags", task.required_tags},
      {"scheduled_at", optional_millis(task.scheduled_at)},
      {"assigned_worker", task.assigned_worker
                              ? nlohmann::json(task.assigned_worker->str())
                              : nlohmann::json(nullptr)},
      {"workflow_id", task.workflow_id
                          ? nlohmann::json(task.workflow_id->str())
                          : nlohmann::json(nullptr)},
      {"step", task.step ? nlohmann::json(*task.step) : nlohmann::json(nullptr)},
      {"metadata", task.metadata},
      {"result", task.result},
      {"last_error", task.last_error ? nlohmann::json(*task.last_error)
                                     : nlohmann::json(nullptr)},
      {"created_at", to_millis(task.created_at)},
      {"started_at", optional_millis(task.started_at)},
      {"completed_at", optional_millis(task.completed_at)},
      {"failed_at", optional_millis(task.failed_at)},
      {"cancelled_at", optional_millis(task.cancelled_at)},
  };
}

}  // namespace tamma
