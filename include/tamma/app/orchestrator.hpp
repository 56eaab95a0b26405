#pragma once

#include "tamma/config/system_config.hpp"
#include "tamma/core/error.hpp"
#include "tamma/core/health.hpp"
#include "tamma/events/event_sink.hpp"
#include "tamma/queue/task_queue.hpp"
#include "tamma/storage/database.hpp"
#include "tamma/util/clock.hpp"
#include "tamma/workers/worker_pool.hpp"
#include "tamma/workflow/state_manager.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tamma {

enum class LifecycleState : std::uint8_t {
  Initializing,
  Running,
  Draining,
  Stopped,
};

[[nodiscard]] constexpr auto lifecycle_state_name(LifecycleState s) noexcept
    -> std::string_view {
  switch (s) {
    case LifecycleState::Initializing: return "initializing";
    case LifecycleState::Running: return "running";
    case LifecycleState::Draining: return "draining";
    case LifecycleState::Stopped: return "stopped";
  }
  return "unknown";
}

struct RecoveryReport {
  std::size_t inspected{0};
  std::vector<WorkflowId> requeued;
  std::vector<WorkflowId> failed;
  std::vector<WorkflowId> untouched;

  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

struct ShutdownReport {
  bool performed{false};  // false when shutdown was already done or under way
  bool drain_deadline_hit{false};
  std::vector<TaskId> remaining_tasks;
  std::vector<WorkflowId> remaining_workflows;

  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

// Wires the store, queue, worker pool and state manager together and runs
// the process lifecycle: initializing -> running -> draining -> stopped.
class Orchestrator {
public:
  Orchestrator(SystemConfig config, EventSink& events, Clock& clock);
  ~Orchestrator();

  Orchestrator(const Orchestrator&) = delete;
  auto operator=(const Orchestrator&) -> Orchestrator& = delete;

  // Phases: store, components, recovery, intake, health, announcement. Any
  // failure leaves the orchestrator stopped.
  [[nodiscard]] auto start() -> Result<void>;

  // Idempotent. Pauses claims, drains running work up to the drain timeout,
  // closes intake and the transport, then releases the store.
  auto shutdown() -> ShutdownReport;

  [[nodiscard]] auto state() const noexcept -> LifecycleState {
    return state_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto health_check() -> HealthReport;

  // Invoked once during shutdown, after intake is closed.
  auto set_transport_close(std::function<void()> hook) -> void;

  // Extra component reported by health_check() after the core ones, e.g. the
  // transport. Register before start(); startup aborts if it is unhealthy.
  auto add_health_check(std::function<ComponentHealth()> check) -> void;

  // Task submission
  [[nodiscard]] auto enqueue(NewTask task) -> Result<TaskId>;
  [[nodiscard]] auto cancel(const TaskId& id) -> Result<void>;
  [[nodiscard]] auto get_task(const TaskId& id) -> Result<Task>;
  [[nodiscard]] auto list_tasks(const TaskFilter& filter = {})
      -> Result<std::vector<Task>>;
  [[nodiscard]] auto stats() -> Result<QueueStats>;

  // Worker protocol
  [[nodiscard]] auto register_worker(const WorkerId& id,
                                     std::vector<std::string> capabilities,
                                     std::optional<int> max_concurrency =
                                         std::nullopt) -> Result<Worker>;
  [[nodiscard]] auto unregister_worker(const WorkerId& id) -> Result<void>;
  [[nodiscard]] auto heartbeat(const WorkerId& id) -> Result<void>;
  // None for stale or saturated workers, or when nothing is eligible.
  [[nodiscard]] auto claim(const WorkerId& worker)
      -> Result<std::optional<Task>>;
  [[nodiscard]] auto complete(const TaskId& id, nlohmann::json result = {})
      -> Result<TaskOutcome>;
  [[nodiscard]] auto fail(const TaskId& id, std::string_view error)
      -> Result<TaskResolution>;

  // Workflows
  [[nodiscard]] auto start_workflow(NewWorkflow initial) -> Result<WorkflowId>;
  [[nodiscard]] auto update_workflow(const WorkflowId& id,
                                     const WorkflowStateUpdate& update)
      -> Result<WorkflowState>;
  [[nodiscard]] auto get_workflow(const WorkflowId& id)
      -> Result<WorkflowState>;
  [[nodiscard]] auto list_workflows(const WorkflowFilter& filter = {})
      -> Result<std::vector<WorkflowState>>;
  [[nodiscard]] auto workflow_history(const WorkflowId& id)
      -> Result<std::vector<WorkflowHistoryEntry>>;
  [[nodiscard]] auto archive_workflow(
      const WorkflowId& id,
      WorkflowStatus final_status = WorkflowStatus::Completed)
      -> Result<WorkflowState>;

  // Applies the recovery policy to running workflows without live tasks.
  [[nodiscard]] auto recover_workflows() -> Result<RecoveryReport>;
  // Fails running tasks whose worker is no longer registered.
  [[nodiscard]] auto reap_orphaned_tasks() -> Result<std::size_t>;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig& {
    return config_;
  }
  [[nodiscard]] auto queue() noexcept -> TaskQueue& { return queue_; }
  [[nodiscard]] auto workers() noexcept -> WorkerPool& { return workers_; }
  [[nodiscard]] auto states() noexcept -> StateManager& { return states_; }

private:
  auto abort_startup(std::string_view phase, std::error_code ec)
      -> std::unexpected<std::error_code>;
  auto drain(ShutdownReport& report) -> void;
  // Reflects a finished task on its workflow: a completed step advances it,
  // a permanent failure fails it.
  auto follow_up(const TaskId& id, TaskOutcome outcome) -> Result<void>;
  [[nodiscard]] auto live() const noexcept -> bool;

  SystemConfig config_;
  EventSink& events_;
  Clock& clock_;

  Database db_;
  WorkerPool workers_;
  TaskQueue queue_;
  StateManager states_;

  std::atomic<LifecycleState> state_{LifecycleState::Initializing};
  std::atomic<bool> accepting_tasks_{false};
  std::atomic<bool> accepting_workers_{false};
  std::mutex start_mu_;
  std::function<void()> transport_close_;
  std::vector<std::function<ComponentHealth()>> health_checks_;
};

}  // namespace tamma
