#include "tamma/app/orchestrator.hpp"

#include "tamma/storage/state_strings.hpp"
#include "tamma/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <unordered_set>

namespace tamma {

namespace {

constexpr std::size_t kScanLimit = 10000;

template <typename Tag>
auto ids_json(const std::vector<TypedId<Tag>>& ids) -> nlohmann::json {
  auto arr = nlohmann::json::array();
  for (const auto& id : ids) {
    arr.push_back(id.str());
  }
  return arr;
}

auto lifecycle_event(std::string_view type, Delivery delivery,
                     nlohmann::json payload) -> Event {
  Event event;
  event.type = std::string(type);
  event.delivery = delivery;
  event.tags["component"] = "orchestrator";
  event.payload = std::move(payload);
  return event;
}

// A step with a recorded result is done; resume with the one after it.
auto resume_step(const WorkflowState& wf) -> int {
  auto steps = wf.context.find("steps");
  if (steps != wf.context.end() && steps->is_object() &&
      steps->contains(std::to_string(wf.current_step))) {
    return wf.current_step + 1;
  }
  return wf.current_step;
}

}  // namespace

auto RecoveryReport::to_json() const -> nlohmann::json {
  return {{"inspected", inspected},
          {"requeued", ids_json(requeued)},
          {"failed", ids_json(failed)},
          {"untouched", ids_json(untouched)}};
}

auto ShutdownReport::to_json() const -> nlohmann::json {
  return {{"performed", performed},
          {"drain_deadline_hit", drain_deadline_hit},
          {"remaining_tasks", ids_json(remaining_tasks)},
          {"remaining_workflows", ids_json(remaining_workflows)}};
}

Orchestrator::Orchestrator(SystemConfig config, EventSink& events,
                           Clock& clock)
    : config_(std::move(config)),
      events_(events),
      clock_(clock),
      db_(config_.storage),
      workers_(db_, config_.workers, clock_),
      queue_(db_, config_.queue, clock_, events_, &workers_),
      states_(db_, clock_, events_) {}

Orchestrator::~Orchestrator() {
  if (state() == LifecycleState::Running) {
    shutdown();
  }
}

auto Orchestrator::start() -> Result<void> {
  std::lock_guard lock(start_mu_);
  if (state() != LifecycleState::Initializing) {
    return tamma::fail(Error::InvalidState);
  }
  log::info("Orchestrator starting ({} mode, store {})",
            platform_mode_name(config_.orchestrator.mode),
            config_.storage.db_file);

  // Phase 1: store
  if (auto r = db_.open(); !r) {
    return abort_startup("store", r.error());
  }

  // Phase 2: components
  if (auto r = workers_.init(); !r) {
    return abort_startup("worker_pool", r.error());
  }
  if (auto r = queue_.init(); !r) {
    return abort_startup("task_queue", r.error());
  }
  if (auto r = states_.init(); !r) {
    return abort_startup("state_manager", r.error());
  }

  if (config_.orchestrator.reap_orphaned_tasks) {
    if (auto r = reap_orphaned_tasks(); !r) {
      return abort_startup("reaper", r.error());
    }
  }
  if (auto r = recover_workflows(); !r) {
    return abort_startup("recovery", r.error());
  }

  // Phase 3: intake
  accepting_tasks_.store(true, std::memory_order_release);
  accepting_workers_.store(true, std::memory_order_release);

  // Phase 4: self check
  auto health = health_check();
  if (!health.healthy) {
    for (const auto& c : health.components) {
      if (!c.healthy) {
        log::error("Component {} unhealthy: {}", c.name, c.detail);
      }
    }
    return abort_startup("health", make_error_code(Error::StorageFailed));
  }

  // Phase 5: announcement
  nlohmann::json inventory{
      {"mode", std::string(platform_mode_name(config_.orchestrator.mode))},
      {"store", config_.storage.db_file},
      {"started_at", to_millis(clock_.now())},
      {"components", health.to_json()["components"]}};
  if (auto r = emit_event(events_,
                          lifecycle_event("orchestrator.startup_complete",
                                          Delivery::Critical,
                                          std::move(inventory)));
      !r) {
    return abort_startup("announce", r.error());
  }

  state_.store(LifecycleState::Running, std::memory_order_release);
  log::info("Orchestrator running");
  return ok();
}

auto Orchestrator::abort_startup(std::string_view phase, std::error_code ec)
    -> std::unexpected<std::error_code> {
  log::error("Startup failed in phase '{}': {}", phase, ec.message());
  accepting_tasks_.store(false, std::memory_order_release);
  accepting_workers_.store(false, std::memory_order_release);
  db_.close();
  state_.store(LifecycleState::Stopped, std::memory_order_release);

  nlohmann::json payload{{"phase", std::string(phase)},
                         {"error", ec.message()}};
  if (auto r = emit_event(events_,
                          lifecycle_event("orchestrator.startup_failed",
                                          Delivery::BestEffort,
                                          std::move(payload)));
      !r) {
    log::error("Could not report startup failure: {}", r.error().message());
  }
  return tamma::fail(ec);
}

auto Orchestrator::shutdown() -> ShutdownReport {
  ShutdownReport report;
  auto expected = LifecycleState::Running;
  if (!state_.compare_exchange_strong(expected, LifecycleState::Draining,
                                      std::memory_order_acq_rel)) {
    log::debug("Shutdown ignored in state {}", lifecycle_state_name(expected));
    return report;
  }
  report.performed = true;
  log::info("Orchestrator draining");

  // Phase 1: no new claims or submissions
  queue_.pause();
  accepting_tasks_.store(false, std::memory_order_release);

  // Phase 2: wait for running work
  drain(report);

  // Phase 3: worker intake and transport
  accepting_workers_.store(false, std::memory_order_release);
  if (transport_close_) {
    transport_close_();
  }

  // Phase 4: store
  db_.close();

  // Phase 5
  state_.store(LifecycleState::Stopped, std::memory_order_release);
  if (auto r = emit_event(events_,
                          lifecycle_event("orchestrator.shutdown_complete",
                                          Delivery::BestEffort,
                                          report.to_json()));
      !r) {
    log::error("Could not report shutdown: {}", r.error().message());
  }
  log::info("Orchestrator stopped{}",
            report.drain_deadline_hit ? " (drain deadline hit)" : "");
  return report;
}

auto Orchestrator::drain(ShutdownReport& report) -> void {
  const auto& cfg = config_.orchestrator;
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(cfg.drain_timeout_ms);

  while (true) {
    auto s = queue_.stats();
    if (!s) {
      log::error("Drain cannot read queue stats: {}", s.error().message());
      report.drain_deadline_hit = true;
      return;
    }
    if (s->running == 0) {
      log::info("Drain complete");
      return;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(
        std::chrono::milliseconds(cfg.drain_poll_interval_ms));
  }

  report.drain_deadline_hit = true;
  TaskFilter running;
  running.status = TaskStatus::Running;
  running.limit = kScanLimit;
  auto tasks = queue_.list_tasks(running);
  if (!tasks) {
    log::error("Drain deadline hit; running tasks unknown: {}",
               tasks.error().message());
    return;
  }
  std::unordered_set<WorkflowId> seen;
  for (const auto& t : *tasks) {
    report.remaining_tasks.push_back(t.id);
    if (t.workflow_id && seen.insert(*t.workflow_id).second) {
      report.remaining_workflows.push_back(*t.workflow_id);
    }
  }
  log::warn("Drain deadline of {}ms hit with {} running tasks: tasks={} "
            "workflows={}",
            cfg.drain_timeout_ms, report.remaining_tasks.size(),
            ids_json(report.remaining_tasks).dump(),
            ids_json(report.remaining_workflows).dump());
}

auto Orchestrator::health_check() -> HealthReport {
  HealthReport report;
  report.components.push_back(queue_.health());
  report.components.push_back(workers_.health());
  report.components.push_back(states_.health());
  for (const auto& check : health_checks_) {
    report.components.push_back(check());
  }
  report.healthy = std::ranges::all_of(
      report.components, [](const auto& c) { return c.healthy; });
  return report;
}

auto Orchestrator::set_transport_close(std::function<void()> hook) -> void {
  transport_close_ = std::move(hook);
}

auto Orchestrator::add_health_check(std::function<ComponentHealth()> check)
    -> void {
  health_checks_.push_back(std::move(check));
}

auto Orchestrator::live() const noexcept -> bool {
  auto s = state();
  return s == LifecycleState::Running || s == LifecycleState::Draining;
}

auto Orchestrator::enqueue(NewTask task) -> Result<TaskId> {
  if (!accepting_tasks_.load(std::memory_order_acquire)) {
    return tamma::fail(Error::NotAccepting);
  }
  return queue_.enqueue(std::move(task));
}

auto Orchestrator::cancel(const TaskId& id) -> Result<void> {
  if (!live()) {
    return tamma::fail(Error::NotAccepting);
  }
  return queue_.cancel(id);
}

auto Orchestrator::get_task(const TaskId& id) -> Result<Task> {
  if (!live()) {
    return tamma::fail(Error::NotAccepting);
  }
  return queue_.get_task(id);
}

auto Orchestrator::list_tasks(const TaskFilter& filter)
    -> Result<std::vector<Task>> {
  if (!live()) {
    return tamma::fail(Error::NotAccepting);
  }
  return queue_.list_tasks(filter);
}

auto Orchestrator::stats() -> Result<QueueStats> {
  if (!live()) {
    return tamma::fail(Error::NotAccepting);
  }
  return queue_.stats();
}

auto Orchestrator::register_worker(const WorkerId& id,
                                   std::vector<std::string> capabilities,
                                   std::optional<int> max_concurrency)
    -> Result<Worker> {
  if (!accepting_workers_.load(std::memory_order_acquire)) {
    return tamma::fail(Error::NotAccepting);
  }
  return workers_.register_worker(id, std::move(capabilities),
                                  max_concurrency);
}

auto Orchestrator::unregister_worker(const WorkerId& id) -> Result<void> {
  if (!live()) {
    return tamma::fail(Error::NotAccepting);
  }
  return workers_.unregister_worker(id);
}

auto Orchestrator::heartbeat(const WorkerId& id) -> Result<void> {
  if (!accepting_workers_.load(std::memory_order_acquire)) {
    return tamma::fail(Error::NotAccepting);
  }
  return workers_.heartbeat(id);
}

auto Orchestrator::claim(const WorkerId& worker)
    -> Result<std::optional<Task>> {
  if (!live()) {
    return tamma::fail(Error::NotAccepting);
  }
  auto w = workers_.get_worker(worker);
  if (!w) {
    return tamma::fail(w.error());
  }
  if (workers_.is_stale(*w)) {
    log::debug("Worker {} is stale, no claim", worker);
    return std::optional<Task>{};
  }
  if (!w->has_capacity()) {
    log::debug("Worker {} at capacity ({}/{})", worker,
               w->current_tasks.size(), w->max_concurrency);
    return std::optional<Task>{};
  }
  return queue_.claim(w->id, w->capabilities, w->max_concurrency);
}

auto Orchestrator::complete(const TaskId& id, nlohmann::json result)
    -> Result<TaskOutcome> {
  if (!live()) {
    return tamma::fail(Error::NotAccepting);
  }
  auto outcome = queue_.complete(id, std::move(result));
  if (!outcome) {
    return outcome;
  }
  if (auto r = follow_up(id, *outcome); !r) {
    return tamma::fail(r.error());
  }
  return outcome;
}

auto Orchestrator::fail(const TaskId& id, std::string_view error)
    -> Result<TaskResolution> {
  if (!live()) {
    return tamma::fail(Error::NotAccepting);
  }
  auto resolution = queue_.fail(id, error);
  if (!resolution) {
    return resolution;
  }
  if (auto r = follow_up(id, resolution->outcome); !r) {
    return tamma::fail(r.error());
  }
  return resolution;
}

auto Orchestrator::follow_up(const TaskId& id, TaskOutcome outcome)
    -> Result<void> {
  if (outcome == TaskOutcome::RetryScheduled) {
    return ok();
  }
  auto task = queue_.get_task(id);
  if (!task) {
    return tamma::fail(task.error());
  }
  if (!task->workflow_id) {
    return ok();
  }
  const auto& wf_id = *task->workflow_id;

  auto wf = states_.get_workflow_state(wf_id);
  if (!wf) {
    if (wf.error() == Error::NotFound) {
      log::warn("Task {} refers to unknown workflow {}", id, wf_id);
      return ok();
    }
    return tamma::fail(wf.error());
  }
  if (wf->status != WorkflowStatus::Running &&
      wf->status != WorkflowStatus::Paused) {
    log::debug("Workflow {} is {}, task {} not applied", wf_id,
               workflow_status_name(wf->status), id);
    return ok();
  }

  WorkflowStateUpdate update;
  if (outcome == TaskOutcome::Completed) {
    if (!task->step) {
      return ok();
    }
    if (*task->step > wf->current_step) {
      update.current_step = *task->step;
    }
    auto result =
        task->result.is_null() ? nlohmann::json::object() : task->result;
    update.context_patch =
        nlohmann::json{{"steps", {{std::to_string(*task->step), result}}}};
  } else {
    update.status = WorkflowStatus::Failed;
    update.context_patch =
        nlohmann::json{{"last_error", task->last_error.value_or("")},
                       {"failed_task", id.str()}};
  }

  auto r = states_.update_workflow_state(wf_id, update);
  if (!r) {
    if (is_domain_error(r.error())) {
      log::warn("Workflow {} not updated after task {}: {}", wf_id, id,
                r.error().message());
      return ok();
    }
    return tamma::fail(r.error());
  }
  return ok();
}

auto Orchestrator::start_workflow(NewWorkflow initial) -> Result<WorkflowId> {
  if (!accepting_tasks_.load(std::memory_order_acquire)) {
    return tamma::fail(Error::NotAccepting);
  }
  return states_.create_workflow_state(std::move(initial));
}

auto Orchestrator::update_workflow(const WorkflowId& id,
                                   const WorkflowStateUpdate& update)
    -> Result<WorkflowState> {
  if (!live()) {
    return tamma::fail(Error::NotAccepting);
  }
  return states_.update_workflow_state(id, update);
}

auto Orchestrator::get_workflow(const WorkflowId& id)
    -> Result<WorkflowState> {
  if (!live()) {
    return tamma::fail(Error::NotAccepting);
  }
  return states_.get_workflow_state(id);
}

auto Orchestrator::list_workflows(const WorkflowFilter& filter)
    -> Result<std::vector<WorkflowState>> {
  if (!live()) {
    return tamma::fail(Error::NotAccepting);
  }
  return states_.list_workflow_states(filter);
}

auto Orchestrator::workflow_history(const WorkflowId& id)
    -> Result<std::vector<WorkflowHistoryEntry>> {
  if (!live()) {
    return tamma::fail(Error::NotAccepting);
  }
  return states_.get_workflow_history(id);
}

auto Orchestrator::archive_workflow(const WorkflowId& id,
                                    WorkflowStatus final_status)
    -> Result<WorkflowState> {
  if (!live()) {
    return tamma::fail(Error::NotAccepting);
  }
  return states_.archive_workflow_state(id, final_status);
}

auto Orchestrator::recover_workflows() -> Result<RecoveryReport> {
  RecoveryReport report;
  auto policy = config_.orchestrator.recovery;

  WorkflowFilter filter;
  filter.status = WorkflowStatus::Running;
  filter.limit = kScanLimit;
  auto running = states_.list_workflow_states(filter);
  if (!running) {
    return tamma::fail(running.error());
  }

  for (const auto& wf : *running) {
    ++report.inspected;

    TaskFilter tf;
    tf.workflow_id = wf.id;
    tf.limit = kScanLimit;
    auto tasks = queue_.list_tasks(tf);
    if (!tasks) {
      return tamma::fail(tasks.error());
    }
    bool has_live_task = std::ranges::any_of(*tasks, [](const Task& t) {
      return t.status == TaskStatus::Pending ||
             t.status == TaskStatus::Running;
    });
    if (has_live_task) {
      continue;
    }

    switch (policy) {
      case RecoveryPolicy::Requeue: {
        int next = resume_step(wf);
        NewTask step;
        step.type = TaskType::WorkflowStep;
        step.priority = wf.metadata.priority;
        step.workflow_id = wf.id;
        step.step = next;
        step.payload = {{"step", next}, {"recovered", true}};
        step.metadata = {{"reason", "recovery"}};
        auto id = queue_.enqueue(std::move(step));
        if (!id) {
          return tamma::fail(id.error());
        }
        log::info("Recovery: workflow {} step {} requeued as task {}", wf.id,
                  next, *id);
        report.requeued.push_back(wf.id);
        break;
      }
      case RecoveryPolicy::Fail: {
        WorkflowStateUpdate update;
        update.status = WorkflowStatus::Failed;
        update.context_patch =
            nlohmann::json{{"last_error", "orchestrator restarted"}};
        if (auto r = states_.update_workflow_state(wf.id, update); !r) {
          return tamma::fail(r.error());
        }
        log::info("Recovery: workflow {} marked failed", wf.id);
        report.failed.push_back(wf.id);
        break;
      }
      case RecoveryPolicy::None:
        report.untouched.push_back(wf.id);
        break;
    }
  }

  if (report.inspected > 0) {
    log::info("Recovery ({}): {} running workflows, {} requeued, {} failed, "
              "{} untouched",
              recovery_policy_name(policy), report.inspected,
              report.requeued.size(), report.failed.size(),
              report.untouched.size());
    auto payload = report.to_json();
    payload["policy"] = std::string(recovery_policy_name(policy));
    if (auto r = emit_event(events_,
                            lifecycle_event("orchestrator.recovery",
                                            Delivery::Critical,
                                            std::move(payload)));
        !r) {
      return tamma::fail(r.error());
    }
  }
  return report;
}

auto Orchestrator::reap_orphaned_tasks() -> Result<std::size_t> {
  TaskFilter filter;
  filter.status = TaskStatus::Running;
  filter.limit = kScanLimit;
  auto tasks = queue_.list_tasks(filter);
  if (!tasks) {
    return tamma::fail(tasks.error());
  }
  auto workers = workers_.list_workers();
  if (!workers) {
    return tamma::fail(workers.error());
  }
  std::unordered_set<WorkerId> registered;
  for (const auto& w : *workers) {
    registered.insert(w.id);
  }

  std::size_t reaped = 0;
  for (const auto& t : *tasks) {
    if (t.assigned_worker && registered.contains(*t.assigned_worker)) {
      continue;
    }
    auto r = queue_.fail(t.id, "worker lost");
    if (!r) {
      if (r.error() == Error::InvalidState) {
        continue;  // finished meanwhile
      }
      return tamma::fail(r.error());
    }
    ++reaped;
    if (auto f = follow_up(t.id, r->outcome); !f) {
      return tamma::fail(f.error());
    }
  }
  if (reaped > 0) {
    log::warn("Reaped {} tasks of lost workers", reaped);
  }
  return reaped;
}

}  // namespace tamma
