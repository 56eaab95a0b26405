#include "tamma/queue/task_queue.hpp"
#include "tamma/storage/database.hpp"
#include "tamma/workers/worker_pool.hpp"

#include "test_utils.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace tamma;
using namespace std::chrono_literals;

namespace {

const std::vector<std::string> kStepCaps = {"workflow-step"};

}  // namespace

class TaskQueueTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_db_path_ = test::make_temp_db_path();
    ASSERT_FALSE(test_db_path_.empty());
    config_ = test::test_config(test_db_path_);
    db_ = std::make_unique<Database>(config_.storage);
    ASSERT_TRUE(db_->open().has_value());
    make_queue(events_);
  }

  void TearDown() override {
    queue_.reset();
    workers_.reset();
    db_.reset();
    test::remove_db_files(test_db_path_);
  }

  void make_queue(EventSink& sink) {
    workers_ = std::make_unique<WorkerPool>(*db_, config_.workers, clock_);
    ASSERT_TRUE(workers_->init().has_value());
    queue_ = std::make_unique<TaskQueue>(*db_, config_.queue, clock_, sink,
                                         workers_.get());
    ASSERT_TRUE(queue_->init().has_value());
  }

  auto submit(std::string id, int priority = 0,
              TaskType type = TaskType::WorkflowStep) -> TaskId {
    NewTask t;
    t.id = TaskId{std::move(id)};
    t.priority = priority;
    t.type = type;
    auto r = queue_->enqueue(std::move(t));
    EXPECT_TRUE(r.has_value());
    return r ? *r : TaskId{};
  }

  auto claim_one(std::string_view worker = "w1",
                 const std::vector<std::string>& caps = kStepCaps)
      -> std::optional<Task> {
    auto r = queue_->claim(WorkerId{std::string(worker)}, caps);
    EXPECT_TRUE(r.has_value());
    return r ? *r : std::nullopt;
  }

  std::string test_db_path_;
  SystemConfig config_;
  ManualClock clock_;
  test::RecordingEventSink events_;
  std::unique_ptr<Database> db_;
  std::unique_ptr<WorkerPool> workers_;
  std::unique_ptr<TaskQueue> queue_;
};

TEST_F(TaskQueueTest, Enqueue_AppliesDefaults) {
  NewTask t;
  t.payload = {{"step", 1}};
  auto id = queue_->enqueue(std::move(t));
  ASSERT_TRUE(id.has_value());
  EXPECT_FALSE(id->empty());

  auto task = queue_->get_task(*id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::Pending);
  EXPECT_EQ(task->retry_count, 0);
  EXPECT_EQ(task->max_retries, config_.queue.default_max_retries);
  EXPECT_EQ(task->payload["step"], 1);
  EXPECT_EQ(task->created_at, clock_.now());
  EXPECT_FALSE(task->assigned_worker.has_value());
  EXPECT_EQ(events_.count("task.enqueued"), 1u);
}

TEST_F(TaskQueueTest, Enqueue_NegativeMaxRetriesRejected) {
  NewTask t;
  t.max_retries = -1;

  auto r = queue_->enqueue(std::move(t));

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::ValidationFailed);
  EXPECT_EQ(events_.count("task.enqueued"), 0u);
}

TEST_F(TaskQueueTest, Enqueue_EmptyRequiredTagRejected) {
  NewTask t;
  t.required_tags = {"gpu", ""};

  auto r = queue_->enqueue(std::move(t));

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::ValidationFailed);
}

TEST_F(TaskQueueTest, Enqueue_DuplicateIdRejected) {
  submit("dup");

  NewTask t;
  t.id = TaskId{"dup"};
  auto r = queue_->enqueue(std::move(t));

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::ValidationFailed);
}

TEST_F(TaskQueueTest, Claim_HighestPriorityFirst) {
  submit("A", 1);
  submit("B", 5);
  submit("C", 3);

  auto first = claim_one();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->id, TaskId{"B"});
  EXPECT_EQ(first->status, TaskStatus::Running);
  EXPECT_EQ(first->assigned_worker, WorkerId{"w1"});
  EXPECT_TRUE(first->started_at.has_value());

  auto second = claim_one();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->id, TaskId{"C"});
  auto third = claim_one();
  ASSERT_TRUE(third.has_value());
  EXPECT_EQ(third->id, TaskId{"A"});
  EXPECT_FALSE(claim_one().has_value());
}

TEST_F(TaskQueueTest, Claim_EqualPriorityIsFifo) {
  submit("first", 2);
  clock_.advance(1ms);
  submit("second", 2);
  submit("third", 2);

  EXPECT_EQ(claim_one()->id, TaskId{"first"});
  EXPECT_EQ(claim_one()->id, TaskId{"second"});
  EXPECT_EQ(claim_one()->id, TaskId{"third"});
}

TEST_F(TaskQueueTest, Claim_RequiresMatchingCapability) {
  submit("gate", 10, TaskType::QualityGate);
  submit("step", 1, TaskType::WorkflowStep);

  auto task = claim_one("w1", {"workflow-step"});
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->id, TaskId{"step"});
  EXPECT_FALSE(claim_one("w1", {"workflow-step"}).has_value());

  auto gate = claim_one("w2", {"quality-gate"});
  ASSERT_TRUE(gate.has_value());
  EXPECT_EQ(gate->id, TaskId{"gate"});
}

TEST_F(TaskQueueTest, Claim_RequiredTagsMustAllBePresent) {
  NewTask t;
  t.id = TaskId{"gpu-task"};
  t.required_tags = {"gpu", "linux"};
  ASSERT_TRUE(queue_->enqueue(std::move(t)).has_value());

  EXPECT_FALSE(claim_one("w1", {"workflow-step", "gpu"}).has_value());

  auto task = claim_one("w2", {"workflow-step", "gpu", "linux"});
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->id, TaskId{"gpu-task"});
}

TEST_F(TaskQueueTest, Claim_FutureScheduledTaskIsSkipped) {
  NewTask t;
  t.id = TaskId{"later"};
  t.scheduled_at = clock_.now() + 5s;
  ASSERT_TRUE(queue_->enqueue(std::move(t)).has_value());

  EXPECT_FALSE(claim_one().has_value());

  clock_.advance(5s);
  auto task = claim_one();
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->id, TaskId{"later"});
}

TEST_F(TaskQueueTest, Claim_EmptyWorkerRejected) {
  submit("t1");

  auto r = queue_->claim(WorkerId{}, kStepCaps);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::ValidationFailed);
}

TEST_F(TaskQueueTest, Claim_RecordsAssignmentOnWorker) {
  ASSERT_TRUE(
      workers_->register_worker(WorkerId{"w1"}, kStepCaps, 2).has_value());
  auto id = submit("t1");

  ASSERT_TRUE(claim_one("w1").has_value());

  auto worker = workers_->get_worker(WorkerId{"w1"});
  ASSERT_TRUE(worker.has_value());
  ASSERT_EQ(worker->current_tasks.size(), 1u);
  EXPECT_EQ(worker->current_tasks[0], id);

  ASSERT_TRUE(queue_->complete(id).has_value());
  worker = workers_->get_worker(WorkerId{"w1"});
  ASSERT_TRUE(worker.has_value());
  EXPECT_TRUE(worker->current_tasks.empty());
  EXPECT_EQ(worker->tasks_completed, 1);
}

TEST_F(TaskQueueTest, Complete_StoresResultAndClearsWorker) {
  auto id = submit("t1");
  ASSERT_TRUE(claim_one().has_value());
  clock_.advance(250ms);

  auto outcome = queue_->complete(id, {{"files", 3}});
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(*outcome, TaskOutcome::Completed);

  auto task = queue_->get_task(id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::Completed);
  EXPECT_EQ(task->result["files"], 3);
  EXPECT_FALSE(task->assigned_worker.has_value());
  ASSERT_TRUE(task->completed_at.has_value());
  EXPECT_EQ(*task->completed_at, clock_.now());

  auto event = events_.last("task.completed");
  EXPECT_EQ(event.delivery, Delivery::Critical);
  EXPECT_EQ(event.tags["task_id"], "t1");
  EXPECT_EQ(event.payload["worker_id"], "w1");
}

TEST_F(TaskQueueTest, Complete_UnknownTaskIsNotFound) {
  auto r = queue_->complete(TaskId{"missing"});

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::NotFound);
}

TEST_F(TaskQueueTest, Complete_PendingTaskIsInvalidState) {
  auto id = submit("t1");

  auto r = queue_->complete(id);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidState);
  EXPECT_EQ(queue_->get_task(id)->status, TaskStatus::Pending);
}

TEST_F(TaskQueueTest, Complete_TwiceIsInvalidState) {
  auto id = submit("t1");
  ASSERT_TRUE(claim_one().has_value());
  ASSERT_TRUE(queue_->complete(id).has_value());

  auto r = queue_->complete(id);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidState);
  EXPECT_EQ(events_.count("task.completed"), 1u);
}

TEST_F(TaskQueueTest, Fail_RetriesUntilBudgetSpent) {
  NewTask t;
  t.id = TaskId{"flaky"};
  t.max_retries = 2;
  ASSERT_TRUE(queue_->enqueue(std::move(t)).has_value());
  TaskId id{"flaky"};

  int attempts = 0;
  std::optional<TaskResolution> last;
  while (auto task = claim_one()) {
    ++attempts;
    auto r = queue_->fail(id, "boom");
    ASSERT_TRUE(r.has_value());
    last = *r;
    if (r->retry_at) {
      clock_.set(*r->retry_at);
    }
  }

  EXPECT_EQ(attempts, 3);
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->outcome, TaskOutcome::FailedPermanently);
  EXPECT_EQ(last->retry_count, 2);

  auto task = queue_->get_task(id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::Failed);
  EXPECT_EQ(task->last_error, "boom");
  EXPECT_TRUE(task->failed_at.has_value());
  EXPECT_EQ(events_.count("task.retry_scheduled"), 2u);
  EXPECT_EQ(events_.count("task.failed"), 1u);
}

TEST_F(TaskQueueTest, Fail_SchedulesRetryWithBackoff) {
  auto id = submit("t1");
  ASSERT_TRUE(claim_one().has_value());
  auto before = clock_.now();

  auto r = queue_->fail(id, "transient");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->outcome, TaskOutcome::RetryScheduled);
  EXPECT_EQ(r->retry_count, 1);
  ASSERT_TRUE(r->retry_at.has_value());
  EXPECT_EQ(*r->retry_at, before + queue_->backoff_delay(1));

  auto task = queue_->get_task(id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::Pending);
  EXPECT_FALSE(task->assigned_worker.has_value());

  EXPECT_FALSE(claim_one().has_value());
  clock_.set(*r->retry_at);
  EXPECT_TRUE(claim_one().has_value());
}

TEST_F(TaskQueueTest, Fail_ZeroRetriesFailsImmediately) {
  NewTask t;
  t.id = TaskId{"once"};
  t.max_retries = 0;
  ASSERT_TRUE(queue_->enqueue(std::move(t)).has_value());
  ASSERT_TRUE(claim_one().has_value());

  auto r = queue_->fail(TaskId{"once"}, "fatal");

  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->outcome, TaskOutcome::FailedPermanently);
  EXPECT_FALSE(r->retry_at.has_value());
}

TEST_F(TaskQueueTest, Fail_PendingTaskIsInvalidState) {
  auto id = submit("t1");

  auto r = queue_->fail(id, "nope");

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidState);
}

TEST_F(TaskQueueTest, BackoffDelay_IsMonotonicAndCapped) {
  auto previous = queue_->backoff_delay(0);
  EXPECT_EQ(previous.count(), config_.queue.retry_base_delay_ms);
  for (int n = 1; n < 80; ++n) {
    auto delay = queue_->backoff_delay(n);
    EXPECT_GE(delay, previous);
    EXPECT_LE(delay.count(), config_.queue.retry_max_delay_ms);
    previous = delay;
  }
  EXPECT_EQ(previous.count(), config_.queue.retry_max_delay_ms);
}

TEST_F(TaskQueueTest, Cancel_PendingTask) {
  auto id = submit("t1");

  ASSERT_TRUE(queue_->cancel(id).has_value());

  auto task = queue_->get_task(id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::Cancelled);
  EXPECT_TRUE(task->cancelled_at.has_value());
  EXPECT_FALSE(claim_one().has_value());
  EXPECT_EQ(events_.last("task.cancelled").payload["was_running"], false);
}

TEST_F(TaskQueueTest, Cancel_IsIdempotent) {
  auto id = submit("t1");

  ASSERT_TRUE(queue_->cancel(id).has_value());
  ASSERT_TRUE(queue_->cancel(id).has_value());

  EXPECT_EQ(events_.count("task.cancelled"), 1u);
}

TEST_F(TaskQueueTest, Cancel_RunningTaskReleasesWorker) {
  ASSERT_TRUE(workers_->register_worker(WorkerId{"w1"}, kStepCaps).has_value());
  auto id = submit("t1");
  ASSERT_TRUE(claim_one("w1").has_value());

  ASSERT_TRUE(queue_->cancel(id).has_value());

  auto task = queue_->get_task(id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::Cancelled);
  EXPECT_EQ(task->assigned_worker, WorkerId{"w1"});
  EXPECT_EQ(events_.last("task.cancelled").payload["was_running"], true);

  auto worker = workers_->get_worker(WorkerId{"w1"});
  ASSERT_TRUE(worker.has_value());
  EXPECT_TRUE(worker->current_tasks.empty());
  EXPECT_EQ(worker->tasks_completed, 0);
  EXPECT_EQ(worker->tasks_failed, 0);

  auto late = queue_->complete(id);
  ASSERT_FALSE(late.has_value());
  EXPECT_EQ(late.error(), Error::InvalidState);
}

TEST_F(TaskQueueTest, Cancel_CompletedTaskIsInvalidState) {
  auto id = submit("t1");
  ASSERT_TRUE(claim_one().has_value());
  ASSERT_TRUE(queue_->complete(id).has_value());

  auto r = queue_->cancel(id);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidState);
}

TEST_F(TaskQueueTest, Cancel_UnknownTaskIsNotFound) {
  auto r = queue_->cancel(TaskId{"missing"});

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::NotFound);
}

TEST_F(TaskQueueTest, Pause_StopsClaimsButNotCompletion) {
  auto running = submit("running");
  ASSERT_TRUE(claim_one().has_value());
  submit("waiting");

  queue_->pause();
  EXPECT_TRUE(queue_->is_paused());
  EXPECT_FALSE(claim_one().has_value());

  ASSERT_TRUE(queue_->complete(running).has_value());
  auto stats = queue_->stats();
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->running, 0);
  EXPECT_EQ(stats->pending, 1);

  queue_->resume();
  auto task = claim_one();
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->id, TaskId{"waiting"});
}

TEST_F(TaskQueueTest, Stats_CountsAndAverageDuration) {
  auto a = submit("a");
  auto b = submit("b");
  submit("c");
  auto d = submit("d");
  ASSERT_TRUE(queue_->cancel(d).has_value());

  ASSERT_TRUE(claim_one().has_value());
  clock_.advance(100ms);
  ASSERT_TRUE(queue_->complete(a).has_value());
  ASSERT_TRUE(claim_one().has_value());
  clock_.advance(300ms);
  ASSERT_TRUE(queue_->complete(b).has_value());

  auto stats = queue_->stats();
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->pending, 1);
  EXPECT_EQ(stats->running, 0);
  EXPECT_EQ(stats->completed, 2);
  EXPECT_EQ(stats->cancelled, 1);
  EXPECT_EQ(stats->total(), 4);
  EXPECT_DOUBLE_EQ(stats->avg_duration_ms, 200.0);
}

TEST_F(TaskQueueTest, Stats_AverageDurationMeasuresFinalAttempt) {
  auto id = submit("retried");
  ASSERT_TRUE(claim_one().has_value());
  clock_.advance(1s);
  auto r = queue_->fail(id, "transient");
  ASSERT_TRUE(r.has_value());
  ASSERT_TRUE(r->retry_at.has_value());
  clock_.set(*r->retry_at);
  clock_.advance(5s);

  ASSERT_TRUE(claim_one().has_value());
  clock_.advance(150ms);
  ASSERT_TRUE(queue_->complete(id).has_value());

  auto stats = queue_->stats();
  ASSERT_TRUE(stats.has_value());
  EXPECT_DOUBLE_EQ(stats->avg_duration_ms, 150.0);
  auto task = queue_->get_task(id);
  ASSERT_TRUE(task.has_value());
  ASSERT_TRUE(task->started_at.has_value());
  EXPECT_LT(*task->started_at, clock_.now() - 150ms);
}

TEST_F(TaskQueueTest, ListTasks_FiltersByStatus) {
  submit("a");
  submit("b");
  ASSERT_TRUE(claim_one().has_value());

  TaskFilter filter;
  filter.status = TaskStatus::Running;
  auto running = queue_->list_tasks(filter);
  ASSERT_TRUE(running.has_value());
  ASSERT_EQ(running->size(), 1u);
  EXPECT_EQ((*running)[0].id, TaskId{"a"});

  auto all = queue_->list_tasks();
  ASSERT_TRUE(all.has_value());
  EXPECT_EQ(all->size(), 2u);
}

TEST_F(TaskQueueTest, CriticalEventFailure_SurfacesAuditFailed) {
  test::FailingEventSink sink({"task.completed"});
  make_queue(sink);
  auto id = submit("t1");
  ASSERT_TRUE(claim_one().has_value());

  auto r = queue_->complete(id);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::AuditFailed);
  EXPECT_EQ(queue_->get_task(id)->status, TaskStatus::Completed);
}

TEST_F(TaskQueueTest, BestEffortEventFailure_IsIgnored) {
  test::FailingEventSink sink({"task.enqueued", "task.claimed"});
  make_queue(sink);

  auto id = submit("t1");
  ASSERT_FALSE(id.empty());
  EXPECT_TRUE(claim_one().has_value());
  EXPECT_EQ(sink.rejected(), 2);
}

TEST_F(TaskQueueTest, EventTags_CarryWorkflowCorrelation) {
  NewTask t;
  t.id = TaskId{"t1"};
  t.workflow_id = WorkflowId{"wf-1"};
  t.step = 3;
  ASSERT_TRUE(queue_->enqueue(std::move(t)).has_value());

  auto event = events_.last("task.enqueued");
  EXPECT_EQ(event.tags["workflow_id"], "wf-1");
  EXPECT_EQ(event.tags["step"], "3");
  EXPECT_EQ(event.tags["task_type"], "workflow-step");
}

TEST_F(TaskQueueTest, State_SurvivesReopen) {
  auto id = submit("durable", 7);
  queue_.reset();
  workers_.reset();
  db_->close();

  db_ = std::make_unique<Database>(config_.storage);
  ASSERT_TRUE(db_->open().has_value());
  make_queue(events_);

  auto task = queue_->get_task(id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->priority, 7);
  EXPECT_EQ(task->status, TaskStatus::Pending);
}

TEST(NewTaskTest, FromJson_ParsesSubmission) {
  auto j = nlohmann::json::parse(R"({
    "type": "quality-gate",
    "priority": 4,
    "max_retries": 1,
    "required_tags": ["linux"],
    "workflow_id": "wf-9",
    "step": 2,
    "payload": {"gate": "lint"}
  })");

  auto task = NewTask::from_json(j);

  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->type, TaskType::QualityGate);
  EXPECT_EQ(task->priority, 4);
  EXPECT_EQ(task->max_retries, 1);
  EXPECT_EQ(task->required_tags, std::vector<std::string>{"linux"});
  EXPECT_EQ(task->workflow_id, WorkflowId{"wf-9"});
  EXPECT_EQ(task->step, 2);
  EXPECT_EQ(task->payload["gate"], "lint");
  EXPECT_FALSE(task->id.has_value());
}

TEST(NewTaskTest, FromJson_RejectsMalformedSubmission) {
  auto missing_priority =
      NewTask::from_json(nlohmann::json{{"type", "workflow-step"}});
  ASSERT_FALSE(missing_priority.has_value());
  EXPECT_EQ(missing_priority.error(), Error::ValidationFailed);

  auto unknown_type = NewTask::from_json(
      nlohmann::json{{"type", "deploy"}, {"priority", 1}});
  ASSERT_FALSE(unknown_type.has_value());
  EXPECT_EQ(unknown_type.error(), Error::ValidationFailed);

  auto huge_priority = NewTask::from_json(nlohmann::json{
      {"type", "workflow-step"}, {"priority", std::int64_t{1} << 40}});
  ASSERT_FALSE(huge_priority.has_value());
  EXPECT_EQ(huge_priority.error(), Error::ValidationFailed);

  auto huge_step = NewTask::from_json(nlohmann::json{
      {"type", "workflow-step"}, {"priority", 1},
      {"step", std::uint64_t{1} << 33}});
  ASSERT_FALSE(huge_step.has_value());
  EXPECT_EQ(huge_step.error(), Error::ValidationFailed);

  auto bad_tags = NewTask::from_json(nlohmann::json{
      {"type", "git-operation"}, {"priority", 1}, {"required_tags", "gpu"}});
  ASSERT_FALSE(bad_tags.has_value());
  EXPECT_EQ(bad_tags.error(), Error::ValidationFailed);
}
