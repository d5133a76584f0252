#include <gtest/gtest.h>

#include "core/task_scheduler.h"
#include "test_support.h"

#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

using namespace convoy::core;
using convoy::testing::EventLog;
using convoy::testing::ExecutionLab;
using convoy::testing::executor_factory;
using convoy::testing::FakeReviewer;
using convoy::testing::make_item;
using convoy::testing::make_memory_store;
using convoy::testing::RecordingLogger;
using convoy::testing::wait_until;

namespace {

class TaskSchedulerTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_ = make_memory_store();
    ASSERT_NE(store_, nullptr);
    lab_ = std::make_shared<ExecutionLab>();
    logger_ = std::make_shared<RecordingLogger>();
    events_ = std::make_shared<EventBus>(logger_);
    machine_ = std::make_shared<PipelineStateMachine>();
    cancel_ = CancelToken::create();
    log_.attach(*events_);
    ASSERT_TRUE(machine_->transition_to(PipelineState::Executing).is_ok());
  }

  void TearDown() override {
    // Let abandoned executions finish before the fixture goes away.
    cancel_->request_cancel();
    scheduler_.reset();
    pool_.reset();
  }

  void build(int capacity, SchedulerConfig config = SchedulerConfig{},
             std::shared_ptr<IReviewer> reviewer = nullptr) {
    config.poll_interval = std::chrono::milliseconds(10);
    pool_ = std::make_shared<WorkerPool>(capacity, executor_factory(lab_), store_,
                                         logger_, std::chrono::milliseconds(200));
    scheduler_ = std::make_unique<TaskScheduler>(config, store_, pool_, events_,
                                                 machine_, std::move(reviewer),
                                                 cancel_, logger_);
  }

  std::vector<WorkItem> persist(const std::vector<WorkItem> &items) {
    for (const auto &item : items) {
      EXPECT_TRUE(store_->create_work_item(item).is_ok()) << item.id;
    }
    std::vector<std::string> ids;
    for (const auto &item : items) {
      ids.push_back(item.id);
    }
    return store_->list_work_items_by_ids(ids).value();
  }

  WorkItem stored(const std::string &id) {
    auto got = store_->get_work_item(id);
    EXPECT_TRUE(got.is_ok());
    return got.value().value_or(WorkItem{});
  }

  std::future<Result<MilestoneOutcome, Error>>
  run_async(const std::vector<WorkItem> &items) {
    return std::async(std::launch::async,
                      [this, items]() { return scheduler_->run(items); });
  }

  std::shared_ptr<convoy::infra::SqliteStateStore> store_;
  std::shared_ptr<ExecutionLab> lab_;
  std::shared_ptr<RecordingLogger> logger_;
  std::shared_ptr<EventBus> events_;
  std::shared_ptr<PipelineStateMachine> machine_;
  std::shared_ptr<CancelToken> cancel_;
  std::shared_ptr<WorkerPool> pool_;
  std::unique_ptr<TaskScheduler> scheduler_;
  EventLog log_;
};

} // namespace

// ============================================================
// Test: Basic scheduling
// ============================================================

TEST_F(TaskSchedulerTest, RunsEveryItemToMerged) {
  build(2);
  auto items = persist({make_item("a"), make_item("b"), make_item("c")});

  auto outcome = scheduler_->run(items);
  ASSERT_TRUE(outcome.is_ok());
  EXPECT_EQ(outcome.value().completed.size(), 3u);
  EXPECT_TRUE(outcome.value().failed.empty());

  for (const char *id : {"a", "b", "c"}) {
    EXPECT_EQ(stored(id).status, WorkItemStatus::Merged) << id;
    EXPECT_EQ(stored(id).retry_count, 0) << id;
  }
  EXPECT_EQ(log_.count(EventType::TaskStarted), 3);
  EXPECT_EQ(log_.count(EventType::TaskCompleted), 3);
  EXPECT_EQ(pool_->active_count(), 0);
  EXPECT_EQ(scheduler_->completed().size(), 3u);
}

TEST_F(TaskSchedulerTest, EmptyMilestoneFinishesImmediately) {
  build(1);
  auto outcome = scheduler_->run({});
  ASSERT_TRUE(outcome.is_ok());
  EXPECT_TRUE(outcome.value().completed.empty());
  EXPECT_EQ(lab_->created.load(), 0);
}

TEST_F(TaskSchedulerTest, PoolBoundIsNeverExceeded) {
  lab_->delay = std::chrono::milliseconds(20);
  build(2);
  std::vector<WorkItem> items;
  for (int i = 0; i < 7; ++i) {
    items.push_back(make_item("t" + std::to_string(i)));
  }
  auto outcome = scheduler_->run(persist(items));

  ASSERT_TRUE(outcome.is_ok());
  EXPECT_EQ(outcome.value().completed.size(), 7u);
  EXPECT_LE(lab_->max_running.load(), 2);
  EXPECT_GE(lab_->max_running.load(), 1);
}

TEST_F(TaskSchedulerTest, FastItemFreesSlotWhileSlowSiblingRuns) {
  build(2);
  lab_->hold("slow");
  auto items = persist({make_item("slow"), make_item("fast1"), make_item("fast2")});

  auto running = run_async(items);
  // With two slots, fast2 can only start after fast1 finished.
  ASSERT_TRUE(wait_until([this]() { return lab_->has_finished("fast2"); }));
  EXPECT_FALSE(lab_->has_finished("slow"));

  lab_->release("slow");
  ASSERT_EQ(running.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_TRUE(running.get().is_ok());
}

TEST_F(TaskSchedulerTest, ResourceUsageIsAccounted) {
  lab_->resource_per_run = 25;
  build(1);
  auto outcome = scheduler_->run(persist({make_item("a")}));
  ASSERT_TRUE(outcome.is_ok());

  EXPECT_EQ(stored("a").resource_usage, 25);
  auto executor = store_->get_executor("worker-001");
  ASSERT_TRUE(executor.is_ok());
  ASSERT_TRUE(executor.value().has_value());
  EXPECT_EQ(executor.value()->resource_usage, 25);
  EXPECT_EQ(executor.value()->status, ExecutorStatus::Terminated);
}

// ============================================================
// Test: Dependency ordering
// ============================================================

TEST_F(TaskSchedulerTest, DependentStartsOnlyAfterDependencyCompleted) {
  build(3);
  auto items = persist({make_item("b", "m1", {"a"}), make_item("a")});

  auto outcome = scheduler_->run(items);
  ASSERT_TRUE(outcome.is_ok());

  const int a_finished = lab_->journal_index("finish:a");
  const int b_started = lab_->journal_index("start:b");
  ASSERT_GE(a_finished, 0);
  ASSERT_GE(b_started, 0);
  EXPECT_LT(a_finished, b_started);
  EXPECT_EQ(stored("b").status, WorkItemStatus::Merged);
}

TEST_F(TaskSchedulerTest, DiamondDependencies) {
  build(4);
  auto items = persist({make_item("root"), make_item("left", "m1", {"root"}),
                        make_item("right", "m1", {"root"}),
                        make_item("join", "m1", {"left", "right"})});

  ASSERT_TRUE(scheduler_->run(items).is_ok());
  EXPECT_LT(lab_->journal_index("finish:left"), lab_->journal_index("start:join"));
  EXPECT_LT(lab_->journal_index("finish:right"), lab_->journal_index("start:join"));
}

TEST_F(TaskSchedulerTest, CompletedSetCrossesMilestones) {
  build(1);
  scheduler_->mark_completed("earlier");
  auto outcome = scheduler_->run(persist({make_item("b", "m2", {"earlier"})}));
  ASSERT_TRUE(outcome.is_ok());
  EXPECT_EQ(stored("b").status, WorkItemStatus::Merged);
}

// ============================================================
// Test: Retry & escalation
// ============================================================

TEST_F(TaskSchedulerTest, EscalatesAfterMaxRetries) {
  lab_->outcomes["a"] = {false, false, false};
  build(1);

  auto outcome = scheduler_->run(persist({make_item("a")}));
  ASSERT_TRUE(outcome.is_ok());
  EXPECT_EQ(outcome.value().failed, (std::vector<std::string>{"a"}));

  auto a = stored("a");
  EXPECT_EQ(a.status, WorkItemStatus::Blocked);
  EXPECT_EQ(a.retry_count, 3);
  EXPECT_NE(a.last_error.find("attempt 3"), std::string::npos);
  EXPECT_EQ(lab_->attempts_of("a"), 3);

  auto escalations = log_.of(EventType::Escalation);
  ASSERT_EQ(escalations.size(), 1u);
  EXPECT_EQ(escalations[0].subject_id, "a");
  EXPECT_EQ(escalations[0].data.at("reason"), "Max retries exceeded");
  EXPECT_EQ(escalations[0].data.at("retry_count"), "3");
  EXPECT_EQ(log_.count(EventType::TaskFailed), 3);
  EXPECT_EQ(scheduler_->failed().count("a"), 1u);
}

TEST_F(TaskSchedulerTest, FailOnceThenSucceed) {
  lab_->outcomes["a"] = {false, true};
  build(1);

  auto outcome = scheduler_->run(persist({make_item("a")}));
  ASSERT_TRUE(outcome.is_ok());

  auto a = stored("a");
  EXPECT_EQ(a.status, WorkItemStatus::Merged);
  EXPECT_EQ(a.retry_count, 1);
  EXPECT_EQ(log_.count(EventType::Escalation), 0);
}

TEST_F(TaskSchedulerTest, ConfiguredRetryLimitIsHonored) {
  lab_->outcomes["a"] = {false, false, false, false, false};
  SchedulerConfig config;
  config.max_retries = 5;
  build(1, config);

  ASSERT_TRUE(scheduler_->run(persist({make_item("a")})).is_ok());
  EXPECT_EQ(stored("a").retry_count, 5);
  EXPECT_EQ(stored("a").status, WorkItemStatus::Blocked);
}

TEST_F(TaskSchedulerTest, ExecutorExceptionIsAnOrdinaryFailure) {
  lab_->throwing.insert("a");
  SchedulerConfig config;
  config.max_retries = 1;
  build(1, config);

  auto outcome = scheduler_->run(persist({make_item("a"), make_item("b")}));
  ASSERT_TRUE(outcome.is_ok());
  EXPECT_EQ(stored("a").status, WorkItemStatus::Blocked);
  EXPECT_NE(stored("a").last_error.find("executor threw"), std::string::npos);
  EXPECT_EQ(stored("b").status, WorkItemStatus::Merged);
}

TEST_F(TaskSchedulerTest, DependentOfEscalatedItemStalls) {
  lab_->outcomes["a"] = {false};
  SchedulerConfig config;
  config.max_retries = 1;
  config.stall_policy = StallPolicy::Abandon;
  build(1, config);

  auto outcome = scheduler_->run(persist({make_item("a"), make_item("b", "m1", {"a"})}));
  ASSERT_TRUE(outcome.is_ok());
  EXPECT_EQ(outcome.value().stalled, (std::vector<std::string>{"b"}));
  EXPECT_EQ(stored("b").status, WorkItemStatus::Pending);
  EXPECT_FALSE(lab_->has_started("b"));
}

// ============================================================
// Test: Review sub-phase
// ============================================================

TEST_F(TaskSchedulerTest, ReviewRejectionCountsAsFailure) {
  auto reviewer = std::make_shared<FakeReviewer>();
  reviewer->rejections["a"] = 1;
  build(1, SchedulerConfig{}, reviewer);

  auto outcome = scheduler_->run(persist({make_item("a")}));
  ASSERT_TRUE(outcome.is_ok());

  auto a = stored("a");
  EXPECT_EQ(a.status, WorkItemStatus::Merged);
  EXPECT_EQ(a.retry_count, 1);
  EXPECT_NE(a.last_error.find("review rejected: needs tests"), std::string::npos);
  EXPECT_EQ(reviewer->calls.load(), 2);
  EXPECT_EQ(log_.count(EventType::ReviewStarted), 2);
  EXPECT_EQ(log_.count(EventType::ReviewCompleted), 2);
  EXPECT_EQ(machine_->state(), PipelineState::Executing);
}

TEST_F(TaskSchedulerTest, ReviewerExceptionAbortsTheLoop) {
  auto reviewer = std::make_shared<FakeReviewer>();
  reviewer->throw_on.insert("a");
  build(1, SchedulerConfig{}, reviewer);

  auto outcome = scheduler_->run(persist({make_item("a"), make_item("b", "m1", {"a"})}));
  ASSERT_TRUE(outcome.is_err());
  EXPECT_EQ(outcome.error().category, ErrorCategory::Execution);
  EXPECT_NE(outcome.error().message.find("reviewer crashed"), std::string::npos);
  EXPECT_FALSE(lab_->has_started("b"));
}

TEST_F(TaskSchedulerTest, FailedExecutionIsNotReviewed) {
  auto reviewer = std::make_shared<FakeReviewer>();
  lab_->outcomes["a"] = {false};
  build(1, SchedulerConfig{}, reviewer);

  ASSERT_TRUE(scheduler_->run(persist({make_item("a")})).is_ok());
  EXPECT_EQ(lab_->attempts_of("a"), 2);
  EXPECT_EQ(reviewer->calls.load(), 1);
}

// ============================================================
// Test: Terminal monotonicity and re-admission
// ============================================================

TEST_F(TaskSchedulerTest, TerminalItemsAreNeverRescheduled) {
  build(2);
  auto merged = make_item("merged");
  merged.status = WorkItemStatus::Merged;
  auto blocked = make_item("blocked");
  blocked.status = WorkItemStatus::Blocked;
  auto failed = make_item("failed");
  failed.status = WorkItemStatus::Failed;
  auto items = persist({merged, blocked, failed, make_item("next", "m1", {"merged"})});

  auto outcome = scheduler_->run(items);
  ASSERT_TRUE(outcome.is_ok());

  EXPECT_EQ(stored("merged").status, WorkItemStatus::Merged);
  EXPECT_EQ(stored("blocked").status, WorkItemStatus::Blocked);
  EXPECT_EQ(stored("failed").status, WorkItemStatus::Failed);
  EXPECT_EQ(stored("next").status, WorkItemStatus::Merged);
  EXPECT_EQ(lab_->started_order(), (std::vector<std::string>{"next"}));
}

TEST_F(TaskSchedulerTest, ItemLeftInReviewIsRunAgain) {
  build(1);
  auto interrupted = make_item("a");
  interrupted.status = WorkItemStatus::Review;
  auto outcome = scheduler_->run(persist({interrupted}));

  ASSERT_TRUE(outcome.is_ok());
  EXPECT_EQ(lab_->attempts_of("a"), 1);
  EXPECT_EQ(stored("a").status, WorkItemStatus::Merged);
}

TEST_F(TaskSchedulerTest, ItemLeftInProgressIsRunAgain) {
  build(1);
  auto interrupted = make_item("a");
  interrupted.status = WorkItemStatus::InProgress;
  interrupted.assigned_executor = "worker-009";
  auto outcome = scheduler_->run(persist({interrupted}));

  ASSERT_TRUE(outcome.is_ok());
  EXPECT_EQ(lab_->attempts_of("a"), 1);
  EXPECT_EQ(stored("a").status, WorkItemStatus::Merged);
  EXPECT_TRUE(logger_->saw("work_item_readmitted"));
}

TEST_F(TaskSchedulerTest, ItemsMissingFromTheStoreAreSkipped) {
  build(1);
  auto outcome = scheduler_->run({make_item("never-persisted")});
  ASSERT_TRUE(outcome.is_ok());
  EXPECT_EQ(lab_->created.load(), 0);
  EXPECT_TRUE(logger_->saw("unknown_work_item"));
}

// ============================================================
// Test: Pause semantics
// ============================================================

TEST_F(TaskSchedulerTest, PauseLetsInFlightFinishButAdmitsNothing) {
  build(3);
  lab_->hold("a");
  auto items = persist({make_item("a"), make_item("b", "m1", {"a"}),
                        make_item("c", "m1", {"a"})});

  auto running = run_async(items);
  ASSERT_TRUE(wait_until([this]() { return lab_->has_started("a"); }));

  machine_->pause();
  lab_->release("a");
  ASSERT_TRUE(wait_until(
      [this]() { return stored("a").status == WorkItemStatus::Merged; }));

  // b and c are ready now, but the gate is closed.
  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  EXPECT_FALSE(lab_->has_started("b"));
  EXPECT_FALSE(lab_->has_started("c"));
  EXPECT_EQ(stored("b").status, WorkItemStatus::Pending);
  EXPECT_EQ(running.wait_for(std::chrono::milliseconds(0)),
            std::future_status::timeout);

  machine_->resume();
  ASSERT_EQ(running.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  ASSERT_TRUE(running.get().is_ok());
  EXPECT_EQ(stored("b").status, WorkItemStatus::Merged);
  EXPECT_EQ(stored("c").status, WorkItemStatus::Merged);
}

// ============================================================
// Test: Stalls (cycles and forward references)
// ============================================================

TEST_F(TaskSchedulerTest, ForwardReferenceStallsUntilShutdown) {
  // Known stall: a dependency on an item that is never created can never
  // be satisfied. The default policy keeps waiting.
  build(1);
  auto items = persist({make_item("a", "m1", {"not-yet-created"})});

  auto running = run_async(items);
  EXPECT_EQ(running.wait_for(std::chrono::milliseconds(200)),
            std::future_status::timeout);
  EXPECT_EQ(stored("a").status, WorkItemStatus::Pending);
  EXPECT_TRUE(logger_->saw("milestone_stalled"));

  cancel_->request_cancel();
  ASSERT_EQ(running.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  auto outcome = running.get();
  ASSERT_TRUE(outcome.is_err());
  EXPECT_EQ(outcome.error().category, ErrorCategory::Canceled);
  EXPECT_EQ(stored("a").status, WorkItemStatus::Pending);
  EXPECT_EQ(lab_->created.load(), 0);
}

TEST_F(TaskSchedulerTest, CycleIsAbandonedUnderAbandonPolicy) {
  SchedulerConfig config;
  config.stall_policy = StallPolicy::Abandon;
  build(2, config);
  auto items = persist({make_item("a", "m1", {"b"}), make_item("b", "m1", {"a"}),
                        make_item("free")});

  auto outcome = scheduler_->run(items);
  ASSERT_TRUE(outcome.is_ok());
  auto stalled = outcome.value().stalled;
  std::sort(stalled.begin(), stalled.end());
  EXPECT_EQ(stalled, (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(stored("a").status, WorkItemStatus::Pending);
  EXPECT_EQ(stored("free").status, WorkItemStatus::Merged);
}

// ============================================================
// Test: Cancellation
// ============================================================

TEST_F(TaskSchedulerTest, CancelLeavesInFlightItemForRecovery) {
  build(2);
  lab_->hold("a");
  auto items = persist({make_item("a"), make_item("b", "m1", {"a"})});

  auto running = run_async(items);
  ASSERT_TRUE(wait_until([this]() { return lab_->has_started("a"); }));

  cancel_->request_cancel();
  ASSERT_EQ(running.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  auto outcome = running.get();
  ASSERT_TRUE(outcome.is_err());
  EXPECT_EQ(outcome.error().category, ErrorCategory::Canceled);

  EXPECT_EQ(stored("a").status, WorkItemStatus::InProgress);
  EXPECT_FALSE(lab_->has_started("b"));

  ASSERT_TRUE(store_->cleanup_stale_states().is_ok());
  EXPECT_EQ(stored("a").status, WorkItemStatus::Pending);
  EXPECT_FALSE(stored("a").assigned_executor.has_value());
}
