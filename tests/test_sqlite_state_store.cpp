#include <gtest/gtest.h>

#include "infra/sqlite_state_store.h"
#include "test_support.h"

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

using namespace convoy::core;
using convoy::infra::SqliteStateStore;
using convoy::testing::make_item;
using convoy::testing::make_memory_store;
using convoy::testing::make_milestone;

namespace {

class SqliteStateStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_ = make_memory_store();
    ASSERT_NE(store_, nullptr);
  }

  WorkItem must_get(const std::string &id) {
    auto got = store_->get_work_item(id);
    EXPECT_TRUE(got.is_ok());
    EXPECT_TRUE(got.value().has_value()) << id;
    return got.value().value_or(WorkItem{});
  }

  std::shared_ptr<SqliteStateStore> store_;
};

ExecutorRecord running_executor(const std::string &id,
                                const std::string &item = "a") {
  ExecutorRecord record;
  record.id = id;
  record.kind = "implementer";
  record.status = ExecutorStatus::Running;
  record.current_work_item = item;
  record.started_at = Clock::now();
  record.last_activity = Clock::now();
  return record;
}

} // namespace

// ============================================================
// Test: Work item CRUD
// ============================================================

TEST_F(SqliteStateStoreTest, CreateAndGetWorkItem) {
  auto w = make_item("a", "m1", {"x", "y"});
  w.metadata = {{"file", "src/main.cpp"}, {"owner", "core"}};
  ASSERT_TRUE(store_->create_work_item(w).is_ok());

  auto got = must_get("a");
  EXPECT_EQ(got.milestone_id, "m1");
  EXPECT_EQ(got.description, "implement a");
  EXPECT_EQ(got.status, WorkItemStatus::Pending);
  EXPECT_EQ(got.dependencies, (std::vector<std::string>{"x", "y"}));
  EXPECT_EQ(got.metadata.at("file"), "src/main.cpp");
  EXPECT_EQ(got.retry_count, 0);
  EXPECT_FALSE(got.assigned_executor.has_value());
  EXPECT_NE(got.created_at, TimePoint{});
}

TEST_F(SqliteStateStoreTest, MissingWorkItemIsEmptyNotError) {
  auto got = store_->get_work_item("nope");
  ASSERT_TRUE(got.is_ok());
  EXPECT_FALSE(got.value().has_value());
}

TEST_F(SqliteStateStoreTest, DuplicateWorkItemRejected) {
  ASSERT_TRUE(store_->create_work_item(make_item("a")).is_ok());
  auto again = store_->create_work_item(make_item("a"));
  ASSERT_TRUE(again.is_err());
  EXPECT_EQ(again.error().category, ErrorCategory::Validation);
}

TEST_F(SqliteStateStoreTest, ListsKeepCreationOrder) {
  for (const char *id : {"c", "a", "b"}) {
    ASSERT_TRUE(store_->create_work_item(make_item(id)).is_ok());
  }
  ASSERT_TRUE(store_->create_work_item(make_item("z", "m2")).is_ok());

  auto all = store_->list_work_items();
  ASSERT_TRUE(all.is_ok());
  ASSERT_EQ(all.value().size(), 4u);
  EXPECT_EQ(all.value()[0].id, "c");
  EXPECT_EQ(all.value()[3].id, "z");

  auto m1 = store_->list_work_items_by_milestone("m1");
  ASSERT_TRUE(m1.is_ok());
  ASSERT_EQ(m1.value().size(), 3u);
  EXPECT_EQ(m1.value()[1].id, "a");

  auto by_ids = store_->list_work_items_by_ids({"z", "missing", "c"});
  ASSERT_TRUE(by_ids.is_ok());
  ASSERT_EQ(by_ids.value().size(), 2u);
  EXPECT_EQ(by_ids.value()[0].id, "z");
  EXPECT_EQ(by_ids.value()[1].id, "c");
}

TEST_F(SqliteStateStoreTest, ListByStatus) {
  ASSERT_TRUE(store_->create_work_item(make_item("a")).is_ok());
  ASSERT_TRUE(store_->create_work_item(make_item("b")).is_ok());
  ASSERT_TRUE(
      store_->update_work_item_status("b", WorkItemStatus::InProgress, "worker-001")
          .is_ok());

  auto pending = store_->list_work_items_by_status(WorkItemStatus::Pending);
  ASSERT_TRUE(pending.is_ok());
  ASSERT_EQ(pending.value().size(), 1u);
  EXPECT_EQ(pending.value()[0].id, "a");
}

// ============================================================
// Test: Status transitions
// ============================================================

TEST_F(SqliteStateStoreTest, TransitionAssignsExecutor) {
  ASSERT_TRUE(store_->create_work_item(make_item("a")).is_ok());

  auto updated =
      store_->update_work_item_status("a", WorkItemStatus::InProgress, "worker-001");
  ASSERT_TRUE(updated.is_ok());
  EXPECT_EQ(updated.value().status, WorkItemStatus::InProgress);
  ASSERT_TRUE(updated.value().assigned_executor.has_value());
  EXPECT_EQ(*updated.value().assigned_executor, "worker-001");

  // Without an executor argument the assignment is kept.
  auto review = store_->update_work_item_status("a", WorkItemStatus::Review);
  ASSERT_TRUE(review.is_ok());
  EXPECT_EQ(review.value().assigned_executor.value_or(""), "worker-001");
}

TEST_F(SqliteStateStoreTest, BackToPendingClearsAssignment) {
  ASSERT_TRUE(store_->create_work_item(make_item("a")).is_ok());
  ASSERT_TRUE(
      store_->update_work_item_status("a", WorkItemStatus::InProgress, "worker-001")
          .is_ok());

  auto pending = store_->update_work_item_status("a", WorkItemStatus::Pending);
  ASSERT_TRUE(pending.is_ok());
  EXPECT_FALSE(pending.value().assigned_executor.has_value());
}

TEST_F(SqliteStateStoreTest, TerminalStatusIsNeverLeft) {
  ASSERT_TRUE(store_->create_work_item(make_item("a")).is_ok());
  ASSERT_TRUE(store_->update_work_item_status("a", WorkItemStatus::InProgress).is_ok());
  ASSERT_TRUE(store_->update_work_item_status("a", WorkItemStatus::Review).is_ok());
  ASSERT_TRUE(store_->update_work_item_status("a", WorkItemStatus::Merged).is_ok());

  auto back = store_->update_work_item_status("a", WorkItemStatus::Pending);
  ASSERT_TRUE(back.is_err());
  EXPECT_EQ(back.error().category, ErrorCategory::Internal);
  EXPECT_EQ(must_get("a").status, WorkItemStatus::Merged);
}

TEST_F(SqliteStateStoreTest, IllegalSkipIsRejected) {
  ASSERT_TRUE(store_->create_work_item(make_item("a")).is_ok());
  auto skip = store_->update_work_item_status("a", WorkItemStatus::Merged);
  ASSERT_TRUE(skip.is_err());
  EXPECT_EQ(skip.error().category, ErrorCategory::Internal);
  EXPECT_EQ(must_get("a").status, WorkItemStatus::Pending);
}

TEST_F(SqliteStateStoreTest, UnknownWorkItemIsNotFound) {
  auto updated = store_->update_work_item_status("ghost", WorkItemStatus::Blocked);
  ASSERT_TRUE(updated.is_err());
  EXPECT_EQ(updated.error().category, ErrorCategory::NotFound);

  auto retry = store_->increment_retry("ghost");
  ASSERT_TRUE(retry.is_err());
  EXPECT_EQ(retry.error().category, ErrorCategory::NotFound);
}

// ============================================================
// Test: Relative counters
// ============================================================

TEST_F(SqliteStateStoreTest, RetryCountIncrements) {
  ASSERT_TRUE(store_->create_work_item(make_item("a")).is_ok());
  EXPECT_EQ(store_->increment_retry("a").value(), 1);
  EXPECT_EQ(store_->increment_retry("a").value(), 2);
  EXPECT_EQ(must_get("a").retry_count, 2);
}

TEST_F(SqliteStateStoreTest, ConcurrentUsageUpdatesAreNotLost) {
  ASSERT_TRUE(store_->create_work_item(make_item("a")).is_ok());

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([this]() {
      for (int i = 0; i < 25; ++i) {
        EXPECT_TRUE(store_->add_work_item_usage("a", 2).is_ok());
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  EXPECT_EQ(must_get("a").resource_usage, 200);
}

TEST_F(SqliteStateStoreTest, NegativeUsageRejected) {
  ASSERT_TRUE(store_->create_work_item(make_item("a")).is_ok());
  auto r = store_->add_work_item_usage("a", -5);
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().category, ErrorCategory::Validation);
}

TEST_F(SqliteStateStoreTest, LastErrorIsKept) {
  ASSERT_TRUE(store_->create_work_item(make_item("a")).is_ok());
  ASSERT_TRUE(store_->record_work_item_error("a", "compile error").is_ok());
  EXPECT_EQ(must_get("a").last_error, "compile error");
}

// ============================================================
// Test: Milestones
// ============================================================

TEST_F(SqliteStateStoreTest, MilestonesOrderedByPhase) {
  ASSERT_TRUE(store_->create_milestone(make_milestone("late", 3)).is_ok());
  ASSERT_TRUE(store_->create_milestone(make_milestone("early", 1)).is_ok());
  ASSERT_TRUE(store_->create_milestone(make_milestone("middle", 2)).is_ok());

  auto list = store_->list_milestones();
  ASSERT_TRUE(list.is_ok());
  ASSERT_EQ(list.value().size(), 3u);
  EXPECT_EQ(list.value()[0].id, "early");
  EXPECT_EQ(list.value()[1].id, "middle");
  EXPECT_EQ(list.value()[2].id, "late");
}

TEST_F(SqliteStateStoreTest, MilestoneMembersReplaced) {
  auto m = make_milestone("m1", 1);
  m.member_ids = {"a"};
  m.estimated_resource = 5000;
  ASSERT_TRUE(store_->create_milestone(m).is_ok());
  ASSERT_TRUE(store_->set_milestone_members("m1", {"b", "c"}).is_ok());

  auto got = store_->get_milestone("m1");
  ASSERT_TRUE(got.is_ok());
  ASSERT_TRUE(got.value().has_value());
  EXPECT_EQ(got.value()->member_ids, (std::vector<std::string>{"b", "c"}));
  EXPECT_EQ(got.value()->estimated_resource, 5000);
}

TEST_F(SqliteStateStoreTest, MergedMilestoneKeepsItsStatus) {
  ASSERT_TRUE(store_->create_milestone(make_milestone("m1", 1)).is_ok());
  ASSERT_TRUE(
      store_->update_milestone_status("m1", WorkItemStatus::InProgress).is_ok());
  ASSERT_TRUE(store_->update_milestone_status("m1", WorkItemStatus::Merged).is_ok());
  EXPECT_TRUE(store_->update_milestone_status("m1", WorkItemStatus::Merged).is_ok());

  auto reopen = store_->update_milestone_status("m1", WorkItemStatus::Pending);
  ASSERT_TRUE(reopen.is_err());
  EXPECT_EQ(reopen.error().category, ErrorCategory::Internal);

  auto missing = store_->update_milestone_status("m9", WorkItemStatus::Merged);
  ASSERT_TRUE(missing.is_err());
  EXPECT_EQ(missing.error().category, ErrorCategory::NotFound);
}

// ============================================================
// Test: Executors
// ============================================================

TEST_F(SqliteStateStoreTest, RegisterExecutorIsAnUpsert) {
  ASSERT_TRUE(store_->register_executor(running_executor("worker-001")).is_ok());
  ASSERT_TRUE(store_->add_executor_usage("worker-001", 40).is_ok());

  auto again = running_executor("worker-001", "b");
  again.pid = 4242;
  ASSERT_TRUE(store_->register_executor(again).is_ok());

  auto all = store_->list_executors();
  ASSERT_TRUE(all.is_ok());
  ASSERT_EQ(all.value().size(), 1u);
  const auto &record = all.value()[0];
  EXPECT_EQ(record.current_work_item.value_or(""), "b");
  EXPECT_EQ(record.pid.value_or(0), 4242);
  EXPECT_EQ(record.resource_usage, 40);
  EXPECT_TRUE(record.started_at.has_value());
}

TEST_F(SqliteStateStoreTest, ExecutorStatusUpdate) {
  ASSERT_TRUE(store_->register_executor(running_executor("worker-001")).is_ok());
  ASSERT_TRUE(store_
                  ->update_executor_status("worker-001",
                                           ExecutorStatus::Terminated,
                                           std::nullopt)
                  .is_ok());

  auto got = store_->get_executor("worker-001");
  ASSERT_TRUE(got.is_ok());
  ASSERT_TRUE(got.value().has_value());
  EXPECT_EQ(got.value()->status, ExecutorStatus::Terminated);
  EXPECT_FALSE(got.value()->current_work_item.has_value());

  auto missing = store_->update_executor_status("worker-404",
                                                ExecutorStatus::Idle, std::nullopt);
  ASSERT_TRUE(missing.is_err());
  EXPECT_EQ(missing.error().category, ErrorCategory::NotFound);
}

// ============================================================
// Test: Logs
// ============================================================

TEST_F(SqliteStateStoreTest, LogsNewestFirstWithFilterAndLimit) {
  for (int i = 0; i < 5; ++i) {
    LogEntry entry;
    entry.executor_id = (i % 2 == 0) ? "worker-001" : "orchestrator";
    entry.message = "entry " + std::to_string(i);
    entry.metadata = {{"index", std::to_string(i)}};
    auto appended = store_->append_log(entry);
    ASSERT_TRUE(appended.is_ok());
    EXPECT_GT(appended.value(), 0);
  }

  auto all = store_->list_logs(std::nullopt);
  ASSERT_TRUE(all.is_ok());
  ASSERT_EQ(all.value().size(), 5u);
  EXPECT_EQ(all.value()[0].message, "entry 4");
  EXPECT_EQ(all.value()[0].metadata.at("index"), "4");
  EXPECT_EQ(all.value()[0].level, "INFO");

  auto worker = store_->list_logs(std::string("worker-001"), 2);
  ASSERT_TRUE(worker.is_ok());
  ASSERT_EQ(worker.value().size(), 2u);
  EXPECT_EQ(worker.value()[0].message, "entry 4");
  EXPECT_EQ(worker.value()[1].message, "entry 2");
}

// ============================================================
// Test: Crash recovery sweep
// ============================================================

TEST_F(SqliteStateStoreTest, CleanupReadmitsInProgressItems) {
  ASSERT_TRUE(store_->create_work_item(make_item("a")).is_ok());
  ASSERT_TRUE(store_->create_work_item(make_item("b")).is_ok());
  ASSERT_TRUE(store_->create_work_item(make_item("c")).is_ok());
  ASSERT_TRUE(
      store_->update_work_item_status("a", WorkItemStatus::InProgress, "worker-001")
          .is_ok());
  ASSERT_TRUE(store_->update_work_item_status("b", WorkItemStatus::Blocked).is_ok());
  ASSERT_TRUE(store_->register_executor(running_executor("worker-001")).is_ok());

  auto swept = store_->cleanup_stale_states();
  ASSERT_TRUE(swept.is_ok());
  EXPECT_EQ(swept.value(), 2); // One executor, one work item

  auto a = must_get("a");
  EXPECT_EQ(a.status, WorkItemStatus::Pending);
  EXPECT_FALSE(a.assigned_executor.has_value());
  EXPECT_EQ(must_get("b").status, WorkItemStatus::Blocked);
  EXPECT_EQ(must_get("c").status, WorkItemStatus::Pending);
  EXPECT_EQ(store_->get_executor("worker-001").value()->status,
            ExecutorStatus::Idle);
}

TEST_F(SqliteStateStoreTest, CleanupIsIdempotent) {
  ASSERT_TRUE(store_->create_work_item(make_item("a")).is_ok());
  ASSERT_TRUE(
      store_->update_work_item_status("a", WorkItemStatus::InProgress, "worker-001")
          .is_ok());

  ASSERT_EQ(store_->cleanup_stale_states().value(), 1);
  auto second = store_->cleanup_stale_states();
  ASSERT_TRUE(second.is_ok());
  EXPECT_EQ(second.value(), 0);
  EXPECT_EQ(must_get("a").status, WorkItemStatus::Pending);
  EXPECT_FALSE(must_get("a").assigned_executor.has_value());
}

// ============================================================
// Test: Statistics and reset
// ============================================================

TEST_F(SqliteStateStoreTest, StatisticsReportLargerResourceSum) {
  ASSERT_TRUE(store_->create_work_item(make_item("a")).is_ok());
  ASSERT_TRUE(store_->create_work_item(make_item("b")).is_ok());
  ASSERT_TRUE(store_->update_work_item_status("b", WorkItemStatus::Blocked).is_ok());
  ASSERT_TRUE(store_->add_work_item_usage("a", 100).is_ok());
  ASSERT_TRUE(store_->register_executor(running_executor("worker-001")).is_ok());
  ASSERT_TRUE(store_->add_executor_usage("worker-001", 150).is_ok());

  auto stats = store_->statistics();
  ASSERT_TRUE(stats.is_ok());
  EXPECT_EQ(stats.value().work_items.at("PENDING"), 1);
  EXPECT_EQ(stats.value().work_items.at("BLOCKED"), 1);
  EXPECT_EQ(stats.value().executors.at("RUNNING"), 1);
  EXPECT_EQ(stats.value().work_item_resource, 100);
  EXPECT_EQ(stats.value().executor_resource, 150);
  EXPECT_EQ(stats.value().total_resource, 150);
}

TEST_F(SqliteStateStoreTest, ClearAllDeletesEverything) {
  ASSERT_TRUE(store_->create_work_item(make_item("a", "m1", {"x"})).is_ok());
  ASSERT_TRUE(store_->create_milestone(make_milestone("m1", 1)).is_ok());
  ASSERT_TRUE(store_->register_executor(running_executor("worker-001")).is_ok());
  ASSERT_TRUE(store_->append_log(LogEntry{}).is_ok());

  ASSERT_TRUE(store_->clear_all().is_ok());
  EXPECT_TRUE(store_->list_work_items().value().empty());
  EXPECT_TRUE(store_->list_milestones().value().empty());
  EXPECT_TRUE(store_->list_executors().value().empty());
  EXPECT_TRUE(store_->list_logs(std::nullopt).value().empty());

  // Ids are free again.
  EXPECT_TRUE(store_->create_work_item(make_item("a")).is_ok());
  EXPECT_TRUE(must_get("a").dependencies.empty());
}

// ============================================================
// Test: Durability across reopen
// ============================================================

TEST(SqliteStateStoreFile, StateSurvivesReopen) {
  const auto path = std::filesystem::temp_directory_path() /
                    ("convoy_store_test_" +
                     std::to_string(std::chrono::steady_clock::now()
                                        .time_since_epoch()
                                        .count()) +
                     ".db");
  {
    auto opened = SqliteStateStore::open(path.string());
    ASSERT_TRUE(opened.is_ok());
    auto store = opened.value();
    ASSERT_TRUE(store->create_milestone(make_milestone("m1", 1)).is_ok());
    ASSERT_TRUE(store->create_work_item(make_item("a", "m1", {"z"})).is_ok());
    ASSERT_TRUE(
        store->update_work_item_status("a", WorkItemStatus::InProgress, "worker-001")
            .is_ok());
  }
  {
    auto opened = SqliteStateStore::open(path.string());
    ASSERT_TRUE(opened.is_ok());
    auto store = opened.value();
    auto a = store->get_work_item("a");
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(a.value().has_value());
    EXPECT_EQ(a.value()->status, WorkItemStatus::InProgress);
    EXPECT_EQ(a.value()->dependencies, (std::vector<std::string>{"z"}));
    EXPECT_EQ(store->cleanup_stale_states().value(), 1);
    EXPECT_EQ(store->list_milestones().value().size(), 1u);
  }

  std::error_code ec;
  std::filesystem::remove(path, ec);
  std::filesystem::remove(path.string() + "-wal", ec);
  std::filesystem::remove(path.string() + "-shm", ec);
}

TEST(SqliteStateStoreFile, UnopenablePathIsPersistenceError) {
  auto opened = SqliteStateStore::open("/nonexistent-dir/convoy/state.db");
  ASSERT_TRUE(opened.is_err());
  EXPECT_EQ(opened.error().category, ErrorCategory::Persistence);
}
