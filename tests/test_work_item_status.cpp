#include <gtest/gtest.h>

#include "core/work_item.h"

#include <initializer_list>

using namespace convoy::core;

namespace {

const std::initializer_list<WorkItemStatus> kAllStatuses = {
    WorkItemStatus::Pending, WorkItemStatus::InProgress, WorkItemStatus::Review,
    WorkItemStatus::Merged,  WorkItemStatus::Failed,     WorkItemStatus::Blocked};

} // namespace

// ============================================================
// Test: Persisted names
// ============================================================

TEST(WorkItemStatus, PersistedNames) {
  EXPECT_STREQ(to_string(WorkItemStatus::Pending), "PENDING");
  EXPECT_STREQ(to_string(WorkItemStatus::InProgress), "IN_PROGRESS");
  EXPECT_STREQ(to_string(WorkItemStatus::Review), "REVIEW");
  EXPECT_STREQ(to_string(WorkItemStatus::Merged), "MERGED");
  EXPECT_STREQ(to_string(WorkItemStatus::Failed), "FAILED");
  EXPECT_STREQ(to_string(WorkItemStatus::Blocked), "BLOCKED");
}

TEST(WorkItemStatus, ParseAcceptsEveryPersistedName) {
  for (auto status : kAllStatuses) {
    auto parsed = parse_work_item_status(to_string(status));
    ASSERT_TRUE(parsed.has_value()) << to_string(status);
    EXPECT_EQ(*parsed, status);
  }
}

TEST(WorkItemStatus, ParseRejectsUnknownNames) {
  EXPECT_FALSE(parse_work_item_status("pending").has_value());
  EXPECT_FALSE(parse_work_item_status("DONE").has_value());
  EXPECT_FALSE(parse_work_item_status("").has_value());
}

TEST(WorkItemStatus, TerminalStates) {
  EXPECT_FALSE(is_terminal(WorkItemStatus::Pending));
  EXPECT_FALSE(is_terminal(WorkItemStatus::InProgress));
  EXPECT_FALSE(is_terminal(WorkItemStatus::Review));
  EXPECT_TRUE(is_terminal(WorkItemStatus::Merged));
  EXPECT_TRUE(is_terminal(WorkItemStatus::Failed));
  EXPECT_TRUE(is_terminal(WorkItemStatus::Blocked));
}

// ============================================================
// Test: Transition table
// ============================================================

TEST(WorkItemTransitions, HappyPath) {
  EXPECT_TRUE(can_transition(WorkItemStatus::Pending, WorkItemStatus::InProgress));
  EXPECT_TRUE(can_transition(WorkItemStatus::InProgress, WorkItemStatus::Review));
  EXPECT_TRUE(can_transition(WorkItemStatus::Review, WorkItemStatus::Merged));
}

TEST(WorkItemTransitions, RetryReturnsToPending) {
  EXPECT_TRUE(can_transition(WorkItemStatus::InProgress, WorkItemStatus::Pending));
  EXPECT_TRUE(can_transition(WorkItemStatus::Review, WorkItemStatus::Pending));
}

TEST(WorkItemTransitions, EscalationFromAnyActiveState) {
  for (auto from : {WorkItemStatus::Pending, WorkItemStatus::InProgress,
                    WorkItemStatus::Review}) {
    EXPECT_TRUE(can_transition(from, WorkItemStatus::Blocked)) << to_string(from);
    EXPECT_TRUE(can_transition(from, WorkItemStatus::Failed)) << to_string(from);
  }
}

TEST(WorkItemTransitions, SkippingStepsIsIllegal) {
  EXPECT_FALSE(can_transition(WorkItemStatus::Pending, WorkItemStatus::Review));
  EXPECT_FALSE(can_transition(WorkItemStatus::Pending, WorkItemStatus::Merged));
  EXPECT_FALSE(can_transition(WorkItemStatus::InProgress, WorkItemStatus::Merged));
  EXPECT_FALSE(can_transition(WorkItemStatus::Review, WorkItemStatus::InProgress));
}

TEST(WorkItemTransitions, TerminalStatesHaveNoExit) {
  for (auto from : {WorkItemStatus::Merged, WorkItemStatus::Failed,
                    WorkItemStatus::Blocked}) {
    for (auto to : kAllStatuses) {
      if (to == from) {
        continue;
      }
      EXPECT_FALSE(can_transition(from, to))
          << to_string(from) << " -> " << to_string(to);
    }
  }
}

TEST(WorkItemTransitions, ReassertingCurrentStatusIsLegal) {
  for (auto status : kAllStatuses) {
    EXPECT_TRUE(can_transition(status, status)) << to_string(status);
  }
}

// ============================================================
// Test: Executor status
// ============================================================

TEST(ExecutorStatus, NamesRoundTrip) {
  for (auto status : {ExecutorStatus::Idle, ExecutorStatus::Running,
                      ExecutorStatus::Waiting, ExecutorStatus::Error,
                      ExecutorStatus::Terminated}) {
    auto parsed = parse_executor_status(to_string(status));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, status);
  }
  EXPECT_STREQ(to_string(ExecutorStatus::Running), "RUNNING");
  EXPECT_FALSE(parse_executor_status("BUSY").has_value());
}
