#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace convoy::core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// ---- Work Item Status ----

enum class WorkItemStatus {
  Pending,    // Waiting for dependencies / a free worker slot
  InProgress, // Assigned to an executor
  Review,     // Executed, awaiting reviewer verdict
  Merged,     // Approved and merged (terminal)
  Failed,     // Failed outside the retry policy (terminal)
  Blocked     // Escalated after exhausting retries (terminal)
};

/// Convert WorkItemStatus to its persisted name ("PENDING", "IN_PROGRESS"...).
const char *to_string(WorkItemStatus status);

/// Parse a persisted status name. Returns nullopt on unknown input.
std::optional<WorkItemStatus> parse_work_item_status(std::string_view name);

/// MERGED, FAILED and BLOCKED are terminal: never re-admitted to scheduling.
bool is_terminal(WorkItemStatus status);

/// Legal status transitions:
///   PENDING     -> IN_PROGRESS, BLOCKED, FAILED
///   IN_PROGRESS -> PENDING, REVIEW, BLOCKED, FAILED
///   REVIEW      -> MERGED, PENDING, BLOCKED, FAILED
///   terminal    -> (none)
/// Re-asserting the current status is always legal.
bool can_transition(WorkItemStatus from, WorkItemStatus to);

// ---- Executor Status ----

enum class ExecutorStatus { Idle, Running, Waiting, Error, Terminated };

const char *to_string(ExecutorStatus status);
std::optional<ExecutorStatus> parse_executor_status(std::string_view name);

// ---- Records ----

/// A unit of implementation work. Working copies are handed around freely;
/// the durable copy lives in the state store and only changes through it.
struct WorkItem {
  std::string id; // Globally unique, stable across restarts
  std::string milestone_id;
  std::string description;
  WorkItemStatus status = WorkItemStatus::Pending;
  std::optional<std::string> assigned_executor; // Reference, not ownership
  int retry_count = 0;                          // Only ever increases
  std::int64_t resource_usage = 0;              // Only ever incremented
  std::vector<std::string> dependencies;        // Ordered WorkItem ids
  std::map<std::string, std::string> metadata;  // Opaque to the scheduler
  std::string last_error;                       // Context of the last failure
  TimePoint created_at{};
  TimePoint updated_at{};
};

/// An ordered phase grouping work items.
struct Milestone {
  std::string id;
  std::string name;
  std::string description;
  int phase = 0; // Ordering key; phases run strictly sequentially
  WorkItemStatus status = WorkItemStatus::Pending;
  std::vector<std::string> member_ids; // Reference list, not ownership
  std::int64_t estimated_resource = 0;
};

/// A live or historical executor instance. Retained after termination.
struct ExecutorRecord {
  std::string id;
  std::string kind; // Role tag ("planner", "implementer", ...)
  ExecutorStatus status = ExecutorStatus::Idle;
  std::optional<std::string> current_work_item;
  std::optional<std::int64_t> pid;
  std::int64_t resource_usage = 0;
  std::optional<TimePoint> started_at;
  TimePoint last_activity{};
};

/// Append-only observability record.
struct LogEntry {
  std::int64_t id = 0; // Assigned by the store
  std::string executor_id;
  std::string level = "INFO";
  std::string message;
  std::map<std::string, std::string> metadata;
  TimePoint timestamp{};
};

} // namespace convoy::core
