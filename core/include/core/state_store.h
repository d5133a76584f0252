#pragma once

#include "core/error.h"
#include "core/result.h"
#include "core/work_item.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace convoy::core {

/// Aggregate counters over the whole store.
struct StoreStatistics {
  std::map<std::string, int> work_items; // status name -> count
  std::map<std::string, int> executors;  // status name -> count
  std::int64_t work_item_resource = 0;   // sum over work items
  std::int64_t executor_resource = 0;    // sum over executors
  /// max(work_item_resource, executor_resource): executors count in real
  /// time, work items carry final counts, so the larger one is reported.
  std::int64_t total_resource = 0;
};

/// Durable state store: the single source of truth across restarts.
///
/// Every mutation is atomic with respect to a single record. Counter
/// updates are relative (`+= delta`) so concurrent callers never lose an
/// update. Any storage failure is returned as an ErrorCategory::Persistence
/// error and is never retried here.
class IStateStore {
public:
  virtual ~IStateStore() = default;

  // ---- Work items ----

  /// Insert a new work item. Duplicate ids are rejected.
  virtual Result<void, Error> create_work_item(const WorkItem &item) = 0;

  [[nodiscard]] virtual Result<std::optional<WorkItem>, Error>
  get_work_item(const std::string &id) const = 0;

  /// All work items in creation order.
  [[nodiscard]] virtual Result<std::vector<WorkItem>, Error>
  list_work_items() const = 0;

  [[nodiscard]] virtual Result<std::vector<WorkItem>, Error>
  list_work_items_by_status(WorkItemStatus status) const = 0;

  [[nodiscard]] virtual Result<std::vector<WorkItem>, Error>
  list_work_items_by_milestone(const std::string &milestone_id) const = 0;

  /// Items for the given ids, in the order given; unknown ids are skipped.
  [[nodiscard]] virtual Result<std::vector<WorkItem>, Error>
  list_work_items_by_ids(const std::vector<std::string> &ids) const = 0;

  /// Atomic read-modify-write status transition, validated with
  /// can_transition(). When `executor` is given it becomes the assigned
  /// executor; a transition to PENDING always clears the assignment.
  /// Returns the updated record.
  virtual Result<WorkItem, Error>
  update_work_item_status(const std::string &id, WorkItemStatus status,
                          std::optional<std::string> executor = std::nullopt) = 0;

  /// retry_count += 1. Returns the new count.
  virtual Result<int, Error> increment_retry(const std::string &id) = 0;

  /// resource_usage += delta (delta must be non-negative).
  virtual Result<void, Error> add_work_item_usage(const std::string &id,
                                                  std::int64_t delta) = 0;

  /// Remember the context of the latest failure for manual resolution.
  virtual Result<void, Error> record_work_item_error(const std::string &id,
                                                     const std::string &error) = 0;

  // ---- Milestones ----

  virtual Result<void, Error> create_milestone(const Milestone &milestone) = 0;

  [[nodiscard]] virtual Result<std::optional<Milestone>, Error>
  get_milestone(const std::string &id) const = 0;

  /// All milestones ordered by ascending phase.
  [[nodiscard]] virtual Result<std::vector<Milestone>, Error>
  list_milestones() const = 0;

  /// Milestones move PENDING -> IN_PROGRESS -> MERGED. Changing the status
  /// of a MERGED, BLOCKED or FAILED milestone is an Internal error.
  virtual Result<void, Error>
  update_milestone_status(const std::string &id, WorkItemStatus status) = 0;

  virtual Result<void, Error>
  set_milestone_members(const std::string &id,
                        const std::vector<std::string> &member_ids) = 0;

  // ---- Executors ----

  /// Idempotent upsert keyed by executor id: re-registration overwrites the
  /// mutable fields instead of creating a duplicate.
  virtual Result<void, Error> register_executor(const ExecutorRecord &record) = 0;

  [[nodiscard]] virtual Result<std::optional<ExecutorRecord>, Error>
  get_executor(const std::string &id) const = 0;

  [[nodiscard]] virtual Result<std::vector<ExecutorRecord>, Error>
  list_executors() const = 0;

  virtual Result<void, Error>
  update_executor_status(const std::string &id, ExecutorStatus status,
                         std::optional<std::string> current_work_item) = 0;

  virtual Result<void, Error> add_executor_usage(const std::string &id,
                                                 std::int64_t delta) = 0;

  // ---- Logs ----

  /// Append a log entry. Returns the assigned entry id.
  virtual Result<std::int64_t, Error> append_log(const LogEntry &entry) = 0;

  /// Newest first, optionally filtered by executor id.
  [[nodiscard]] virtual Result<std::vector<LogEntry>, Error>
  list_logs(const std::optional<std::string> &executor_id,
            int limit = 100) const = 0;

  // ---- Maintenance ----

  /// Crash recovery sweep: RUNNING executors become IDLE, IN_PROGRESS work
  /// items become PENDING with no assigned executor. Everything else is left
  /// untouched. Returns the number of rows changed.
  virtual Result<int, Error> cleanup_stale_states() = 0;

  [[nodiscard]] virtual Result<StoreStatistics, Error> statistics() const = 0;

  /// Explicit data reset; the only path that deletes records.
  virtual Result<void, Error> clear_all() = 0;
};

} // namespace convoy::core
