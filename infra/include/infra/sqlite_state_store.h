#pragma once

#include "core/error.h"
#include "core/result.h"
#include "core/state_store.h"

#include <memory>
#include <mutex>
#include <string>

struct sqlite3;

namespace convoy::infra {

/// IStateStore over a single SQLite database file.
///
/// Every public operation runs under one mutex, and every multi-statement
/// mutation inside a BEGIN IMMEDIATE transaction, so single-record updates
/// are atomic even when several processes share the file. Timestamps are
/// stored as milliseconds since the Unix epoch. Dependencies, metadata and
/// milestone members live in child tables keyed by their owner id.
///
/// Pass ":memory:" for a private in-memory database.
class SqliteStateStore : public core::IStateStore {
public:
  /// Open (or create) the database at `path` and apply the schema.
  static core::Result<std::shared_ptr<SqliteStateStore>, core::Error>
  open(const std::string &path);

  ~SqliteStateStore() override;

  SqliteStateStore(const SqliteStateStore &) = delete;
  SqliteStateStore &operator=(const SqliteStateStore &) = delete;

  [[nodiscard]] const std::string &path() const { return path_; }

  // ---- Work items ----
  core::Result<void, core::Error>
  create_work_item(const core::WorkItem &item) override;
  core::Result<std::optional<core::WorkItem>, core::Error>
  get_work_item(const std::string &id) const override;
  core::Result<std::vector<core::WorkItem>, core::Error>
  list_work_items() const override;
  core::Result<std::vector<core::WorkItem>, core::Error>
  list_work_items_by_status(core::WorkItemStatus status) const override;
  core::Result<std::vector<core::WorkItem>, core::Error>
  list_work_items_by_milestone(const std::string &milestone_id) const override;
  core::Result<std::vector<core::WorkItem>, core::Error>
  list_work_items_by_ids(const std::vector<std::string> &ids) const override;
  core::Result<core::WorkItem, core::Error>
  update_work_item_status(const std::string &id, core::WorkItemStatus status,
                          std::optional<std::string> executor =
                              std::nullopt) override;
  core::Result<int, core::Error> increment_retry(const std::string &id) override;
  core::Result<void, core::Error>
  add_work_item_usage(const std::string &id, std::int64_t delta) override;
  core::Result<void, core::Error>
  record_work_item_error(const std::string &id,
                         const std::string &error) override;

  // ---- Milestones ----
  core::Result<void, core::Error>
  create_milestone(const core::Milestone &milestone) override;
  core::Result<std::optional<core::Milestone>, core::Error>
  get_milestone(const std::string &id) const override;
  core::Result<std::vector<core::Milestone>, core::Error>
  list_milestones() const override;
  core::Result<void, core::Error>
  update_milestone_status(const std::string &id,
                          core::WorkItemStatus status) override;
  core::Result<void, core::Error>
  set_milestone_members(const std::string &id,
                        const std::vector<std::string> &member_ids) override;

  // ---- Executors ----
  core::Result<void, core::Error>
  register_executor(const core::ExecutorRecord &record) override;
  core::Result<std::optional<core::ExecutorRecord>, core::Error>
  get_executor(const std::string &id) const override;
  core::Result<std::vector<core::ExecutorRecord>, core::Error>
  list_executors() const override;
  core::Result<void, core::Error>
  update_executor_status(const std::string &id, core::ExecutorStatus status,
                         std::optional<std::string> current_work_item) override;
  core::Result<void, core::Error>
  add_executor_usage(const std::string &id, std::int64_t delta) override;

  // ---- Logs ----
  core::Result<std::int64_t, core::Error>
  append_log(const core::LogEntry &entry) override;
  core::Result<std::vector<core::LogEntry>, core::Error>
  list_logs(const std::optional<std::string> &executor_id,
            int limit = 100) const override;

  // ---- Maintenance ----
  core::Result<int, core::Error> cleanup_stale_states() override;
  core::Result<core::StoreStatistics, core::Error> statistics() const override;
  core::Result<void, core::Error> clear_all() override;

private:
  SqliteStateStore(sqlite3 *db, std::string path);

  void ensure_schema();
  std::optional<core::WorkItem> load_work_item(const std::string &id) const;
  std::vector<core::WorkItem> load_work_items(const std::string &where,
                                              const std::string &param) const;
  void load_work_item_children(core::WorkItem &item) const;
  std::optional<core::Milestone> load_milestone(const std::string &id) const;
  void load_members(core::Milestone &milestone) const;

  sqlite3 *db_ = nullptr;
  std::string path_;
  mutable std::mutex mutex_;
};

} // namespace convoy::infra
