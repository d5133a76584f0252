#include "infra/sqlite_state_store.h"

#include <sqlite3.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace convoy::infra {

using core::Error;
using core::ErrorCategory;
using core::ExecutorRecord;
using core::ExecutorStatus;
using core::LogEntry;
using core::Milestone;
using core::Result;
using core::WorkItem;
using core::WorkItemStatus;

namespace {

/// Raised by the statement helpers; converted to a Persistence error at
/// the public boundary of the store.
class StoreError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

std::int64_t to_millis(core::TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

core::TimePoint from_millis(std::int64_t ms) {
  return core::TimePoint(std::chrono::duration_cast<core::Clock::duration>(
      std::chrono::milliseconds(ms)));
}

std::int64_t now_millis() { return to_millis(core::Clock::now()); }

/// RAII prepared statement. Bind indexes are 1-based, column indexes 0-based.
class Statement {
public:
  Statement(sqlite3 *db, const std::string &sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) !=
        SQLITE_OK) {
      throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db_) +
                       " [" + sql + "]");
    }
  }
  ~Statement() { sqlite3_finalize(stmt_); }

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  Statement &bind_text(int index, const std::string &value) {
    check(sqlite3_bind_text(stmt_, index, value.c_str(),
                            static_cast<int>(value.size()), SQLITE_TRANSIENT));
    return *this;
  }

  Statement &bind_int64(int index, std::int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, value));
    return *this;
  }

  Statement &bind_optional(int index, const std::optional<std::string> &value) {
    return value ? bind_text(index, *value) : bind_null(index);
  }

  Statement &bind_optional(int index, const std::optional<std::int64_t> &value) {
    return value ? bind_int64(index, *value) : bind_null(index);
  }

  Statement &bind_null(int index) {
    check(sqlite3_bind_null(stmt_, index));
    return *this;
  }

  /// Advance to the next row. Returns false when the statement is done.
  bool step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc == SQLITE_DONE) {
      return false;
    }
    throw StoreError(std::string("step failed: ") + sqlite3_errmsg(db_));
  }

  /// Execute a statement that returns no rows.
  void run() {
    while (step()) {
    }
  }

  void reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

  [[nodiscard]] bool is_null(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
  }

  [[nodiscard]] std::string text(int col) const {
    const auto *raw = sqlite3_column_text(stmt_, col);
    return raw ? std::string(reinterpret_cast<const char *>(raw)) : std::string();
  }

  [[nodiscard]] std::optional<std::string> optional_text(int col) const {
    if (is_null(col)) {
      return std::nullopt;
    }
    return text(col);
  }

  [[nodiscard]] std::int64_t int64(int col) const {
    return sqlite3_column_int64(stmt_, col);
  }

private:
  void check(int rc) {
    if (rc != SQLITE_OK) {
      throw StoreError(std::string("bind failed: ") + sqlite3_errmsg(db_));
    }
  }

  sqlite3 *db_;
  sqlite3_stmt *stmt_ = nullptr;
};

void exec(sqlite3 *db, const char *sql) {
  char *err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string message = err ? err : sqlite3_errmsg(db);
    sqlite3_free(err);
    throw StoreError(message);
  }
}

/// BEGIN IMMEDIATE on construction; rolls back unless commit() was called.
class Transaction {
public:
  explicit Transaction(sqlite3 *db) : db_(db) { exec(db_, "BEGIN IMMEDIATE"); }

  ~Transaction() {
    if (!committed_) {
      // Nothing useful can be done if the rollback itself fails.
      sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }
  }

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void commit() {
    exec(db_, "COMMIT");
    committed_ = true;
  }

private:
  sqlite3 *db_;
  bool committed_ = false;
};

/// Run `body` and map storage exceptions to a Persistence error.
template <typename T, typename Body>
Result<T, Error> guarded(const char *operation, Body &&body) {
  try {
    return body();
  } catch (const StoreError &e) {
    return Result<T, Error>::Err(Error::Persistence(
        std::string("State store operation failed: ") + operation, e.what()));
  }
}

WorkItemStatus parse_item_status(const std::string &name) {
  auto status = core::parse_work_item_status(name);
  if (!status) {
    throw StoreError("unknown work item status '" + name + "'");
  }
  return *status;
}

ExecutorStatus parse_exec_status(const std::string &name) {
  auto status = core::parse_executor_status(name);
  if (!status) {
    throw StoreError("unknown executor status '" + name + "'");
  }
  return *status;
}

Error not_found(const std::string &kind, const std::string &id) {
  return Error::NotFound(kind + " " + id);
}

constexpr const char *kWorkItemColumns =
    "id, milestone_id, description, status, assigned_executor, retry_count, "
    "resource_usage, last_error, created_at, updated_at";

WorkItem read_work_item_row(const Statement &stmt) {
  WorkItem item;
  item.id = stmt.text(0);
  item.milestone_id = stmt.text(1);
  item.description = stmt.text(2);
  item.status = parse_item_status(stmt.text(3));
  item.assigned_executor = stmt.optional_text(4);
  item.retry_count = static_cast<int>(stmt.int64(5));
  item.resource_usage = stmt.int64(6);
  item.last_error = stmt.text(7);
  item.created_at = from_millis(stmt.int64(8));
  item.updated_at = from_millis(stmt.int64(9));
  return item;
}

constexpr const char *kExecutorColumns =
    "id, kind, status, current_work_item, pid, resource_usage, started_at, "
    "last_activity";

ExecutorRecord read_executor_row(const Statement &stmt) {
  ExecutorRecord record;
  record.id = stmt.text(0);
  record.kind = stmt.text(1);
  record.status = parse_exec_status(stmt.text(2));
  record.current_work_item = stmt.optional_text(3);
  if (!stmt.is_null(4)) {
    record.pid = stmt.int64(4);
  }
  record.resource_usage = stmt.int64(5);
  if (!stmt.is_null(6)) {
    record.started_at = from_millis(stmt.int64(6));
  }
  record.last_activity = from_millis(stmt.int64(7));
  return record;
}

} // namespace

// ---- Lifecycle ----

Result<std::shared_ptr<SqliteStateStore>, Error>
SqliteStateStore::open(const std::string &path) {
  using OpenResult = Result<std::shared_ptr<SqliteStateStore>, Error>;

  sqlite3 *db = nullptr;
  const int flags =
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
    std::string detail = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    return OpenResult::Err(
        Error::Persistence("Cannot open state database " + path, detail));
  }

  std::shared_ptr<SqliteStateStore> store(new SqliteStateStore(db, path));
  try {
    store->ensure_schema();
  } catch (const StoreError &e) {
    return OpenResult::Err(Error::Persistence(
        "Cannot initialize state database " + path, e.what()));
  }
  return OpenResult::Ok(std::move(store));
}

SqliteStateStore::SqliteStateStore(sqlite3 *db, std::string path)
    : db_(db), path_(std::move(path)) {}

SqliteStateStore::~SqliteStateStore() { sqlite3_close(db_); }

void SqliteStateStore::ensure_schema() {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_busy_timeout(db_, 5000);
  if (path_ != ":memory:") {
    exec(db_, "PRAGMA journal_mode=WAL");
  }

  exec(db_, R"sql(
    CREATE TABLE IF NOT EXISTS work_items (
      seq               INTEGER PRIMARY KEY AUTOINCREMENT,
      id                TEXT NOT NULL UNIQUE,
      milestone_id      TEXT NOT NULL DEFAULT '',
      description       TEXT NOT NULL DEFAULT '',
      status            TEXT NOT NULL,
      assigned_executor TEXT,
      retry_count       INTEGER NOT NULL DEFAULT 0,
      resource_usage    INTEGER NOT NULL DEFAULT 0,
      last_error        TEXT NOT NULL DEFAULT '',
      created_at        INTEGER NOT NULL,
      updated_at        INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_work_items_status ON work_items(status);
    CREATE INDEX IF NOT EXISTS idx_work_items_milestone
      ON work_items(milestone_id);

    CREATE TABLE IF NOT EXISTS work_item_dependencies (
      work_item_id  TEXT NOT NULL,
      position      INTEGER NOT NULL,
      dependency_id TEXT NOT NULL,
      PRIMARY KEY (work_item_id, position)
    );

    CREATE TABLE IF NOT EXISTS work_item_metadata (
      work_item_id TEXT NOT NULL,
      key          TEXT NOT NULL,
      value        TEXT NOT NULL,
      PRIMARY KEY (work_item_id, key)
    );

    CREATE TABLE IF NOT EXISTS milestones (
      id                 TEXT PRIMARY KEY,
      name               TEXT NOT NULL,
      description        TEXT NOT NULL DEFAULT '',
      phase              INTEGER NOT NULL,
      status             TEXT NOT NULL,
      estimated_resource INTEGER NOT NULL DEFAULT 0,
      created_at         INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS milestone_members (
      milestone_id TEXT NOT NULL,
      position     INTEGER NOT NULL,
      work_item_id TEXT NOT NULL,
      PRIMARY KEY (milestone_id, position)
    );

    CREATE TABLE IF NOT EXISTS executors (
      id                TEXT PRIMARY KEY,
      kind              TEXT NOT NULL,
      status            TEXT NOT NULL,
      current_work_item TEXT,
      pid               INTEGER,
      resource_usage    INTEGER NOT NULL DEFAULT 0,
      started_at        INTEGER,
      last_activity     INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_executors_status ON executors(status);

    CREATE TABLE IF NOT EXISTS logs (
      id          INTEGER PRIMARY KEY AUTOINCREMENT,
      executor_id TEXT NOT NULL,
      level       TEXT NOT NULL,
      message     TEXT NOT NULL,
      timestamp   INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_logs_executor ON logs(executor_id);

    CREATE TABLE IF NOT EXISTS log_metadata (
      log_id INTEGER NOT NULL,
      key    TEXT NOT NULL,
      value  TEXT NOT NULL,
      PRIMARY KEY (log_id, key)
    );
  )sql");
}

// ---- Work items ----

Result<void, Error> SqliteStateStore::create_work_item(const WorkItem &item) {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<void>("create_work_item", [&]() {
    if (item.id.empty()) {
      return Result<void, Error>::Err(
          Error::Validation("Work item id must not be empty"));
    }

    Transaction tx(db_);
    if (load_work_item(item.id)) {
      return Result<void, Error>::Err(Error(ErrorCategory::Validation, 1004,
                                            "Work item already exists: " +
                                                item.id));
    }

    const std::int64_t now = now_millis();
    const std::int64_t created =
        item.created_at == core::TimePoint{} ? now : to_millis(item.created_at);

    Statement insert(db_, "INSERT INTO work_items (id, milestone_id, "
                          "description, status, assigned_executor, "
                          "retry_count, resource_usage, last_error, "
                          "created_at, updated_at) "
                          "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    insert.bind_text(1, item.id)
        .bind_text(2, item.milestone_id)
        .bind_text(3, item.description)
        .bind_text(4, core::to_string(item.status))
        .bind_optional(5, item.assigned_executor)
        .bind_int64(6, item.retry_count)
        .bind_int64(7, item.resource_usage)
        .bind_text(8, item.last_error)
        .bind_int64(9, created)
        .bind_int64(10, now)
        .run();

    Statement dep(db_, "INSERT INTO work_item_dependencies "
                       "(work_item_id, position, dependency_id) "
                       "VALUES (?, ?, ?)");
    for (size_t i = 0; i < item.dependencies.size(); ++i) {
      dep.reset();
      dep.bind_text(1, item.id)
          .bind_int64(2, static_cast<std::int64_t>(i))
          .bind_text(3, item.dependencies[i])
          .run();
    }

    Statement meta(db_, "INSERT INTO work_item_metadata "
                        "(work_item_id, key, value) VALUES (?, ?, ?)");
    for (const auto &[key, value] : item.metadata) {
      meta.reset();
      meta.bind_text(1, item.id).bind_text(2, key).bind_text(3, value).run();
    }

    tx.commit();
    return Result<void, Error>::Ok();
  });
}

Result<std::optional<WorkItem>, Error>
SqliteStateStore::get_work_item(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<std::optional<WorkItem>>("get_work_item", [&]() {
    return Result<std::optional<WorkItem>, Error>::Ok(load_work_item(id));
  });
}

Result<std::vector<WorkItem>, Error> SqliteStateStore::list_work_items() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<std::vector<WorkItem>>("list_work_items", [&]() {
    return Result<std::vector<WorkItem>, Error>::Ok(load_work_items("", ""));
  });
}

Result<std::vector<WorkItem>, Error>
SqliteStateStore::list_work_items_by_status(WorkItemStatus status) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<std::vector<WorkItem>>("list_work_items_by_status", [&]() {
    return Result<std::vector<WorkItem>, Error>::Ok(
        load_work_items("status = ?", core::to_string(status)));
  });
}

Result<std::vector<WorkItem>, Error>
SqliteStateStore::list_work_items_by_milestone(
    const std::string &milestone_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<std::vector<WorkItem>>("list_work_items_by_milestone", [&]() {
    return Result<std::vector<WorkItem>, Error>::Ok(
        load_work_items("milestone_id = ?", milestone_id));
  });
}

Result<std::vector<WorkItem>, Error> SqliteStateStore::list_work_items_by_ids(
    const std::vector<std::string> &ids) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<std::vector<WorkItem>>("list_work_items_by_ids", [&]() {
    std::vector<WorkItem> items;
    items.reserve(ids.size());
    for (const auto &id : ids) {
      if (auto item = load_work_item(id)) {
        items.push_back(std::move(*item));
      }
    }
    return Result<std::vector<WorkItem>, Error>::Ok(std::move(items));
  });
}

Result<WorkItem, Error>
SqliteStateStore::update_work_item_status(const std::string &id,
                                          WorkItemStatus status,
                                          std::optional<std::string> executor) {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<WorkItem>("update_work_item_status", [&]() {
    Transaction tx(db_);
    auto current = load_work_item(id);
    if (!current) {
      return Result<WorkItem, Error>::Err(not_found("work item", id));
    }
    if (!core::can_transition(current->status, status)) {
      return Result<WorkItem, Error>::Err(Error::Internal(
          std::string("Illegal work item transition for ") + id + ": " +
          core::to_string(current->status) + " -> " + core::to_string(status)));
    }

    std::optional<std::string> assigned = current->assigned_executor;
    if (status == WorkItemStatus::Pending) {
      assigned.reset();
    } else if (executor) {
      assigned = std::move(executor);
    }

    Statement update(db_, "UPDATE work_items SET status = ?, "
                          "assigned_executor = ?, updated_at = ? WHERE id = ?");
    update.bind_text(1, core::to_string(status))
        .bind_optional(2, assigned)
        .bind_int64(3, now_millis())
        .bind_text(4, id)
        .run();

    auto updated = load_work_item(id);
    tx.commit();
    return Result<WorkItem, Error>::Ok(std::move(*updated));
  });
}

Result<int, Error> SqliteStateStore::increment_retry(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<int>("increment_retry", [&]() {
    Transaction tx(db_);
    Statement update(db_, "UPDATE work_items SET retry_count = retry_count + 1, "
                          "updated_at = ? WHERE id = ?");
    update.bind_int64(1, now_millis()).bind_text(2, id).run();
    if (sqlite3_changes(db_) == 0) {
      return Result<int, Error>::Err(not_found("work item", id));
    }

    Statement select(db_, "SELECT retry_count FROM work_items WHERE id = ?");
    select.bind_text(1, id);
    if (!select.step()) {
      throw StoreError("work item vanished during increment_retry: " + id);
    }
    const int count = static_cast<int>(select.int64(0));
    tx.commit();
    return Result<int, Error>::Ok(count);
  });
}

Result<void, Error> SqliteStateStore::add_work_item_usage(const std::string &id,
                                                          std::int64_t delta) {
  if (delta < 0) {
    return Result<void, Error>::Err(
        Error::Validation("Resource usage delta must be non-negative"));
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<void>("add_work_item_usage", [&]() {
    Statement update(db_, "UPDATE work_items SET resource_usage = "
                          "resource_usage + ?, updated_at = ? WHERE id = ?");
    update.bind_int64(1, delta).bind_int64(2, now_millis()).bind_text(3, id).run();
    if (sqlite3_changes(db_) == 0) {
      return Result<void, Error>::Err(not_found("work item", id));
    }
    return Result<void, Error>::Ok();
  });
}

Result<void, Error>
SqliteStateStore::record_work_item_error(const std::string &id,
                                         const std::string &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<void>("record_work_item_error", [&]() {
    Statement update(db_, "UPDATE work_items SET last_error = ?, "
                          "updated_at = ? WHERE id = ?");
    update.bind_text(1, error).bind_int64(2, now_millis()).bind_text(3, id).run();
    if (sqlite3_changes(db_) == 0) {
      return Result<void, Error>::Err(not_found("work item", id));
    }
    return Result<void, Error>::Ok();
  });
}

std::optional<WorkItem>
SqliteStateStore::load_work_item(const std::string &id) const {
  Statement select(db_, std::string("SELECT ") + kWorkItemColumns +
                            " FROM work_items WHERE id = ?");
  select.bind_text(1, id);
  if (!select.step()) {
    return std::nullopt;
  }
  WorkItem item = read_work_item_row(select);
  load_work_item_children(item);
  return item;
}

std::vector<WorkItem>
SqliteStateStore::load_work_items(const std::string &where,
                                  const std::string &param) const {
  std::string sql = std::string("SELECT ") + kWorkItemColumns + " FROM work_items";
  if (!where.empty()) {
    sql += " WHERE " + where;
  }
  sql += " ORDER BY seq";

  Statement select(db_, sql);
  if (!where.empty()) {
    select.bind_text(1, param);
  }

  std::vector<WorkItem> items;
  while (select.step()) {
    items.push_back(read_work_item_row(select));
  }
  for (auto &item : items) {
    load_work_item_children(item);
  }
  return items;
}

void SqliteStateStore::load_work_item_children(WorkItem &item) const {
  Statement deps(db_, "SELECT dependency_id FROM work_item_dependencies "
                      "WHERE work_item_id = ? ORDER BY position");
  deps.bind_text(1, item.id);
  while (deps.step()) {
    item.dependencies.push_back(deps.text(0));
  }

  Statement meta(db_, "SELECT key, value FROM work_item_metadata "
                      "WHERE work_item_id = ?");
  meta.bind_text(1, item.id);
  while (meta.step()) {
    item.metadata.emplace(meta.text(0), meta.text(1));
  }
}

// ---- Milestones ----

Result<void, Error> SqliteStateStore::create_milestone(const Milestone &milestone) {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<void>("create_milestone", [&]() {
    if (milestone.id.empty()) {
      return Result<void, Error>::Err(
          Error::Validation("Milestone id must not be empty"));
    }

    Transaction tx(db_);
    if (load_milestone(milestone.id)) {
      return Result<void, Error>::Err(Error(ErrorCategory::Validation, 1004,
                                            "Milestone already exists: " +
                                                milestone.id));
    }

    Statement insert(db_, "INSERT INTO milestones (id, name, description, "
                          "phase, status, estimated_resource, created_at) "
                          "VALUES (?, ?, ?, ?, ?, ?, ?)");
    insert.bind_text(1, milestone.id)
        .bind_text(2, milestone.name)
        .bind_text(3, milestone.description)
        .bind_int64(4, milestone.phase)
        .bind_text(5, core::to_string(milestone.status))
        .bind_int64(6, milestone.estimated_resource)
        .bind_int64(7, now_millis())
        .run();

    Statement member(db_, "INSERT INTO milestone_members "
                          "(milestone_id, position, work_item_id) "
                          "VALUES (?, ?, ?)");
    for (size_t i = 0; i < milestone.member_ids.size(); ++i) {
      member.reset();
      member.bind_text(1, milestone.id)
          .bind_int64(2, static_cast<std::int64_t>(i))
          .bind_text(3, milestone.member_ids[i])
          .run();
    }

    tx.commit();
    return Result<void, Error>::Ok();
  });
}

Result<std::optional<Milestone>, Error>
SqliteStateStore::get_milestone(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<std::optional<Milestone>>("get_milestone", [&]() {
    return Result<std::optional<Milestone>, Error>::Ok(load_milestone(id));
  });
}

Result<std::vector<Milestone>, Error> SqliteStateStore::list_milestones() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<std::vector<Milestone>>("list_milestones", [&]() {
    Statement select(db_, "SELECT id, name, description, phase, status, "
                          "estimated_resource FROM milestones "
                          "ORDER BY phase, created_at, id");
    std::vector<Milestone> milestones;
    while (select.step()) {
      Milestone milestone;
      milestone.id = select.text(0);
      milestone.name = select.text(1);
      milestone.description = select.text(2);
      milestone.phase = static_cast<int>(select.int64(3));
      milestone.status = parse_item_status(select.text(4));
      milestone.estimated_resource = select.int64(5);
      milestones.push_back(std::move(milestone));
    }
    for (auto &milestone : milestones) {
      load_members(milestone);
    }
    return Result<std::vector<Milestone>, Error>::Ok(std::move(milestones));
  });
}

Result<void, Error>
SqliteStateStore::update_milestone_status(const std::string &id,
                                          WorkItemStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<void>("update_milestone_status", [&]() {
    Transaction tx(db_);
    auto current = load_milestone(id);
    if (!current) {
      return Result<void, Error>::Err(not_found("milestone", id));
    }
    if (current->status == status) {
      return Result<void, Error>::Ok();
    }
    if (core::is_terminal(current->status)) {
      return Result<void, Error>::Err(Error::Internal(
          std::string("Milestone ") + id + " is already " +
          core::to_string(current->status)));
    }

    Statement update(db_, "UPDATE milestones SET status = ? WHERE id = ?");
    update.bind_text(1, core::to_string(status)).bind_text(2, id).run();
    tx.commit();
    return Result<void, Error>::Ok();
  });
}

Result<void, Error>
SqliteStateStore::set_milestone_members(const std::string &id,
                                        const std::vector<std::string> &member_ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<void>("set_milestone_members", [&]() {
    Transaction tx(db_);
    if (!load_milestone(id)) {
      return Result<void, Error>::Err(not_found("milestone", id));
    }

    Statement clear(db_, "DELETE FROM milestone_members WHERE milestone_id = ?");
    clear.bind_text(1, id).run();

    Statement member(db_, "INSERT INTO milestone_members "
                          "(milestone_id, position, work_item_id) "
                          "VALUES (?, ?, ?)");
    for (size_t i = 0; i < member_ids.size(); ++i) {
      member.reset();
      member.bind_text(1, id)
          .bind_int64(2, static_cast<std::int64_t>(i))
          .bind_text(3, member_ids[i])
          .run();
    }
    tx.commit();
    return Result<void, Error>::Ok();
  });
}

std::optional<Milestone>
SqliteStateStore::load_milestone(const std::string &id) const {
  Statement select(db_, "SELECT id, name, description, phase, status, "
                        "estimated_resource FROM milestones WHERE id = ?");
  select.bind_text(1, id);
  if (!select.step()) {
    return std::nullopt;
  }
  Milestone milestone;
  milestone.id = select.text(0);
  milestone.name = select.text(1);
  milestone.description = select.text(2);
  milestone.phase = static_cast<int>(select.int64(3));
  milestone.status = parse_item_status(select.text(4));
  milestone.estimated_resource = select.int64(5);
  load_members(milestone);
  return milestone;
}

void SqliteStateStore::load_members(Milestone &milestone) const {
  Statement select(db_, "SELECT work_item_id FROM milestone_members "
                        "WHERE milestone_id = ? ORDER BY position");
  select.bind_text(1, milestone.id);
  while (select.step()) {
    milestone.member_ids.push_back(select.text(0));
  }
}

// ---- Executors ----

Result<void, Error>
SqliteStateStore::register_executor(const ExecutorRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<void>("register_executor", [&]() {
    if (record.id.empty()) {
      return Result<void, Error>::Err(
          Error::Validation("Executor id must not be empty"));
    }

    std::optional<std::int64_t> started;
    if (record.started_at) {
      started = to_millis(*record.started_at);
    }
    const std::int64_t activity = record.last_activity == core::TimePoint{}
                                      ? now_millis()
                                      : to_millis(record.last_activity);

    // Accumulated resource usage survives re-registration.
    Statement upsert(db_, "INSERT INTO executors (id, kind, status, "
                          "current_work_item, pid, resource_usage, started_at, "
                          "last_activity) VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
                          "ON CONFLICT(id) DO UPDATE SET "
                          "kind = excluded.kind, status = excluded.status, "
                          "current_work_item = excluded.current_work_item, "
                          "pid = excluded.pid, started_at = excluded.started_at, "
                          "last_activity = excluded.last_activity");
    upsert.bind_text(1, record.id)
        .bind_text(2, record.kind)
        .bind_text(3, core::to_string(record.status))
        .bind_optional(4, record.current_work_item)
        .bind_optional(5, record.pid)
        .bind_int64(6, record.resource_usage)
        .bind_optional(7, started)
        .bind_int64(8, activity)
        .run();
    return Result<void, Error>::Ok();
  });
}

Result<std::optional<ExecutorRecord>, Error>
SqliteStateStore::get_executor(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<std::optional<ExecutorRecord>>("get_executor", [&]() {
    Statement select(db_, std::string("SELECT ") + kExecutorColumns +
                              " FROM executors WHERE id = ?");
    select.bind_text(1, id);
    std::optional<ExecutorRecord> record;
    if (select.step()) {
      record = read_executor_row(select);
    }
    return Result<std::optional<ExecutorRecord>, Error>::Ok(std::move(record));
  });
}

Result<std::vector<ExecutorRecord>, Error>
SqliteStateStore::list_executors() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<std::vector<ExecutorRecord>>("list_executors", [&]() {
    Statement select(db_, std::string("SELECT ") + kExecutorColumns +
                              " FROM executors ORDER BY id");
    std::vector<ExecutorRecord> records;
    while (select.step()) {
      records.push_back(read_executor_row(select));
    }
    return Result<std::vector<ExecutorRecord>, Error>::Ok(std::move(records));
  });
}

Result<void, Error>
SqliteStateStore::update_executor_status(const std::string &id,
                                         ExecutorStatus status,
                                         std::optional<std::string> current_work_item) {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<void>("update_executor_status", [&]() {
    Statement update(db_, "UPDATE executors SET status = ?, "
                          "current_work_item = ?, last_activity = ? "
                          "WHERE id = ?");
    update.bind_text(1, core::to_string(status))
        .bind_optional(2, current_work_item)
        .bind_int64(3, now_millis())
        .bind_text(4, id)
        .run();
    if (sqlite3_changes(db_) == 0) {
      return Result<void, Error>::Err(not_found("executor", id));
    }
    return Result<void, Error>::Ok();
  });
}

Result<void, Error> SqliteStateStore::add_executor_usage(const std::string &id,
                                                         std::int64_t delta) {
  if (delta < 0) {
    return Result<void, Error>::Err(
        Error::Validation("Resource usage delta must be non-negative"));
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<void>("add_executor_usage", [&]() {
    Statement update(db_, "UPDATE executors SET resource_usage = "
                          "resource_usage + ?, last_activity = ? WHERE id = ?");
    update.bind_int64(1, delta).bind_int64(2, now_millis()).bind_text(3, id).run();
    if (sqlite3_changes(db_) == 0) {
      return Result<void, Error>::Err(not_found("executor", id));
    }
    return Result<void, Error>::Ok();
  });
}

// ---- Logs ----

Result<std::int64_t, Error> SqliteStateStore::append_log(const LogEntry &entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<std::int64_t>("append_log", [&]() {
    Transaction tx(db_);
    const std::int64_t ts = entry.timestamp == core::TimePoint{}
                                ? now_millis()
                                : to_millis(entry.timestamp);
    Statement insert(db_, "INSERT INTO logs (executor_id, level, message, "
                          "timestamp) VALUES (?, ?, ?, ?)");
    insert.bind_text(1, entry.executor_id)
        .bind_text(2, entry.level)
        .bind_text(3, entry.message)
        .bind_int64(4, ts)
        .run();
    const std::int64_t log_id = sqlite3_last_insert_rowid(db_);

    Statement meta(db_, "INSERT INTO log_metadata (log_id, key, value) "
                        "VALUES (?, ?, ?)");
    for (const auto &[key, value] : entry.metadata) {
      meta.reset();
      meta.bind_int64(1, log_id).bind_text(2, key).bind_text(3, value).run();
    }
    tx.commit();
    return Result<std::int64_t, Error>::Ok(log_id);
  });
}

Result<std::vector<LogEntry>, Error>
SqliteStateStore::list_logs(const std::optional<std::string> &executor_id,
                            int limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<std::vector<LogEntry>>("list_logs", [&]() {
    std::string sql =
        "SELECT id, executor_id, level, message, timestamp FROM logs";
    if (executor_id) {
      sql += " WHERE executor_id = ?";
    }
    sql += " ORDER BY timestamp DESC, id DESC LIMIT ?";

    Statement select(db_, sql);
    int index = 1;
    if (executor_id) {
      select.bind_text(index++, *executor_id);
    }
    select.bind_int64(index, std::max(0, limit));

    std::vector<LogEntry> entries;
    while (select.step()) {
      LogEntry entry;
      entry.id = select.int64(0);
      entry.executor_id = select.text(1);
      entry.level = select.text(2);
      entry.message = select.text(3);
      entry.timestamp = from_millis(select.int64(4));
      entries.push_back(std::move(entry));
    }

    Statement meta(db_, "SELECT key, value FROM log_metadata WHERE log_id = ?");
    for (auto &entry : entries) {
      meta.reset();
      meta.bind_int64(1, entry.id);
      while (meta.step()) {
        entry.metadata.emplace(meta.text(0), meta.text(1));
      }
    }
    return Result<std::vector<LogEntry>, Error>::Ok(std::move(entries));
  });
}

// ---- Maintenance ----

Result<int, Error> SqliteStateStore::cleanup_stale_states() {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<int>("cleanup_stale_states", [&]() {
    Transaction tx(db_);
    const std::int64_t now = now_millis();

    Statement executors(db_, "UPDATE executors SET status = 'IDLE', "
                             "last_activity = ? WHERE status = 'RUNNING'");
    executors.bind_int64(1, now).run();
    int touched = sqlite3_changes(db_);

    Statement items(db_, "UPDATE work_items SET status = 'PENDING', "
                         "assigned_executor = NULL, updated_at = ? "
                         "WHERE status = 'IN_PROGRESS'");
    items.bind_int64(1, now).run();
    touched += sqlite3_changes(db_);

    tx.commit();
    return Result<int, Error>::Ok(touched);
  });
}

Result<core::StoreStatistics, Error> SqliteStateStore::statistics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<core::StoreStatistics>("statistics", [&]() {
    core::StoreStatistics stats;

    Statement items(db_, "SELECT status, COUNT(*) FROM work_items "
                         "GROUP BY status");
    while (items.step()) {
      stats.work_items[items.text(0)] = static_cast<int>(items.int64(1));
    }

    Statement executors(db_, "SELECT status, COUNT(*) FROM executors "
                             "GROUP BY status");
    while (executors.step()) {
      stats.executors[executors.text(0)] = static_cast<int>(executors.int64(1));
    }

    Statement item_sum(db_,
                       "SELECT COALESCE(SUM(resource_usage), 0) FROM work_items");
    if (item_sum.step()) {
      stats.work_item_resource = item_sum.int64(0);
    }

    Statement executor_sum(
        db_, "SELECT COALESCE(SUM(resource_usage), 0) FROM executors");
    if (executor_sum.step()) {
      stats.executor_resource = executor_sum.int64(0);
    }

    stats.total_resource =
        std::max(stats.work_item_resource, stats.executor_resource);
    return Result<core::StoreStatistics, Error>::Ok(std::move(stats));
  });
}

Result<void, Error> SqliteStateStore::clear_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded<void>("clear_all", [&]() {
    Transaction tx(db_);
    exec(db_, "DELETE FROM work_item_dependencies;"
              "DELETE FROM work_item_metadata;"
              "DELETE FROM work_items;"
              "DELETE FROM milestone_members;"
              "DELETE FROM milestones;"
              "DELETE FROM executors;"
              "DELETE FROM log_metadata;"
              "DELETE FROM logs;");
    tx.commit();
    return Result<void, Error>::Ok();
  });
}

} // namespace convoy::infra
