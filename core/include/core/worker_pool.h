#pragma once

#include "core/collaborators.h"
#include "core/error.h"
#include "core/result.h"
#include "core/state_store.h"
#include "core/work_item.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace convoy::core {

class ILogger;

/// A reserved execution slot: one executor bound to one work item.
struct WorkerHandle {
  std::string executor_id;
  std::string work_item_id;
  std::shared_ptr<IExecutor> executor;
};

/// Stops `executor` gracefully, waiting at most `timeout`, then falls back
/// to terminate(). The graceful stop runs on a detached thread, so a stuck
/// executor never blocks the caller. Returns true if the graceful stop
/// finished in time.
bool stop_with_timeout(const std::shared_ptr<IExecutor> &executor,
                       std::chrono::milliseconds timeout);

/// Fixed-capacity pool of execution slots.
///
/// The pool gates how many work items run at once; it never decides which
/// ones. Capacity is a logical cap, not a thread count.
class WorkerPool {
public:
  WorkerPool(int capacity, ExecutorFactory factory,
             std::shared_ptr<IStateStore> store,
             std::shared_ptr<ILogger> logger = nullptr,
             std::chrono::milliseconds stop_timeout = std::chrono::seconds(2),
             std::string executor_kind = "implementer");
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  [[nodiscard]] int capacity() const noexcept { return capacity_; }
  [[nodiscard]] int active_count() const;

  /// capacity - active_count.
  [[nodiscard]] int available_slots() const;

  /// Reserve a slot for `item`: creates its executor and registers it in
  /// the store as RUNNING. Fails fast with ErrorCategory::Capacity when no
  /// slot is free.
  Result<std::shared_ptr<WorkerHandle>, Error> spawn(const WorkItem &item);

  /// Stop the executor bound to `work_item_id` and reclaim its slot. The
  /// slot is reclaimed even if the store update fails. Releasing an unknown
  /// id is a no-op.
  Result<void, Error> release(const std::string &work_item_id);

  [[nodiscard]] std::shared_ptr<WorkerHandle>
  find(const std::string &work_item_id) const;

  /// Stop every live executor, each bounded by the stop timeout. Returns
  /// the number of executors that had to be force-terminated.
  int shutdown();

private:
  std::string next_executor_id();

  const int capacity_;
  ExecutorFactory factory_;
  std::shared_ptr<IStateStore> store_;
  std::shared_ptr<ILogger> logger_;
  std::chrono::milliseconds stop_timeout_;
  std::string executor_kind_;

  mutable std::mutex mutex_;
  int spawned_total_ = 0;
  int pending_spawns_ = 0;
  std::unordered_map<std::string, std::shared_ptr<WorkerHandle>> active_;
};

} // namespace convoy::core
