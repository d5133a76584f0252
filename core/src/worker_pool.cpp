#include "core/worker_pool.h"

#include "core/logger.h"

#include <cstdio>
#include <exception>
#include <future>
#include <thread>
#include <utility>
#include <vector>

namespace convoy::core {
namespace {

/// Run executor->stop() on a detached thread and hand back its completion.
/// The thread owns a reference to the executor, so abandoning the future
/// after a timeout is safe.
std::future<void> begin_stop(const std::shared_ptr<IExecutor> &executor) {
  auto done = std::make_shared<std::promise<void>>();
  auto future = done->get_future();
  std::thread([executor, done]() {
    try {
      executor->stop();
      done->set_value();
    } catch (...) {
      done->set_exception(std::current_exception());
    }
  }).detach();
  return future;
}

/// Wait for a stop started by begin_stop(). Terminates the executor when
/// the graceful stop timed out or threw.
bool finish_stop(const std::shared_ptr<IExecutor> &executor,
                 std::future<void> &stopped, Clock::time_point deadline) {
  if (stopped.wait_until(deadline) != std::future_status::ready) {
    executor->terminate();
    return false;
  }
  try {
    stopped.get();
  } catch (const std::exception &) {
    executor->terminate();
    return false;
  } catch (...) {
    executor->terminate();
    return false;
  }
  return true;
}

} // namespace

bool stop_with_timeout(const std::shared_ptr<IExecutor> &executor,
                       std::chrono::milliseconds timeout) {
  if (!executor) {
    return true;
  }
  auto stopped = begin_stop(executor);
  return finish_stop(executor, stopped, Clock::now() + timeout);
}

WorkerPool::WorkerPool(int capacity, ExecutorFactory factory,
                       std::shared_ptr<IStateStore> store,
                       std::shared_ptr<ILogger> logger,
                       std::chrono::milliseconds stop_timeout,
                       std::string executor_kind)
    : capacity_(capacity > 0 ? capacity : 1), factory_(std::move(factory)),
      store_(std::move(store)), logger_(std::move(logger)),
      stop_timeout_(stop_timeout), executor_kind_(std::move(executor_kind)) {}

WorkerPool::~WorkerPool() { shutdown(); }

int WorkerPool::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(active_.size()) + pending_spawns_;
}

int WorkerPool::available_slots() const { return capacity_ - active_count(); }

Result<std::shared_ptr<WorkerHandle>, Error>
WorkerPool::spawn(const WorkItem &item) {
  using SpawnResult = Result<std::shared_ptr<WorkerHandle>, Error>;

  auto handle = std::make_shared<WorkerHandle>();
  handle->work_item_id = item.id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(active_.size()) + pending_spawns_ >= capacity_) {
      return SpawnResult::Err(Error::PoolAtCapacity(capacity_));
    }
    if (active_.count(item.id) > 0) {
      return SpawnResult::Err(
          Error::Internal("Work item already has a live worker: " + item.id));
    }
    handle->executor_id = next_executor_id();
    ++pending_spawns_; // Slot reserved while the executor is created
  }

  auto unreserve = [this]() {
    std::lock_guard<std::mutex> lock(mutex_);
    --pending_spawns_;
  };

  try {
    handle->executor = factory_ ? factory_(handle->executor_id, item) : nullptr;
  } catch (const std::exception &e) {
    unreserve();
    return SpawnResult::Err(Error::Execution(
        "Executor factory failed for " + item.id + ": " + e.what()));
  } catch (...) {
    unreserve();
    return SpawnResult::Err(Error::Execution(
        "Executor factory failed for " + item.id +
        " with a non-standard exception"));
  }
  if (!handle->executor) {
    unreserve();
    return SpawnResult::Err(
        Error::Execution("Executor factory returned no executor for " + item.id));
  }

  ExecutorRecord record;
  record.id = handle->executor_id;
  record.kind = executor_kind_;
  record.status = ExecutorStatus::Running;
  record.current_work_item = item.id;
  record.started_at = Clock::now();
  record.last_activity = *record.started_at;

  auto registered = store_->register_executor(record);
  if (registered.is_err()) {
    unreserve();
    stop_with_timeout(handle->executor, stop_timeout_);
    return SpawnResult::Err(registered.error());
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    --pending_spawns_;
    active_.emplace(item.id, handle);
  }

  if (logger_) {
    logger_->info(item.id, "worker_pool", "worker_spawned",
                  "Spawned worker " + handle->executor_id + " for task " +
                      item.id);
  }
  return SpawnResult::Ok(std::move(handle));
}

Result<void, Error> WorkerPool::release(const std::string &work_item_id) {
  std::shared_ptr<WorkerHandle> handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(work_item_id);
    if (it == active_.end()) {
      return Result<void, Error>::Ok();
    }
    handle = std::move(it->second);
    active_.erase(it);
  }

  if (!stop_with_timeout(handle->executor, stop_timeout_) && logger_) {
    logger_->warn(work_item_id, "worker_pool", "worker_force_terminated",
                  "Worker " + handle->executor_id +
                      " did not stop in time and was terminated");
  }

  auto updated = store_->update_executor_status(
      handle->executor_id, ExecutorStatus::Terminated, std::nullopt);
  if (updated.is_ok() && logger_) {
    logger_->info(work_item_id, "worker_pool", "worker_released",
                  "Released worker " + handle->executor_id + " for task " +
                      work_item_id);
  }
  return updated;
}

std::shared_ptr<WorkerHandle>
WorkerPool::find(const std::string &work_item_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = active_.find(work_item_id);
  return it == active_.end() ? nullptr : it->second;
}

int WorkerPool::shutdown() {
  std::vector<std::shared_ptr<WorkerHandle>> handles;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &[_, handle] : active_) {
      handles.push_back(std::move(handle));
    }
    active_.clear();
  }
  if (handles.empty()) {
    return 0;
  }

  // Stop everything concurrently under one shared deadline.
  std::vector<std::future<void>> stops;
  stops.reserve(handles.size());
  for (const auto &handle : handles) {
    stops.push_back(begin_stop(handle->executor));
  }

  const auto deadline = Clock::now() + stop_timeout_;
  int forced = 0;
  for (size_t i = 0; i < handles.size(); ++i) {
    const auto &handle = handles[i];
    if (!finish_stop(handle->executor, stops[i], deadline)) {
      ++forced;
      if (logger_) {
        logger_->warn(handle->work_item_id, "worker_pool",
                      "worker_force_terminated",
                      "Worker " + handle->executor_id +
                          " exceeded the shutdown timeout");
      }
    }

    auto updated = store_->update_executor_status(
        handle->executor_id, ExecutorStatus::Terminated, std::nullopt);
    if (updated.is_err() && logger_) {
      logger_->error(handle->work_item_id, "worker_pool", "shutdown_persist",
                     updated.error().internal_message);
    }
  }

  if (logger_) {
    logger_->info("pool", "worker_pool", "shutdown_complete",
                  std::to_string(handles.size()) + " worker(s) stopped, " +
                      std::to_string(forced) + " forced");
  }
  return forced;
}

std::string WorkerPool::next_executor_id() {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "worker-%03d", ++spawned_total_);
  return buffer;
}

} // namespace convoy::core
