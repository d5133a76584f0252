#include "core/task_scheduler.h"

#include "core/dependency_resolver.h"
#include "core/logger.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <system_error>
#include <utility>

namespace convoy::core {

/// Outcome of one execution attempt, posted by its execution thread.
struct TaskScheduler::Completion {
  std::string work_item_id;
  std::string executor_id;
  ExecutionResult execution;
  bool reached_review = false; // Item was moved to REVIEW by the thread
  std::optional<ReviewResult> review;
  std::optional<Error> fatal; // Review threw, or REVIEW could not be stored
};

/// Queue between execution threads and the control loop. Shared with the
/// threads so that abandoned executions can still post safely.
class TaskScheduler::CompletionChannel {
public:
  void post(Completion done) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push_back(std::move(done));
    }
    cv_.notify_all();
  }

  /// Wait until at least one completion is available or `timeout` elapses,
  /// then drain everything that is queued.
  std::vector<Completion> wait_any(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return !queue_.empty(); });
    std::vector<Completion> drained(std::make_move_iterator(queue_.begin()),
                                    std::make_move_iterator(queue_.end()));
    queue_.clear();
    return drained;
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Completion> queue_;
};

/// Everything an execution thread touches, held by shared ownership so the
/// thread can outlive a canceled scheduler loop.
struct TaskScheduler::Attempt {
  WorkItem item;
  std::shared_ptr<WorkerHandle> worker;
  std::shared_ptr<IStateStore> store;
  std::shared_ptr<EventBus> events;
  std::shared_ptr<PipelineStateMachine> machine;
  std::shared_ptr<IReviewer> reviewer;
  std::shared_ptr<CancelToken> cancel;
};

TaskScheduler::TaskScheduler(SchedulerConfig config,
                             std::shared_ptr<IStateStore> store,
                             std::shared_ptr<WorkerPool> pool,
                             std::shared_ptr<EventBus> events,
                             std::shared_ptr<PipelineStateMachine> machine,
                             std::shared_ptr<IReviewer> reviewer,
                             std::shared_ptr<CancelToken> cancel,
                             std::shared_ptr<ILogger> logger)
    : config_(config), store_(std::move(store)), pool_(std::move(pool)),
      events_(std::move(events)), machine_(std::move(machine)),
      reviewer_(std::move(reviewer)), cancel_(std::move(cancel)),
      logger_(std::move(logger)),
      channel_(std::make_shared<CompletionChannel>()) {
  config_.max_retries = std::max(1, config_.max_retries);
  if (config_.poll_interval.count() <= 0) {
    config_.poll_interval = std::chrono::milliseconds(100);
  }
  if (!cancel_) {
    cancel_ = CancelToken::create();
  }
}

TaskScheduler::~TaskScheduler() { abandon_in_flight(); }

void TaskScheduler::mark_completed(const std::string &work_item_id) {
  completed_.insert(work_item_id);
}

Result<MilestoneOutcome, Error>
TaskScheduler::run(const std::vector<WorkItem> &items) {
  outcome_ = MilestoneOutcome{};
  pending_.clear();

  auto admitted = admit_initial(items);
  if (admitted.is_err()) {
    return abort(admitted.error());
  }

  bool stall_reported = false;
  while (!pending_.empty() || !in_flight_.empty()) {
    if (cancel_->is_canceled()) {
      return abort(Error::Canceled("Scheduling canceled by shutdown"));
    }

    // Pause blocks admission only; in-flight work keeps being harvested.
    const bool paused = machine_->is_paused();
    if (paused && in_flight_.empty()) {
      machine_->pause_gate().wait_until_open(*cancel_);
      continue;
    }

    bool nothing_ready = false;
    if (!paused) {
      auto refreshed = refresh_pending();
      if (refreshed.is_err()) {
        return abort(refreshed.error());
      }

      const auto ready = ready_items(pending_, completed_);
      nothing_ready = ready.empty();
      for (const auto &item : ready) {
        if (pool_->available_slots() <= 0) {
          break;
        }
        if (in_flight_.count(item.id) > 0) {
          continue;
        }
        auto started = dispatch(item);
        if (started.is_err()) {
          return abort(started.error());
        }
        if (!started.value()) {
          break; // Pool reported backpressure
        }
      }
    }

    if (!in_flight_.empty()) {
      // First-completion semantics: any finisher frees its slot at once.
      auto finished = channel_->wait_any(config_.poll_interval);
      if (cancel_->is_canceled()) {
        return abort(Error::Canceled("Scheduling canceled by shutdown"));
      }
      for (auto &done : finished) {
        auto harvested = harvest(done);
        if (harvested.is_err()) {
          return abort(harvested.error());
        }
      }
      continue;
    }

    if (pending_.empty()) {
      break;
    }

    if (nothing_ready && !paused) {
      // Nothing running and nothing can start: a dependency cycle or a
      // dependency on an item that does not exist.
      if (!stall_reported && logger_) {
        std::string dangling;
        for (const auto &dep : dangling_dependencies(pending_, completed_)) {
          dangling += (dangling.empty() ? "" : ",") + dep;
        }
        logger_->warn("scheduler", "scheduler", "milestone_stalled",
                      std::to_string(pending_.size()) +
                          " pending item(s) can never become ready" +
                          (dangling.empty() ? std::string(" (cycle)")
                                            : " (unsatisfiable deps: " +
                                                  dangling + ")"));
      }
      stall_reported = true;

      if (config_.stall_policy == StallPolicy::Abandon) {
        for (const auto &item : pending_) {
          outcome_.stalled.push_back(item.id);
        }
        pending_.clear();
        break;
      }
    }

    cancel_->wait_for(config_.poll_interval);
  }

  return Result<MilestoneOutcome, Error>::Ok(outcome_);
}

Result<void, Error>
TaskScheduler::admit_initial(const std::vector<WorkItem> &items) {
  std::unordered_set<std::string> seen;
  for (const auto &item : items) {
    if (!seen.insert(item.id).second || completed_.count(item.id) > 0 ||
        failed_.count(item.id) > 0) {
      continue;
    }

    auto current = store_->get_work_item(item.id);
    if (current.is_err()) {
      return Result<void, Error>::Err(current.error());
    }
    if (!current.value().has_value()) {
      if (logger_) {
        logger_->warn(item.id, "scheduler", "unknown_work_item",
                      "Work item is not in the store; skipped");
      }
      continue;
    }

    WorkItem latest = std::move(*current.value());
    if (latest.status == WorkItemStatus::Review ||
        latest.status == WorkItemStatus::InProgress) {
      // Left behind by an interrupted session: nothing in this loop is
      // executing it, so it runs again.
      if (logger_) {
        logger_->warn(latest.id, "scheduler", "work_item_readmitted",
                      std::string("Found in ") + to_string(latest.status) +
                          " at admission; reset to PENDING");
      }
      auto readmitted = store_->update_work_item_status(
          latest.id, WorkItemStatus::Pending);
      if (readmitted.is_err()) {
        return Result<void, Error>::Err(readmitted.error());
      }
      latest = std::move(readmitted).value();
    }
    pending_.push_back(std::move(latest));
  }
  return refresh_pending();
}

Result<void, Error> TaskScheduler::refresh_pending() {
  // Working copies are re-validated against the store on every pass: other
  // flows (reviewers, operators) may have moved an item meanwhile.
  std::vector<WorkItem> fresh;
  fresh.reserve(pending_.size());
  for (const auto &item : pending_) {
    auto current = store_->get_work_item(item.id);
    if (current.is_err()) {
      return Result<void, Error>::Err(current.error());
    }
    if (!current.value().has_value()) {
      if (logger_) {
        logger_->warn(item.id, "scheduler", "work_item_vanished",
                      "Work item was removed from the store");
      }
      continue;
    }

    WorkItem latest = std::move(*current.value());
    switch (latest.status) {
    case WorkItemStatus::Merged:
      completed_.insert(latest.id);
      outcome_.completed.push_back(latest.id);
      break;
    case WorkItemStatus::Blocked:
    case WorkItemStatus::Failed:
      failed_.insert(latest.id);
      outcome_.failed.push_back(latest.id);
      break;
    default:
      fresh.push_back(std::move(latest));
      break;
    }
  }
  pending_ = std::move(fresh);
  return Result<void, Error>::Ok();
}

Result<bool, Error> TaskScheduler::dispatch(const WorkItem &item) {
  auto spawned = pool_->spawn(item);
  if (spawned.is_err()) {
    const auto &err = spawned.error();
    if (err.category == ErrorCategory::Capacity) {
      return Result<bool, Error>::Ok(false);
    }
    if (err.category == ErrorCategory::Execution) {
      // No executor could be created: counts as a failed attempt.
      remove_pending(item.id);
      auto handled = handle_failure(item.id, err.message);
      if (handled.is_err()) {
        return Result<bool, Error>::Err(handled.error());
      }
      return Result<bool, Error>::Ok(true);
    }
    return Result<bool, Error>::Err(err);
  }
  auto worker = std::move(spawned).value();

  auto assigned = store_->update_work_item_status(
      item.id, WorkItemStatus::InProgress, worker->executor_id);
  if (assigned.is_err()) {
    auto released = pool_->release(item.id);
    if (released.is_err() && logger_) {
      logger_->error(item.id, "scheduler", "release_failed",
                     released.error().internal_message);
    }
    return Result<bool, Error>::Err(assigned.error());
  }

  remove_pending(item.id);
  events_->emit(EventType::TaskStarted, item.id,
                {{"executor", worker->executor_id},
                 {"milestone", item.milestone_id}});

  Attempt attempt{std::move(assigned).value(), worker, store_, events_,
                  machine_, reviewer_, cancel_};
  auto channel = channel_;
  InFlight flight;
  flight.worker = worker;
  try {
    flight.thread = std::thread([attempt = std::move(attempt), channel]() {
      execute(attempt, *channel);
    });
  } catch (const std::system_error &e) {
    auto released = pool_->release(item.id);
    if (released.is_err() && logger_) {
      logger_->error(item.id, "scheduler", "release_failed",
                     released.error().internal_message);
    }
    return Result<bool, Error>::Err(Error::Internal(
        "Could not start execution thread for " + item.id + ": " + e.what()));
  }

  in_flight_.emplace(item.id, std::move(flight));
  if (logger_) {
    logger_->info(item.id, "scheduler", "task_started",
                  "executor=" + worker->executor_id + " in_flight=" +
                      std::to_string(in_flight_.size()));
  }
  return Result<bool, Error>::Ok(true);
}

Result<void, Error> TaskScheduler::harvest(Completion &done) {
  auto it = in_flight_.find(done.work_item_id);
  if (it == in_flight_.end()) {
    return Result<void, Error>::Ok(); // Stale post from an abandoned run
  }
  if (it->second.thread.joinable()) {
    it->second.thread.join(); // Posting is the thread's last action
  }
  in_flight_.erase(it);

  const std::string &id = done.work_item_id;
  auto release = [this, &id]() { return pool_->release(id); };

  if (done.fatal.has_value()) {
    auto released = release();
    if (released.is_err() && logger_) {
      logger_->error(id, "scheduler", "release_failed",
                     released.error().internal_message);
    }
    return Result<void, Error>::Err(*done.fatal);
  }

  if (done.execution.success && !done.reached_review) {
    // Shutdown tripped between execution and review; leave the item
    // IN_PROGRESS for the recovery sweep.
    auto released = release();
    if (released.is_err() && logger_) {
      logger_->error(id, "scheduler", "release_failed",
                     released.error().internal_message);
    }
    return Result<void, Error>::Err(
        Error::Canceled("Scheduling canceled by shutdown"));
  }

  if (done.execution.resource_used > 0) {
    auto item_usage = store_->add_work_item_usage(id, done.execution.resource_used);
    if (item_usage.is_err()) {
      return item_usage;
    }
    auto executor_usage =
        store_->add_executor_usage(done.executor_id, done.execution.resource_used);
    if (executor_usage.is_err()) {
      return executor_usage;
    }
  }

  const bool approved =
      done.execution.success &&
      (done.review.has_value() ? done.review->approved : reviewer_ == nullptr);

  if (approved) {
    // The reviewer may already have merged the item itself.
    auto current = store_->get_work_item(id);
    if (current.is_err()) {
      return Result<void, Error>::Err(current.error());
    }
    if (!current.value().has_value() ||
        current.value()->status != WorkItemStatus::Merged) {
      auto merged = store_->update_work_item_status(id, WorkItemStatus::Merged);
      if (merged.is_err()) {
        return Result<void, Error>::Err(merged.error());
      }
    }
    completed_.insert(id);
    outcome_.completed.push_back(id);
    events_->emit(EventType::TaskCompleted, id,
                  {{"executor", done.executor_id}});
    if (logger_) {
      logger_->info(id, "scheduler", "task_completed",
                    "executor=" + done.executor_id);
    }
    return release();
  }

  std::string reason;
  if (!done.execution.success) {
    reason = done.execution.error.empty() ? "execution failed"
                                          : done.execution.error;
  } else {
    reason = "review rejected";
    if (done.review.has_value() && !done.review->feedback.empty()) {
      reason += ": " + done.review->feedback;
    }
  }

  auto handled = handle_failure(id, reason);
  auto released = release();
  if (handled.is_err()) {
    return handled;
  }
  return released;
}

Result<void, Error> TaskScheduler::handle_failure(const std::string &work_item_id,
                                                  const std::string &reason) {
  events_->emit(EventType::TaskFailed, work_item_id, {{"error", reason}});

  auto recorded = store_->record_work_item_error(work_item_id, reason);
  if (recorded.is_err()) {
    return recorded;
  }

  auto retries = store_->increment_retry(work_item_id);
  if (retries.is_err()) {
    return Result<void, Error>::Err(retries.error());
  }
  const int retry_count = retries.value();

  if (retry_count >= config_.max_retries) {
    auto blocked =
        store_->update_work_item_status(work_item_id, WorkItemStatus::Blocked);
    if (blocked.is_err()) {
      return Result<void, Error>::Err(blocked.error());
    }
    failed_.insert(work_item_id);
    outcome_.failed.push_back(work_item_id);
    events_->emit(EventType::Escalation, work_item_id,
                  {{"reason", "Max retries exceeded"},
                   {"retry_count", std::to_string(retry_count)},
                   {"error", reason}});
    if (logger_) {
      logger_->warn(work_item_id, "scheduler", "escalation",
                    "Blocked after " + std::to_string(retry_count) +
                        " failed attempt(s): " + reason);
    }
    return Result<void, Error>::Ok();
  }

  auto requeued =
      store_->update_work_item_status(work_item_id, WorkItemStatus::Pending);
  if (requeued.is_err()) {
    return Result<void, Error>::Err(requeued.error());
  }
  pending_.push_back(std::move(requeued).value());
  if (logger_) {
    logger_->info(work_item_id, "scheduler", "retry_scheduled",
                  "attempt " + std::to_string(retry_count) + " of " +
                      std::to_string(config_.max_retries) + " failed: " +
                      reason);
  }
  return Result<void, Error>::Ok();
}

void TaskScheduler::remove_pending(const std::string &work_item_id) {
  pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                [&work_item_id](const WorkItem &item) {
                                  return item.id == work_item_id;
                                }),
                 pending_.end());
}

void TaskScheduler::abandon_in_flight() {
  // Abandoned executions keep their shared context alive and post into a
  // channel nobody drains; their items stay IN_PROGRESS until the next
  // crash-recovery sweep re-admits them.
  for (auto &[_, flight] : in_flight_) {
    if (flight.thread.joinable()) {
      flight.thread.detach();
    }
  }
  in_flight_.clear();
}

Result<MilestoneOutcome, Error> TaskScheduler::abort(Error error) {
  if (logger_) {
    logger_->error("scheduler", "scheduler", "loop_aborted",
                   std::string(to_string(error.category)) + ": " +
                       error.message + " (in_flight=" +
                       std::to_string(in_flight_.size()) + ")");
  }
  abandon_in_flight();
  pending_.clear();
  return Result<MilestoneOutcome, Error>::Err(std::move(error));
}

void TaskScheduler::execute(const Attempt &attempt, CompletionChannel &channel) {
  Completion done;
  done.work_item_id = attempt.item.id;
  done.executor_id = attempt.worker->executor_id;

  try {
    done.execution = attempt.worker->executor->run(attempt.item, *attempt.cancel);
  } catch (const std::exception &e) {
    done.execution.success = false;
    done.execution.error = std::string("executor threw: ") + e.what();
  } catch (...) {
    done.execution.success = false;
    done.execution.error = "executor threw a non-standard exception";
  }

  if (done.execution.success && !attempt.cancel->is_canceled()) {
    auto to_review = attempt.store->update_work_item_status(
        attempt.item.id, WorkItemStatus::Review);
    if (to_review.is_err()) {
      done.fatal = to_review.error();
    } else {
      done.reached_review = true;
      if (attempt.reviewer) {
        attempt.machine->begin_review();
        attempt.events->emit(EventType::ReviewStarted, attempt.item.id,
                             {{"executor", done.executor_id}});
        try {
          done.review = attempt.reviewer->review(to_review.value());
        } catch (const std::exception &e) {
          done.fatal = Error(ErrorCategory::Execution, 2002,
                             "Review of " + attempt.item.id +
                                 " failed: " + e.what());
        } catch (...) {
          done.fatal = Error(ErrorCategory::Execution, 2002,
                             "Review of " + attempt.item.id +
                                 " failed with a non-standard exception");
        }
        attempt.machine->end_review();
        attempt.events->emit(
            EventType::ReviewCompleted, attempt.item.id,
            {{"approved", done.review.has_value() && done.review->approved
                              ? "true"
                              : "false"}});
      }
    }
  }

  channel.post(std::move(done));
}

} // namespace convoy::core
