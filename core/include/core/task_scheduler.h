#pragma once

#include "core/cancel_token.h"
#include "core/collaborators.h"
#include "core/error.h"
#include "core/events.h"
#include "core/pipeline_state.h"
#include "core/result.h"
#include "core/state_store.h"
#include "core/work_item.h"
#include "core/worker_pool.h"

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace convoy::core {

class ILogger;

/// What the loop does when pending items exist, nothing is in flight and
/// nothing can become ready (dependency cycle, forward reference).
enum class StallPolicy {
  Wait,   // Keep polling until shutdown; stalled items stay PENDING
  Abandon // End the milestone, leaving stalled items PENDING
};

struct SchedulerConfig {
  int max_retries = 3; // Failures before escalation to BLOCKED
  std::chrono::milliseconds poll_interval{100};
  StallPolicy stall_policy = StallPolicy::Wait;
};

/// Result of driving one milestone's work items to exhaustion.
struct MilestoneOutcome {
  std::vector<std::string> completed; // Merged during this run
  std::vector<std::string> failed;    // Escalated or already failed
  std::vector<std::string> stalled;   // Left PENDING (StallPolicy::Abandon)
};

/// Per-milestone scheduling loop.
///
/// One control flow repeatedly asks the dependency resolver for ready items,
/// reserves worker slots, starts executions and harvests whichever finishes
/// first. Executions (and their reviews) run concurrently on their own
/// threads and report back through a completion channel; every store
/// mutation for scheduling decisions happens on the control flow.
///
/// The completed and failed sets live for the scheduler's lifetime, so
/// dependencies may cross milestones.
///
/// Invariant: a work item id is in exactly one of pending, in-flight or
/// completed/failed at any time, and is never in flight twice.
class TaskScheduler {
public:
  TaskScheduler(SchedulerConfig config, std::shared_ptr<IStateStore> store,
                std::shared_ptr<WorkerPool> pool,
                std::shared_ptr<EventBus> events,
                std::shared_ptr<PipelineStateMachine> machine,
                std::shared_ptr<IReviewer> reviewer,
                std::shared_ptr<CancelToken> cancel,
                std::shared_ptr<ILogger> logger = nullptr);
  ~TaskScheduler();

  TaskScheduler(const TaskScheduler &) = delete;
  TaskScheduler &operator=(const TaskScheduler &) = delete;

  /// Drive `items` until none is pending or in flight.
  /// Returns Canceled when the cancel token trips (in-flight items are left
  /// IN_PROGRESS for the crash-recovery sweep), or the first persistence /
  /// review-invocation error.
  Result<MilestoneOutcome, Error> run(const std::vector<WorkItem> &items);

  /// Seed the completed set, e.g. with items merged in an earlier session.
  void mark_completed(const std::string &work_item_id);

  [[nodiscard]] const std::unordered_set<std::string> &completed() const {
    return completed_;
  }
  [[nodiscard]] const std::unordered_set<std::string> &failed() const {
    return failed_;
  }

private:
  struct Completion;
  class CompletionChannel;
  struct Attempt;

  struct InFlight {
    std::shared_ptr<WorkerHandle> worker;
    std::thread thread;
  };

  /// Body of an execution thread: run, move to REVIEW, review, post.
  static void execute(const Attempt &attempt, CompletionChannel &channel);

  Result<void, Error> admit_initial(const std::vector<WorkItem> &items);
  Result<void, Error> refresh_pending();
  Result<bool, Error> dispatch(const WorkItem &item);
  Result<void, Error> harvest(Completion &done);
  Result<void, Error> handle_failure(const std::string &work_item_id,
                                     const std::string &reason);
  void remove_pending(const std::string &work_item_id);
  void abandon_in_flight();
  Result<MilestoneOutcome, Error> abort(Error error);

  SchedulerConfig config_;
  std::shared_ptr<IStateStore> store_;
  std::shared_ptr<WorkerPool> pool_;
  std::shared_ptr<EventBus> events_;
  std::shared_ptr<PipelineStateMachine> machine_;
  std::shared_ptr<IReviewer> reviewer_;
  std::shared_ptr<CancelToken> cancel_;
  std::shared_ptr<ILogger> logger_;
  std::shared_ptr<CompletionChannel> channel_;

  std::vector<WorkItem> pending_; // Working copies, discovery order
  std::unordered_map<std::string, InFlight> in_flight_;
  std::unordered_set<std::string> completed_;
  std::unordered_set<std::string> failed_;
  MilestoneOutcome outcome_;
};

} // namespace convoy::core
