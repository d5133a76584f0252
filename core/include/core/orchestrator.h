#pragma once

#include "core/cancel_token.h"
#include "core/collaborators.h"
#include "core/error.h"
#include "core/events.h"
#include "core/pipeline_state.h"
#include "core/result.h"
#include "core/state_store.h"
#include "core/task_scheduler.h"
#include "core/work_item.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace convoy::core {

class ILogger;
class WorkerPool;

struct OrchestratorConfig {
  int max_workers = 5; // Worker pool capacity
  int max_retries = 3; // Failures before a work item is escalated
  std::chrono::milliseconds poll_interval{100};
  std::chrono::milliseconds shutdown_timeout{2000}; // Per executor
  StallPolicy stall_policy = StallPolicy::Wait;
  std::string executor_kind = "implementer";
};

struct MilestoneSummary {
  std::string id;
  std::string name;
  int phase = 0;
  WorkItemStatus status = WorkItemStatus::Pending;
};

/// Summary returned by a finished run.
struct RunReport {
  std::string run_id;
  std::string status; // "completed" or "completed_with_failures"
  StoreStatistics statistics;
  int completed_count = 0;             // MERGED work items
  std::vector<std::string> failed_ids; // BLOCKED or FAILED work items
  std::vector<MilestoneSummary> milestones;
  std::int64_t total_resource = 0; // Sum of work item usage
};

/// Orchestrator: drives one pipeline run from requirements to merged
/// milestones.
///
/// Responsibilities:
///   1. Invoke the planner once and validate its output
///   2. Persist milestones and run them strictly in phase order
///   3. Decompose each milestone and hand its items to a TaskScheduler
///   4. Publish lifecycle events and keep the pipeline state machine current
///   5. Tear down live executors when the run fails or is shut down
///
/// Does NOT execute work items itself; executors do, gated by the pool.
/// run() and resume_run() block the calling thread; pause(), resume() and
/// request_shutdown() may be called from any other thread.
class Orchestrator {
public:
  Orchestrator(OrchestratorConfig config, std::shared_ptr<IStateStore> store,
               Collaborators collaborators,
               std::shared_ptr<ILogger> logger = nullptr);
  ~Orchestrator();

  Orchestrator(const Orchestrator &) = delete;
  Orchestrator &operator=(const Orchestrator &) = delete;

  /// Plan and execute a fresh run. A pipeline left COMPLETED or FAILED by an
  /// earlier run is reset first. Returns Internal if a run is in progress.
  Result<RunReport, Error> run(const std::string &requirements);

  /// Continue from the persisted state after a crash or shutdown: sweeps
  /// stale records, skips planning and every MERGED milestone.
  Result<RunReport, Error> resume_run();

  /// Stop admitting new work items; in-flight ones keep running.
  void pause();
  void resume();

  /// Trip the current run's cancel token. Live executors are stopped, each
  /// bounded by the shutdown timeout. Issued while no run is in progress,
  /// it applies to the next run, which then fails with Canceled before
  /// planning.
  void request_shutdown();

  [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
  [[nodiscard]] PipelineState state() const { return machine_->state(); }
  [[nodiscard]] bool is_paused() const { return machine_->is_paused(); }

  EventBus &events() { return *events_; }
  [[nodiscard]] const PipelineStateMachine &state_machine() const {
    return *machine_;
  }
  [[nodiscard]] const OrchestratorConfig &config() const { return config_; }

private:
  Result<RunReport, Error> start(const std::string *requirements);
  Result<std::vector<Milestone>, Error> plan(const std::string &requirements);
  Result<void, Error> execute_milestones(const std::vector<Milestone> &milestones,
                                         TaskScheduler &scheduler,
                                         bool resuming);
  Result<std::vector<WorkItem>, Error> load_or_decompose(const Milestone &milestone);
  Result<void, Error> seed_completed(TaskScheduler &scheduler);
  Result<RunReport, Error> fail(Error error);
  Result<RunReport, Error> generate_report();
  std::shared_ptr<CancelToken> current_cancel() const;
  /// Replace `used` with a fresh token once its run is over, if it tripped.
  void retire_cancel(const std::shared_ptr<CancelToken> &used);
  std::string generate_run_id();

  OrchestratorConfig config_;
  std::shared_ptr<IStateStore> store_;
  Collaborators collaborators_;
  std::shared_ptr<ILogger> logger_;
  std::shared_ptr<EventBus> events_;
  std::shared_ptr<PipelineStateMachine> machine_;

  std::atomic<bool> running_{false};
  mutable std::mutex run_mutex_; // Guards cancel_, pool_ and run_id_
  std::shared_ptr<CancelToken> cancel_;
  std::shared_ptr<WorkerPool> pool_;
  std::string run_id_;
};

} // namespace convoy::core
