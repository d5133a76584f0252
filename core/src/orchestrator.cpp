#include "core/orchestrator.h"

#include "core/logger.h"
#include "core/worker_pool.h"

#include <algorithm>
#include <exception>
#include <functional>
#include <random>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace convoy::core {
namespace {

/// Runs `on_exit` and then clears the running flag however start() returns.
class RunningScope {
public:
  RunningScope(std::atomic<bool> &flag, std::function<void()> on_exit)
      : flag_(flag), on_exit_(std::move(on_exit)) {}
  ~RunningScope() {
    if (on_exit_) {
      on_exit_();
    }
    flag_.store(false);
  }

  RunningScope(const RunningScope &) = delete;
  RunningScope &operator=(const RunningScope &) = delete;

private:
  std::atomic<bool> &flag_;
  std::function<void()> on_exit_;
};

} // namespace

Orchestrator::Orchestrator(OrchestratorConfig config,
                           std::shared_ptr<IStateStore> store,
                           Collaborators collaborators,
                           std::shared_ptr<ILogger> logger)
    : config_(std::move(config)), store_(std::move(store)),
      collaborators_(std::move(collaborators)), logger_(std::move(logger)),
      events_(std::make_shared<EventBus>(logger_)),
      machine_(std::make_shared<PipelineStateMachine>()),
      cancel_(CancelToken::create()) {
  config_.max_workers = std::max(1, config_.max_workers);
  config_.max_retries = std::max(1, config_.max_retries);
}

Orchestrator::~Orchestrator() {
  request_shutdown();
  std::shared_ptr<WorkerPool> pool;
  {
    std::lock_guard<std::mutex> lock(run_mutex_);
    pool = std::move(pool_);
  }
  if (pool) {
    pool->shutdown();
  }
}

Result<RunReport, Error> Orchestrator::run(const std::string &requirements) {
  return start(&requirements);
}

Result<RunReport, Error> Orchestrator::resume_run() { return start(nullptr); }

void Orchestrator::pause() {
  if (machine_->is_paused()) {
    return;
  }
  machine_->pause();
  events_->emit(EventType::Paused, {}, {{"state", to_string(machine_->state())}});
  if (logger_) {
    logger_->info("pipeline", "orchestrator", "paused",
                  "Admission of new work items paused");
  }
}

void Orchestrator::resume() {
  if (!machine_->is_paused()) {
    return;
  }
  machine_->resume();
  if (logger_) {
    logger_->info("pipeline", "orchestrator", "resumed",
                  "Admission of new work items resumed");
  }
}

void Orchestrator::request_shutdown() {
  auto cancel = current_cancel();
  if (cancel->is_canceled()) {
    return;
  }
  if (logger_ && running_.load()) {
    logger_->warn("pipeline", "orchestrator", "shutdown_requested",
                  "Stopping admission and shutting down live executors");
  }
  cancel->request_cancel();
}

Result<RunReport, Error> Orchestrator::start(const std::string *requirements) {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return Result<RunReport, Error>::Err(
        Error::Internal("Orchestrator already running"));
  }
  std::shared_ptr<CancelToken> cancel;
  RunningScope running(running_, [this, &cancel]() {
    if (cancel) {
      retire_cancel(cancel);
    }
  });

  // ---- Fresh run state ----
  if (machine_->state() != PipelineState::Idle) {
    auto reset = machine_->reset();
    if (reset.is_err()) {
      return Result<RunReport, Error>::Err(reset.error());
    }
  }

  auto pool = std::make_shared<WorkerPool>(
      config_.max_workers, collaborators_.executor_factory, store_, logger_,
      config_.shutdown_timeout, config_.executor_kind);
  // The run adopts the pending token; a shutdown requested while idle
  // stays in effect.
  const std::string run_id = generate_run_id();
  {
    std::lock_guard<std::mutex> lock(run_mutex_);
    pool_ = pool;
    cancel = cancel_;
    run_id_ = run_id;
  }

  SchedulerConfig scheduler_config;
  scheduler_config.max_retries = config_.max_retries;
  scheduler_config.poll_interval = config_.poll_interval;
  scheduler_config.stall_policy = config_.stall_policy;
  TaskScheduler scheduler(scheduler_config, store_, pool, events_, machine_,
                          collaborators_.reviewer, cancel, logger_);

  const bool resuming = requirements == nullptr;
  events_->emit(EventType::PipelineStarted, {},
                {{"run_id", run_id}, {"mode", resuming ? "resume" : "fresh"}});
  if (logger_) {
    logger_->info(run_id, "orchestrator", "run_start",
                  std::string(resuming ? "Resuming" : "Starting") +
                      " pipeline: max_workers=" +
                      std::to_string(config_.max_workers) +
                      " max_retries=" + std::to_string(config_.max_retries));
  }

  if (cancel->is_canceled()) {
    return fail(Error::Canceled("Shutdown requested before the run started"));
  }

  std::vector<Milestone> milestones;
  if (resuming) {
    // ---- Crash recovery ----
    auto swept = store_->cleanup_stale_states();
    if (swept.is_err()) {
      return fail(swept.error());
    }
    if (logger_) {
      logger_->info(run_id, "orchestrator", "stale_states_cleaned",
                    std::to_string(swept.value()) + " record(s) reset");
    }

    auto transitioned = machine_->transition_to(PipelineState::Executing);
    if (transitioned.is_err()) {
      return fail(transitioned.error());
    }

    auto persisted = store_->list_milestones();
    if (persisted.is_err()) {
      return fail(persisted.error());
    }
    milestones = std::move(persisted).value();
    if (milestones.empty()) {
      return fail(Error::Validation("No milestones found to resume"));
    }
  } else {
    auto planned = plan(*requirements);
    if (planned.is_err()) {
      return fail(planned.error());
    }
    milestones = std::move(planned).value();

    auto transitioned = machine_->transition_to(PipelineState::Executing);
    if (transitioned.is_err()) {
      return fail(transitioned.error());
    }
  }

  auto seeded = seed_completed(scheduler);
  if (seeded.is_err()) {
    return fail(seeded.error());
  }

  auto executed = execute_milestones(milestones, scheduler, resuming);
  if (executed.is_err()) {
    return fail(executed.error());
  }

  auto completed = machine_->transition_to(PipelineState::Completed);
  if (completed.is_err()) {
    return fail(completed.error());
  }

  auto report = generate_report();
  if (report.is_err()) {
    // The pipeline itself finished; only the summary could not be read.
    if (logger_) {
      logger_->error(run_id, "orchestrator", "report_failed",
                     report.error().internal_message);
    }
    return report;
  }

  events_->emit(EventType::PipelineCompleted, {},
                {{"run_id", run_id}, {"status", report.value().status}});
  if (logger_) {
    logger_->info(run_id, "orchestrator", "run_completed",
                  "status=" + report.value().status + " merged=" +
                      std::to_string(report.value().completed_count) +
                      " failed=" +
                      std::to_string(report.value().failed_ids.size()));
  }
  return report;
}

Result<std::vector<Milestone>, Error>
Orchestrator::plan(const std::string &requirements) {
  using PlanOutcome = Result<std::vector<Milestone>, Error>;

  auto planning = machine_->transition_to(PipelineState::Planning);
  if (planning.is_err()) {
    return PlanOutcome::Err(planning.error());
  }
  events_->emit(EventType::PlanningStarted);

  if (!collaborators_.planner) {
    return PlanOutcome::Err(Error::Validation("No planner configured"));
  }

  PlanResult result;
  try {
    result = collaborators_.planner->plan(requirements);
  } catch (const std::exception &e) {
    return PlanOutcome::Err(
        Error::Execution(std::string("Planning failed: ") + e.what()));
  } catch (...) {
    return PlanOutcome::Err(
        Error::Execution("Planning failed with a non-standard exception"));
  }

  // ---- Validation gate ----
  if (!result.valid) {
    return PlanOutcome::Err(
        Error(ErrorCategory::Validation, 1002,
              "Failed to parse planning output: " + result.parse_error));
  }
  if (result.milestones.empty()) {
    return PlanOutcome::Err(Error(ErrorCategory::Validation, 1003,
                                  "No milestones found in plan"));
  }

  auto milestones = std::move(result.milestones);
  std::stable_sort(milestones.begin(), milestones.end(),
                   [](const Milestone &a, const Milestone &b) {
                     return a.phase < b.phase;
                   });

  std::unordered_set<std::string> seen;
  for (auto &milestone : milestones) {
    if (milestone.id.empty()) {
      milestone.id = "milestone-" + std::to_string(milestone.phase);
    }
    if (!seen.insert(milestone.id).second) {
      return PlanOutcome::Err(
          Error::Validation("Duplicate milestone id in plan: " + milestone.id));
    }

    auto existing = store_->get_milestone(milestone.id);
    if (existing.is_err()) {
      return PlanOutcome::Err(existing.error());
    }
    if (existing.value().has_value()) {
      // Re-planning the same project keeps the persisted record.
      milestone = *existing.value();
      continue;
    }
    milestone.status = WorkItemStatus::Pending;
    auto created = store_->create_milestone(milestone);
    if (created.is_err()) {
      return PlanOutcome::Err(created.error());
    }
  }

  events_->emit(EventType::PlanningCompleted, {},
                {{"milestones", std::to_string(milestones.size())}});
  if (logger_) {
    logger_->info(run_id_, "orchestrator", "planning_completed",
                  "Created " + std::to_string(milestones.size()) +
                      " milestone(s)");
  }
  return PlanOutcome::Ok(std::move(milestones));
}

Result<void, Error>
Orchestrator::execute_milestones(const std::vector<Milestone> &milestones,
                                 TaskScheduler &scheduler, bool resuming) {
  auto cancel = current_cancel();

  for (const auto &milestone : milestones) {
    // Phases run strictly in order; a paused pipeline waits here too.
    if (!machine_->pause_gate().wait_until_open(*cancel) ||
        cancel->is_canceled()) {
      return Result<void, Error>::Err(
          Error::Canceled("Pipeline shut down before milestone " +
                          milestone.id));
    }

    if (milestone.status == WorkItemStatus::Merged) {
      if (logger_) {
        logger_->info(milestone.id, "orchestrator", "milestone_skipped",
                      resuming ? "Already merged in an earlier session"
                               : "Already merged");
      }
      continue;
    }

    events_->emit(EventType::MilestoneStarted, milestone.id,
                  {{"name", milestone.name},
                   {"phase", std::to_string(milestone.phase)}});
    if (logger_) {
      logger_->info(milestone.id, "orchestrator", "milestone_started",
                    "Phase " + std::to_string(milestone.phase) + ": " +
                        milestone.name);
    }

    auto started =
        store_->update_milestone_status(milestone.id, WorkItemStatus::InProgress);
    if (started.is_err()) {
      return started;
    }

    auto items = load_or_decompose(milestone);
    if (items.is_err()) {
      return Result<void, Error>::Err(items.error());
    }

    auto outcome = scheduler.run(items.value());
    if (outcome.is_err()) {
      return Result<void, Error>::Err(outcome.error());
    }

    // A milestone is closed once its items are exhausted, including when
    // some of them were escalated.
    auto merged =
        store_->update_milestone_status(milestone.id, WorkItemStatus::Merged);
    if (merged.is_err()) {
      return merged;
    }

    const auto &result = outcome.value();
    events_->emit(EventType::MilestoneCompleted, milestone.id,
                  {{"completed", std::to_string(result.completed.size())},
                   {"failed", std::to_string(result.failed.size())},
                   {"stalled", std::to_string(result.stalled.size())}});
    if (logger_) {
      logger_->info(milestone.id, "orchestrator", "milestone_completed",
                    "merged=" + std::to_string(result.completed.size()) +
                        " failed=" + std::to_string(result.failed.size()) +
                        " stalled=" + std::to_string(result.stalled.size()));
    }
  }
  return Result<void, Error>::Ok();
}

Result<std::vector<WorkItem>, Error>
Orchestrator::load_or_decompose(const Milestone &milestone) {
  using Items = Result<std::vector<WorkItem>, Error>;

  auto persisted = store_->list_work_items_by_milestone(milestone.id);
  if (persisted.is_err()) {
    return persisted;
  }
  if (!persisted.value().empty()) {
    if (logger_) {
      logger_->info(milestone.id, "orchestrator", "work_items_reused",
                    std::to_string(persisted.value().size()) +
                        " persisted work item(s)");
    }
    return persisted;
  }

  if (!collaborators_.decomposer) {
    return Items::Err(Error::Validation("No decomposer configured"));
  }

  std::vector<WorkItem> items;
  try {
    items = collaborators_.decomposer->decompose(milestone);
  } catch (const std::exception &e) {
    return Items::Err(Error::Execution("Decomposition of milestone " +
                                       milestone.id + " failed: " + e.what()));
  } catch (...) {
    return Items::Err(Error::Execution("Decomposition of milestone " +
                                       milestone.id +
                                       " failed with a non-standard exception"));
  }

  std::vector<std::string> member_ids;
  member_ids.reserve(items.size());
  int sequence = 0;
  for (auto &item : items) {
    ++sequence;
    if (item.id.empty()) {
      item.id = milestone.id + "-task-" + std::to_string(sequence);
    }
    item.milestone_id = milestone.id;
    item.status = WorkItemStatus::Pending;
    item.assigned_executor.reset();
    item.retry_count = 0;
    item.resource_usage = 0;

    auto created = store_->create_work_item(item);
    if (created.is_err()) {
      return Items::Err(created.error());
    }
    member_ids.push_back(item.id);
  }

  auto members = store_->set_milestone_members(milestone.id, member_ids);
  if (members.is_err()) {
    return Items::Err(members.error());
  }
  if (logger_) {
    logger_->info(milestone.id, "orchestrator", "milestone_decomposed",
                  std::to_string(items.size()) + " work item(s)");
  }

  // Hand back the store's view (timestamps filled in).
  return store_->list_work_items_by_ids(member_ids);
}

Result<void, Error> Orchestrator::seed_completed(TaskScheduler &scheduler) {
  auto merged = store_->list_work_items_by_status(WorkItemStatus::Merged);
  if (merged.is_err()) {
    return Result<void, Error>::Err(merged.error());
  }
  for (const auto &item : merged.value()) {
    scheduler.mark_completed(item.id);
  }
  return Result<void, Error>::Ok();
}

Result<RunReport, Error> Orchestrator::fail(Error error) {
  auto failed = machine_->fail(error.message);
  if (failed.is_err() && logger_) {
    logger_->warn(run_id_, "orchestrator", "fail_on_terminal",
                  failed.error().message);
  }

  events_->emit(EventType::PipelineFailed, {},
                {{"error", error.message},
                 {"category", to_string(error.category)}});
  if (logger_) {
    logger_->error(run_id_, "orchestrator", "run_failed",
                   std::string(to_string(error.category)) + ": " +
                       error.internal_message);
  }

  // Best-effort teardown of every live executor.
  std::shared_ptr<WorkerPool> pool;
  {
    std::lock_guard<std::mutex> lock(run_mutex_);
    pool = pool_;
  }
  if (pool) {
    const int forced = pool->shutdown();
    if (forced > 0 && logger_) {
      logger_->warn(run_id_, "orchestrator", "teardown_forced",
                    std::to_string(forced) + " executor(s) force-terminated");
    }
  }
  return Result<RunReport, Error>::Err(std::move(error));
}

Result<RunReport, Error> Orchestrator::generate_report() {
  RunReport report;
  report.run_id = run_id_;

  auto stats = store_->statistics();
  if (stats.is_err()) {
    return Result<RunReport, Error>::Err(stats.error());
  }
  report.statistics = std::move(stats).value();
  report.total_resource = report.statistics.work_item_resource;

  auto items = store_->list_work_items();
  if (items.is_err()) {
    return Result<RunReport, Error>::Err(items.error());
  }
  for (const auto &item : items.value()) {
    if (item.status == WorkItemStatus::Merged) {
      ++report.completed_count;
    } else if (item.status == WorkItemStatus::Blocked ||
               item.status == WorkItemStatus::Failed) {
      report.failed_ids.push_back(item.id);
    }
  }

  auto milestones = store_->list_milestones();
  if (milestones.is_err()) {
    return Result<RunReport, Error>::Err(milestones.error());
  }
  for (const auto &milestone : milestones.value()) {
    report.milestones.push_back(
        {milestone.id, milestone.name, milestone.phase, milestone.status});
  }

  report.status =
      report.failed_ids.empty() ? "completed" : "completed_with_failures";
  return Result<RunReport, Error>::Ok(std::move(report));
}

void Orchestrator::retire_cancel(const std::shared_ptr<CancelToken> &used) {
  if (!used->is_canceled()) {
    return; // Still clean: the next run keeps it
  }
  std::lock_guard<std::mutex> lock(run_mutex_);
  if (cancel_ == used) {
    cancel_ = CancelToken::create();
  }
}

std::shared_ptr<CancelToken> Orchestrator::current_cancel() const {
  std::lock_guard<std::mutex> lock(run_mutex_);
  return cancel_;
}

std::string Orchestrator::generate_run_id() {
  static std::random_device rd;
  static std::mt19937 gen(rd());
  static std::uniform_int_distribution<uint32_t> dis;

  std::stringstream ss;
  ss << "run-" << std::hex;
  ss << (dis(gen) & 0xFFFFFF);
  ss << "-";
  ss << (dis(gen) & 0xFFFF);
  return ss.str();
}

} // namespace convoy::core
