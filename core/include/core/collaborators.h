#pragma once

#include "core/cancel_token.h"
#include "core/work_item.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace convoy::core {

// ============================================================
// External collaborator contracts.
// The orchestration core only consumes these; prompt content, model
// backends and repository handling live behind them.
// ============================================================

/// Output of the planning phase.
struct PlanResult {
  std::vector<Milestone> milestones;
  bool valid = true;       // false when the planner output was unparsable
  std::string parse_error; // Planner-side detail when !valid
};

/// Turns requirements into an ordered list of milestones.
class IPlanner {
public:
  virtual ~IPlanner() = default;
  virtual PlanResult plan(const std::string &requirements) = 0;
};

/// Splits one milestone into work items with populated dependencies.
class IDecomposer {
public:
  virtual ~IDecomposer() = default;
  virtual std::vector<WorkItem> decompose(const Milestone &milestone) = 0;
};

/// Final outcome of one execution attempt. Transient backend failures are
/// retried inside the executor and never show up here.
struct ExecutionResult {
  bool success = false;
  std::int64_t resource_used = 0;
  std::string error; // Failure context, empty on success
};

/// One live executor instance bound to a single work item.
class IExecutor {
public:
  virtual ~IExecutor() = default;

  /// Execute the work item. Should return early once `cancel` trips.
  /// Exceptions are treated as a failed attempt.
  virtual ExecutionResult run(const WorkItem &item,
                              const CancelToken &cancel) = 0;

  /// Graceful stop. May block; callers bound it with a timeout.
  virtual void stop() = 0;

  /// Forced stop after a graceful stop timed out. Must not block.
  virtual void terminate() noexcept = 0;
};

/// Creates the executor that will run `item` under `executor_id`.
using ExecutorFactory = std::function<std::shared_ptr<IExecutor>(
    const std::string &executor_id, const WorkItem &item)>;

struct ReviewResult {
  bool approved = false;
  std::string feedback;
};

/// Reviews an executed work item before it counts as completed.
class IReviewer {
public:
  virtual ~IReviewer() = default;
  virtual ReviewResult review(const WorkItem &item) = 0;
};

/// Bundle handed to the orchestrator.
struct Collaborators {
  std::shared_ptr<IPlanner> planner;
  std::shared_ptr<IDecomposer> decomposer;
  std::shared_ptr<IReviewer> reviewer; // Optional: null approves every item
  ExecutorFactory executor_factory;
};

} // namespace convoy::core
