#pragma once

#include "core/error.h"
#include "core/pause_gate.h"
#include "core/result.h"

#include <mutex>
#include <string>

namespace convoy::core {

// ---- Pipeline State Enum ----

enum class PipelineState {
  Idle,      // Not started
  Planning,  // Planner running
  Executing, // Milestones being decomposed and scheduled
  Reviewing, // At least one review in progress
  Completed, // All milestones processed (terminal)
  Failed     // Validation or collaborator failure (terminal)
};

const char *to_string(PipelineState state);

/// Completed and Failed never re-enter Planning on their own.
bool is_terminal(PipelineState state);

/// Explicit pipeline state machine shared by the orchestrator, the
/// scheduler loop and the execution threads. State only changes through
/// the transition methods below.
///
/// Pause is an orthogonal flag: pausing never changes state(), it only
/// closes the admission gate.
class PipelineStateMachine {
public:
  PipelineStateMachine() = default;
  PipelineStateMachine(const PipelineStateMachine &) = delete;
  PipelineStateMachine &operator=(const PipelineStateMachine &) = delete;

  [[nodiscard]] PipelineState state() const;
  [[nodiscard]] bool is_paused() const;

  /// Reason recorded by the last fail(), empty otherwise.
  [[nodiscard]] std::string failure_reason() const;

  /// Attempt a transition. Returns Err if the transition is illegal.
  /// Legal transitions:
  ///   Idle      -> Planning, Executing (resume from the store)
  ///   Planning  -> Executing, Failed
  ///   Executing -> Reviewing, Completed, Failed
  ///   Reviewing -> Executing, Completed, Failed
  Result<void, Error> transition_to(PipelineState next);

  /// Move to Failed from any non-terminal state and record `reason`.
  /// Returns Err if the machine is already terminal.
  Result<void, Error> fail(std::string reason);

  /// Explicit re-invocation: Completed/Failed/Idle -> Idle.
  Result<void, Error> reset();

  /// Review bookkeeping, called from execution threads. The machine is in
  /// Reviewing while at least one review is running.
  void begin_review();
  void end_review();

  void pause();
  void resume();
  [[nodiscard]] const PauseGate &pause_gate() const { return gate_; }

private:
  mutable std::mutex mutex_;
  PipelineState state_ = PipelineState::Idle;
  int active_reviews_ = 0;
  std::string failure_reason_;
  PauseGate gate_;
};

} // namespace convoy::core
