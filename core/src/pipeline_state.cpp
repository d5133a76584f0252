#include "core/pipeline_state.h"

namespace convoy::core {

const char *to_string(PipelineState state) {
  switch (state) {
  case PipelineState::Idle:
    return "IDLE";
  case PipelineState::Planning:
    return "PLANNING";
  case PipelineState::Executing:
    return "EXECUTING";
  case PipelineState::Reviewing:
    return "REVIEWING";
  case PipelineState::Completed:
    return "COMPLETED";
  case PipelineState::Failed:
    return "FAILED";
  }
  return "UNKNOWN";
}

bool is_terminal(PipelineState state) {
  return state == PipelineState::Completed || state == PipelineState::Failed;
}

PipelineState PipelineStateMachine::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool PipelineStateMachine::is_paused() const { return gate_.is_paused(); }

std::string PipelineStateMachine::failure_reason() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failure_reason_;
}

Result<void, Error> PipelineStateMachine::transition_to(PipelineState next) {
  std::lock_guard<std::mutex> lock(mutex_);

  bool legal = false;
  switch (state_) {
  case PipelineState::Idle:
    legal = (next == PipelineState::Planning ||
             next == PipelineState::Executing);
    break;
  case PipelineState::Planning:
    legal = (next == PipelineState::Executing || next == PipelineState::Failed);
    break;
  case PipelineState::Executing:
    legal = (next == PipelineState::Reviewing ||
             next == PipelineState::Completed || next == PipelineState::Failed);
    break;
  case PipelineState::Reviewing:
    legal = (next == PipelineState::Executing ||
             next == PipelineState::Completed || next == PipelineState::Failed);
    break;
  case PipelineState::Completed:
  case PipelineState::Failed:
    legal = false;
    break;
  }

  if (!legal) {
    return Result<void, Error>::Err(Error::Internal(
        std::string("Illegal pipeline transition: ") + to_string(state_) +
        " -> " + to_string(next)));
  }

  state_ = next;
  if (next == PipelineState::Executing || next == PipelineState::Completed) {
    active_reviews_ = 0;
  }
  return Result<void, Error>::Ok();
}

Result<void, Error> PipelineStateMachine::fail(std::string reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (is_terminal(state_)) {
    return Result<void, Error>::Err(Error::Internal(
        std::string("Cannot fail a terminal pipeline: ") + to_string(state_)));
  }
  state_ = PipelineState::Failed;
  failure_reason_ = std::move(reason);
  return Result<void, Error>::Ok();
}

Result<void, Error> PipelineStateMachine::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != PipelineState::Idle && !is_terminal(state_)) {
    return Result<void, Error>::Err(Error::Internal(
        std::string("Cannot reset a running pipeline: ") + to_string(state_)));
  }
  state_ = PipelineState::Idle;
  active_reviews_ = 0;
  failure_reason_.clear();
  return Result<void, Error>::Ok();
}

void PipelineStateMachine::begin_review() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++active_reviews_;
  if (state_ == PipelineState::Executing) {
    state_ = PipelineState::Reviewing;
  }
}

void PipelineStateMachine::end_review() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (active_reviews_ > 0) {
    --active_reviews_;
  }
  if (active_reviews_ == 0 && state_ == PipelineState::Reviewing) {
    state_ = PipelineState::Executing;
  }
}

void PipelineStateMachine::pause() { gate_.pause(); }

void PipelineStateMachine::resume() { gate_.resume(); }

} // namespace convoy::core
