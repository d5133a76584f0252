#pragma once

#include "core/cancel_token.h"

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace convoy::core {

/// Shared admission gate behind pause/resume.
///
/// Closing the gate blocks admission of new work; it never interrupts work
/// that is already executing. Every wait is cancel-aware so that a process
/// shutdown is never held up by a paused pipeline.
class PauseGate {
public:
  PauseGate() = default;
  PauseGate(const PauseGate &) = delete;
  PauseGate &operator=(const PauseGate &) = delete;

  /// Close the gate. Idempotent.
  void pause();

  /// Open the gate and wake every waiter. Idempotent.
  void resume();

  [[nodiscard]] bool is_paused() const;

  /// Block until the gate is open. Returns false if `cancel` was tripped
  /// first. `recheck` bounds how long a single wait lasts before the cancel
  /// token is consulted again.
  bool wait_until_open(const CancelToken &cancel,
                       std::chrono::milliseconds recheck =
                           std::chrono::milliseconds(50)) const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool paused_ = false;
};

} // namespace convoy::core
