#include "core/pause_gate.h"

namespace convoy::core {

void PauseGate::pause() {
  std::lock_guard<std::mutex> lock(mutex_);
  paused_ = true;
}

void PauseGate::resume() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = false;
  }
  cv_.notify_all();
}

bool PauseGate::is_paused() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return paused_;
}

bool PauseGate::wait_until_open(const CancelToken &cancel,
                                std::chrono::milliseconds recheck) const {
  std::unique_lock<std::mutex> lock(mutex_);
  while (paused_) {
    if (cancel.is_canceled()) {
      return false;
    }
    cv_.wait_for(lock, recheck);
  }
  return !cancel.is_canceled();
}

} // namespace convoy::core
