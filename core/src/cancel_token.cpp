#include "core/cancel_token.h"

namespace convoy::core {

void CancelToken::request_cancel() noexcept {
  bool expected = false;
  if (!canceled_.compare_exchange_strong(expected, true,
                                         std::memory_order_release,
                                         std::memory_order_relaxed)) {
    return;
  }

  std::vector<Callback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks.swap(callbacks_);
  }
  cv_.notify_all();

  // First cancellation: invoke callbacks outside the lock.
  for (auto &cb : callbacks) {
    invoke(cb);
  }
}

void CancelToken::invoke(const Callback &cb) noexcept {
  if (!cb) {
    return;
  }
  try {
    cb();
  } catch (...) { /* swallow: cancel must not throw */
  }
}

bool CancelToken::is_canceled() const noexcept {
  return canceled_.load(std::memory_order_acquire);
}

bool CancelToken::wait_for(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]() { return is_canceled(); });
}

void CancelToken::on_cancel(Callback cb) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_canceled()) {
      callbacks_.push_back(std::move(cb));
      return;
    }
  }
  // Already canceled: invoke immediately
  invoke(cb);
}

std::shared_ptr<CancelToken> CancelToken::create() {
  return std::make_shared<CancelToken>();
}

} // namespace convoy::core
