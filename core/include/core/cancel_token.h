#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace convoy::core {

/// Thread-safe, process-level cancellation token.
///
/// Tripped once by request_cancel() (operator interrupt, shutdown). The
/// scheduler loop consults it at every suspension point; executors receive
/// it so that long-running work can stop early.
class CancelToken {
public:
  CancelToken() = default;

  /// Request cancellation. Thread-safe, idempotent.
  void request_cancel() noexcept;

  /// Check if cancellation has been requested.
  [[nodiscard]] bool is_canceled() const noexcept;

  /// Sleep for at most `timeout`, waking early on cancellation.
  /// Returns true if the token was canceled.
  bool wait_for(std::chrono::milliseconds timeout) const;

  /// Register a callback to be invoked when cancellation is requested.
  /// Callbacks are invoked synchronously from request_cancel(); an exception
  /// thrown by one is dropped. A callback registered after cancellation runs
  /// immediately.
  using Callback = std::function<void()>;
  void on_cancel(Callback cb);

  /// Create a shared CancelToken.
  static std::shared_ptr<CancelToken> create();

private:
  static void invoke(const Callback &cb) noexcept;

  std::atomic<bool> canceled_{false};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::vector<Callback> callbacks_;
};

} // namespace convoy::core
