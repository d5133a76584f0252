#pragma once

#include "core/events.h"
#include "core/logger.h"
#include "core/state_store.h"

#include <atomic>
#include <memory>

namespace convoy::infra {

/// Subscribes to an EventBus and appends one LogEntry per lifecycle event
/// to the state store, so a run's history survives the process.
///
/// The entry's executor id is the executor named by the event, or
/// "orchestrator" for pipeline-level events. Store failures are logged and
/// counted; they never reach the emitter.
class EventRecorder {
public:
  EventRecorder(core::EventBus &bus, std::shared_ptr<core::IStateStore> store,
                std::shared_ptr<core::ILogger> logger = nullptr);

  /// Unsubscribes. `bus` must still be alive.
  ~EventRecorder();

  EventRecorder(const EventRecorder &) = delete;
  EventRecorder &operator=(const EventRecorder &) = delete;

  [[nodiscard]] int recorded() const;
  [[nodiscard]] int dropped() const;

private:
  struct Sink {
    std::shared_ptr<core::IStateStore> store;
    std::shared_ptr<core::ILogger> logger;
    std::atomic<int> recorded{0};
    std::atomic<int> dropped{0};

    void record(const core::Event &event);
  };

  core::EventBus &bus_;
  std::shared_ptr<Sink> sink_; // Shared with the listener closure
  core::EventBus::ListenerId listener_id_ = 0;
};

} // namespace convoy::infra
