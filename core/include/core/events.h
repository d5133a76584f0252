#pragma once

#include "core/work_item.h"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace convoy::core {

class ILogger;

// ---- Lifecycle Events ----

enum class EventType {
  PipelineStarted,
  PlanningStarted,
  PlanningCompleted,
  MilestoneStarted,
  MilestoneCompleted,
  TaskStarted,
  TaskCompleted,
  TaskFailed,
  ReviewStarted,
  ReviewCompleted,
  Escalation,
  PipelineCompleted,
  PipelineFailed,
  Paused
};

/// Convert EventType to its wire name ("task_started", ...).
const char *to_string(EventType type);

struct Event {
  EventType type = EventType::PipelineStarted;
  std::string subject_id; // Milestone or work item id, empty for pipeline
  std::map<std::string, std::string> data;
  TimePoint at{};
};

/// Fan-out of lifecycle events to registered listeners.
///
/// Thread-safe: events are emitted from the scheduler loop and from
/// execution threads (review events). Listener exceptions are caught and
/// logged; they never reach the emitter.
class EventBus {
public:
  using Listener = std::function<void(const Event &)>;
  using ListenerId = std::size_t;

  explicit EventBus(std::shared_ptr<ILogger> logger = nullptr);

  ListenerId subscribe(Listener listener);
  void unsubscribe(ListenerId id);

  void emit(EventType type, std::string subject_id = {},
            std::map<std::string, std::string> data = {});

  [[nodiscard]] std::size_t listener_count() const;

private:
  std::shared_ptr<ILogger> logger_;
  mutable std::mutex mutex_;
  ListenerId next_id_ = 1;
  std::vector<std::pair<ListenerId, Listener>> listeners_;
};

} // namespace convoy::core
