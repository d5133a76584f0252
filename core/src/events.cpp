#include "core/events.h"

#include "core/logger.h"

#include <algorithm>
#include <exception>

namespace convoy::core {

const char *to_string(EventType type) {
  switch (type) {
  case EventType::PipelineStarted:
    return "started";
  case EventType::PlanningStarted:
    return "planning_started";
  case EventType::PlanningCompleted:
    return "planning_completed";
  case EventType::MilestoneStarted:
    return "milestone_started";
  case EventType::MilestoneCompleted:
    return "milestone_completed";
  case EventType::TaskStarted:
    return "task_started";
  case EventType::TaskCompleted:
    return "task_completed";
  case EventType::TaskFailed:
    return "task_failed";
  case EventType::ReviewStarted:
    return "review_started";
  case EventType::ReviewCompleted:
    return "review_completed";
  case EventType::Escalation:
    return "escalation";
  case EventType::PipelineCompleted:
    return "completed";
  case EventType::PipelineFailed:
    return "failed";
  case EventType::Paused:
    return "paused";
  }
  return "unknown";
}

EventBus::EventBus(std::shared_ptr<ILogger> logger)
    : logger_(std::move(logger)) {}

EventBus::ListenerId EventBus::subscribe(Listener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  const ListenerId id = next_id_++;
  listeners_.emplace_back(id, std::move(listener));
  return id;
}

void EventBus::unsubscribe(ListenerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [id](const auto &entry) {
                                    return entry.first == id;
                                  }),
                   listeners_.end());
}

void EventBus::emit(EventType type, std::string subject_id,
                    std::map<std::string, std::string> data) {
  Event event;
  event.type = type;
  event.subject_id = std::move(subject_id);
  event.data = std::move(data);
  event.at = Clock::now();

  // Snapshot listeners so a listener may (un)subscribe without deadlock.
  std::vector<std::pair<ListenerId, Listener>> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners = listeners_;
  }

  for (const auto &[id, listener] : listeners) {
    if (!listener) {
      continue;
    }
    try {
      listener(event);
    } catch (const std::exception &e) {
      if (logger_) {
        logger_->error(event.subject_id, "events", "listener_failed",
                       std::string("listener ") + std::to_string(id) +
                           " threw on " + to_string(type) + ": " + e.what());
      }
    } catch (...) {
      if (logger_) {
        logger_->error(event.subject_id, "events", "listener_failed",
                       std::string("listener ") + std::to_string(id) +
                           " threw a non-standard exception on " +
                           to_string(type));
      }
    }
  }
}

std::size_t EventBus::listener_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listeners_.size();
}

} // namespace convoy::core
