#include "infra/event_recorder.h"

#include <utility>

namespace convoy::infra {
namespace {

const char *level_for(core::EventType type) {
  switch (type) {
  case core::EventType::PipelineFailed:
    return "ERROR";
  case core::EventType::TaskFailed:
  case core::EventType::Escalation:
    return "WARN";
  default:
    return "INFO";
  }
}

} // namespace

EventRecorder::EventRecorder(core::EventBus &bus,
                             std::shared_ptr<core::IStateStore> store,
                             std::shared_ptr<core::ILogger> logger)
    : bus_(bus), sink_(std::make_shared<Sink>()) {
  sink_->store = std::move(store);
  sink_->logger = std::move(logger);

  // The closure owns the sink, so an emit racing with destruction is safe.
  auto sink = sink_;
  listener_id_ = bus_.subscribe(
      [sink](const core::Event &event) { sink->record(event); });
}

EventRecorder::~EventRecorder() { bus_.unsubscribe(listener_id_); }

int EventRecorder::recorded() const { return sink_->recorded.load(); }

int EventRecorder::dropped() const { return sink_->dropped.load(); }

void EventRecorder::Sink::record(const core::Event &event) {
  core::LogEntry entry;
  auto executor = event.data.find("executor");
  entry.executor_id =
      executor != event.data.end() ? executor->second : "orchestrator";
  entry.level = level_for(event.type);
  entry.message = core::to_string(event.type);
  if (!event.subject_id.empty()) {
    entry.message += " " + event.subject_id;
  }
  entry.metadata = event.data;
  entry.metadata["event"] = core::to_string(event.type);
  if (!event.subject_id.empty()) {
    entry.metadata["subject"] = event.subject_id;
  }
  entry.timestamp = event.at;

  auto appended = store->append_log(entry);
  if (appended.is_err()) {
    dropped.fetch_add(1);
    if (logger) {
      logger->warn(event.subject_id, "event_recorder", "record_failed",
                   appended.error().internal_message);
    }
    return;
  }
  recorded.fetch_add(1);
}

} // namespace convoy::infra
