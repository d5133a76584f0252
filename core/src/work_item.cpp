#include "core/work_item.h"

#include <initializer_list>

namespace convoy::core {

const char *to_string(WorkItemStatus status) {
  switch (status) {
  case WorkItemStatus::Pending:
    return "PENDING";
  case WorkItemStatus::InProgress:
    return "IN_PROGRESS";
  case WorkItemStatus::Review:
    return "REVIEW";
  case WorkItemStatus::Merged:
    return "MERGED";
  case WorkItemStatus::Failed:
    return "FAILED";
  case WorkItemStatus::Blocked:
    return "BLOCKED";
  }
  return "UNKNOWN";
}

std::optional<WorkItemStatus> parse_work_item_status(std::string_view name) {
  for (auto status :
       {WorkItemStatus::Pending, WorkItemStatus::InProgress,
        WorkItemStatus::Review, WorkItemStatus::Merged, WorkItemStatus::Failed,
        WorkItemStatus::Blocked}) {
    if (name == to_string(status)) {
      return status;
    }
  }
  return std::nullopt;
}

bool is_terminal(WorkItemStatus status) {
  switch (status) {
  case WorkItemStatus::Merged:
  case WorkItemStatus::Failed:
  case WorkItemStatus::Blocked:
    return true;
  default:
    return false;
  }
}

bool can_transition(WorkItemStatus from, WorkItemStatus to) {
  if (from == to) {
    return true;
  }

  switch (from) {
  case WorkItemStatus::Pending:
    return to == WorkItemStatus::InProgress || to == WorkItemStatus::Blocked ||
           to == WorkItemStatus::Failed;
  case WorkItemStatus::InProgress:
    return to == WorkItemStatus::Pending || to == WorkItemStatus::Review ||
           to == WorkItemStatus::Blocked || to == WorkItemStatus::Failed;
  case WorkItemStatus::Review:
    return to == WorkItemStatus::Merged || to == WorkItemStatus::Pending ||
           to == WorkItemStatus::Blocked || to == WorkItemStatus::Failed;
  case WorkItemStatus::Merged:
  case WorkItemStatus::Failed:
  case WorkItemStatus::Blocked:
    // Terminal states: no transitions allowed
    return false;
  }
  return false;
}

const char *to_string(ExecutorStatus status) {
  switch (status) {
  case ExecutorStatus::Idle:
    return "IDLE";
  case ExecutorStatus::Running:
    return "RUNNING";
  case ExecutorStatus::Waiting:
    return "WAITING";
  case ExecutorStatus::Error:
    return "ERROR";
  case ExecutorStatus::Terminated:
    return "TERMINATED";
  }
  return "UNKNOWN";
}

std::optional<ExecutorStatus> parse_executor_status(std::string_view name) {
  for (auto status : {ExecutorStatus::Idle, ExecutorStatus::Running,
                      ExecutorStatus::Waiting, ExecutorStatus::Error,
                      ExecutorStatus::Terminated}) {
    if (name == to_string(status)) {
      return status;
    }
  }
  return std::nullopt;
}

} // namespace convoy::core
