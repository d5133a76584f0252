#pragma once

#include <string>

namespace convoy::core {

/// Logger interface used by the orchestration core.
/// Concrete implementations live in infra. The correlation id is a run,
/// milestone or work-item id; component names the emitting subsystem.
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual void info(const std::string &correlation_id,
                    const std::string &component, const std::string &event,
                    const std::string &msg) = 0;

  virtual void warn(const std::string &correlation_id,
                    const std::string &component, const std::string &event,
                    const std::string &msg) = 0;

  virtual void error(const std::string &correlation_id,
                     const std::string &component, const std::string &event,
                     const std::string &msg) = 0;
};

} // namespace convoy::core
