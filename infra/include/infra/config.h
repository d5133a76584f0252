#pragma once

#include "core/error.h"
#include "core/orchestrator.h"
#include "core/result.h"
#include "infra/logger.h"

#include <filesystem>
#include <string>

namespace convoy::infra {

/// Application configuration, read from CONVOY_* environment variables.
///
///   CONVOY_PROJECT_ROOT         project being orchestrated (default: cwd)
///   CONVOY_STATE_DIR            state directory (default: <root>/.convoy)
///   CONVOY_MAX_WORKERS          1..10, default 5
///   CONVOY_MAX_RETRIES          1..5, default 3
///   CONVOY_SHUTDOWN_TIMEOUT_MS  > 0, default 2000
///   CONVOY_POLL_INTERVAL_MS     > 0, default 100
///   CONVOY_LOG_LEVEL            debug|info|warn|error|off, default info
struct AppConfig {
  std::filesystem::path project_root;
  std::filesystem::path state_dir;
  core::OrchestratorConfig orchestrator;
  LogLevel log_level = LogLevel::Info;

  /// <state_dir>/state.db
  [[nodiscard]] std::filesystem::path database_path() const;

  /// <state_dir>/logs
  [[nodiscard]] std::filesystem::path log_dir() const;

  /// Create the state and log directories if missing.
  core::Result<void, core::Error> ensure_dirs() const;

  /// Out-of-range or non-numeric values are Validation errors.
  static core::Result<AppConfig, core::Error> from_environment();
};

} // namespace convoy::infra
