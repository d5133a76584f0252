#include "infra/config.h"

#include <chrono>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace convoy::infra {
namespace {

std::optional<std::string> read_env(const char *name) {
  const char *value = std::getenv(name);
  if (value && value[0] != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

/// Parse an integer variable and check it against [min, max].
core::Result<int, core::Error> read_int(const char *name, int fallback, int min,
                                        int max) {
  auto raw = read_env(name);
  if (!raw) {
    return core::Result<int, core::Error>::Ok(fallback);
  }

  int value = 0;
  try {
    size_t consumed = 0;
    value = std::stoi(*raw, &consumed);
    if (consumed != raw->size()) {
      throw std::invalid_argument(*raw);
    }
  } catch (const std::exception &) {
    return core::Result<int, core::Error>::Err(core::Error::Validation(
        std::string(name) + " must be an integer, got '" + *raw + "'"));
  }

  if (value < min || value > max) {
    return core::Result<int, core::Error>::Err(core::Error::Validation(
        std::string(name) + " must be between " + std::to_string(min) +
        " and " + std::to_string(max) + ", got " + std::to_string(value)));
  }
  return core::Result<int, core::Error>::Ok(value);
}

} // namespace

std::filesystem::path AppConfig::database_path() const {
  return state_dir / "state.db";
}

std::filesystem::path AppConfig::log_dir() const { return state_dir / "logs"; }

core::Result<void, core::Error> AppConfig::ensure_dirs() const {
  std::error_code ec;
  std::filesystem::create_directories(log_dir(), ec);
  if (ec) {
    return core::Result<void, core::Error>::Err(core::Error::Persistence(
        "Cannot create state directory " + state_dir.string(), ec.message()));
  }
  return core::Result<void, core::Error>::Ok();
}

core::Result<AppConfig, core::Error> AppConfig::from_environment() {
  using ConfigResult = core::Result<AppConfig, core::Error>;
  AppConfig config;

  if (auto root = read_env("CONVOY_PROJECT_ROOT")) {
    config.project_root = *root;
  } else {
    std::error_code ec;
    config.project_root = std::filesystem::current_path(ec);
    if (ec) {
      return ConfigResult::Err(core::Error::Validation(
          "CONVOY_PROJECT_ROOT is not set and the working directory is "
          "unavailable"));
    }
  }

  if (auto state = read_env("CONVOY_STATE_DIR")) {
    config.state_dir = *state;
  } else {
    config.state_dir = config.project_root / ".convoy";
  }

  auto workers = read_int("CONVOY_MAX_WORKERS", 5, 1, 10);
  if (workers.is_err()) {
    return ConfigResult::Err(workers.error());
  }
  config.orchestrator.max_workers = workers.value();

  auto retries = read_int("CONVOY_MAX_RETRIES", 3, 1, 5);
  if (retries.is_err()) {
    return ConfigResult::Err(retries.error());
  }
  config.orchestrator.max_retries = retries.value();

  auto shutdown_ms = read_int("CONVOY_SHUTDOWN_TIMEOUT_MS", 2000, 1, 600000);
  if (shutdown_ms.is_err()) {
    return ConfigResult::Err(shutdown_ms.error());
  }
  config.orchestrator.shutdown_timeout =
      std::chrono::milliseconds(shutdown_ms.value());

  auto poll_ms = read_int("CONVOY_POLL_INTERVAL_MS", 100, 1, 60000);
  if (poll_ms.is_err()) {
    return ConfigResult::Err(poll_ms.error());
  }
  config.orchestrator.poll_interval = std::chrono::milliseconds(poll_ms.value());

  if (auto level = read_env("CONVOY_LOG_LEVEL")) {
    config.log_level = parse_log_level(*level);
  }

  return ConfigResult::Ok(std::move(config));
}

} // namespace convoy::infra
