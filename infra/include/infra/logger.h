#pragma once

#include "core/logger.h"

#include <memory>
#include <string>

namespace convoy::infra {

/// Minimum level passed through to the spdlog sinks.
enum class LogLevel { Debug, Info, Warn, Error, Off };

/// Parse "debug", "info", "warn", "error" or "off" (case-insensitive).
/// Unknown names fall back to Info.
LogLevel parse_log_level(const std::string &name);

/// spdlog-backed console logger.
/// Format: [ts] [level] [correlation_id] [component] event: msg
std::unique_ptr<core::ILogger> create_console_logger(LogLevel level = LogLevel::Info);

/// Same format as the console logger, appended to `path`. Throws
/// spdlog::spdlog_ex if the file cannot be opened.
std::unique_ptr<core::ILogger> create_file_logger(const std::string &path,
                                                  LogLevel level = LogLevel::Info);

} // namespace convoy::infra
