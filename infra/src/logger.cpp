#include "infra/logger.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace convoy::infra {
namespace {

constexpr const char *kPattern = "[%Y-%m-%dT%H:%M:%S.%e%z] [%^%l%$] %v";

spdlog::level::level_enum to_spdlog(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return spdlog::level::debug;
  case LogLevel::Info:
    return spdlog::level::info;
  case LogLevel::Warn:
    return spdlog::level::warn;
  case LogLevel::Error:
    return spdlog::level::err;
  case LogLevel::Off:
    return spdlog::level::off;
  }
  return spdlog::level::info;
}

/// Structured logger over any spdlog logger.
class SpdLogger : public core::ILogger {
public:
  explicit SpdLogger(std::shared_ptr<spdlog::logger> logger)
      : logger_(std::move(logger)) {}

  void info(const std::string &correlation_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->info("[{}] [{}] {}: {}", correlation_id, component, event, msg);
  }

  void warn(const std::string &correlation_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->warn("[{}] [{}] {}: {}", correlation_id, component, event, msg);
  }

  void error(const std::string &correlation_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->error("[{}] [{}] {}: {}", correlation_id, component, event, msg);
    logger_->flush();
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

LogLevel parse_log_level(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug" || lower == "trace") {
    return LogLevel::Debug;
  }
  if (lower == "warn" || lower == "warning") {
    return LogLevel::Warn;
  }
  if (lower == "error") {
    return LogLevel::Error;
  }
  if (lower == "off") {
    return LogLevel::Off;
  }
  return LogLevel::Info;
}

std::unique_ptr<core::ILogger> create_console_logger(LogLevel level) {
  auto logger = spdlog::get("convoy");
  if (!logger) {
    logger = spdlog::stdout_color_mt("convoy");
  }
  logger->set_pattern(kPattern);
  logger->set_level(to_spdlog(level));
  return std::make_unique<SpdLogger>(std::move(logger));
}

std::unique_ptr<core::ILogger> create_file_logger(const std::string &path,
                                                  LogLevel level) {
  // Not registered globally: several runs may log to different files.
  auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
  auto logger = std::make_shared<spdlog::logger>("convoy-file", std::move(sink));
  logger->set_pattern(kPattern);
  logger->set_level(to_spdlog(level));
  logger->flush_on(spdlog::level::warn);
  return std::make_unique<SpdLogger>(std::move(logger));
}

} // namespace convoy::infra
