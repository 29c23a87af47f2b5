#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace rfshared::observability {
namespace {

std::string ResolveLevel(const rfshared::runtime::config::LoggingConfig& config) {
  if (const char* level = std::getenv("RFSHARED_LOG_LEVEL")) {
    return level;
  }

  if (!config.level().empty()) {
    return config.level();
  }

  return "info";
}

std::string ResolvePattern(const rfshared::runtime::config::LoggingConfig& config) {
  if (const char* pattern = std::getenv("RFSHARED_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.pattern().empty()) {
    return config.pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%n] [%^%l%$] %v";
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

SpdLogger::SpdLogger(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {
}

void SpdLogger::Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!logger_->should_log(level)) {
    return;
  }

  auto serialized_fields = SerializeFields(fields);
  if (!serialized_fields.empty()) {
    logger_->log(level, "{} {}", message, serialized_fields);
    return;
  }
  logger_->log(level, "{}", message);
}

LoggerPtr MakeLogger(const std::string& name, const rfshared::runtime::config::LoggingConfig& config) {
  auto sink   = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  logger->flush_on(spdlog::level::warn);
  return std::make_shared<SpdLogger>(std::move(logger));
}

LoggerPtr MakeLogger(const std::string& name) {
  return MakeLogger(name, rfshared::runtime::config::LoggingConfig{});
}

} // namespace rfshared::observability
