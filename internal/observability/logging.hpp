#pragma once

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace rfshared::runtime::config {
class LoggingConfig;
}

namespace rfshared::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Leveled logging capability.

  Components receive a Logger at construction instead of reaching for a
  process-wide registry. Fields are rendered as key=value after the message.
*/
class Logger {
 public:
  virtual ~Logger() = default;

  virtual void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {}) = 0;

  void Debug(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(spdlog::level::debug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(spdlog::level::info, message, fields);
  }

  void Warning(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(spdlog::level::warn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(spdlog::level::err, message, fields);
  }

  void Critical(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(spdlog::level::critical, message, fields);
  }
};

using LoggerPtr = std::shared_ptr<Logger>;

class SpdLogger final : public Logger {
 public:
  explicit SpdLogger(std::shared_ptr<spdlog::logger> logger);

  void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {}) override;

  const std::shared_ptr<spdlog::logger>& underlying() const {
    return logger_;
  }

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

// Discards everything.
class NullLogger final : public Logger {
 public:
  void Log(spdlog::level::level_enum, std::string_view, std::initializer_list<LogField> = {}) override {
  }
};

/*
  Builds an unregistered spdlog logger writing to stderr.

  Level and pattern come from RFSHARED_LOG_LEVEL / RFSHARED_LOG_PATTERN when
  set, then from the config, then default to info and an ISO-8601 pattern.
*/
LoggerPtr MakeLogger(const std::string& name, const rfshared::runtime::config::LoggingConfig& config);
LoggerPtr MakeLogger(const std::string& name);

std::string SerializeFields(std::initializer_list<LogField> fields);

} // namespace rfshared::observability
