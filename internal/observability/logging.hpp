#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/util/lsn.hpp"

namespace pgcdc::runtime::config {
class LoggingConfig;
}

namespace pgcdc::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// WAL position in the server's text form, e.g. lsn=0/16B3748
LogField LsnField(std::string_view key, util::Lsn lsn);

void InitializeLogging(const pgcdc::runtime::config::LoggingConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogTrace(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::trace, message, fields);
}

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace pgcdc::observability

#define PGCDC_LOG_TRACE(message, ...) ::pgcdc::observability::LogTrace((message), ##__VA_ARGS__)
#define PGCDC_LOG_DEBUG(message, ...) ::pgcdc::observability::LogDebug((message), ##__VA_ARGS__)
#define PGCDC_LOG_INFO(message, ...) ::pgcdc::observability::LogInfo((message), ##__VA_ARGS__)
#define PGCDC_LOG_WARN(message, ...) ::pgcdc::observability::LogWarn((message), ##__VA_ARGS__)
#define PGCDC_LOG_ERROR(message, ...) ::pgcdc::observability::LogError((message), ##__VA_ARGS__)
