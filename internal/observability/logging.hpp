#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace graphvc::runtime::config {
class RuntimeConfig;
}

namespace graphvc::observability {

/*
  Structured logging over spdlog.

  Messages are short constant phrases; everything variable goes into
  key=value fields. Values containing spaces, quotes or '=' are quoted.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// JSON pointer lists, comma joined
LogField PathsField(std::string_view key, const std::vector<std::string>& paths);

void InitializeLogging(const graphvc::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

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

} // namespace graphvc::observability

#define GRAPHVC_LOG_DEBUG(message, ...) ::graphvc::observability::LogDebug((message), ##__VA_ARGS__)
#define GRAPHVC_LOG_INFO(message, ...) ::graphvc::observability::LogInfo((message), ##__VA_ARGS__)
#define GRAPHVC_LOG_WARN(message, ...) ::graphvc::observability::LogWarn((message), ##__VA_ARGS__)
#define GRAPHVC_LOG_ERROR(message, ...) ::graphvc::observability::LogError((message), ##__VA_ARGS__)
