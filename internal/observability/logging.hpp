#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace hostreg::config::v1 {
class RuntimeConfig;
}

namespace hostreg::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const hostreg::config::v1::RuntimeConfig& config);
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

} // namespace hostreg::observability

#define HOSTREG_LOG_DEBUG(message, ...) ::hostreg::observability::LogDebug((message), ##__VA_ARGS__)
#define HOSTREG_LOG_INFO(message, ...) ::hostreg::observability::LogInfo((message), ##__VA_ARGS__)
#define HOSTREG_LOG_WARN(message, ...) ::hostreg::observability::LogWarn((message), ##__VA_ARGS__)
#define HOSTREG_LOG_ERROR(message, ...) ::hostreg::observability::LogError((message), ##__VA_ARGS__)
