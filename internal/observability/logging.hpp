#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <initializer_list>
#include <string>
#include <string_view>

namespace twingraph::runtime::config {
class RuntimeConfig;
}

namespace twingraph::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// spdlog level names plus "warning"; throws std::runtime_error for anything else.
spdlog::level::level_enum ParseLevel(std::string_view name);

// key=value pairs; values that are empty or hold spaces, quotes or '=' are quoted.
std::string FormatFields(std::initializer_list<LogField> fields);

void InitializeLogging(const twingraph::runtime::config::RuntimeConfig& config);
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

/*
  One client call: the operation, the twin, model or query it acts on,
  and how long it took. Completed logs at debug, Failed at error.
*/
class CallLog {
 public:
  CallLog(std::string_view operation, std::string_view subject);

  void Completed() const;
  void Failed(const std::exception& error) const;

  std::int64_t ElapsedMs() const;

 private:
  std::string                           operation_;
  std::string                           subject_;
  std::chrono::steady_clock::time_point started_at_;
};

} // namespace twingraph::observability

#define TWINGRAPH_LOG_DEBUG(message, ...) ::twingraph::observability::LogDebug((message), ##__VA_ARGS__)
#define TWINGRAPH_LOG_INFO(message, ...) ::twingraph::observability::LogInfo((message), ##__VA_ARGS__)
#define TWINGRAPH_LOG_WARN(message, ...) ::twingraph::observability::LogWarn((message), ##__VA_ARGS__)
#define TWINGRAPH_LOG_ERROR(message, ...) ::twingraph::observability::LogError((message), ##__VA_ARGS__)
