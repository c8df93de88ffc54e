#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace twingraph::observability {
namespace {

constexpr const char* kLoggerName     = "twingraph";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// Environment first, then the config file, then the fallback.
std::string Setting(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool NeedsQuotes(const std::string& value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\t' || c == '\n') return true;
  }
  return false;
}

void AppendValue(std::string& out, const std::string& value) {
  if (!NeedsQuotes(value)) {
    out += value;
    return;
  }
  out += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') out += '\\';
    if (c == '\n') {
      out += "\\n";
      continue;
    }
    out += c;
  }
  out += '"';
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

spdlog::level::level_enum ParseLevel(std::string_view name) {
  if (name == "warning") return spdlog::level::warn;

  // from_str maps unknown names to "off", which would silence the library
  const auto level = spdlog::level::from_str(std::string(name));
  if (level == spdlog::level::off && name != "off") {
    throw std::runtime_error("Unknown log level: " + std::string(name));
  }
  return level;
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out += ' ';
    out += field.key;
    out += '=';
    AppendValue(out, field.value);
  }
  return out;
}

void InitializeLogging(const twingraph::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();
  const auto  level   = ParseLevel(Setting("TWINGRAPH_LOG_LEVEL", logging.level(), "info"));
  const auto  pattern = Setting("TWINGRAPH_LOG_PATTERN", logging.pattern(), kDefaultPattern);

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!logging.file().empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logging.file()));
    } catch (const spdlog::spdlog_ex& e) {
      throw std::runtime_error("Failed to open log file " + logging.file() + ": " + e.what());
    }
  }

  // re-initializing replaces the sinks of an earlier call
  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(pattern);
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  const auto formatted = FormatFields(fields);
  if (formatted.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, formatted);
}

// ------------------------------------------------------------
// CallLog
// ------------------------------------------------------------

CallLog::CallLog(std::string_view operation, std::string_view subject)
    : operation_(operation), subject_(subject), started_at_(std::chrono::steady_clock::now()) {
}

std::int64_t CallLog::ElapsedMs() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at_)
      .count();
}

void CallLog::Completed() const {
  LogDebug("call completed",
           {StringField("operation", operation_), StringField("subject", subject_), IntField("duration_ms", ElapsedMs())});
}

void CallLog::Failed(const std::exception& error) const {
  LogError("call failed", {StringField("operation", operation_), StringField("subject", subject_),
                           StringField("error", error.what()), IntField("duration_ms", ElapsedMs())});
}

} // namespace twingraph::observability
