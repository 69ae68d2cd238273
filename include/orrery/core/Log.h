#pragma once

#include <string_view>

namespace orrery::core {

enum class LogLevel {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Off   = 5
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

std::string_view toString(LogLevel level);

// Accepts trace|debug|info|warn|error|off (case-insensitive).
bool parseLogLevel(std::string_view text, LogLevel& out);

// Optional callback sink for log messages.
//
// Sinks run after the message has been written to stderr and obey the level filter.
// The timestamp and message views are only valid for the duration of the callback.
struct LogSink {
  using Fn = void (*)(LogLevel level, std::string_view timestamp, std::string_view message, void* user);
  Fn fn{nullptr};
  void* user{nullptr};
};

void addLogSink(LogSink sink);
void removeLogSink(LogSink sink);

// Writes "[HH:MM:SS.mmm][LEVEL] message" to stderr, then forwards to sinks.
void log(LogLevel level, std::string_view message);

} // namespace orrery::core

#define ORRERY_LOG_TRACE(msg) ::orrery::core::log(::orrery::core::LogLevel::Trace, (msg))
#define ORRERY_LOG_DEBUG(msg) ::orrery::core::log(::orrery::core::LogLevel::Debug, (msg))
#define ORRERY_LOG_INFO(msg)  ::orrery::core::log(::orrery::core::LogLevel::Info,  (msg))
#define ORRERY_LOG_WARN(msg)  ::orrery::core::log(::orrery::core::LogLevel::Warn,  (msg))
#define ORRERY_LOG_ERROR(msg) ::orrery::core::log(::orrery::core::LogLevel::Error, (msg))
