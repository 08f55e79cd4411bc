#pragma once
#include <cstdint>
#include <string>

namespace batchkin::core {

enum class LogLevel : std::uint8_t {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3
};

using LogSink = void(*)(LogLevel, const std::string&);

// The initial level is Warn, or the value of BATCHKIN_LOG_LEVEL
// (error|warn|info|debug, case-insensitive) when that is set.
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Returns false and leaves `out` untouched for unrecognized names.
bool parseLogLevel(const std::string& name, LogLevel* out);

// nullptr restores the stderr sink.
void setLogSink(LogSink sink);
LogSink getLogSink();

bool shouldLog(LogLevel level);
void log(LogLevel level, const std::string& msg);
void log(LogLevel level, const char* msg);

// "<op>: <msg>" at Error level; returns `st` so call sites can `return fail(...)`.
template <typename StatusT>
StatusT logFailure(StatusT st, const char* op, const std::string& msg) {
  log(LogLevel::Error, std::string(op) + ": " + msg);
  return st;
}

const char* logLevelToString(LogLevel level);

}  // namespace batchkin::core
