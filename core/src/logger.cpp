#include "batchkin/core/common/logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>

#ifndef _WIN32
#include <unistd.h>
#include <cstdio>
#endif

namespace batchkin::core {

static LogLevel levelFromEnvironment() {
  const char* env = std::getenv("BATCHKIN_LOG_LEVEL");
  LogLevel level = LogLevel::Warn;
  if (env != nullptr && !parseLogLevel(env, &level)) {
    std::cerr << "[batchkin][WARN] ignoring BATCHKIN_LOG_LEVEL=" << env << "\n";
  }
  return level;
}

static std::atomic<LogLevel> g_level{levelFromEnvironment()};
static std::atomic<LogSink> g_sink{nullptr};

const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Info: return "INFO";
    case LogLevel::Debug: return "DEBUG";
  }
  return "UNKNOWN";
}

bool parseLogLevel(const std::string& name, LogLevel* out) {
  if (!out) return false;
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (s == "error") { *out = LogLevel::Error; return true; }
  if (s == "warn" || s == "warning") { *out = LogLevel::Warn; return true; }
  if (s == "info") { *out = LogLevel::Info; return true; }
  if (s == "debug") { *out = LogLevel::Debug; return true; }
  return false;
}

static bool useColor() {
#ifdef _WIN32
  return false;
#else
  static const bool cached =
      std::getenv("NO_COLOR") == nullptr && isatty(fileno(stderr)) != 0;
  return cached;
#endif
}

static const char* logLevelToColor(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "\x1b[31m";  // red
    case LogLevel::Warn: return "\x1b[33m";   // yellow
    case LogLevel::Info: return "\x1b[36m";   // cyan
    case LogLevel::Debug: return "\x1b[90m";  // bright black
  }
  return "\x1b[0m";
}

static void stderrSink(LogLevel level, const std::string& msg) {
  if (useColor()) {
    std::cerr << logLevelToColor(level) << "[batchkin][" << logLevelToString(level)
              << "] " << msg << "\x1b[0m\n";
    return;
  }
  std::cerr << "[batchkin][" << logLevelToString(level) << "] " << msg << "\n";
}

void setLogLevel(LogLevel level) {
  g_level.store(level);
}

LogLevel getLogLevel() {
  return g_level.load();
}

void setLogSink(LogSink sink) {
  g_sink.store(sink);
}

LogSink getLogSink() {
  return g_sink.load();
}

bool shouldLog(LogLevel level) {
  return static_cast<int>(level) <= static_cast<int>(g_level.load());
}

void log(LogLevel level, const std::string& msg) {
  if (!shouldLog(level)) return;
  LogSink sink = g_sink.load();
  (sink ? sink : &stderrSink)(level, msg);
}

void log(LogLevel level, const char* msg) {
  if (!shouldLog(level)) return;
  log(level, msg ? std::string(msg) : std::string());
}

}  // namespace batchkin::core
