#include "lerpable/core/common/logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>

#ifndef _WIN32
#include <unistd.h>
#include <cstdio>
#endif

namespace lerpable::core {

static LogLevel initialLevel() {
  const char* env = std::getenv("LERPABLE_LOG_LEVEL");
  if (env == nullptr) {
    return LogLevel::Warn;
  }
  const std::optional<LogLevel> parsed = logLevelFromString(env);
  return parsed ? *parsed : LogLevel::Warn;
}

static std::atomic<LogLevel>& levelRef() {
  static std::atomic<LogLevel> level{initialLevel()};
  return level;
}

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

std::optional<LogLevel> logLevelFromString(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "error") return LogLevel::Error;
  if (lower == "warn" || lower == "warning") return LogLevel::Warn;
  if (lower == "info") return LogLevel::Info;
  if (lower == "debug") return LogLevel::Debug;
  return std::nullopt;
}

static bool useColor() {
#ifdef _WIN32
  return false;
#else
  static const bool enabled =
      std::getenv("NO_COLOR") == nullptr && isatty(fileno(stderr)) != 0;
  return enabled;
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
  const bool color = useColor();
  if (color) {
    std::cerr << logLevelToColor(level);
  }
  std::cerr << "[lerpable][" << logLevelToString(level) << "] " << msg;
  if (color) {
    std::cerr << "\x1b[0m";
  }
  std::cerr << "\n";
}

void setLogLevel(LogLevel level) {
  levelRef().store(level);
}

LogLevel getLogLevel() {
  return levelRef().load();
}

void setLogSink(LogSink sink) {
  g_sink.store(sink);
}

LogSink getLogSink() {
  return g_sink.load();
}

bool shouldLog(LogLevel level) {
  return static_cast<int>(level) <= static_cast<int>(getLogLevel());
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

}  // namespace lerpable::core
