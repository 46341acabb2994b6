#pragma once
#include "lerpable/core/export.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace lerpable::core {

enum class LogLevel : std::uint8_t {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3
};

using LogSink = void(*)(LogLevel, const std::string&);

// The initial level is Warn unless LERPABLE_LOG_LEVEL names another level
// ("error", "warn", "info", "debug"); setLogLevel() overrides either.
LERPABLE_CORE_API void setLogLevel(LogLevel level);
LERPABLE_CORE_API LogLevel getLogLevel();

// nullptr restores the stderr sink.
LERPABLE_CORE_API void setLogSink(LogSink sink);
LERPABLE_CORE_API LogSink getLogSink();

LERPABLE_CORE_API bool shouldLog(LogLevel level);
LERPABLE_CORE_API void log(LogLevel level, const std::string& msg);
LERPABLE_CORE_API void log(LogLevel level, const char* msg);

LERPABLE_CORE_API const char* logLevelToString(LogLevel level);
LERPABLE_CORE_API std::optional<LogLevel> logLevelFromString(const std::string& name);

}  // namespace lerpable::core
