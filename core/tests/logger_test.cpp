#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "lerpable/core/common/logger.hpp"

using lerpable::core::LogLevel;
using lerpable::core::getLogLevel;
using lerpable::core::logLevelFromString;
using lerpable::core::setLogLevel;
using lerpable::core::shouldLog;

static std::vector<std::string> g_messages;

static void captureSink(LogLevel, const std::string& msg) {
  g_messages.push_back(msg);
}

// Registered with LERPABLE_LOG_LEVEL=debug; must run before anything sets the level.
static void test_level_from_environment() {
  assert(getLogLevel() == LogLevel::Debug);
  assert(shouldLog(LogLevel::Debug));

  lerpable::core::setLogSink(&captureSink);
  lerpable::core::log(LogLevel::Debug, "initial level");
  assert(g_messages.size() == 1);
  assert(g_messages[0] == "initial level");
  lerpable::core::setLogSink(nullptr);
}

static void test_level_names() {
  assert(logLevelFromString("DEBUG") == LogLevel::Debug);
  assert(logLevelFromString("Warning") == LogLevel::Warn);
  assert(logLevelFromString("error") == LogLevel::Error);
  assert(!logLevelFromString("verbose").has_value());
}

static void test_level_filtering() {
  lerpable::core::setLogSink(&captureSink);
  setLogLevel(LogLevel::Warn);
  g_messages.clear();
  lerpable::core::log(LogLevel::Info, "dropped");
  lerpable::core::log(LogLevel::Warn, "kept");
  assert(g_messages.size() == 1);
  assert(g_messages[0] == "kept");
  lerpable::core::setLogSink(nullptr);
}

int main() {
  test_level_from_environment();
  test_level_names();
  test_level_filtering();
  std::cout << "lerpable_logger_test: PASS\n";
  return 0;
}
