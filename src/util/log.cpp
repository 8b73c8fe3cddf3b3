/// @file log.cpp
/// @brief Implementation of the diagnostic message sinks.

#include "util/log.h"

#include <iostream>

namespace autopitch {

namespace {
constexpr const char* kLogPrefix = "[auto_pitch] ";
}  // namespace

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Info:
      return "info";
    case LogLevel::Warning:
      return "warning";
  }
  return "unknown";
}

std::string format_log_line(LogLevel level, const std::string& message) {
  if (level == LogLevel::Warning) {
    return std::string(kLogPrefix) + "WARN: " + message;
  }
  return std::string(kLogPrefix) + message;
}

void default_log_callback(LogLevel level, const std::string& message) {
  if (level == LogLevel::Debug) return;
  std::cerr << format_log_line(level, message) << "\n";
}

void null_log_callback(LogLevel /*level*/, const std::string& /*message*/) {}

}  // namespace autopitch
