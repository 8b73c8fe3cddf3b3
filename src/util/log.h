#pragma once

/// @file log.h
/// @brief Diagnostic message sink used by the resolution pipeline.

#include <functional>
#include <string>

namespace autopitch {

/// @brief Severity of a diagnostic message.
enum class LogLevel {
  Debug,
  Info,
  Warning,
};

/// @brief Receives diagnostic messages.
/// @details The library never writes to a stream itself; callers install a
/// callback (or keep the default stderr sink).
using LogCallback = std::function<void(LogLevel level, const std::string& message)>;

/// @brief Returns the name of a log level.
/// @param level Log level
/// @return "debug", "info" or "warning"
const char* log_level_name(LogLevel level);

/// @brief Formats a message as an "[auto_pitch]" log line (no trailing newline).
/// @param level Log level
/// @param message Message text
/// @return Formatted line, warnings carry a "WARN:" marker
std::string format_log_line(LogLevel level, const std::string& message);

/// @brief Default sink writing Info and Warning lines to stderr.
void default_log_callback(LogLevel level, const std::string& message);

/// @brief Sink that discards everything.
void null_log_callback(LogLevel level, const std::string& message);

}  // namespace autopitch
