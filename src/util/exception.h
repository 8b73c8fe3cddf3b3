#pragma once

/// @file exception.h
/// @brief Exception classes for autopitch.

#include <stdexcept>
#include <string>

#include "util/types.h"

namespace autopitch {

/// @brief Base exception class for autopitch errors.
class AutopitchException : public std::runtime_error {
 public:
  /// @brief Constructs exception with error code.
  /// @param code Error code
  explicit AutopitchException(ErrorCode code)
      : std::runtime_error(error_message(code)), code_(code) {}

  /// @brief Constructs exception with error code and custom message.
  /// @param code Error code
  /// @param message Custom error message
  AutopitchException(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  /// @brief Returns the error code.
  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

/// @def AUTOPITCH_CHECK
/// @brief Throws AutopitchException if condition is false.
#define AUTOPITCH_CHECK(cond, code)   \
  do {                                \
    if (!(cond)) {                    \
      throw AutopitchException(code); \
    }                                 \
  } while (0)

/// @def AUTOPITCH_CHECK_MSG
/// @brief Throws AutopitchException with custom message if condition is false.
#define AUTOPITCH_CHECK_MSG(cond, code, msg) \
  do {                                       \
    if (!(cond)) {                           \
      throw AutopitchException(code, msg);   \
    }                                        \
  } while (0)

}  // namespace autopitch
