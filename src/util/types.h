#pragma once

/// @file types.h
/// @brief Common type definitions for autopitch.

#include <optional>

namespace autopitch {

/// @brief Error codes for library operations.
enum class ErrorCode : int {
  Ok = 0,
  FileNotFound,
  InvalidFormat,
  DecodeFailed,
  InvalidParameter,
  EstimationFailed,
};

/// @brief Single representative fundamental frequency in Hz.
/// @details An empty optional means "could not estimate". It is a normal
/// outcome, not an error.
using F0Estimate = std::optional<float>;

/// @brief Returns error message for an error code.
/// @param code Error code
/// @return Human-readable error message
inline const char* error_message(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return "OK";
    case ErrorCode::FileNotFound:
      return "File not found";
    case ErrorCode::InvalidFormat:
      return "Invalid format";
    case ErrorCode::DecodeFailed:
      return "Decode failed";
    case ErrorCode::InvalidParameter:
      return "Invalid parameter";
    case ErrorCode::EstimationFailed:
      return "Estimation failed";
  }
  return "Unknown error";
}

}  // namespace autopitch
