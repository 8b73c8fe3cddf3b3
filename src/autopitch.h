#pragma once

/// @file autopitch.h
/// @brief Main header for libautopitch - automatic pitch resolution for voice conversion.
/// @details Include this file to access all libautopitch functionality.

// Version information
#define AUTOPITCH_VERSION_MAJOR 1
#define AUTOPITCH_VERSION_MINOR 0
#define AUTOPITCH_VERSION_PATCH 0
#define AUTOPITCH_VERSION_STRING "1.0.0"

// Utility
#include "util/exception.h"
#include "util/json_reader.h"
#include "util/log.h"
#include "util/math_utils.h"
#include "util/types.h"

// Core
#include "core/asset_resolver.h"
#include "core/audio.h"
#include "core/audio_io.h"
#include "core/convert.h"
#include "core/resample.h"
#include "core/scratch_file.h"

// Features
#include "feature/pitch.h"

// Analysis
#include "analysis/autocorr_estimator.h"
#include "analysis/contour_estimator.h"
#include "analysis/f0_estimator.h"
#include "analysis/pitch_resolver.h"
#include "analysis/target_pitch.h"

namespace autopitch {

/// @brief Returns the library version string.
/// @return Version string (e.g., "1.0.0")
inline const char* version() { return AUTOPITCH_VERSION_STRING; }

/// @brief Returns the major version number.
inline int version_major() { return AUTOPITCH_VERSION_MAJOR; }

/// @brief Returns the minor version number.
inline int version_minor() { return AUTOPITCH_VERSION_MINOR; }

/// @brief Returns the patch version number.
inline int version_patch() { return AUTOPITCH_VERSION_PATCH; }

}  // namespace autopitch
