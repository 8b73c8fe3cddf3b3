#pragma once

/// @file contour_estimator.h
/// @brief Median f0 from a frame-wise contour produced by a pluggable analyzer.

#include <functional>
#include <vector>

#include "core/audio.h"
#include "core/resample.h"
#include "feature/pitch.h"
#include "util/types.h"

namespace autopitch {

/// @brief Contour analyzer: f0 per frame in Hz (NaN or <= 0 for unvoiced).
using F0ContourFn = std::function<std::vector<float>(const Audio& audio)>;

/// @brief Configuration for contour-based estimation.
struct ContourConfig {
  int analysis_rate = 16000;  ///< Rate the analyzer receives (0 = keep source rate)
  float fmin = 50.0f;         ///< Lowest frequency kept from the contour
  float fmax = 1100.0f;       ///< Highest frequency kept from the contour
  YinConfig yin;              ///< Settings of the bundled YIN analyzer
};

/// @brief Median of the finite contour values inside [fmin, fmax].
/// @param contour f0 per frame
/// @param fmin Lower bound in Hz (inclusive)
/// @param fmax Upper bound in Hz (inclusive)
/// @return Median (mean of the middle pair for even counts), or nothing if no value qualifies
F0Estimate median_contour_f0(const std::vector<float>& contour, float fmin, float fmax);

/// @brief Returns the bundled YIN analyzer bound to a configuration.
F0ContourFn yin_contour_analyzer(const YinConfig& config = YinConfig());

/// @brief Estimates f0 with a contour analyzer.
/// @details Resamples to config.analysis_rate, runs the analyzer and reduces
/// the contour with median_contour_f0().
/// @param audio Input audio
/// @param analyzer Contour analyzer
/// @param config Configuration
/// @param resampler Resampler collaborator (defaults to resample())
/// @return Median voiced f0, or nothing
/// @throws AutopitchException(EstimationFailed) if no analyzer is provided or it fails
F0Estimate estimate_f0_contour(const Audio& audio, const F0ContourFn& analyzer,
                               const ContourConfig& config = ContourConfig(),
                               const ResampleFn& resampler = nullptr);

}  // namespace autopitch
