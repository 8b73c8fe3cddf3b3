#pragma once

/// @file f0_estimator.h
/// @brief Selection of the source f0 estimation strategy.

#include <functional>
#include <string>

#include "analysis/autocorr_estimator.h"
#include "analysis/contour_estimator.h"
#include "core/audio.h"
#include "util/types.h"

namespace autopitch {

/// @brief Estimation strategy.
enum class EstimatorType {
  Autocorrelation,  ///< Dependency-free median autocorrelation pitch
  Contour,          ///< Contour analyzer (YIN by default) at the analysis rate
};

/// @brief Estimator: decoded audio to a representative f0.
/// @details Returning nothing means "could not estimate". Throwing signals
/// that the estimator could not run.
using F0Estimator = std::function<F0Estimate(const Audio& audio)>;

/// @brief Returns the CLI/config name of a strategy ("autocorr" or "yin").
const char* estimator_type_name(EstimatorType type);

/// @brief Parses a strategy name.
/// @param name "autocorr" or "yin" (case-sensitive)
/// @return Strategy
/// @throws AutopitchException(InvalidParameter) on unknown name
EstimatorType parse_estimator_type(const std::string& name);

/// @brief Builds an estimator for a strategy.
/// @param type Strategy
/// @param autocorr Autocorrelation settings (used by Autocorrelation)
/// @param contour Contour settings (used by Contour)
/// @param analyzer Contour analyzer; nullptr selects the bundled YIN analyzer
/// @return Estimator function
F0Estimator make_estimator(EstimatorType type, const AutocorrConfig& autocorr = AutocorrConfig(),
                           const ContourConfig& contour = ContourConfig(),
                           F0ContourFn analyzer = nullptr);

}  // namespace autopitch
