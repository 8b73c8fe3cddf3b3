#include "analysis/contour_estimator.h"

#include <cmath>
#include <exception>

#include "util/exception.h"
#include "util/math_utils.h"

namespace autopitch {

F0Estimate median_contour_f0(const std::vector<float>& contour, float fmin, float fmax) {
  std::vector<float> voiced;
  voiced.reserve(contour.size());
  for (float f : contour) {
    if (std::isfinite(f) && f >= fmin && f <= fmax) {
      voiced.push_back(f);
    }
  }
  if (voiced.empty()) {
    return std::nullopt;
  }
  return median(voiced.data(), voiced.size());
}

F0ContourFn yin_contour_analyzer(const YinConfig& config) {
  return [config](const Audio& audio) { return yin_contour(audio, config); };
}

F0Estimate estimate_f0_contour(const Audio& audio, const F0ContourFn& analyzer,
                               const ContourConfig& config, const ResampleFn& resampler) {
  AUTOPITCH_CHECK_MSG(static_cast<bool>(analyzer), ErrorCode::EstimationFailed,
                      "No contour analyzer configured");
  AUTOPITCH_CHECK(config.analysis_rate >= 0, ErrorCode::InvalidParameter);

  if (audio.empty()) {
    return std::nullopt;
  }

  Audio input = audio;
  if (config.analysis_rate > 0 && audio.sample_rate() != config.analysis_rate) {
    try {
      input = resampler ? resampler(audio, config.analysis_rate)
                        : resample(audio, config.analysis_rate);
    } catch (const std::exception& e) {
      throw AutopitchException(ErrorCode::EstimationFailed,
                               std::string("Resampling failed: ") + e.what());
    }
  }

  std::vector<float> contour;
  try {
    contour = analyzer(input);
  } catch (const std::exception& e) {
    throw AutopitchException(ErrorCode::EstimationFailed,
                             std::string("Contour analyzer failed: ") + e.what());
  }
  return median_contour_f0(contour, config.fmin, config.fmax);
}

}  // namespace autopitch
