#include "analysis/f0_estimator.h"

#include "util/exception.h"

namespace autopitch {

const char* estimator_type_name(EstimatorType type) {
  switch (type) {
    case EstimatorType::Autocorrelation:
      return "autocorr";
    case EstimatorType::Contour:
      return "yin";
  }
  return "unknown";
}

EstimatorType parse_estimator_type(const std::string& name) {
  if (name == "autocorr") return EstimatorType::Autocorrelation;
  if (name == "yin") return EstimatorType::Contour;
  throw AutopitchException(ErrorCode::InvalidParameter,
                           "Unknown estimator '" + name + "' (expected autocorr or yin)");
}

F0Estimator make_estimator(EstimatorType type, const AutocorrConfig& autocorr,
                           const ContourConfig& contour, F0ContourFn analyzer) {
  if (type == EstimatorType::Contour) {
    if (!analyzer) {
      analyzer = yin_contour_analyzer(contour.yin);
    }
    return [contour, analyzer](const Audio& audio) {
      return estimate_f0_contour(audio, analyzer, contour);
    };
  }
  return [autocorr](const Audio& audio) { return estimate_f0_autocorr(audio, autocorr); };
}

}  // namespace autopitch
