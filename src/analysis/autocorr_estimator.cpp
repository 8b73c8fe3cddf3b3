#include "analysis/autocorr_estimator.h"

#include <limits>

#include "core/convert.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace autopitch {

float autocorr_frame_pitch(const float* frame, int frame_length, int sr, int min_lag, int max_lag,
                           float fmin, float fmax) {
  int best_lag = 0;
  double best_val = -std::numeric_limits<double>::infinity();

  for (int lag = min_lag; lag < max_lag; ++lag) {
    double r = autocorrelation(frame, static_cast<size_t>(frame_length), static_cast<size_t>(lag));
    if (r > best_val) {
      best_val = r;
      best_lag = lag;
    }
  }

  if (best_lag <= 0 || best_val <= 0.0) {
    return 0.0f;
  }

  float hz = static_cast<float>(sr) / static_cast<float>(best_lag);
  if (hz < fmin || hz > fmax) {
    return 0.0f;
  }
  return hz;
}

std::vector<float> autocorr_candidates(const Audio& audio, const AutocorrConfig& config) {
  AUTOPITCH_CHECK_MSG(config.fmin > 0.0f && config.fmax > config.fmin,
                      ErrorCode::InvalidParameter, "Search window must satisfy 0 < fmin < fmax");
  AUTOPITCH_CHECK(config.max_duration > 0.0f, ErrorCode::InvalidParameter);
  AUTOPITCH_CHECK(config.frame_seconds > 0.0 && config.hop_seconds > 0.0,
                  ErrorCode::InvalidParameter);

  std::vector<float> pitches;
  const int sr = audio.sample_rate();
  if (audio.empty() || sr <= 0) {
    return pitches;
  }

  Audio window = audio.center(static_cast<size_t>(time_to_samples(config.max_duration, sr)));
  const size_t n = window.size();

  const int frame_length = time_to_samples(config.frame_seconds, sr);
  const int hop = time_to_samples(config.hop_seconds, sr);
  if (frame_length <= 0 || hop <= 0 || n < static_cast<size_t>(frame_length)) {
    return pitches;
  }

  const int min_lag = static_cast<int>(static_cast<float>(sr) / config.fmax);
  const int max_lag = static_cast<int>(static_cast<float>(sr) / config.fmin);
  if (max_lag <= min_lag + 1) {
    return pitches;
  }

  std::vector<float> x(window.begin(), window.end());
  const float dc = mean(x.data(), x.size());
  for (float& v : x) {
    v -= dc;
  }

  const size_t frame_len = static_cast<size_t>(frame_length);
  for (size_t start = 0; start + frame_len < n; start += static_cast<size_t>(hop)) {
    const float* frame = x.data() + start;
    if (mean_square(frame, frame_len) < config.energy_floor) {
      continue;
    }

    float hz = autocorr_frame_pitch(frame, frame_length, sr, min_lag, max_lag, config.fmin,
                                    config.fmax);
    if (hz > 0.0f) {
      pitches.push_back(hz);
    }
  }
  return pitches;
}

F0Estimate estimate_f0_autocorr(const Audio& audio, const AutocorrConfig& config) {
  std::vector<float> pitches = autocorr_candidates(audio, config);
  if (pitches.empty()) {
    return std::nullopt;
  }
  return median_high(pitches.data(), pitches.size());
}

}  // namespace autopitch
