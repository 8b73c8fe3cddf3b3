#include "feature/pitch.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "util/exception.h"

namespace autopitch {

namespace {

/// @brief Vertex offset of the parabola through three equally spaced points.
float parabolic_offset(float ym1, float y0, float yp1) {
  float denom = ym1 - 2.0f * y0 + yp1;
  if (std::abs(denom) < 1e-10f) {
    return 0.0f;
  }
  return 0.5f * (ym1 - yp1) / denom;
}

}  // namespace

std::vector<float> yin_difference(const float* frame, int frame_length, int max_lag) {
  std::vector<float> diff(std::max(max_lag, 0), 0.0f);
  int window = frame_length - max_lag;
  if (window <= 0) {
    return diff;
  }

  // d(tau) = sum_{j<W} (x[j] - x[j+tau])^2
  for (int tau = 1; tau < max_lag; ++tau) {
    float sum = 0.0f;
    for (int j = 0; j < window; ++j) {
      float delta = frame[j] - frame[j + tau];
      sum += delta * delta;
    }
    diff[tau] = sum;
  }
  return diff;
}

std::vector<float> yin_cmndf(const std::vector<float>& diff) {
  std::vector<float> cmndf(diff.size(), 1.0f);

  float running_sum = 0.0f;
  for (size_t tau = 1; tau < diff.size(); ++tau) {
    running_sum += diff[tau];
    if (running_sum > 1e-10f) {
      cmndf[tau] = diff[tau] * static_cast<float>(tau) / running_sum;
    }
  }
  return cmndf;
}

float yin_find_period(const std::vector<float>& cmndf, float threshold, int min_period,
                      int max_period) {
  int n = static_cast<int>(cmndf.size());
  min_period = std::max(1, min_period);
  max_period = std::min(max_period, n);

  for (int tau = min_period; tau < max_period; ++tau) {
    if (cmndf[tau] >= threshold) continue;

    // Descend to the bottom of the dip.
    while (tau + 1 < max_period && cmndf[tau + 1] < cmndf[tau]) {
      ++tau;
    }
    if (tau <= 0 || tau >= n - 1) {
      return static_cast<float>(tau);
    }
    return static_cast<float>(tau) + parabolic_offset(cmndf[tau - 1], cmndf[tau], cmndf[tau + 1]);
  }
  return 0.0f;
}

std::vector<float> yin_contour(const Audio& audio, const YinConfig& config) {
  AUTOPITCH_CHECK(config.fmin > 0.0f && config.fmax > config.fmin, ErrorCode::InvalidParameter);
  AUTOPITCH_CHECK(config.frame_length > 2, ErrorCode::InvalidParameter);
  AUTOPITCH_CHECK(config.frame_period > 0.0f, ErrorCode::InvalidParameter);

  std::vector<float> f0;
  if (audio.empty() || audio.sample_rate() <= 0) {
    return f0;
  }

  const int sr = audio.sample_rate();
  const int frame_length = config.frame_length;
  const int hop = std::max(1, static_cast<int>(std::lround(config.frame_period * sr)));
  const int min_period = static_cast<int>(std::floor(static_cast<float>(sr) / config.fmax));
  const int max_period = std::min(static_cast<int>(std::ceil(static_cast<float>(sr) / config.fmin)),
                                  frame_length / 2);
  const float nan = std::numeric_limits<float>::quiet_NaN();

  const size_t n_samples = audio.size();
  if (n_samples < static_cast<size_t>(frame_length)) {
    return f0;
  }
  const size_t n_frames = 1 + (n_samples - frame_length) / static_cast<size_t>(hop);
  f0.assign(n_frames, nan);

  if (std::max(min_period, 1) >= max_period) {
    return f0;
  }

  const float* samples = audio.data();
  for (size_t i = 0; i < n_frames; ++i) {
    const float* frame = samples + i * static_cast<size_t>(hop);
    std::vector<float> cmndf = yin_cmndf(yin_difference(frame, frame_length, max_period + 1));
    float period = yin_find_period(cmndf, config.threshold, min_period, max_period + 1);
    if (period <= 0.0f) continue;

    float freq = static_cast<float>(sr) / period;
    if (freq >= config.fmin && freq <= config.fmax) {
      f0[i] = freq;
    }
  }
  return f0;
}

}  // namespace autopitch
