#pragma once

/// @file pitch.h
/// @brief Frame-wise fundamental frequency contour using the YIN algorithm.

#include <vector>

#include "core/audio.h"

namespace autopitch {

/// @brief YIN contour configuration.
struct YinConfig {
  float fmin = 50.0f;          ///< Minimum frequency in Hz
  float fmax = 1100.0f;        ///< Maximum frequency in Hz
  int frame_length = 1024;     ///< Analysis frame length in samples
  float frame_period = 0.01f;  ///< Hop between frames in seconds
  float threshold = 0.15f;     ///< Absolute CMNDF threshold for voicing
};

/// @brief Computes the YIN difference function d(tau) for tau in [0, max_lag).
/// @param frame Audio frame
/// @param frame_length Length of frame (must exceed max_lag)
/// @param max_lag Number of lags to compute
/// @return Difference values [max_lag]
std::vector<float> yin_difference(const float* frame, int frame_length, int max_lag);

/// @brief Cumulative mean normalized difference function.
/// @param diff Output of yin_difference()
/// @return CMNDF values, cmndf[0] == 1
std::vector<float> yin_cmndf(const std::vector<float>& diff);

/// @brief Finds the pitch period: first dip under threshold, refined to sub-sample precision.
/// @param cmndf Cumulative mean normalized difference function
/// @param threshold Voicing threshold
/// @param min_period Smallest period considered (samples)
/// @param max_period Largest period considered (samples, exclusive)
/// @return Period in samples, or 0 if no dip falls under the threshold
float yin_find_period(const std::vector<float>& cmndf, float threshold, int min_period,
                      int max_period);

/// @brief Tracks f0 frame by frame.
/// @details Frames start every frame_period seconds and must fit entirely in
/// the audio. Unvoiced frames and frames outside [fmin, fmax] hold NaN.
/// @param audio Input audio
/// @param config YIN configuration
/// @return f0 per frame in Hz (empty if the audio is shorter than one frame)
/// @throws AutopitchException(InvalidParameter) on invalid configuration
std::vector<float> yin_contour(const Audio& audio, const YinConfig& config = YinConfig());

}  // namespace autopitch
