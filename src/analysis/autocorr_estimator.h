#pragma once

/// @file autocorr_estimator.h
/// @brief Median f0 of a buffer by brute-force autocorrelation.

#include <vector>

#include "core/audio.h"
#include "util/types.h"

namespace autopitch {

/// @brief Configuration for the autocorrelation estimator.
struct AutocorrConfig {
  float fmin = 50.0f;           ///< Lowest accepted frequency in Hz
  float fmax = 500.0f;          ///< Highest accepted frequency in Hz
  float max_duration = 8.0f;    ///< Central analysis window in seconds
  double frame_seconds = 0.04;  ///< Frame length in seconds
  double hop_seconds = 0.01;    ///< Hop length in seconds
  float energy_floor = 1e-5f;   ///< Mean-square energy below which a frame is skipped
};

/// @brief Picks the autocorrelation-maximizing lag of one frame.
/// @param frame Frame samples (DC already removed)
/// @param frame_length Frame length in samples
/// @param sr Sample rate in Hz
/// @param min_lag Smallest lag (inclusive)
/// @param max_lag Largest lag (exclusive)
/// @param fmin Lowest accepted frequency in Hz
/// @param fmax Highest accepted frequency in Hz
/// @return sr / best_lag, or 0 if the peak is not positive or falls outside [fmin, fmax]
float autocorr_frame_pitch(const float* frame, int frame_length, int sr, int min_lag, int max_lag,
                           float fmin, float fmax);

/// @brief Collects per-frame pitch candidates over the central window.
/// @details Removes the DC offset of the window, skips frames whose
/// mean-square energy is below the floor, and keeps one candidate per voiced
/// frame. Cost is O(frames * lags * frame_length).
/// @param audio Input audio
/// @param config Estimator configuration
/// @return Candidate frequencies in Hz, in frame order
/// @throws AutopitchException(InvalidParameter) on invalid configuration
std::vector<float> autocorr_candidates(const Audio& audio,
                                       const AutocorrConfig& config = AutocorrConfig());

/// @brief Estimates the representative f0 of a buffer.
/// @param audio Input audio
/// @param config Estimator configuration
/// @return Upper median of the candidates, or nothing if no frame is voiced
/// @throws AutopitchException(InvalidParameter) on invalid configuration
F0Estimate estimate_f0_autocorr(const Audio& audio,
                                const AutocorrConfig& config = AutocorrConfig());

}  // namespace autopitch
