#pragma once

/// @file resample.h
/// @brief Sample-rate conversion using r8brain.

#include <cstddef>
#include <functional>
#include <vector>

#include "core/audio.h"

namespace autopitch {

/// @brief Resampler collaborator: returns audio at the requested rate.
using ResampleFn = std::function<Audio(const Audio& audio, int target_sr)>;

/// @brief Resamples audio to a target sample rate.
/// @param audio Input audio
/// @param target_sr Target sample rate in Hz
/// @return Resampled audio (the input itself when the rate already matches)
/// @throws AutopitchException(InvalidParameter) if target_sr <= 0
Audio resample(const Audio& audio, int target_sr);

/// @brief Resamples raw samples to a target sample rate.
/// @param samples Input samples
/// @param size Number of input samples
/// @param src_sr Source sample rate in Hz
/// @param target_sr Target sample rate in Hz
/// @return Resampled samples, round(size * target_sr / src_sr) long
std::vector<float> resample(const float* samples, size_t size, int src_sr, int target_sr);

}  // namespace autopitch
