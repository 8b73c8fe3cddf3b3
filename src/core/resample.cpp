#include "core/resample.h"

#include <algorithm>
#include <cmath>

#include "CDSPResampler.h"
#include "util/exception.h"

namespace autopitch {

namespace {
constexpr int kBlockSize = 1024;
constexpr int kMaxFlushPasses = 10;
}  // namespace

std::vector<float> resample(const float* samples, size_t size, int src_sr, int target_sr) {
  AUTOPITCH_CHECK(src_sr > 0 && target_sr > 0, ErrorCode::InvalidParameter);

  if (size == 0) {
    return {};
  }
  if (src_sr == target_sr) {
    return std::vector<float>(samples, samples + size);
  }

  std::vector<double> input(samples, samples + size);

  double ratio = static_cast<double>(target_sr) / static_cast<double>(src_sr);
  size_t expected = static_cast<size_t>(std::round(static_cast<double>(size) * ratio));
  std::vector<double> output;
  output.reserve(expected + kBlockSize);

  // 24-bit quality is ample for float output.
  r8b::CDSPResampler24 resampler(static_cast<double>(src_sr), static_cast<double>(target_sr),
                                 kBlockSize);

  double* input_ptr = input.data();
  size_t remaining = size;
  while (remaining > 0) {
    int block_len = static_cast<int>(std::min(remaining, static_cast<size_t>(kBlockSize)));

    double* output_ptr = nullptr;
    int output_len = resampler.process(input_ptr, block_len, output_ptr);
    if (output_len > 0 && output_ptr != nullptr) {
      output.insert(output.end(), output_ptr, output_ptr + output_len);
    }

    input_ptr += block_len;
    remaining -= static_cast<size_t>(block_len);
  }

  // Feed silence to drain the filter latency.
  std::vector<double> zeros(kBlockSize, 0.0);
  for (int pass = 0; pass < kMaxFlushPasses && output.size() < expected; ++pass) {
    double* output_ptr = nullptr;
    int output_len = resampler.process(zeros.data(), kBlockSize, output_ptr);
    if (output_len > 0 && output_ptr != nullptr) {
      output.insert(output.end(), output_ptr, output_ptr + output_len);
    }
  }

  if (output.size() > expected) {
    output.resize(expected);
  }

  return std::vector<float>(output.begin(), output.end());
}

Audio resample(const Audio& audio, int target_sr) {
  AUTOPITCH_CHECK(target_sr > 0, ErrorCode::InvalidParameter);

  if (audio.sample_rate() == target_sr || audio.empty()) {
    return audio;
  }

  std::vector<float> resampled =
      resample(audio.data(), audio.size(), audio.sample_rate(), target_sr);
  return Audio::from_vector(std::move(resampled), target_sr);
}

}  // namespace autopitch
