/// @file math_utils.cpp
/// @brief Implementation of math utility functions.

#include "util/math_utils.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace autopitch {

double autocorrelation(const float* data, size_t size, size_t lag) {
  if (lag >= size) return 0.0;

  double sum = 0.0;
  size_t limit = size - lag;
  for (size_t j = 0; j < limit; ++j) {
    sum += static_cast<double>(data[j]) * static_cast<double>(data[j + lag]);
  }
  return sum;
}

float median(const float* data, size_t size) {
  if (size == 0) return 0.0f;

  std::vector<float> sorted(data, data + size);
  std::sort(sorted.begin(), sorted.end());

  if (size % 2 == 0) {
    return (sorted[size / 2 - 1] + sorted[size / 2]) / 2.0f;
  }
  return sorted[size / 2];
}

float median_high(const float* data, size_t size) {
  if (size == 0) return 0.0f;

  std::vector<float> sorted(data, data + size);
  auto mid = sorted.begin() + static_cast<std::ptrdiff_t>(size / 2);
  std::nth_element(sorted.begin(), mid, sorted.end());
  return *mid;
}

}  // namespace autopitch
