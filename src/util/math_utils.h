#pragma once

/// @file math_utils.h
/// @brief Mathematical utility functions for signal processing.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>

namespace autopitch {

/// @brief Computes the arithmetic mean.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Mean value (0 if empty)
template <typename T>
T mean(const T* data, size_t size) {
  if (size == 0) return T{0};
  T sum = std::accumulate(data, data + size, T{0});
  return sum / static_cast<T>(size);
}

/// @brief Computes the mean of squared values (short-term energy).
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Mean square (0 if empty)
template <typename T>
T mean_square(const T* data, size_t size) {
  if (size == 0) return T{0};
  T sum_sq = T{0};
  for (size_t i = 0; i < size; ++i) {
    sum_sq += data[i] * data[i];
  }
  return sum_sq / static_cast<T>(size);
}

/// @brief Unnormalized autocorrelation at a single lag.
/// @param data Pointer to frame
/// @param size Frame length
/// @param lag Lag in samples
/// @return sum_{j < size - lag} x[j] * x[j + lag] (0 if lag >= size)
double autocorrelation(const float* data, size_t size, size_t lag);

/// @brief Computes the median value.
/// @details Even-sized inputs average the two middle elements.
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Median value (0 if empty)
float median(const float* data, size_t size);

/// @brief Returns the upper median (element at index size / 2 after sorting).
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Upper median (0 if empty)
float median_high(const float* data, size_t size);

}  // namespace autopitch
