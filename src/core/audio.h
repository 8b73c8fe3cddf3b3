#pragma once

/// @file audio.h
/// @brief Mono sample buffer with shared ownership and zero-copy slicing.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace autopitch {

struct AudioLoadOptions;

/// @brief Decoded mono audio: samples normalized to roughly [-1, 1] plus sample rate.
/// @details Slices share the underlying buffer, avoiding copies. A buffer
/// decoded from a container with zero frames is empty but keeps its sample rate.
class Audio {
 public:
  /// @brief Default constructor creates an empty Audio with no sample rate.
  Audio();

  /// @brief Creates Audio from existing samples.
  /// @param samples Pointer to sample data (will be copied)
  /// @param size Number of samples
  /// @param sample_rate Sample rate in Hz
  /// @return Audio object
  /// @throws AutopitchException(InvalidParameter) if sample_rate <= 0
  static Audio from_buffer(const float* samples, size_t size, int sample_rate);

  /// @brief Creates Audio from a vector of samples.
  /// @param samples Vector of samples (will be moved)
  /// @param sample_rate Sample rate in Hz
  /// @return Audio object
  /// @throws AutopitchException(InvalidParameter) if sample_rate <= 0
  static Audio from_vector(std::vector<float> samples, int sample_rate);

  /// @brief Loads Audio from a file (WAV or MP3).
  /// @param path Path to audio file
  /// @param options Loading options
  /// @return Audio object
  /// @throws AutopitchException on file not found or decode error
  static Audio from_file(const std::string& path, const AudioLoadOptions& options);

  /// @brief Loads Audio from a file with default options.
  static Audio from_file(const std::string& path);

  /// @brief Loads Audio from memory buffer.
  /// @param data Pointer to audio data
  /// @param size Size of data in bytes
  /// @return Audio object
  /// @throws AutopitchException on decode error
  static Audio from_memory(const uint8_t* data, size_t size);

  /// @brief Returns pointer to sample data (nullptr if empty).
  const float* data() const;

  /// @brief Returns number of samples.
  size_t size() const { return length_; }

  /// @brief Returns sample rate in Hz.
  int sample_rate() const { return sample_rate_; }

  /// @brief Returns duration in seconds.
  float duration() const;

  /// @brief Returns true if audio has no samples.
  bool empty() const { return length_ == 0; }

  /// @brief Creates a slice by sample indices (shared buffer, zero-copy).
  /// @param start_sample Start sample index
  /// @param end_sample End sample index (size_t(-1) means end of audio)
  /// @return New Audio object sharing the same buffer
  Audio slice_samples(size_t start_sample, size_t end_sample = static_cast<size_t>(-1)) const;

  /// @brief Returns the centered slice of at most max_samples samples.
  /// @details The slice starts at (size - max_samples) / 2.
  Audio center(size_t max_samples) const;

  /// @brief Access sample by index.
  /// @throws AutopitchException(InvalidParameter) if index is out of range
  float operator[](size_t index) const;

  const float* begin() const { return data(); }
  const float* end() const { return data() + size(); }

 private:
  Audio(std::shared_ptr<const std::vector<float>> buffer, size_t offset, size_t length,
        int sample_rate);

  std::shared_ptr<const std::vector<float>> buffer_;
  size_t offset_;
  size_t length_;
  int sample_rate_;
};

}  // namespace autopitch
