#pragma once

/// @file audio_io.h
/// @brief Audio container decoding using dr_wav and minimp3.

#include <cstddef>
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace autopitch {

/// @brief Detected audio format.
enum class AudioFormat {
  Unknown,
  WAV,
  MP3,
};

/// @brief How 32-bit WAV samples are interpreted.
enum class Sample32Mode {
  FormatTag,  ///< Trust a PCM/IEEE-float tag in the header, inspect samples only when it is neither
  Detect,     ///< Always try IEEE float first, fall back to int32 if values are not sane
};

/// @brief Result of audio loading: samples and sample rate.
using AudioLoadResult = std::tuple<std::vector<float>, int>;

/// @brief Options for audio loading.
struct AudioLoadOptions {
  /// @brief Maximum file size in bytes (0 = no limit).
  size_t max_file_size = 500 * 1024 * 1024;
  /// @brief Interpretation of 32-bit sample data.
  Sample32Mode sample32 = Sample32Mode::FormatTag;
};

/// @brief Default audio load options.
inline const AudioLoadOptions kDefaultLoadOptions{};

/// @brief Detects audio format from buffer header.
/// @param data Pointer to audio data
/// @param size Size of data in bytes
/// @return Detected audio format
AudioFormat detect_format(const uint8_t* data, size_t size);

/// @brief Detects audio format of a file from its first bytes.
/// @param path File path
/// @return Detected audio format
/// @throws AutopitchException(FileNotFound) if the file cannot be opened
AudioFormat detect_file_format(const std::string& path);

/// @brief Returns true if 32-bit samples read as IEEE float look like real audio.
/// @details Every value must be finite, within +/-16 and either zero or at
/// least 1e-20 in magnitude. Integer PCM reinterpreted as float produces
/// huge or vanishingly small values.
/// @param values Candidate float samples
/// @param count Number of samples
bool plausible_float_samples(const float* values, size_t count);

/// @brief Decodes a WAV stream to mono (channel 0).
/// @param data Pointer to WAV data
/// @param size Size of data in bytes
/// @param options Loading options
/// @return Tuple of (channel 0 samples normalized to [-1,1], sample rate)
/// @throws AutopitchException(DecodeFailed) on zero channels, unsupported
/// sample width, truncated or malformed data
AudioLoadResult load_buffer_wav(const uint8_t* data, size_t size,
                                const AudioLoadOptions& options = kDefaultLoadOptions);

/// @brief Decodes an MP3 stream to mono (channel 0).
/// @param data Pointer to MP3 data
/// @param size Size of data in bytes
/// @return Tuple of (channel 0 samples normalized to [-1,1], sample rate)
/// @throws AutopitchException(DecodeFailed) on decode error
AudioLoadResult load_buffer_mp3(const uint8_t* data, size_t size);

/// @brief Decodes audio from memory (auto-detect format).
/// @param data Pointer to audio data
/// @param size Size of data in bytes
/// @param options Loading options
/// @return Tuple of (mono samples normalized to [-1,1], sample rate)
/// @throws AutopitchException on unknown format or decode error
AudioLoadResult load_buffer(const uint8_t* data, size_t size,
                            const AudioLoadOptions& options = kDefaultLoadOptions);

/// @brief Loads audio file (auto-detect format).
/// @param path Path to audio file
/// @param options Loading options (max file size, 32-bit interpretation)
/// @return Tuple of (mono samples normalized to [-1,1], sample rate)
/// @throws AutopitchException on file not found, unknown format, file too large, or decode error
AudioLoadResult load_audio(const std::string& path,
                           const AudioLoadOptions& options = kDefaultLoadOptions);

}  // namespace autopitch
