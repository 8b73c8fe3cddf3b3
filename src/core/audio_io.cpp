#include "core/audio_io.h"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>

#include "util/exception.h"

#define DR_WAV_IMPLEMENTATION
#include "dr_wav.h"

#define MINIMP3_IMPLEMENTATION
#include "minimp3.h"
#include "minimp3_ex.h"

namespace autopitch {

namespace {

constexpr float kInt16Scale = 32768.0f;
constexpr float kInt24Scale = 8388608.0f;
constexpr double kInt32Scale = 2147483648.0;
constexpr float kMaxPlausibleFloat = 16.0f;
constexpr float kMinPlausibleFloat = 1e-20f;

/// @brief RAII guard for an initialized drwav handle.
struct WavGuard {
  drwav* wav = nullptr;
  ~WavGuard() {
    if (wav) {
      drwav_uninit(wav);
    }
  }
};

/// @brief RAII guard for MP3 decode buffer.
struct Mp3BufferGuard {
  mp3d_sample_t* ptr = nullptr;
  ~Mp3BufferGuard() {
    if (ptr) {
      free(ptr);
    }
  }
};

int16_t read_le16(const uint8_t* p) {
  return static_cast<int16_t>(static_cast<uint16_t>(p[0]) | (static_cast<uint16_t>(p[1]) << 8));
}

int32_t read_le24(const uint8_t* p) {
  int32_t v = static_cast<int32_t>(p[0]) | (static_cast<int32_t>(p[1]) << 8) |
              (static_cast<int32_t>(p[2]) << 16);
  if (v & 0x800000) {
    v |= ~0xFFFFFF;
  }
  return v;
}

int32_t read_le32(const uint8_t* p) {
  uint32_t u = static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
               (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
  int32_t v;
  std::memcpy(&v, &u, sizeof(v));
  return v;
}

float read_le_float(const uint8_t* p) {
  int32_t bits = read_le32(p);
  float v;
  std::memcpy(&v, &bits, sizeof(v));
  return v;
}

/// @brief Extracts channel 0 of 32-bit frames, choosing float or int32.
std::vector<float> decode_channel0_32(const uint8_t* raw, size_t frames, size_t stride,
                                      drwav_uint16 format_tag, Sample32Mode mode) {
  std::vector<float> as_float(frames);
  for (size_t i = 0; i < frames; ++i) {
    as_float[i] = read_le_float(raw + i * stride);
  }

  bool use_float;
  if (mode == Sample32Mode::FormatTag && format_tag == DR_WAVE_FORMAT_IEEE_FLOAT) {
    use_float = true;
  } else if (mode == Sample32Mode::FormatTag && format_tag == DR_WAVE_FORMAT_PCM) {
    use_float = false;
  } else {
    use_float = plausible_float_samples(as_float.data(), as_float.size());
  }

  if (use_float) {
    return as_float;
  }

  std::vector<float> mono(frames);
  for (size_t i = 0; i < frames; ++i) {
    mono[i] = static_cast<float>(static_cast<double>(read_le32(raw + i * stride)) / kInt32Scale);
  }
  return mono;
}

/// @brief Reads entire file into memory.
std::vector<uint8_t> read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  AUTOPITCH_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);

  auto size = file.tellg();
  AUTOPITCH_CHECK_MSG(size >= 0, ErrorCode::DecodeFailed, "Failed to read file: " + path);
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> buffer(static_cast<size_t>(size));
  if (!buffer.empty()) {
    file.read(reinterpret_cast<char*>(buffer.data()), size);
    AUTOPITCH_CHECK_MSG(file.good(), ErrorCode::DecodeFailed, "Failed to read file: " + path);
  }

  return buffer;
}

}  // namespace

AudioFormat detect_format(const uint8_t* data, size_t size) {
  if (size < 12) {
    return AudioFormat::Unknown;
  }

  // WAV: "RIFF....WAVE"
  if (data[0] == 'R' && data[1] == 'I' && data[2] == 'F' && data[3] == 'F' && data[8] == 'W' &&
      data[9] == 'A' && data[10] == 'V' && data[11] == 'E') {
    return AudioFormat::WAV;
  }

  // MP3: frame sync or ID3 tag
  if ((data[0] == 0xFF && (data[1] & 0xE0) == 0xE0) ||
      (data[0] == 'I' && data[1] == 'D' && data[2] == '3')) {
    return AudioFormat::MP3;
  }

  return AudioFormat::Unknown;
}

AudioFormat detect_file_format(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  AUTOPITCH_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);

  uint8_t header[12] = {};
  file.read(reinterpret_cast<char*>(header), sizeof(header));
  return detect_format(header, static_cast<size_t>(file.gcount()));
}

bool plausible_float_samples(const float* values, size_t count) {
  for (size_t i = 0; i < count; ++i) {
    float v = values[i];
    if (!std::isfinite(v)) return false;
    float mag = std::abs(v);
    if (mag > kMaxPlausibleFloat) return false;
    if (mag != 0.0f && mag < kMinPlausibleFloat) return false;
  }
  return true;
}

AudioLoadResult load_buffer_wav(const uint8_t* data, size_t size,
                                const AudioLoadOptions& options) {
  drwav wav;
  drwav_bool32 ok = drwav_init_memory(&wav, data, size, nullptr);
  AUTOPITCH_CHECK_MSG(ok, ErrorCode::DecodeFailed, "Failed to parse WAV data");
  WavGuard guard;
  guard.wav = &wav;

  size_t channels = static_cast<size_t>(wav.channels);
  int sample_rate = static_cast<int>(wav.sampleRate);
  int bits = static_cast<int>(wav.bitsPerSample);

  AUTOPITCH_CHECK_MSG(channels > 0, ErrorCode::DecodeFailed, "Invalid WAV: no channels");
  AUTOPITCH_CHECK_MSG(sample_rate > 0, ErrorCode::DecodeFailed, "Invalid WAV: zero sample rate");
  AUTOPITCH_CHECK_MSG(bits == 16 || bits == 24 || bits == 32, ErrorCode::DecodeFailed,
                      "Unsupported WAV sample width: " + std::to_string(bits / 8) + " bytes");

  size_t bytes_per_sample = static_cast<size_t>(bits / 8);
  size_t stride = bytes_per_sample * channels;
  size_t declared_frames = static_cast<size_t>(wav.totalPCMFrameCount);

  std::vector<uint8_t> raw(declared_frames * stride);
  size_t frames_read = 0;
  if (declared_frames > 0) {
    frames_read = static_cast<size_t>(drwav_read_pcm_frames(&wav, wav.totalPCMFrameCount, raw.data()));
  }
  AUTOPITCH_CHECK_MSG(frames_read == declared_frames, ErrorCode::DecodeFailed,
                      "Truncated WAV data: " + std::to_string(frames_read) + " of " +
                          std::to_string(declared_frames) + " frames");

  std::vector<float> mono;
  if (bits == 16) {
    mono.resize(frames_read);
    for (size_t i = 0; i < frames_read; ++i) {
      mono[i] = static_cast<float>(read_le16(raw.data() + i * stride)) / kInt16Scale;
    }
  } else if (bits == 24) {
    mono.resize(frames_read);
    for (size_t i = 0; i < frames_read; ++i) {
      mono[i] = static_cast<float>(read_le24(raw.data() + i * stride)) / kInt24Scale;
    }
  } else {
    mono = decode_channel0_32(raw.data(), frames_read, stride, wav.translatedFormatTag,
                              options.sample32);
  }

  return {std::move(mono), sample_rate};
}

AudioLoadResult load_buffer_mp3(const uint8_t* data, size_t size) {
  mp3dec_t mp3d;
  mp3dec_file_info_t info{};

  mp3dec_init(&mp3d);
  int result = mp3dec_load_buf(&mp3d, data, size, &info, nullptr, nullptr);

  Mp3BufferGuard buffer_guard;
  buffer_guard.ptr = info.buffer;

  AUTOPITCH_CHECK_MSG(result == 0, ErrorCode::DecodeFailed, "Failed to decode MP3 data");
  AUTOPITCH_CHECK_MSG(info.samples > 0 && info.channels > 0 && info.hz > 0,
                      ErrorCode::DecodeFailed, "No audio samples in MP3 data");

  size_t channels = static_cast<size_t>(info.channels);
  size_t frame_count = static_cast<size_t>(info.samples) / channels;

  std::vector<float> mono(frame_count);
  for (size_t i = 0; i < frame_count; ++i) {
    mono[i] = static_cast<float>(info.buffer[i * channels]) / kInt16Scale;
  }
  return {std::move(mono), info.hz};
}

AudioLoadResult load_buffer(const uint8_t* data, size_t size, const AudioLoadOptions& options) {
  switch (detect_format(data, size)) {
    case AudioFormat::WAV:
      return load_buffer_wav(data, size, options);
    case AudioFormat::MP3:
      return load_buffer_mp3(data, size);
    default:
      throw AutopitchException(ErrorCode::InvalidFormat, "Unknown or unsupported audio format");
  }
}

AudioLoadResult load_audio(const std::string& path, const AudioLoadOptions& options) {
  if (options.max_file_size > 0) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    AUTOPITCH_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);
    auto size = file.tellg();
    AUTOPITCH_CHECK_MSG(static_cast<size_t>(size) <= options.max_file_size,
                        ErrorCode::InvalidParameter,
                        "File too large: " + std::to_string(size) + " bytes (max: " +
                            std::to_string(options.max_file_size) + " bytes)");
  }

  std::vector<uint8_t> data = read_file(path);
  return load_buffer(data.data(), data.size(), options);
}

}  // namespace autopitch
