#include "core/audio.h"

#include <algorithm>

#include "core/audio_io.h"
#include "util/exception.h"

namespace autopitch {

Audio::Audio() : buffer_(nullptr), offset_(0), length_(0), sample_rate_(0) {}

Audio::Audio(std::shared_ptr<const std::vector<float>> buffer, size_t offset, size_t length,
             int sample_rate)
    : buffer_(std::move(buffer)), offset_(offset), length_(length), sample_rate_(sample_rate) {}

Audio Audio::from_buffer(const float* samples, size_t size, int sample_rate) {
  AUTOPITCH_CHECK(sample_rate > 0, ErrorCode::InvalidParameter);
  auto buffer = std::make_shared<std::vector<float>>(samples, samples + size);
  return Audio(buffer, 0, size, sample_rate);
}

Audio Audio::from_vector(std::vector<float> samples, int sample_rate) {
  AUTOPITCH_CHECK(sample_rate > 0, ErrorCode::InvalidParameter);
  size_t size = samples.size();
  auto buffer = std::make_shared<std::vector<float>>(std::move(samples));
  return Audio(buffer, 0, size, sample_rate);
}

Audio Audio::from_file(const std::string& path, const AudioLoadOptions& options) {
  auto [samples, sample_rate] = load_audio(path, options);
  return from_vector(std::move(samples), sample_rate);
}

Audio Audio::from_file(const std::string& path) { return from_file(path, kDefaultLoadOptions); }

Audio Audio::from_memory(const uint8_t* data, size_t size) {
  auto [samples, sample_rate] = load_buffer(data, size);
  return from_vector(std::move(samples), sample_rate);
}

const float* Audio::data() const {
  if (!buffer_) {
    return nullptr;
  }
  return buffer_->data() + offset_;
}

float Audio::duration() const {
  if (sample_rate_ == 0) {
    return 0.0f;
  }
  return static_cast<float>(length_) / static_cast<float>(sample_rate_);
}

Audio Audio::slice_samples(size_t start_sample, size_t end_sample) const {
  if (!buffer_) {
    return Audio();
  }

  start_sample = std::min(start_sample, length_);
  if (end_sample > length_) {
    end_sample = length_;
  }
  if (start_sample >= end_sample) {
    // Keep the rate so an empty slice still satisfies sample_rate > 0.
    return Audio(buffer_, offset_, 0, sample_rate_);
  }

  return Audio(buffer_, offset_ + start_sample, end_sample - start_sample, sample_rate_);
}

Audio Audio::center(size_t max_samples) const {
  if (length_ <= max_samples) {
    return *this;
  }
  size_t start = (length_ - max_samples) / 2;
  return slice_samples(start, start + max_samples);
}

float Audio::operator[](size_t index) const {
  AUTOPITCH_CHECK(index < length_, ErrorCode::InvalidParameter);
  return (*buffer_)[offset_ + index];
}

}  // namespace autopitch
