/// @file resample_test.cpp
/// @brief Tests for sample rate conversion.

#include "core/resample.h"

#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <cstdlib>

#include "util/exception.h"
#include "util/test_audio.h"

using namespace autopitch;

TEST_CASE("resample same rate", "[resample]") {
  Audio audio = Audio::from_vector(test::make_sine(220.0, 0.5, 16000), 16000);
  Audio out = resample(audio, 16000);
  REQUIRE(out.size() == audio.size());
  REQUIRE(out.data() == audio.data());
}

TEST_CASE("resample empty input", "[resample]") {
  Audio empty = Audio::from_vector({}, 44100);
  Audio out = resample(empty, 16000);
  REQUIRE(out.empty());
}

TEST_CASE("resample length", "[resample]") {
  Audio audio = Audio::from_vector(test::make_sine(220.0, 1.0, 44100), 44100);
  Audio out = resample(audio, 16000);
  REQUIRE(out.sample_rate() == 16000);
  REQUIRE(std::abs(static_cast<long>(out.size()) - 16000L) <= 2);
}

TEST_CASE("resample preserves a tone", "[resample]") {
  Audio audio = Audio::from_vector(test::make_sine(220.0, 1.0, 22050), 22050);
  Audio out = resample(audio, 16000);

  // Count rising zero crossings over the settled middle half.
  size_t start = out.size() / 4;
  size_t end = 3 * out.size() / 4;
  int crossings = 0;
  for (size_t i = start + 1; i < end; ++i) {
    if (out[i - 1] < 0.0f && out[i] >= 0.0f) ++crossings;
  }
  // 0.5 s of 220 Hz
  REQUIRE(std::abs(crossings - 110) <= 2);
}

TEST_CASE("resample invalid rate", "[resample]") {
  std::vector<float> samples(100, 0.0f);
  REQUIRE_THROWS_AS(resample(samples.data(), samples.size(), 16000, 0), AutopitchException);
}
