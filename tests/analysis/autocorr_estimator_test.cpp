/// @file autocorr_estimator_test.cpp
/// @brief Tests for the autocorrelation f0 estimator.

#include "analysis/autocorr_estimator.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>

#include "util/exception.h"
#include "util/test_audio.h"

using namespace autopitch;
using Catch::Matchers::WithinAbs;

TEST_CASE("estimate_f0_autocorr on pure tones", "[autocorr_estimator]") {
  SECTION("220 Hz at 16 kHz") {
    Audio audio = Audio::from_vector(test::make_sine(220.0, 2.0, 16000), 16000);
    F0Estimate f0 = estimate_f0_autocorr(audio);
    REQUIRE(f0.has_value());
    REQUIRE_THAT(*f0, WithinAbs(220.0f, 2.0f));
  }

  SECTION("150 Hz at 44.1 kHz") {
    Audio audio = Audio::from_vector(test::make_sine(150.0, 1.0, 44100), 44100);
    F0Estimate f0 = estimate_f0_autocorr(audio);
    REQUIRE(f0.has_value());
    REQUIRE_THAT(*f0, WithinAbs(150.0f, 1.0f));
  }

  SECTION("DC offset is removed") {
    std::vector<float> samples = test::make_sine(220.0, 1.0, 16000, 0.3);
    for (float& s : samples) s += 0.4f;
    F0Estimate f0 = estimate_f0_autocorr(Audio::from_vector(samples, 16000));
    REQUIRE(f0.has_value());
    REQUIRE_THAT(*f0, WithinAbs(220.0f, 2.0f));
  }
}

TEST_CASE("estimate_f0_autocorr absent results", "[autocorr_estimator]") {
  SECTION("silence") {
    Audio audio = Audio::from_vector(std::vector<float>(16000, 0.0f), 16000);
    REQUIRE_FALSE(estimate_f0_autocorr(audio).has_value());
  }

  SECTION("empty") {
    Audio audio = Audio::from_vector({}, 16000);
    REQUIRE_FALSE(estimate_f0_autocorr(audio).has_value());
  }

  SECTION("shorter than a frame") {
    Audio audio = Audio::from_vector(test::make_sine(220.0, 0.02, 16000), 16000);
    REQUIRE_FALSE(estimate_f0_autocorr(audio).has_value());
  }

  SECTION("near-silent input below the energy floor") {
    Audio audio = Audio::from_vector(test::make_sine(220.0, 1.0, 16000, 0.001), 16000);
    REQUIRE_FALSE(estimate_f0_autocorr(audio).has_value());
  }
}

TEST_CASE("autocorr_candidates", "[autocorr_estimator]") {
  SECTION("frame count follows the hop") {
    // 1 s at 16 kHz: starts 0, 160, ... while start + 640 < 16000
    Audio audio = Audio::from_vector(test::make_sine(220.0, 1.0, 16000), 16000);
    std::vector<float> candidates = autocorr_candidates(audio);
    REQUIRE(candidates.size() == 96);
  }

  SECTION("analysis is limited to the central window") {
    AutocorrConfig config;
    config.max_duration = 0.5f;
    Audio audio = Audio::from_vector(test::make_sine(220.0, 3.0, 16000), 16000);
    std::vector<float> candidates = autocorr_candidates(audio, config);
    // 8000 samples: starts while start + 640 < 8000
    REQUIRE(candidates.size() == 46);
  }

  SECTION("silent head and tail outside the window are ignored") {
    std::vector<float> samples(16000 * 10, 0.0f);
    std::vector<float> tone = test::make_sine(220.0, 8.0, 16000);
    std::copy(tone.begin(), tone.end(), samples.begin() + 16000);
    std::vector<float> candidates = autocorr_candidates(Audio::from_vector(samples, 16000));
    REQUIRE(candidates.size() == 796);
  }

  SECTION("invalid search window") {
    AutocorrConfig config;
    config.fmin = 400.0f;
    config.fmax = 100.0f;
    Audio audio = Audio::from_vector(test::make_sine(220.0, 1.0, 16000), 16000);
    REQUIRE_THROWS_AS(autocorr_candidates(audio, config), AutopitchException);
  }
}

TEST_CASE("autocorr_frame_pitch", "[autocorr_estimator]") {
  std::vector<float> frame = test::make_sine(200.0, 0.04, 16000);
  int n = static_cast<int>(frame.size());

  SECTION("peak lag gives the frequency") {
    float hz = autocorr_frame_pitch(frame.data(), n, 16000, 32, 320, 50.0f, 500.0f);
    REQUIRE_THAT(hz, WithinAbs(200.0f, 1e-3f));
  }

  SECTION("result outside the bounds is rejected") {
    float hz = autocorr_frame_pitch(frame.data(), n, 16000, 32, 320, 50.0f, 150.0f);
    REQUIRE_THAT(hz, WithinAbs(0.0f, 1e-6f));
  }
}
