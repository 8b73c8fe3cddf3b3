/// @file convert_test.cpp
/// @brief Tests for frequency and semitone conversion.

#include "core/convert.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <limits>

using namespace autopitch;
using Catch::Matchers::WithinAbs;

TEST_CASE("hz_to_midi", "[convert]") {
  // A4 = 440Hz = MIDI 69
  REQUIRE_THAT(hz_to_midi(440.0f), WithinAbs(69.0f, 0.01f));

  // C4 = 261.63Hz = MIDI 60
  REQUIRE_THAT(hz_to_midi(261.63f), WithinAbs(60.0f, 0.1f));

  REQUIRE_THAT(hz_to_midi(0.0f), WithinAbs(0.0f, 1e-6f));
}

TEST_CASE("hz_to_note", "[convert]") {
  REQUIRE(hz_to_note(440.0f) == "A4");
  REQUIRE(hz_to_note(261.63f) == "C4");
  REQUIRE(hz_to_note(220.0f) == "A3");
  REQUIRE(hz_to_note(185.0f) == "F#3");
  REQUIRE(hz_to_note(0.0f) == "?");
  REQUIRE(hz_to_note(-10.0f) == "?");
}

TEST_CASE("transpose_hz", "[convert]") {
  REQUIRE_THAT(transpose_hz(220.0f, 12.0f), WithinAbs(440.0f, 1e-3f));
  REQUIRE_THAT(transpose_hz(440.0f, -12.0f), WithinAbs(220.0f, 1e-3f));
  REQUIRE_THAT(transpose_hz(185.0f, 6.0f), WithinAbs(261.63f, 0.01f));
  REQUIRE_THAT(transpose_hz(300.0f, 0.0f), WithinAbs(300.0f, 1e-4f));
  REQUIRE_THAT(transpose_hz(440.0f, 1.0f),
               WithinAbs(static_cast<float>(440.0 * kSemitoneRatio), 1e-3f));
  REQUIRE_THAT(std::pow(kSemitoneRatio, 12.0), WithinAbs(2.0, 1e-12));
}

TEST_CASE("semitones_between", "[convert]") {
  REQUIRE_THAT(semitones_between(220.0f, 440.0f), WithinAbs(12.0, 1e-6));
  REQUIRE_THAT(semitones_between(440.0f, 220.0f), WithinAbs(-12.0, 1e-6));
  REQUIRE(std::isnan(semitones_between(0.0f, 440.0f)));
  REQUIRE(std::isnan(semitones_between(220.0f, -1.0f)));
}

TEST_CASE("semitone_shift", "[convert]") {
  SECTION("reference values") {
    REQUIRE(semitone_shift(220.0f, 261.63f) == 3);
    REQUIRE(semitone_shift(220.0f, 440.0f) == 12);
    REQUIRE(semitone_shift(440.0f, 220.0f) == -12);
    REQUIRE(semitone_shift(196.0f, 261.63f) == 5);
  }

  SECTION("identity") {
    for (float f : {55.0f, 110.0f, 220.0f, 333.3f, 987.0f}) {
      REQUIRE(semitone_shift(f, f) == 0);
    }
  }

  SECTION("antisymmetry away from half-semitone ties") {
    const float pairs[][2] = {{220.0f, 261.63f}, {100.0f, 150.0f}, {300.0f, 90.0f}};
    for (const auto& p : pairs) {
      REQUIRE(semitone_shift(p[0], p[1]) == -semitone_shift(p[1], p[0]));
    }
  }

  SECTION("monotonic in target") {
    int previous = semitone_shift(220.0f, 60.0f);
    for (float target = 61.0f; target < 1000.0f; target += 7.0f) {
      int current = semitone_shift(220.0f, target);
      REQUIRE(current >= previous);
      previous = current;
    }
  }

  SECTION("invalid input yields zero") {
    REQUIRE(semitone_shift(0.0f, 261.63f) == 0);
    REQUIRE(semitone_shift(220.0f, 0.0f) == 0);
    REQUIRE(semitone_shift(-220.0f, 261.63f) == 0);
    REQUIRE(semitone_shift(std::numeric_limits<float>::quiet_NaN(), 261.63f) == 0);
    REQUIRE(semitone_shift(220.0f, std::numeric_limits<float>::infinity()) == 0);
  }
}

TEST_CASE("time_to_samples", "[convert]") {
  REQUIRE(time_to_samples(0.04, 16000) == 640);
  REQUIRE(time_to_samples(0.01, 16000) == 160);
  REQUIRE(time_to_samples(0.04, 44100) == 1764);
  REQUIRE(time_to_samples(8.0, 22050) == 176400);
  // Truncation
  REQUIRE(time_to_samples(0.01, 22050) == 220);
}
