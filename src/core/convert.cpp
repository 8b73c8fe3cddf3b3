/// @file convert.cpp
/// @brief Implementation of conversion functions.

#include "core/convert.h"

#include <cmath>
#include <limits>

namespace autopitch {

namespace {

bool positive_finite(float v) { return std::isfinite(v) && v > 0.0f; }

}  // namespace

float hz_to_midi(float hz) {
  if (hz <= 0) return 0.0f;
  return 12.0f * std::log2(hz / 440.0f) + 69.0f;
}

std::string hz_to_note(float hz) {
  if (!positive_finite(hz)) return "?";

  int midi_int = static_cast<int>(std::lround(hz_to_midi(hz)));
  if (midi_int < 0) return "?";

  static const char* note_names[] = {"C",  "C#", "D",  "D#", "E",  "F",
                                     "F#", "G",  "G#", "A",  "A#", "B"};

  int octave = midi_int / 12 - 1;
  int note = midi_int % 12;

  return std::string(note_names[note]) + std::to_string(octave);
}

float transpose_hz(float hz, float semitones) {
  return static_cast<float>(static_cast<double>(hz) *
                            std::pow(kSemitoneRatio, static_cast<double>(semitones)));
}

double semitones_between(float source_hz, float target_hz) {
  if (!positive_finite(source_hz) || !positive_finite(target_hz)) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return 12.0 * std::log2(static_cast<double>(target_hz) / static_cast<double>(source_hz));
}

int semitone_shift(float source_hz, float target_hz) {
  double st = semitones_between(source_hz, target_hz);
  if (!std::isfinite(st)) {
    return 0;
  }
  return static_cast<int>(std::lround(st));
}

int time_to_samples(double time, int sr) { return static_cast<int>(time * sr); }

}  // namespace autopitch
