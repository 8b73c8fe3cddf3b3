#pragma once

/// @file convert.h
/// @brief Frequency, semitone and time conversions.

#include <string>

namespace autopitch {

/// @brief Frequency ratio of one semitone.
constexpr double kSemitoneRatio = 1.0594630943592953;  // 2^(1/12)

/// @brief Converts Hz to MIDI note number.
/// @param hz Frequency in Hz
/// @return MIDI note number (A4 = 440Hz = 69), 0 for non-positive input
float hz_to_midi(float hz);

/// @brief Converts Hz to note name.
/// @param hz Frequency in Hz
/// @return Note name (e.g., "A4", "C#5"), "?" for non-positive input
std::string hz_to_note(float hz);

/// @brief Transposes a frequency by a (fractional) number of semitones.
/// @param hz Frequency in Hz
/// @param semitones Shift in semitones (positive = up)
/// @return hz * kSemitoneRatio^semitones
float transpose_hz(float hz, float semitones);

/// @brief Real-valued interval from source to target in semitones.
/// @return 12 * log2(target / source); NaN if either input is not a positive finite number
double semitones_between(float source_hz, float target_hz);

/// @brief Integer semitone shift that moves source_hz closest to target_hz.
/// @details round(12 * log2(target / source)), ties away from zero. Returns 0
/// when either input is <= 0 or non-finite, or the interval is not finite.
/// @param source_hz Source fundamental frequency in Hz
/// @param target_hz Target fundamental frequency in Hz
/// @return Signed semitone count
int semitone_shift(float source_hz, float target_hz);

/// @brief Converts time in seconds to sample count (truncating).
/// @param time Time in seconds
/// @param sr Sample rate
/// @return Number of samples
int time_to_samples(double time, int sr);

}  // namespace autopitch
