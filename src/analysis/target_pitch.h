#pragma once

/// @file target_pitch.h
/// @brief Target fundamental frequency from model metadata.

#include <optional>
#include <string>

#include "util/json_reader.h"
#include "util/types.h"

namespace autopitch {

/// @brief Default speaking-to-singing register offset in semitones.
constexpr float kSingingOffsetSemitones = 6.0f;

/// @brief Record read from a model's metadata descriptor.
struct ModelMetadata {
  std::optional<float> target_f0_hz;  ///< Speaking-register baseline, if recorded
};

/// @brief Target resolution configuration.
struct TargetConfig {
  bool apply_singing_offset = true;                        ///< Shift baseline into singing register
  float singing_offset_semitones = kSingingOffsetSemitones;  ///< Offset applied when enabled
};

/// @brief Extracts metadata from a parsed descriptor.
/// @details target_f0_hz may be a number or a numeric string; anything else,
/// including a missing key, leaves the field empty.
/// @param root Parsed descriptor
/// @return Metadata record
/// @throws AutopitchException(InvalidFormat) if root is not an object
ModelMetadata parse_model_metadata(const JsonValue& root);

/// @brief Reads a metadata descriptor file.
/// @param path Descriptor path
/// @return Metadata, or nothing if the file does not exist
/// @throws AutopitchException(InvalidFormat) if the file is not a JSON object
std::optional<ModelMetadata> read_model_metadata(const std::string& path);

/// @brief Resolves the singing-register target frequency.
/// @param metadata Model metadata
/// @param config Target configuration
/// @return baseline * 2^(offset / 12), or nothing if the baseline is missing,
/// non-finite or not positive
std::optional<float> resolve_target_f0(const ModelMetadata& metadata,
                                       const TargetConfig& config = TargetConfig());

}  // namespace autopitch
