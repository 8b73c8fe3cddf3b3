#include "analysis/target_pitch.h"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <system_error>

#include "core/convert.h"
#include "util/exception.h"

namespace autopitch {

namespace {

constexpr const char* kTargetKey = "target_f0_hz";

/// @brief Parses a whole string as a floating-point number.
std::optional<double> parse_number_string(const std::string& text) {
  if (text.empty()) return std::nullopt;
  char* end = nullptr;
  double v = std::strtod(text.c_str(), &end);
  while (end && (*end == ' ' || *end == '\t' || *end == '\n' || *end == '\r')) ++end;
  if (end == text.c_str() || *end != '\0') return std::nullopt;
  return v;
}

/// @brief Narrows to float, rejecting values float cannot represent.
std::optional<float> to_float(double v) {
  if (!std::isfinite(v) || std::abs(v) > std::numeric_limits<float>::max()) {
    return std::nullopt;
  }
  return static_cast<float>(v);
}

}  // namespace

ModelMetadata parse_model_metadata(const JsonValue& root) {
  AUTOPITCH_CHECK_MSG(root.is_object(), ErrorCode::InvalidFormat,
                      "Model metadata must be a JSON object");

  ModelMetadata meta;
  const JsonValue* value = root.find(kTargetKey);
  if (!value) {
    return meta;
  }

  if (value->is_number()) {
    meta.target_f0_hz = to_float(value->as_number());
  } else if (value->is_string()) {
    if (auto v = parse_number_string(value->as_string())) {
      meta.target_f0_hz = to_float(*v);
    }
  }
  return meta;
}

std::optional<ModelMetadata> read_model_metadata(const std::string& path) {
  std::error_code ec;
  if (path.empty() || !std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }
  return parse_model_metadata(parse_json_file(path));
}

std::optional<float> resolve_target_f0(const ModelMetadata& metadata, const TargetConfig& config) {
  if (!metadata.target_f0_hz) {
    return std::nullopt;
  }
  float baseline = *metadata.target_f0_hz;
  if (!std::isfinite(baseline) || baseline <= 0.0f) {
    return std::nullopt;
  }
  if (!config.apply_singing_offset) {
    return baseline;
  }
  return transpose_hz(baseline, config.singing_offset_semitones);
}

}  // namespace autopitch
