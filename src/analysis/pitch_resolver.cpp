#include "analysis/pitch_resolver.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <limits>
#include <sstream>

#include "core/convert.h"
#include "core/scratch_file.h"
#include "util/exception.h"

namespace autopitch {

namespace {

std::string format_hz(float hz) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2) << hz;
  return ss.str();
}

PitchDecision fallback(PitchDecision decision, Provenance provenance, std::string reason) {
  decision.semitones = 0;
  decision.provenance = provenance;
  decision.reason = std::move(reason);
  return decision;
}

}  // namespace

const char* provenance_name(Provenance provenance) {
  switch (provenance) {
    case Provenance::ExplicitOverride:
      return "explicit-override";
    case Provenance::Computed:
      return "computed";
    case Provenance::FallbackNoMetadata:
      return "fallback-no-metadata";
    case Provenance::FallbackEstimationFailed:
      return "fallback-estimation-failed";
  }
  return "unknown";
}

int parse_explicit_pitch(const std::string& text) {
  AUTOPITCH_CHECK_MSG(!text.empty(), ErrorCode::InvalidParameter, "Pitch override is empty");

  errno = 0;
  char* end = nullptr;
  long value = std::strtol(text.c_str(), &end, 10);
  AUTOPITCH_CHECK_MSG(end != text.c_str() && *end == '\0', ErrorCode::InvalidParameter,
                      "Pitch override must be an integer: '" + text + "'");
  AUTOPITCH_CHECK_MSG(errno != ERANGE && value >= std::numeric_limits<int>::min() &&
                          value <= std::numeric_limits<int>::max(),
                      ErrorCode::InvalidParameter, "Pitch override out of range: '" + text + "'");
  return static_cast<int>(value);
}

PitchResolver::PitchResolver(const ResolverConfig& config)
    : config_(config),
      estimator_(make_estimator(config.estimator, config.autocorr, config.contour)),
      loader_([options = config.load](const std::string& path) {
        return Audio::from_file(path, options);
      }),
      log_callback_(default_log_callback) {}

void PitchResolver::set_log_callback(LogCallback callback) {
  log_callback_ = callback ? std::move(callback) : LogCallback(default_log_callback);
}

void PitchResolver::set_estimator(F0Estimator estimator) {
  estimator_ = estimator ? std::move(estimator)
                         : make_estimator(config_.estimator, config_.autocorr, config_.contour);
}

void PitchResolver::set_audio_loader(AudioLoader loader) {
  if (loader) {
    loader_ = std::move(loader);
    return;
  }
  loader_ = [options = config_.load](const std::string& path) {
    return Audio::from_file(path, options);
  };
}

void PitchResolver::set_format_converter(FormatConverter converter) {
  converter_ = std::move(converter);
}

void PitchResolver::log(LogLevel level, const std::string& message) const {
  if (log_callback_) {
    log_callback_(level, message);
  }
}

std::optional<float> PitchResolver::resolve_target(const std::string& metadata_path,
                                                   std::string& reason) const {
  std::optional<ModelMetadata> metadata;
  try {
    metadata = read_model_metadata(metadata_path);
  } catch (const std::exception& e) {
    log(LogLevel::Warning, "failed reading " + metadata_path + ": " + e.what());
    reason = std::string("unreadable metadata: ") + e.what();
    return std::nullopt;
  } catch (...) {
    log(LogLevel::Warning, "failed reading " + metadata_path + ": unknown error");
    reason = "unreadable metadata: unknown error";
    return std::nullopt;
  }

  if (!metadata) {
    reason = "metadata file not found: " + metadata_path;
    return std::nullopt;
  }

  std::optional<float> target = resolve_target_f0(*metadata, config_.target);
  if (!target) {
    reason = "no valid target_f0_hz in " + metadata_path;
    return std::nullopt;
  }
  if (config_.target.apply_singing_offset) {
    log(LogLevel::Debug, "baseline " + format_hz(*metadata->target_f0_hz) + " Hz + " +
                             format_hz(config_.target.singing_offset_semitones) +
                             " st singing offset");
  }
  return target;
}

Audio PitchResolver::load_input(const std::string& path) const {
  if (converter_ && detect_file_format(path) == AudioFormat::Unknown) {
    ScratchFile scratch(".wav");
    log(LogLevel::Debug, "converting " + path + " -> " + scratch.path());
    converter_(path, scratch.path());
    return loader_(scratch.path());
  }
  return loader_(path);
}

PitchDecision PitchResolver::resolve(const PitchRequest& request) const {
  PitchDecision decision;

  if (request.explicit_pitch) {
    decision.semitones = *request.explicit_pitch;
    decision.provenance = Provenance::ExplicitOverride;
    log(LogLevel::Info, "Using explicit pitch=" + std::to_string(decision.semitones) + " (" +
                            provenance_name(decision.provenance) + ")");
    return decision;
  }

  std::string reason;
  decision.target_f0_hz = resolve_target(request.metadata_path, reason);
  if (!decision.target_f0_hz) {
    log(LogLevel::Warning, "No target_f0_hz in model metadata (" + reason +
                               "). Using pitch=0 (fallback-no-metadata).");
    return fallback(decision, Provenance::FallbackNoMetadata, reason);
  }

  F0Estimate source;
  try {
    Audio audio = load_input(request.audio_path);
    source = estimator_(audio);
    if (!source) {
      reason = "no voiced frames in " + request.audio_path;
    } else if (!std::isfinite(*source) || *source <= 0.0f) {
      reason = "estimator returned invalid f0 " + format_hz(*source);
      source.reset();
    }
  } catch (const std::exception& e) {
    reason = e.what();
  } catch (...) {
    reason = "unknown error";
  }

  if (!source) {
    log(LogLevel::Warning, "Could not estimate input f0 (" + reason +
                               "). Using pitch=0 (fallback-estimation-failed).");
    return fallback(decision, Provenance::FallbackEstimationFailed, reason);
  }

  decision.source_f0_hz = source;
  decision.semitones = semitone_shift(*source, *decision.target_f0_hz);
  decision.provenance = Provenance::Computed;
  log(LogLevel::Info, "input_f0=" + format_hz(*source) + " Hz (" + hz_to_note(*source) +
                          "), target_f0=" + format_hz(*decision.target_f0_hz) + " Hz (" +
                          hz_to_note(*decision.target_f0_hz) +
                          ") -> pitch=" + std::to_string(decision.semitones) + " st (computed)");
  return decision;
}

}  // namespace autopitch
