#pragma once

/// @file pitch_resolver.h
/// @brief Decides the semitone transposition applied before voice conversion.

#include <functional>
#include <optional>
#include <string>

#include "analysis/autocorr_estimator.h"
#include "analysis/contour_estimator.h"
#include "analysis/f0_estimator.h"
#include "analysis/target_pitch.h"
#include "core/audio.h"
#include "core/audio_io.h"
#include "util/log.h"

namespace autopitch {

/// @brief Which branch of the resolution produced a decision.
enum class Provenance {
  ExplicitOverride,          ///< Caller supplied the pitch
  Computed,                  ///< Shift from source f0 to target f0
  FallbackNoMetadata,        ///< No usable target frequency, pitch 0
  FallbackEstimationFailed,  ///< Audio could not be decoded or estimated, pitch 0
};

/// @brief Returns the tag of a provenance ("explicit-override", "computed", ...).
const char* provenance_name(Provenance provenance);

/// @brief Final decision of one resolution.
struct PitchDecision {
  int semitones = 0;                                     ///< Transposition in semitones
  Provenance provenance = Provenance::FallbackNoMetadata;  ///< Why this value was chosen
  std::optional<float> source_f0_hz;                     ///< Estimated input f0, when known
  std::optional<float> target_f0_hz;                     ///< Singing-register target, when known
  std::string reason;                                    ///< Cause of a fallback, empty otherwise
};

/// @brief Inputs of one resolution. Paths are concrete; no lookup is performed.
struct PitchRequest {
  std::string audio_path;             ///< Audio to analyze
  std::string metadata_path;          ///< Model metadata descriptor
  std::optional<int> explicit_pitch;  ///< Caller override, skips all analysis
};

/// @brief Resolver configuration.
struct ResolverConfig {
  EstimatorType estimator = EstimatorType::Autocorrelation;
  AutocorrConfig autocorr;
  ContourConfig contour;
  TargetConfig target;
  AudioLoadOptions load;
};

/// @brief Decodes an audio file.
using AudioLoader = std::function<Audio(const std::string& path)>;

/// @brief Converts a file the decoder cannot read into a WAV file at wav_path.
using FormatConverter =
    std::function<void(const std::string& source_path, const std::string& wav_path)>;

/// @brief Parses a caller-supplied pitch override.
/// @param text Decimal integer, optionally signed
/// @return Semitones
/// @throws AutopitchException(InvalidParameter) if text is not an integer
int parse_explicit_pitch(const std::string& text);

/// @brief Explicit-override-first, fail-to-zero pitch resolution.
/// @details resolve() never throws for decode, estimation or metadata
/// problems. Every such failure becomes a pitch of 0 with a fallback
/// provenance and a logged warning.
class PitchResolver {
 public:
  /// @brief Constructs a resolver with the configured estimator and file loader.
  explicit PitchResolver(const ResolverConfig& config = ResolverConfig());

  /// @brief Sets the diagnostic sink (nullptr restores the stderr default).
  void set_log_callback(LogCallback callback);

  /// @brief Replaces the estimator chosen by the configuration.
  void set_estimator(F0Estimator estimator);

  /// @brief Replaces the file decoder.
  void set_audio_loader(AudioLoader loader);

  /// @brief Installs a converter for inputs that are neither WAV nor MP3.
  void set_format_converter(FormatConverter converter);

  /// @brief Returns the configuration.
  const ResolverConfig& config() const { return config_; }

  /// @brief Resolves the pitch for a request.
  PitchDecision resolve(const PitchRequest& request) const;

 private:
  std::optional<float> resolve_target(const std::string& metadata_path, std::string& reason) const;
  Audio load_input(const std::string& path) const;
  void log(LogLevel level, const std::string& message) const;

  ResolverConfig config_;
  F0Estimator estimator_;
  AudioLoader loader_;
  FormatConverter converter_;
  LogCallback log_callback_;
};

}  // namespace autopitch
