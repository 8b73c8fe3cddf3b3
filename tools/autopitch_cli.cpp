/// @file autopitch_cli.cpp
/// @brief Command-line interface for automatic pitch resolution.

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "autopitch.h"

using namespace autopitch;

namespace {

constexpr const char* kCliVersion = "1.0.0";

// ============================================================================
// JSON Builder - Fluent interface for building JSON output
// ============================================================================

class JsonBuilder {
 public:
  JsonBuilder& begin_object() {
    append_separator();
    ss_ << "{";
    needs_comma_.push_back(false);
    return *this;
  }

  JsonBuilder& end_object() {
    ss_ << "}";
    needs_comma_.pop_back();
    if (!needs_comma_.empty()) needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& key(const std::string& k) {
    append_separator();
    ss_ << "\"" << escape(k) << "\": ";
    needs_comma_.back() = false;
    return *this;
  }

  JsonBuilder& value(const std::string& v) {
    append_separator();
    ss_ << "\"" << escape(v) << "\"";
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(const char* v) { return value(std::string(v)); }

  JsonBuilder& value(int v) {
    append_separator();
    ss_ << v;
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(size_t v) {
    append_separator();
    ss_ << v;
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(float v) {
    append_separator();
    ss_ << v;
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(const std::optional<float>& v) {
    if (v) return value(*v);
    append_separator();
    ss_ << "null";
    needs_comma_.back() = true;
    return *this;
  }

  template <typename T>
  JsonBuilder& kv(const std::string& k, const T& v) {
    return key(k).value(v);
  }

  void print() const { std::cout << ss_.str() << "\n"; }

 private:
  void append_separator() {
    if (!needs_comma_.empty() && needs_comma_.back()) {
      ss_ << ", ";
    }
  }

  static std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
      switch (c) {
        case '"':
          result += "\\\"";
          break;
        case '\\':
          result += "\\\\";
          break;
        case '\n':
          result += "\\n";
          break;
        case '\r':
          result += "\\r";
          break;
        case '\t':
          result += "\\t";
          break;
        default:
          result += c;
      }
    }
    return result;
  }

  std::ostringstream ss_;
  std::vector<bool> needs_comma_;
};

// ============================================================================
// CLI Arguments
// ============================================================================

struct CliArgs {
  std::string command;
  std::vector<std::string> positional;
  bool json_output = false;
  bool quiet = false;
  bool help = false;

  std::map<std::string, std::string> options;

  bool has(const std::string& k) const { return options.count(k) > 0; }

  std::string get_string(const std::string& k, const std::string& def = "") const {
    auto it = options.find(k);
    return it != options.end() ? it->second : def;
  }

  float get_float(const std::string& k, float def) const {
    auto it = options.find(k);
    if (it == options.end()) return def;
    return parse_float(it->second, "--" + k);
  }

  static float parse_float(const std::string& text, const std::string& what) {
    char* end = nullptr;
    float v = std::strtof(text.c_str(), &end);
    AUTOPITCH_CHECK_MSG(!text.empty() && end != text.c_str() && *end == '\0' && std::isfinite(v),
                        ErrorCode::InvalidParameter,
                        what + " expects a number, got '" + text + "'");
    return v;
  }
};

class ArgParser {
 public:
  static CliArgs parse(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        args.help = true;
      } else if (arg == "--json") {
        args.json_output = true;
      } else if (arg == "--quiet" || arg == "-q") {
        args.quiet = true;
      } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
        parse_option(args, arg.substr(2), argv, i, argc);
      } else if (args.command.empty()) {
        args.command = arg;
      } else {
        args.positional.push_back(arg);
      }
    }

    return args;
  }

 private:
  static void parse_option(CliArgs& args, const std::string& key, char* argv[], int& i, int argc) {
    static const std::vector<std::string> bool_flags = {"no-singing-offset", "emit-args"};

    if (std::find(bool_flags.begin(), bool_flags.end(), key) != bool_flags.end()) {
      args.options[key] = "true";
      return;
    }

    if (i + 1 < argc) {
      std::string next = argv[i + 1];
      bool is_negative_num =
          next.size() > 1 && next[0] == '-' && std::isdigit(static_cast<unsigned char>(next[1]));
      bool is_option = next.size() > 1 && next[0] == '-' && !is_negative_num;

      if (!is_option) {
        args.options[key] = argv[++i];
        return;
      }
    }
    args.options[key] = "";
  }
};

// ============================================================================
// Collaborators
// ============================================================================

std::string shell_quote(const std::string& s) {
  std::string quoted = "'";
  for (char c : s) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

/// @brief Converter shelling out to ffmpeg (16-bit PCM WAV output).
FormatConverter ffmpeg_converter(const std::string& ffmpeg) {
  return [ffmpeg](const std::string& source_path, const std::string& wav_path) {
    std::string cmd = shell_quote(ffmpeg) + " -y -loglevel error -i " + shell_quote(source_path) +
                      " -vn -acodec pcm_s16le " + shell_quote(wav_path);
    int status = std::system(cmd.c_str());
    AUTOPITCH_CHECK_MSG(status == 0, ErrorCode::DecodeFailed,
                        "ffmpeg failed to convert " + source_path + " (status " +
                            std::to_string(status) + ")");
  };
}

std::string resolve_audio_path(const CliArgs& args, const std::string& request) {
  std::vector<PathResolver> resolvers = {existing_path_resolver()};
  if (args.has("input-dir")) {
    resolvers.push_back(directory_resolver(args.get_string("input-dir")));
  }
  resolvers.push_back(directory_resolver("input"));

  auto path = resolve_first(resolvers, request);
  AUTOPITCH_CHECK_MSG(path.has_value(), ErrorCode::FileNotFound, "Input not found: " + request);
  return *path;
}

std::string metadata_path_from_args(const CliArgs& args) {
  if (args.has("meta")) return args.get_string("meta");
  if (args.has("model")) return model_metadata_path(args.get_string("model"));
  return "";
}

ResolverConfig config_from_args(const CliArgs& args) {
  ResolverConfig config;
  if (args.has("estimator")) {
    config.estimator = parse_estimator_type(args.get_string("estimator"));
  }
  config.autocorr.fmin = args.get_float("fmin", config.autocorr.fmin);
  config.autocorr.fmax = args.get_float("fmax", config.autocorr.fmax);
  config.target.apply_singing_offset = !args.has("no-singing-offset");
  config.target.singing_offset_semitones =
      args.get_float("singing-offset", config.target.singing_offset_semitones);

  std::string sample32 = args.get_string("sample32", "tag");
  if (sample32 == "detect") {
    config.load.sample32 = Sample32Mode::Detect;
  } else if (sample32 != "tag") {
    throw AutopitchException(ErrorCode::InvalidParameter,
                             "--sample32 expects 'tag' or 'detect', got '" + sample32 + "'");
  }
  return config;
}

LogCallback cli_log_callback(const CliArgs& args) {
  if (args.quiet) return null_log_callback;
  return default_log_callback;
}

// ============================================================================
// Commands
// ============================================================================

using CommandHandler = std::function<int(const CliArgs&)>;

int cmd_resolve(const CliArgs& args) {
  // Validate the override before anything else runs.
  std::optional<int> explicit_pitch;
  if (args.has("pitch")) {
    explicit_pitch = parse_explicit_pitch(args.get_string("pitch"));
  }

  AUTOPITCH_CHECK_MSG(!args.positional.empty(), ErrorCode::InvalidParameter,
                      "resolve requires an audio file");

  PitchRequest request;
  request.audio_path = resolve_audio_path(args, args.positional[0]);
  request.metadata_path = metadata_path_from_args(args);
  request.explicit_pitch = explicit_pitch;

  PitchResolver resolver(config_from_args(args));
  resolver.set_log_callback(cli_log_callback(args));
  if (args.has("ffmpeg")) {
    resolver.set_format_converter(ffmpeg_converter(args.get_string("ffmpeg", "ffmpeg")));
  }

  PitchDecision decision = resolver.resolve(request);

  if (args.json_output) {
    JsonBuilder()
        .begin_object()
        .kv("pitch", decision.semitones)
        .kv("provenance", provenance_name(decision.provenance))
        .kv("source_f0_hz", decision.source_f0_hz)
        .kv("target_f0_hz", decision.target_f0_hz)
        .kv("reason", decision.reason)
        .kv("input", request.audio_path)
        .end_object()
        .print();
  } else if (args.has("emit-args")) {
    std::cout << "--pitch " << decision.semitones << "\n";
  } else {
    printf("Pitch:      %d st\n", decision.semitones);
    printf("Provenance: %s\n", provenance_name(decision.provenance));
    if (decision.source_f0_hz) printf("Source F0:  %.2f Hz\n", *decision.source_f0_hz);
    if (decision.target_f0_hz) printf("Target F0:  %.2f Hz\n", *decision.target_f0_hz);
    if (!decision.reason.empty()) printf("Reason:     %s\n", decision.reason.c_str());
  }
  return 0;
}

int cmd_f0(const CliArgs& args) {
  AUTOPITCH_CHECK_MSG(!args.positional.empty(), ErrorCode::InvalidParameter,
                      "f0 requires an audio file");
  ResolverConfig config = config_from_args(args);
  std::string path = resolve_audio_path(args, args.positional[0]);

  Audio audio = Audio::from_file(path, config.load);
  F0Estimate f0 = make_estimator(config.estimator, config.autocorr, config.contour)(audio);

  if (args.json_output) {
    JsonBuilder()
        .begin_object()
        .kv("estimator", estimator_type_name(config.estimator))
        .kv("f0_hz", f0)
        .kv("duration", audio.duration())
        .end_object()
        .print();
  } else if (f0) {
    printf("F0 (%s): %.2f Hz (%s)\n", estimator_type_name(config.estimator), *f0,
           hz_to_note(*f0).c_str());
  } else {
    printf("F0 (%s): not detected\n", estimator_type_name(config.estimator));
  }
  return 0;
}

int cmd_target(const CliArgs& args) {
  std::string path = metadata_path_from_args(args);
  if (path.empty() && !args.positional.empty()) path = args.positional[0];
  AUTOPITCH_CHECK_MSG(!path.empty(), ErrorCode::InvalidParameter,
                      "target requires --meta, --model or a descriptor path");

  ResolverConfig config = config_from_args(args);
  std::optional<ModelMetadata> meta = read_model_metadata(path);
  std::optional<float> target =
      meta ? resolve_target_f0(*meta, config.target) : std::optional<float>();

  if (args.json_output) {
    JsonBuilder()
        .begin_object()
        .kv("metadata", path)
        .kv("baseline_f0_hz", meta ? meta->target_f0_hz : std::optional<float>())
        .kv("target_f0_hz", target)
        .end_object()
        .print();
  } else if (target) {
    printf("Target F0: %.2f Hz (%s)\n", *target, hz_to_note(*target).c_str());
  } else {
    printf("Target F0: none\n");
  }
  return 0;
}

int cmd_shift(const CliArgs& args) {
  AUTOPITCH_CHECK_MSG(args.positional.size() >= 2, ErrorCode::InvalidParameter,
                      "shift requires <source_hz> <target_hz>");
  float source = CliArgs::parse_float(args.positional[0], "source_hz");
  float target = CliArgs::parse_float(args.positional[1], "target_hz");
  int shift = semitone_shift(source, target);

  if (args.json_output) {
    JsonBuilder()
        .begin_object()
        .kv("source_hz", source)
        .kv("target_hz", target)
        .kv("pitch", shift)
        .end_object()
        .print();
  } else {
    printf("%d\n", shift);
  }
  return 0;
}

int cmd_info(const CliArgs& args) {
  AUTOPITCH_CHECK_MSG(!args.positional.empty(), ErrorCode::InvalidParameter,
                      "info requires an audio file");
  ResolverConfig config = config_from_args(args);
  std::string path = resolve_audio_path(args, args.positional[0]);
  Audio audio = Audio::from_file(path, config.load);

  if (args.json_output) {
    JsonBuilder()
        .begin_object()
        .kv("file", path)
        .kv("duration", audio.duration())
        .kv("sample_rate", audio.sample_rate())
        .kv("samples", audio.size())
        .end_object()
        .print();
  } else {
    std::cout << "Audio File: " << path << "\n";
    printf("  Duration:    %.2fs\n", audio.duration());
    printf("  Sample Rate: %d Hz\n", audio.sample_rate());
    printf("  Samples:     %zu\n", audio.size());
  }
  return 0;
}

int cmd_version(const CliArgs& args) {
  if (args.json_output) {
    JsonBuilder()
        .begin_object()
        .kv("cli_version", kCliVersion)
        .kv("lib_version", AUTOPITCH_VERSION_STRING)
        .end_object()
        .print();
  } else {
    std::cout << "autopitch-cli " << kCliVersion << " (libautopitch " << AUTOPITCH_VERSION_STRING
              << ")\n";
  }
  return 0;
}

struct CommandInfo {
  std::string name;
  std::string description;
  CommandHandler handler;
};

const std::vector<CommandInfo>& get_commands() {
  static std::vector<CommandInfo> commands = {
      {"resolve", "Decide the pitch shift for an input", cmd_resolve},
      {"f0", "Estimate the source fundamental frequency", cmd_f0},
      {"target", "Show the target frequency of a model", cmd_target},
      {"shift", "Semitone shift between two frequencies", cmd_shift},
      {"info", "Show audio file information", cmd_info},
      {"version", "Show version", cmd_version},
  };
  return commands;
}

const CommandInfo* find_command(const std::string& name) {
  for (const auto& cmd : get_commands()) {
    if (cmd.name == name) return &cmd;
  }
  return nullptr;
}

void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <command> [options] <audio_file>\n\n";

  std::cerr << "COMMANDS:\n";
  for (const auto& cmd : get_commands()) {
    fprintf(stderr, "  %-10s %s\n", cmd.name.c_str(), cmd.description.c_str());
  }

  std::cerr << "\nOPTIONS:\n"
            << "  --meta <path>            Model metadata descriptor (model.meta.json)\n"
            << "  --model <path>           Model checkpoint; descriptor is read beside it\n"
            << "  --pitch <int>            Explicit pitch, skips estimation\n"
            << "  --estimator <name>       autocorr (default) or yin\n"
            << "  --fmin, --fmax <hz>      Autocorrelation search window (default: 50-500)\n"
            << "  --singing-offset <st>    Speaking-to-singing offset (default: 6)\n"
            << "  --no-singing-offset      Use the metadata baseline as target\n"
            << "  --sample32 <tag|detect>  32-bit WAV interpretation (default: tag)\n"
            << "  --input-dir <dir>        Extra directory searched for the audio file\n"
            << "  --ffmpeg <path>          Convert non-WAV/MP3 inputs with ffmpeg\n"
            << "  --emit-args              Print the decision as '--pitch N'\n"
            << "  --json                   Output results in JSON format\n"
            << "  --quiet, -q              Suppress log output\n"
            << "  --help, -h               Show help\n"
            << "\nExamples:\n"
            << "  " << prog << " resolve vocals.wav --model models/alice/model.pth\n"
            << "  " << prog << " resolve vocals.wav --meta model.meta.json --json\n"
            << "  " << prog << " shift 220 261.63\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  CliArgs args = ArgParser::parse(argc, argv);

  if (args.help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command.empty()) {
    std::cerr << "Error: No command specified\n\n";
    print_usage(argv[0]);
    return 1;
  }

  const CommandInfo* cmd = find_command(args.command);
  if (!cmd) {
    std::cerr << "Error: Unknown command '" << args.command << "'\n\n";
    print_usage(argv[0]);
    return 1;
  }

  try {
    return cmd->handler(args);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
