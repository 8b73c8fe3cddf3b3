/// @file cli_test.cpp
/// @brief Tests for the autopitch CLI tool.

#include <sys/wait.h>

#include <array>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "util/test_audio.h"

using namespace autopitch;
using Catch::Matchers::ContainsSubstring;

namespace {

/// @brief Executes a shell command and returns output.
/// @param cmd Command to execute
/// @return Pair of (exit_code, output)
std::pair<int, std::string> exec_command(const std::string& cmd) {
  std::array<char, 4096> buffer;
  std::string result;

  // Redirect stderr to stdout
  std::string full_cmd = cmd + " 2>&1";
  std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(full_cmd.c_str(), "r"), pclose);
  if (!pipe) {
    return {-1, "popen failed"};
  }

  while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
    result += buffer.data();
  }

  int status = pclose(pipe.release());
  int exit_code = WEXITSTATUS(status);
  return {exit_code, result};
}

const std::string CLI = AUTOPITCH_CLI_PATH;
const std::string MODEL_DIR = "/tmp/autopitch_cli_model";
const std::string TEST_WAV = "/tmp/autopitch_cli_test.wav";

/// @brief Writes a 220 Hz test tone and a model directory with a 185 Hz baseline.
void create_fixtures() {
  test::write_file(TEST_WAV, test::make_mono_wav(test::make_sine(220.0, 2.0, 16000), 16000));
  std::filesystem::create_directories(MODEL_DIR);
  test::write_text(MODEL_DIR + "/model.pth", "weights");
  test::write_text(MODEL_DIR + "/model.meta.json", R"({"target_f0_hz": 185.0})");
}

}  // namespace

TEST_CASE("CLI version command", "[cli]") {
  SECTION("text output") {
    auto [code, output] = exec_command(CLI + " version");
    REQUIRE(code == 0);
    REQUIRE_THAT(output, ContainsSubstring("autopitch-cli"));
    REQUIRE_THAT(output, ContainsSubstring("libautopitch"));
  }

  SECTION("json output") {
    auto [code, output] = exec_command(CLI + " version --json");
    REQUIRE(code == 0);
    REQUIRE_THAT(output, ContainsSubstring("\"cli_version\""));
    REQUIRE_THAT(output, ContainsSubstring("\"lib_version\""));
  }
}

TEST_CASE("CLI help command", "[cli]") {
  auto [code, output] = exec_command(CLI + " --help");
  REQUIRE(code == 0);
  REQUIRE_THAT(output, ContainsSubstring("COMMANDS"));
  REQUIRE_THAT(output, ContainsSubstring("resolve"));
  REQUIRE_THAT(output, ContainsSubstring("--pitch"));
}

TEST_CASE("CLI resolve command", "[cli]") {
  create_fixtures();

  SECTION("metadata beside the model") {
    auto [code, output] =
        exec_command(CLI + " resolve " + TEST_WAV + " --model " + MODEL_DIR + "/model.pth");
    REQUIRE(code == 0);
    REQUIRE_THAT(output, ContainsSubstring("Pitch:      3 st"));
    REQUIRE_THAT(output, ContainsSubstring("computed"));
    REQUIRE_THAT(output, ContainsSubstring("[auto_pitch] input_f0="));
  }

  SECTION("json output") {
    auto [code, output] = exec_command(CLI + " resolve " + TEST_WAV + " --meta " + MODEL_DIR +
                                       "/model.meta.json --json -q");
    REQUIRE(code == 0);
    REQUIRE_THAT(output, ContainsSubstring("\"pitch\": 3"));
    REQUIRE_THAT(output, ContainsSubstring("\"provenance\": \"computed\""));
    REQUIRE_THAT(output, ContainsSubstring("\"target_f0_hz\": 261.6"));
  }

  SECTION("emit-args") {
    auto [code, output] = exec_command(CLI + " resolve " + TEST_WAV + " --model " + MODEL_DIR +
                                       "/model.pth --emit-args -q");
    REQUIRE(code == 0);
    REQUIRE(output == "--pitch 3\n");
  }

  SECTION("explicit negative pitch") {
    auto [code, output] =
        exec_command(CLI + " resolve " + TEST_WAV + " --pitch -5 --emit-args -q");
    REQUIRE(code == 0);
    REQUIRE(output == "--pitch -5\n");
  }

  SECTION("non-integer pitch is rejected") {
    auto [code, output] = exec_command(CLI + " resolve " + TEST_WAV + " --pitch 2.5 -q");
    REQUIRE(code == 1);
    REQUIRE_THAT(output, ContainsSubstring("integer"));
  }

  SECTION("missing metadata falls back to zero") {
    auto [code, output] = exec_command(CLI + " resolve " + TEST_WAV +
                                       " --meta /nonexistent/model.meta.json --json");
    REQUIRE(code == 0);
    REQUIRE_THAT(output, ContainsSubstring("\"pitch\": 0"));
    REQUIRE_THAT(output, ContainsSubstring("fallback-no-metadata"));
    REQUIRE_THAT(output, ContainsSubstring("[auto_pitch] WARN:"));
  }

  SECTION("bare name resolved from an input directory") {
    auto [code, output] = exec_command(CLI + " resolve autopitch_cli_test --input-dir /tmp --meta " +
                                       MODEL_DIR + "/model.meta.json --emit-args -q");
    REQUIRE(code == 0);
    REQUIRE(output == "--pitch 3\n");
  }

  SECTION("quiet suppresses log lines") {
    auto [code, output] = exec_command(CLI + " resolve " + TEST_WAV + " --model " + MODEL_DIR +
                                       "/model.pth -q");
    REQUIRE(code == 0);
    REQUIRE_THAT(output, !ContainsSubstring("[auto_pitch]"));
  }
}

TEST_CASE("CLI f0 command", "[cli]") {
  create_fixtures();

  SECTION("autocorrelation") {
    auto [code, output] = exec_command(CLI + " f0 " + TEST_WAV + " --json");
    REQUIRE(code == 0);
    REQUIRE_THAT(output, ContainsSubstring("\"estimator\": \"autocorr\""));
    REQUIRE_THAT(output, ContainsSubstring("\"f0_hz\": 2"));
  }

  SECTION("yin") {
    auto [code, output] = exec_command(CLI + " f0 " + TEST_WAV + " --estimator yin");
    REQUIRE(code == 0);
    REQUIRE_THAT(output, ContainsSubstring("F0 (yin)"));
    REQUIRE_THAT(output, ContainsSubstring("A3"));
  }

  SECTION("unknown estimator") {
    auto [code, output] = exec_command(CLI + " f0 " + TEST_WAV + " --estimator crepe");
    REQUIRE(code == 1);
    REQUIRE_THAT(output, ContainsSubstring("Unknown estimator"));
  }
}

TEST_CASE("CLI target command", "[cli]") {
  create_fixtures();

  auto [code, output] = exec_command(CLI + " target --model " + MODEL_DIR + "/model.pth");
  REQUIRE(code == 0);
  REQUIRE_THAT(output, ContainsSubstring("261.63"));
  REQUIRE_THAT(output, ContainsSubstring("C4"));
}

TEST_CASE("CLI shift command", "[cli]") {
  SECTION("positive") {
    auto [code, output] = exec_command(CLI + " shift 220 261.63");
    REQUIRE(code == 0);
    REQUIRE(output == "3\n");
  }

  SECTION("invalid frequency yields zero") {
    auto [code, output] = exec_command(CLI + " shift 0 261.63");
    REQUIRE(code == 0);
    REQUIRE(output == "0\n");
  }

  SECTION("non-numeric") {
    auto [code, output] = exec_command(CLI + " shift abc 261.63");
    REQUIRE(code == 1);
  }
}

TEST_CASE("CLI info command", "[cli]") {
  create_fixtures();

  auto [code, output] = exec_command(CLI + " info " + TEST_WAV + " --json");
  REQUIRE(code == 0);
  REQUIRE_THAT(output, ContainsSubstring("\"sample_rate\": 16000"));
  REQUIRE_THAT(output, ContainsSubstring("\"samples\": 32000"));
}

TEST_CASE("CLI error handling", "[cli]") {
  SECTION("unknown command") {
    auto [code, output] = exec_command(CLI + " unknown-command");
    REQUIRE(code == 1);
    REQUIRE_THAT(output, ContainsSubstring("Unknown command"));
  }

  SECTION("missing audio file") {
    auto [code, output] = exec_command(CLI + " resolve");
    REQUIRE(code == 1);
    REQUIRE_THAT(output, ContainsSubstring("requires an audio file"));
  }

  SECTION("nonexistent file") {
    auto [code, output] = exec_command(CLI + " resolve /nonexistent/file.wav -q");
    REQUIRE(code == 1);
    REQUIRE_THAT(output, ContainsSubstring("Input not found"));
  }
}
