/// @file json_reader_test.cpp
/// @brief Tests for the JSON reader.

#include "util/json_reader.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <string>

#include "util/exception.h"
#include "util/test_audio.h"

using namespace autopitch;
using Catch::Matchers::WithinAbs;

TEST_CASE("parse_json scalars", "[json_reader]") {
  REQUIRE(parse_json("null").is_null());
  REQUIRE(parse_json("true").as_bool());
  REQUIRE_FALSE(parse_json("false").as_bool());
  REQUIRE_THAT(parse_json("-12.5e1").as_number(), WithinAbs(-125.0, 1e-9));
  REQUIRE(parse_json("\"abc\"").as_string() == "abc");
}

TEST_CASE("parse_json strings", "[json_reader]") {
  SECTION("escapes") {
    REQUIRE(parse_json(R"("a\"b\\c\nd")").as_string() == "a\"b\\c\nd");
  }

  SECTION("unicode escape to UTF-8") {
    REQUIRE(parse_json(R"("\u00e9")").as_string() == "\xC3\xA9");
  }

  SECTION("unicode escape requires four hex digits") {
    for (const char* text : {R"("\u +1a")", R"("\u-001")", R"("\u00g1")", R"("\u 0e9")"}) {
      CAPTURE(text);
      try {
        parse_json(text);
        FAIL("expected exception");
      } catch (const AutopitchException& e) {
        REQUIRE(e.code() == ErrorCode::InvalidFormat);
      }
    }
  }
}

TEST_CASE("parse_json containers", "[json_reader]") {
  JsonValue v = parse_json(R"({"target_f0_hz": 185.0, "name": "alice", "tags": [1, 2, 3]})");
  REQUIRE(v.is_object());
  REQUIRE(v.contains("target_f0_hz"));
  REQUIRE_FALSE(v.contains("missing"));
  REQUIRE(v.find("missing") == nullptr);

  const JsonValue* target = v.find("target_f0_hz");
  REQUIRE(target != nullptr);
  REQUIRE_THAT(target->as_number(), WithinAbs(185.0, 1e-9));

  REQUIRE(v.find("name")->as_string() == "alice");
  REQUIRE(v.find("tags")->as_array().size() == 3);
}

TEST_CASE("parse_json lookups on non-objects", "[json_reader]") {
  JsonValue v = parse_json("[1, 2]");
  REQUIRE_FALSE(v.contains("a"));
  REQUIRE(v.find("a") == nullptr);
}

TEST_CASE("parse_json rejects malformed input", "[json_reader]") {
  REQUIRE_THROWS_AS(parse_json(""), AutopitchException);
  REQUIRE_THROWS_AS(parse_json("{"), AutopitchException);
  REQUIRE_THROWS_AS(parse_json("{\"a\" 1}"), AutopitchException);
  REQUIRE_THROWS_AS(parse_json("[1, 2,]"), AutopitchException);
  REQUIRE_THROWS_AS(parse_json("tru"), AutopitchException);

  SECTION("trailing content") {
    try {
      parse_json("{} x");
      FAIL("expected exception");
    } catch (const AutopitchException& e) {
      REQUIRE(e.code() == ErrorCode::InvalidFormat);
    }
  }
}

TEST_CASE("parse_json nesting limit", "[json_reader]") {
  SECTION("64 levels parse") {
    std::string text = std::string(64, '[') + std::string(64, ']');
    JsonValue v = parse_json(text);
    REQUIRE(v.is_array());
    REQUIRE(v.as_array().size() == 1);
  }

  SECTION("siblings do not accumulate depth") {
    std::string text = "[" + std::string(63, '[') + std::string(63, ']') + "," +
                       std::string(63, '[') + std::string(63, ']') + "]";
    REQUIRE(parse_json(text).as_array().size() == 2);
  }

  SECTION("65 levels rejected") {
    std::string text = std::string(65, '[') + std::string(65, ']');
    try {
      parse_json(text);
      FAIL("expected exception");
    } catch (const AutopitchException& e) {
      REQUIRE(e.code() == ErrorCode::InvalidFormat);
      REQUIRE(std::string(e.what()).find("Nesting too deep") != std::string::npos);
    }
  }

  SECTION("deeply nested objects rejected without recursing") {
    std::string text;
    for (int i = 0; i < 200000; ++i) {
      text += "{\"a\":";
    }
    REQUIRE_THROWS_AS(parse_json(text), AutopitchException);
  }

  SECTION("unterminated deep array rejected") {
    REQUIRE_THROWS_AS(parse_json(std::string(200000, '[')), AutopitchException);
  }
}

TEST_CASE("parse_json_file", "[json_reader]") {
  SECTION("reads a file") {
    std::string path = "/tmp/autopitch_json_reader_test.json";
    test::write_text(path, "{\"target_f0_hz\": 120}\n");
    JsonValue v = parse_json_file(path);
    REQUIRE_THAT(v.find("target_f0_hz")->as_number(), WithinAbs(120.0, 1e-9));
  }

  SECTION("missing file") {
    try {
      parse_json_file("/nonexistent/autopitch/meta.json");
      FAIL("expected exception");
    } catch (const AutopitchException& e) {
      REQUIRE(e.code() == ErrorCode::FileNotFound);
    }
  }
}
