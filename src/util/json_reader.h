#pragma once

/// @file json_reader.h
/// @brief Minimal JSON reader for small descriptor files.

#include <cstddef>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace autopitch {

class JsonValue;

using JsonNull = std::nullptr_t;
using JsonArray = std::vector<JsonValue>;
using JsonObject = std::map<std::string, JsonValue>;

/// @brief JSON value container.
class JsonValue {
 public:
  using Variant = std::variant<JsonNull, bool, double, std::string, JsonArray, JsonObject>;

  JsonValue() : value_(nullptr) {}
  JsonValue(std::nullptr_t) : value_(nullptr) {}
  JsonValue(bool v) : value_(v) {}
  JsonValue(double v) : value_(v) {}
  JsonValue(const char* v) : value_(std::string(v)) {}
  JsonValue(std::string v) : value_(std::move(v)) {}
  JsonValue(JsonArray v) : value_(std::move(v)) {}
  JsonValue(JsonObject v) : value_(std::move(v)) {}

  bool is_null() const { return std::holds_alternative<JsonNull>(value_); }
  bool is_bool() const { return std::holds_alternative<bool>(value_); }
  bool is_number() const { return std::holds_alternative<double>(value_); }
  bool is_string() const { return std::holds_alternative<std::string>(value_); }
  bool is_array() const { return std::holds_alternative<JsonArray>(value_); }
  bool is_object() const { return std::holds_alternative<JsonObject>(value_); }

  bool as_bool() const { return std::get<bool>(value_); }
  double as_number() const { return std::get<double>(value_); }
  const std::string& as_string() const { return std::get<std::string>(value_); }
  const JsonArray& as_array() const { return std::get<JsonArray>(value_); }
  const JsonObject& as_object() const { return std::get<JsonObject>(value_); }

  /// @brief Check if object contains key.
  bool contains(const std::string& key) const;

  /// @brief Returns member of an object, or nullptr if absent or not an object.
  const JsonValue* find(const std::string& key) const;

 private:
  Variant value_;
};

/// @brief Parses a JSON document.
/// @param json Document text
/// @return Root value
/// @throws AutopitchException(InvalidFormat) on malformed input, trailing content
///         or containers nested deeper than 64 levels
JsonValue parse_json(const std::string& json);

/// @brief Reads and parses a JSON file.
/// @param path File path
/// @return Root value
/// @throws AutopitchException(FileNotFound) if the file cannot be opened
/// @throws AutopitchException(InvalidFormat) on malformed input
JsonValue parse_json_file(const std::string& path);

}  // namespace autopitch
