/// @file json_reader.cpp
/// @brief Recursive-descent JSON reader.

#include "util/json_reader.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "util/exception.h"

namespace autopitch {

namespace {

// Containers nest by recursion; deeper documents are rejected.
constexpr int kMaxDepth = 64;

/// @brief Appends a code point as UTF-8.
void append_utf8(std::string& out, unsigned int cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

class JsonParser {
 public:
  explicit JsonParser(const std::string& json) : json_(json), pos_(0), depth_(0) {}

  JsonValue parse_document() {
    JsonValue root = parse_value();
    skip_whitespace();
    if (pos_ != json_.size()) {
      fail("Trailing characters after JSON value");
    }
    return root;
  }

 private:
  [[noreturn]] void fail(const std::string& what) const {
    throw AutopitchException(ErrorCode::InvalidFormat,
                             "JSON parse error at offset " + std::to_string(pos_) + ": " + what);
  }

  char peek() const { return pos_ < json_.size() ? json_[pos_] : '\0'; }

  JsonValue parse_value() {
    skip_whitespace();
    if (pos_ >= json_.size()) {
      fail("Unexpected end of input");
    }

    char c = json_[pos_];
    if (c == '{') return parse_object();
    if (c == '[') return parse_array();
    if (c == '"') return JsonValue(parse_string());
    if (c == 't' || c == 'f') return parse_bool();
    if (c == 'n') return parse_null();
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();

    fail(std::string("Unexpected character '") + c + "'");
  }

  void enter_container() {
    if (++depth_ > kMaxDepth) {
      fail("Nesting too deep");
    }
  }

  JsonValue parse_object() {
    JsonObject obj;
    expect('{');
    enter_container();
    skip_whitespace();

    if (peek() == '}') {
      ++pos_;
      --depth_;
      return JsonValue(std::move(obj));
    }

    while (true) {
      skip_whitespace();
      if (peek() != '"') {
        fail("Expected object key");
      }
      std::string key = parse_string();
      skip_whitespace();
      expect(':');
      obj[key] = parse_value();

      skip_whitespace();
      if (peek() == '}') {
        ++pos_;
        break;
      }
      expect(',');
    }
    --depth_;
    return JsonValue(std::move(obj));
  }

  JsonValue parse_array() {
    JsonArray arr;
    expect('[');
    enter_container();
    skip_whitespace();

    if (peek() == ']') {
      ++pos_;
      --depth_;
      return JsonValue(std::move(arr));
    }

    while (true) {
      arr.push_back(parse_value());
      skip_whitespace();
      if (peek() == ']') {
        ++pos_;
        break;
      }
      expect(',');
    }
    --depth_;
    return JsonValue(std::move(arr));
  }

  std::string parse_string() {
    expect('"');
    std::string result;
    while (pos_ < json_.size() && json_[pos_] != '"') {
      char c = json_[pos_];
      if (c != '\\') {
        result += c;
        ++pos_;
        continue;
      }

      ++pos_;
      if (pos_ >= json_.size()) break;
      switch (json_[pos_]) {
        case '"':
        case '\\':
        case '/':
          result += json_[pos_];
          break;
        case 'b':
          result += '\b';
          break;
        case 'f':
          result += '\f';
          break;
        case 'n':
          result += '\n';
          break;
        case 'r':
          result += '\r';
          break;
        case 't':
          result += '\t';
          break;
        case 'u': {
          if (pos_ + 4 >= json_.size()) {
            fail("Truncated unicode escape");
          }
          std::string hex = json_.substr(pos_ + 1, 4);
          for (char h : hex) {
            if (!std::isxdigit(static_cast<unsigned char>(h))) {
              fail("Invalid unicode escape");
            }
          }
          unsigned long cp = std::strtoul(hex.c_str(), nullptr, 16);
          append_utf8(result, static_cast<unsigned int>(cp));
          pos_ += 4;
          break;
        }
        default:
          fail("Invalid escape sequence");
      }
      ++pos_;
    }
    expect('"');
    return result;
  }

  JsonValue parse_number() {
    size_t start = pos_;
    if (peek() == '-') ++pos_;

    if (!std::isdigit(static_cast<unsigned char>(peek()))) {
      fail("Invalid number");
    }
    while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;

    if (peek() == '.') {
      ++pos_;
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    }

    if (peek() == 'e' || peek() == 'E') {
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    }

    // strtod instead of stod: overflow yields HUGE_VAL rather than throwing.
    std::string text = json_.substr(start, pos_ - start);
    return JsonValue(std::strtod(text.c_str(), nullptr));
  }

  JsonValue parse_bool() {
    if (json_.compare(pos_, 4, "true") == 0) {
      pos_ += 4;
      return JsonValue(true);
    }
    if (json_.compare(pos_, 5, "false") == 0) {
      pos_ += 5;
      return JsonValue(false);
    }
    fail("Invalid boolean");
  }

  JsonValue parse_null() {
    if (json_.compare(pos_, 4, "null") == 0) {
      pos_ += 4;
      return JsonValue(nullptr);
    }
    fail("Invalid null");
  }

  void skip_whitespace() {
    while (pos_ < json_.size() && (json_[pos_] == ' ' || json_[pos_] == '\t' ||
                                   json_[pos_] == '\n' || json_[pos_] == '\r')) {
      ++pos_;
    }
  }

  void expect(char c) {
    if (pos_ >= json_.size() || json_[pos_] != c) {
      fail(std::string("Expected '") + c + "'");
    }
    ++pos_;
  }

  const std::string& json_;
  size_t pos_;
  int depth_;
};

}  // namespace

bool JsonValue::contains(const std::string& key) const { return find(key) != nullptr; }

const JsonValue* JsonValue::find(const std::string& key) const {
  if (!is_object()) return nullptr;
  const auto& obj = std::get<JsonObject>(value_);
  auto it = obj.find(key);
  return it != obj.end() ? &it->second : nullptr;
}

JsonValue parse_json(const std::string& json) { return JsonParser(json).parse_document(); }

JsonValue parse_json_file(const std::string& path) {
  std::ifstream file(path);
  AUTOPITCH_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse_json(buffer.str());
}

}  // namespace autopitch
