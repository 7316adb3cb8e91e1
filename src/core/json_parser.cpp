// Implementation of the minimal flat-object JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace band {

namespace {

// Open bounds: every number strictly between them truncates into int.
constexpr double kIntLowerBound = static_cast<double>(std::numeric_limits<int>::min()) - 1.0;
constexpr double kIntUpperBound = static_cast<double>(std::numeric_limits<int>::max()) + 1.0;

}  // namespace

int JsonValue::asInt(int default_val) const {
  if (type == Number && number_val > kIntLowerBound && number_val < kIntUpperBound) {
    return static_cast<int>(number_val);
  }
  return default_val;
}

bool JsonValue::asBool(bool default_val) const {
  if (type == Bool) return bool_val;
  return default_val;
}

std::string JsonValue::asString(const std::string& default_val) const {
  if (type == String) return string_val;
  return default_val;
}

namespace {

/// @brief Read cursor over the input text. Every parse step returns false
/// on malformed input.
class Cursor {
 public:
  Cursor(const char* json, size_t length) : json_(json), length_(length) {}

  bool atEnd() const { return pos_ >= length_; }
  char peek() const { return atEnd() ? '\0' : json_[pos_]; }

  void skipWhitespace() {
    while (!atEnd() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
      ++pos_;
    }
  }

  bool consume(char expected) {
    if (peek() != expected) return false;
    ++pos_;
    return true;
  }

  bool consumeWord(const char* word) {
    size_t len = std::strlen(word);
    if (length_ - pos_ < len || std::strncmp(json_ + pos_, word, len) != 0) return false;
    pos_ += len;
    return true;
  }

  bool parseString(std::string& out) {
    if (!consume('"')) return false;
    out.clear();
    while (!atEnd()) {
      char chr = json_[pos_++];
      if (chr == '"') return true;
      if (chr != '\\') {
        out += chr;
        continue;
      }
      if (atEnd()) return false;
      char esc = json_[pos_++];
      switch (esc) {
        case '"':  out += '"';  break;
        case '\\': out += '\\'; break;
        case '/':  out += '/';  break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 'r':  out += '\r'; break;
        case 't':  out += '\t'; break;
        case 'u': {
          // Only the ASCII range is kept; other code points become '?'.
          if (length_ - pos_ < 4) return false;
          std::string hex(json_ + pos_, 4);
          char* end = nullptr;
          long code = std::strtol(hex.c_str(), &end, 16);
          if (end != hex.c_str() + 4) return false;
          out += code < 0x80 ? static_cast<char>(code) : '?';
          pos_ += 4;
          break;
        }
        default:
          return false;
      }
    }
    return false;  // unterminated
  }

  bool parseNumber(double& out) {
    size_t start = pos_;
    consume('-');
    while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    if (consume('.')) {
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    }
    if (peek() == 'e' || peek() == 'E') {
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    }
    if (pos_ == start) return false;

    std::string num_str(json_ + start, pos_ - start);
    char* end = nullptr;
    out = std::strtod(num_str.c_str(), &end);
    return end == num_str.c_str() + num_str.size();
  }

  /// Skip a nested object or array, honoring strings.
  bool skipContainer() {
    int depth = 0;
    std::string scratch;
    while (!atEnd()) {
      char chr = peek();
      if (chr == '"') {
        if (!parseString(scratch)) return false;
        continue;
      }
      ++pos_;
      if (chr == '{' || chr == '[') ++depth;
      if (chr == '}' || chr == ']') --depth;
      if (depth == 0) return true;
    }
    return false;
  }

 private:
  const char* json_;
  size_t length_;
  size_t pos_ = 0;
};

}  // namespace

std::optional<JsonObject> parseJsonObject(const char* json, size_t length) {
  if (json == nullptr) return std::nullopt;

  Cursor cur(json, length);
  JsonObject result;

  cur.skipWhitespace();
  if (!cur.consume('{')) return std::nullopt;
  cur.skipWhitespace();
  if (cur.consume('}')) return result;

  while (true) {
    cur.skipWhitespace();
    std::string key;
    if (!cur.parseString(key)) return std::nullopt;
    cur.skipWhitespace();
    if (!cur.consume(':')) return std::nullopt;
    cur.skipWhitespace();

    JsonValue val;
    char head = cur.peek();
    if (head == '"') {
      val.type = JsonValue::String;
      if (!cur.parseString(val.string_val)) return std::nullopt;
      result[key] = val;
    } else if (head == '{' || head == '[') {
      if (!cur.skipContainer()) return std::nullopt;
    } else if (cur.consumeWord("true")) {
      val.type = JsonValue::Bool;
      val.bool_val = true;
      result[key] = val;
    } else if (cur.consumeWord("false")) {
      val.type = JsonValue::Bool;
      result[key] = val;
    } else if (cur.consumeWord("null")) {
      result[key] = val;
    } else {
      val.type = JsonValue::Number;
      if (!cur.parseNumber(val.number_val)) return std::nullopt;
      result[key] = val;
    }

    cur.skipWhitespace();
    if (cur.consume(',')) continue;
    if (cur.consume('}')) break;
    return std::nullopt;
  }

  cur.skipWhitespace();
  if (!cur.atEnd()) return std::nullopt;
  return result;
}

std::optional<JsonObject> parseJsonObject(const std::string& json) {
  return parseJsonObject(json.data(), json.size());
}

}  // namespace band
