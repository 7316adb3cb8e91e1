/// @file
/// @brief Implementation of the minimal JSON writer.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>

namespace band {

void JsonWriter::beginObject() { beginScope('{'); }
void JsonWriter::endObject() { endScope('}'); }
void JsonWriter::beginArray() { beginScope('['); }
void JsonWriter::endArray() { endScope(']'); }

void JsonWriter::key(std::string_view name) {
  beforeValue();
  buffer_ += '"';
  buffer_ += escapeString(name);
  buffer_ += "\":";
}

void JsonWriter::value(std::string_view val) {
  beforeValue();
  buffer_ += '"';
  buffer_ += escapeString(val);
  buffer_ += '"';
  afterValue();
}

void JsonWriter::value(int val) {
  beforeValue();
  buffer_ += std::to_string(val);
  afterValue();
}

void JsonWriter::value(uint32_t val) {
  beforeValue();
  buffer_ += std::to_string(val);
  afterValue();
}

void JsonWriter::value(double val) {
  beforeValue();
  if (std::isfinite(val)) {
    char num_buf[32];
    std::snprintf(num_buf, sizeof(num_buf), "%.6g", val);
    buffer_ += num_buf;
  } else {
    buffer_ += "null";
  }
  afterValue();
}

void JsonWriter::value(bool val) {
  beforeValue();
  buffer_ += val ? "true" : "false";
  afterValue();
}

void JsonWriter::valueNull() {
  beforeValue();
  buffer_ += "null";
  afterValue();
}

void JsonWriter::beginScope(char open) {
  beforeValue();
  buffer_ += open;
  needs_comma_.push_back(false);
}

void JsonWriter::endScope(char close) {
  buffer_ += close;
  if (!needs_comma_.empty()) {
    needs_comma_.pop_back();
  }
  afterValue();
}

void JsonWriter::beforeValue() {
  // A value directly after "key": never takes a comma.
  if (!buffer_.empty() && buffer_.back() == ':') return;
  if (!needs_comma_.empty() && needs_comma_.back()) {
    buffer_ += ',';
  }
}

void JsonWriter::afterValue() {
  if (!needs_comma_.empty()) {
    needs_comma_.back() = true;
  }
}

std::string JsonWriter::toPrettyString(int indent_size) const {
  std::string result;
  result.reserve(buffer_.size() * 2);

  int depth = 0;
  bool in_string = false;
  bool escaped = false;

  auto newline = [&]() {
    result += '\n';
    result.append(static_cast<size_t>(depth * indent_size), ' ');
  };

  for (size_t pos = 0; pos < buffer_.size(); ++pos) {
    char chr = buffer_[pos];

    if (in_string) {
      result += chr;
      if (escaped) {
        escaped = false;
      } else if (chr == '\\') {
        escaped = true;
      } else if (chr == '"') {
        in_string = false;
      }
      continue;
    }

    switch (chr) {
      case '"':
        in_string = true;
        result += chr;
        break;
      case '{':
      case '[': {
        result += chr;
        ++depth;
        bool empty = pos + 1 < buffer_.size() &&
                     (buffer_[pos + 1] == '}' || buffer_[pos + 1] == ']');
        if (!empty) newline();
        break;
      }
      case '}':
      case ']':
        --depth;
        if (result.back() != '{' && result.back() != '[') newline();
        result += chr;
        break;
      case ',':
        result += chr;
        newline();
        break;
      case ':':
        result += ": ";
        break;
      default:
        result += chr;
        break;
    }
  }
  return result;
}

std::string JsonWriter::escapeString(std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (char chr : input) {
    switch (chr) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\b': result += "\\b";  break;
      case '\f': result += "\\f";  break;
      case '\n': result += "\\n";  break;
      case '\r': result += "\\r";  break;
      case '\t': result += "\\t";  break;
      default:
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex_buf[8];
          std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          result += hex_buf;
        } else {
          result += chr;
        }
        break;
    }
  }
  return result;
}

}  // namespace band
