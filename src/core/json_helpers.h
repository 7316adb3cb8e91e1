// Minimal JSON serialization writer (no external dependencies).
//
// Used for the voicing/event reports printed by the CLI and returned by the
// C API. Does not parse JSON; see core/json_parser.h for input.

#ifndef BAND_CORE_JSON_HELPERS_H
#define BAND_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace band {

/// @brief Builds a compact JSON string incrementally.
///
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("root");
///   writer.value("D4");
///   writer.key("pitches");
///   writer.beginArray();
///   writer.value(50);
///   writer.endArray();
///   writer.endObject();
///   // -> {"root":"D4","pitches":[50]}
/// @endcode
///
/// Commas are inserted automatically. The caller is responsible for
/// matching begin/end pairs.
class JsonWriter {
 public:
  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key; the next call must write its value.
  void key(std::string_view name);

  void value(std::string_view val);
  void value(const char* val) { value(std::string_view(val)); }
  void value(const std::string& val) { value(std::string_view(val)); }
  void value(int val);
  void value(uint32_t val);
  /// NaN and infinities are written as null.
  void value(double val);
  void value(bool val);
  void valueNull();

  /// @brief Accumulated JSON text.
  const std::string& toString() const { return buffer_; }

  /// @brief Accumulated JSON re-indented with indent_size spaces per level.
  std::string toPrettyString(int indent_size = 2) const;

  /// @brief Escape quotes, backslashes and control characters.
  static std::string escapeString(std::string_view input);

 private:
  void beginScope(char open);
  void endScope(char close);
  void beforeValue();
  void afterValue();

  std::string buffer_;
  // One entry per open scope: true once that scope holds an element.
  std::vector<bool> needs_comma_;
};

}  // namespace band

#endif  // BAND_CORE_JSON_HELPERS_H
