// Minimal flat-object JSON parser for configuration input (no external
// dependencies).
//
// Handles the subset used by band_cli --config and the C API: a single
// object whose values are strings, numbers, booleans or null. Nested
// objects and arrays are skipped.

#ifndef BAND_CORE_JSON_PARSER_H
#define BAND_CORE_JSON_PARSER_H

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace band {

/// @brief A single JSON value (string, number, boolean or null).
struct JsonValue {
  enum Type { String, Number, Bool, Null };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;

  /// @brief Value as integer (truncated), or default_val if not a number
  /// or outside the range of int.
  int asInt(int default_val = 0) const;

  bool asBool(bool default_val = false) const;
  std::string asString(const std::string& default_val = "") const;
};

using JsonObject = std::map<std::string, JsonValue>;

/// @brief Parse a flat JSON object into a key-value map.
///
/// Later duplicates of a key overwrite earlier ones.
///
/// @param json Pointer to JSON text (need not be NUL-terminated).
/// @param length Length of the text.
/// @return The parsed map, or std::nullopt if the text is not a
///         well-formed object.
std::optional<JsonObject> parseJsonObject(const char* json, size_t length);

/// @brief Convenience overload for std::string input.
std::optional<JsonObject> parseJsonObject(const std::string& json);

}  // namespace band

#endif  // BAND_CORE_JSON_PARSER_H
