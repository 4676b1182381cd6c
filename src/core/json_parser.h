// Minimal flat-object JSON parser for rule configuration files.
//
// Handles a flat object with string, number, boolean and null values.
// Nested objects and arrays are skipped and reported as Composite values so
// that callers can reject them.

#ifndef FIGBASS_CORE_JSON_PARSER_H
#define FIGBASS_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace figbass {

/// @brief A single JSON value (string, number, boolean, null or skipped composite).
struct JsonValue {
  enum Type { String, Number, Bool, Null, Composite };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;

  /// @brief True if the value is a number without a fractional part.
  bool isInteger() const;

  /// @brief Get value as integer, with default.
  int asInt(int default_val = 0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;
};

/// @brief Parse a flat JSON object into a key-value map.
///
/// @param json Pointer to JSON text.
/// @param length Length of JSON text.
/// @param out Map of key-value pairs (cleared first).
/// @param error If non-null, receives a message on failure.
/// @return False on malformed input (missing braces, bad literal, etc.).
bool parseJsonObject(const char* json, size_t length,
                     std::map<std::string, JsonValue>& out, std::string* error = nullptr);

}  // namespace figbass

#endif  // FIGBASS_CORE_JSON_PARSER_H
