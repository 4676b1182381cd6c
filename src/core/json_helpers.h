// Minimal JSON serialization writer for progression and rule output.
//
// Builds JSON output via a string-builder approach. Does not parse JSON
// (see core/json_parser.h for the reading side).

#ifndef FIGBASS_CORE_JSON_HELPERS_H
#define FIGBASS_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace figbass {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("count");
///   writer.value(uint64_t{13});
///   writer.key("key");
///   writer.value("C_major");
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"count":13,"key":"C_major"}
/// @endcode
///
/// Supports nested objects and arrays. Tracks comma insertion automatically.
/// Does not validate structure (caller must match begin/end pairs).
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);

  /// @brief Write a C string value; avoids the bool overload for literals.
  void value(const char* val) { value(std::string_view(val)); }

  void value(int val);
  void value(uint64_t val);
  void value(double val);
  void value(bool val);
  void valueNull();

  /// @brief Get the accumulated JSON string.
  std::string toString() const;

 private:
  /// Append a scalar token, inserting a separating comma if needed.
  void writeScalar(std::string_view token);

  /// Open a nested container with the given bracket.
  void open(char bracket);

  /// Close the innermost container with the given bracket.
  void close(char bracket);

  /// Escape special characters in a string for JSON output.
  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // One entry per nesting level: true once the level holds an element.
  std::vector<bool> needs_comma_;
};

}  // namespace figbass

#endif  // FIGBASS_CORE_JSON_HELPERS_H
