// Implementation of minimal flat-object JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cstring>

namespace figbass {

bool JsonValue::isInteger() const {
  return type == Number && std::floor(number_val) == number_val;
}

int JsonValue::asInt(int default_val) const {
  if (type == Number) return static_cast<int>(number_val);
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

/// @brief Skip whitespace in JSON text.
void skipWhitespace(const char* json, size_t length, size_t& pos) {
  while (pos < length && std::isspace(static_cast<unsigned char>(json[pos]))) {
    ++pos;
  }
}

/// @brief Parse a JSON string literal (expects pos at opening quote).
/// @return False if the closing quote is missing.
bool parseString(const char* json, size_t length, size_t& pos, std::string& result) {
  if (pos >= length || json[pos] != '"') return false;
  ++pos;  // skip opening quote

  result.clear();
  while (pos < length && json[pos] != '"') {
    if (json[pos] == '\\' && pos + 1 < length) {
      ++pos;
      switch (json[pos]) {
        case '"':  result += '"'; break;
        case '\\': result += '\\'; break;
        case '/':  result += '/'; break;
        case 'n':  result += '\n'; break;
        case 't':  result += '\t'; break;
        case 'r':  result += '\r'; break;
        default:   result += json[pos]; break;
      }
    } else {
      result += json[pos];
    }
    ++pos;
  }

  if (pos >= length) return false;
  ++pos;  // skip closing quote
  return true;
}

/// @brief Parse a JSON number (integer or floating point).
bool parseNumber(const char* json, size_t length, size_t& pos, JsonValue& val) {
  size_t start = pos;
  if (pos < length && json[pos] == '-') ++pos;
  size_t digits_start = pos;
  while (pos < length && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
  if (pos == digits_start) return false;
  if (pos < length && json[pos] == '.') {
    ++pos;
    while (pos < length && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
  }

  std::string num_str(json + start, pos - start);
  val.type = JsonValue::Number;
  val.number_val = std::strtod(num_str.c_str(), nullptr);
  return true;
}

/// @brief Match a bare literal (true/false/null) at pos.
bool matchLiteral(const char* json, size_t length, size_t& pos, const char* literal) {
  size_t len = std::strlen(literal);
  if (pos + len > length || std::strncmp(json + pos, literal, len) != 0) return false;
  pos += len;
  return true;
}

/// @brief Skip a nested object or array.
bool skipComposite(const char* json, size_t length, size_t& pos) {
  char open = json[pos];
  char close = (open == '{') ? '}' : ']';
  int depth = 1;
  ++pos;
  std::string ignored;
  while (pos < length && depth > 0) {
    if (json[pos] == '"') {
      if (!parseString(json, length, pos, ignored)) return false;
      continue;
    }
    if (json[pos] == open) ++depth;
    if (json[pos] == close) --depth;
    ++pos;
  }
  return depth == 0;
}

bool fail(std::string* error, const std::string& message, size_t pos) {
  if (error) *error = message + " at offset " + std::to_string(pos);
  return false;
}

}  // namespace

bool parseJsonObject(const char* json, size_t length,
                     std::map<std::string, JsonValue>& out, std::string* error) {
  out.clear();
  if (!json || length == 0) return fail(error, "empty JSON input", 0);

  size_t pos = 0;
  skipWhitespace(json, length, pos);
  if (pos >= length || json[pos] != '{') return fail(error, "expected '{'", pos);
  ++pos;  // skip '{'

  bool expect_entry = true;
  while (true) {
    skipWhitespace(json, length, pos);
    if (pos >= length) return fail(error, "unterminated object", pos);
    if (json[pos] == '}') {
      ++pos;
      break;
    }
    if (!expect_entry) {
      if (json[pos] != ',') return fail(error, "expected ',' or '}'", pos);
      ++pos;
      skipWhitespace(json, length, pos);
    }
    expect_entry = false;

    std::string key;
    if (!parseString(json, length, pos, key)) return fail(error, "expected string key", pos);

    skipWhitespace(json, length, pos);
    if (pos >= length || json[pos] != ':') return fail(error, "expected ':'", pos);
    ++pos;
    skipWhitespace(json, length, pos);
    if (pos >= length) return fail(error, "missing value", pos);

    JsonValue val;
    if (json[pos] == '"') {
      val.type = JsonValue::String;
      if (!parseString(json, length, pos, val.string_val)) {
        return fail(error, "unterminated string", pos);
      }
    } else if (matchLiteral(json, length, pos, "true")) {
      val.type = JsonValue::Bool;
      val.bool_val = true;
    } else if (matchLiteral(json, length, pos, "false")) {
      val.type = JsonValue::Bool;
      val.bool_val = false;
    } else if (matchLiteral(json, length, pos, "null")) {
      val.type = JsonValue::Null;
    } else if (json[pos] == '{' || json[pos] == '[') {
      val.type = JsonValue::Composite;
      if (!skipComposite(json, length, pos)) return fail(error, "unterminated composite", pos);
    } else if (!parseNumber(json, length, pos, val)) {
      return fail(error, "invalid value for key '" + key + "'", pos);
    }
    out[key] = val;
  }

  skipWhitespace(json, length, pos);
  if (pos != length) return fail(error, "trailing characters", pos);
  return true;
}

}  // namespace figbass
