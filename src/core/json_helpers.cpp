/// @file
/// @brief Implementation of the minimal JSON writer for structured output.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace figbass {

void JsonWriter::open(char bracket) {
  if (!needs_comma_.empty() && needs_comma_.back()) buffer_ += ',';
  buffer_ += bracket;
  needs_comma_.push_back(false);
}

void JsonWriter::close(char bracket) {
  buffer_ += bracket;
  if (!needs_comma_.empty()) needs_comma_.pop_back();
  if (!needs_comma_.empty()) needs_comma_.back() = true;
}

void JsonWriter::writeScalar(std::string_view token) {
  if (!needs_comma_.empty() && needs_comma_.back()) buffer_ += ',';
  buffer_ += token;
  if (!needs_comma_.empty()) needs_comma_.back() = true;
}

void JsonWriter::beginObject() { open('{'); }
void JsonWriter::endObject() { close('}'); }
void JsonWriter::beginArray() { open('['); }
void JsonWriter::endArray() { close(']'); }

void JsonWriter::key(std::string_view name) {
  writeScalar("\"" + escapeString(name) + "\":");
  // The value that follows belongs to this key and takes no comma.
  if (!needs_comma_.empty()) needs_comma_.back() = false;
}

void JsonWriter::value(std::string_view val) {
  writeScalar("\"" + escapeString(val) + "\"");
}

void JsonWriter::value(int val) { writeScalar(std::to_string(val)); }

void JsonWriter::value(uint64_t val) { writeScalar(std::to_string(val)); }

void JsonWriter::value(double val) {
  if (std::isnan(val) || std::isinf(val)) {
    writeScalar("null");
    return;
  }
  std::ostringstream oss;
  oss << val;
  writeScalar(oss.str());
}

void JsonWriter::value(bool val) { writeScalar(val ? "true" : "false"); }

void JsonWriter::valueNull() { writeScalar("null"); }

std::string JsonWriter::toString() const {
  return buffer_;
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

}  // namespace figbass
