// Implementation of enum-to-string and string-to-enum conversions.

#include "core/basic_types.h"

#include <cctype>

namespace figbass {

namespace {

std::string toLower(const std::string& str) {
  std::string lower;
  lower.reserve(str.size());
  for (char chr : str) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(chr))));
  }
  return lower;
}

}  // namespace

const char* scaleModeToString(ScaleMode mode) {
  switch (mode) {
    case ScaleMode::Major:    return "major";
    case ScaleMode::Minor:    return "minor";
    case ScaleMode::Dorian:   return "dorian";
    case ScaleMode::Phrygian: return "phrygian";
  }
  return "major";
}

bool scaleModeFromString(const std::string& str, ScaleMode& mode) {
  std::string lower = toLower(str);
  if (lower == "major") {
    mode = ScaleMode::Major;
  } else if (lower == "minor") {
    mode = ScaleMode::Minor;
  } else if (lower == "dorian") {
    mode = ScaleMode::Dorian;
  } else if (lower == "phrygian") {
    mode = ScaleMode::Phrygian;
  } else {
    return false;
  }
  return true;
}

const char* renderStyleToString(RenderStyle style) {
  switch (style) {
    case RenderStyle::Keyboard: return "keyboard";
    case RenderStyle::Chorale:  return "chorale";
  }
  return "keyboard";
}

RenderStyle renderStyleFromString(const std::string& str) {
  if (toLower(str) == "chorale") return RenderStyle::Chorale;
  return RenderStyle::Keyboard;
}

}  // namespace figbass
