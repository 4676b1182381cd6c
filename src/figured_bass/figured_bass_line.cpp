// Implementation of figured bass line parsing.

#include "figured_bass/figured_bass_line.h"

#include <cmath>
#include <cstdlib>
#include <sstream>

namespace figbass {

Tick FiguredBassLine::totalDuration() const {
  Tick total = 0;
  for (const auto& note : notes) total += note.duration;
  return total;
}

namespace {

std::vector<std::string> splitWhitespace(const std::string& line) {
  std::vector<std::string> tokens;
  std::istringstream stream(line);
  std::string token;
  while (stream >> token) tokens.push_back(token);
  return tokens;
}

/// @brief Quarter length text ("1", "0.5", "1.5") to ticks.
bool parseQuarterLength(const std::string& text, Tick& out) {
  if (text.empty()) return false;
  char* end = nullptr;
  double quarters = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0' || !(quarters > 0.0) || quarters > 64.0) return false;
  double ticks = quarters * static_cast<double>(kTicksPerBeat);
  out = static_cast<Tick>(std::lround(ticks));
  return out > 0;
}

bool parseFixedPitch(const std::string& token, FixedPitch& out) {
  size_t eq = token.find('=');
  if (eq == std::string::npos || eq == 0 || eq + 1 >= token.size()) return false;
  FixedPitch fixed;
  fixed.label = token.substr(0, eq);
  if (!parseSpelledPitch(token.substr(eq + 1), fixed.pitch)) return false;
  out = fixed;
  return true;
}

}  // namespace

bool parseFiguredBassLine(const std::string& text, FiguredBassLine& out, std::string* error) {
  auto fail = [error](int line_no, const std::string& message) {
    if (error) *error = "line " + std::to_string(line_no) + ": " + message;
    return false;
  };

  FiguredBassLine result;
  bool key_seen = false;
  std::istringstream stream(text);
  std::string raw;
  int line_no = 0;
  while (std::getline(stream, raw)) {
    ++line_no;
    std::vector<std::string> tokens = splitWhitespace(raw);
    // Comment lines start with '#'; figures such as "#6" may not.
    if (tokens.empty() || tokens[0][0] == '#') continue;

    if (tokens[0] == "key") {
      if (tokens.size() != 2) return fail(line_no, "expected 'key <tonic>_<mode>'");
      if (key_seen || !result.notes.empty()) return fail(line_no, "key must come once, before notes");
      if (!keySignatureFromString(tokens[1], result.key)) {
        return fail(line_no, "invalid key '" + tokens[1] + "'");
      }
      key_seen = true;
      continue;
    }

    BassNote note;
    if (!parseSpelledPitch(tokens[0], note.pitch)) {
      return fail(line_no, "invalid bass pitch '" + tokens[0] + "'");
    }
    if (tokens.size() < 2 || !parseQuarterLength(tokens[1], note.duration)) {
      return fail(line_no, "missing or invalid quarter length");
    }
    size_t next = 2;
    if (next < tokens.size() && tokens[next].find('=') == std::string::npos) {
      note.figure = tokens[next] == "_" ? "" : tokens[next];
      ++next;
    }
    for (; next < tokens.size(); ++next) {
      FixedPitch fixed;
      if (!parseFixedPitch(tokens[next], fixed)) {
        return fail(line_no, "invalid fixed pitch '" + tokens[next] + "'");
      }
      note.fixed_pitches.push_back(fixed);
    }
    result.notes.push_back(note);
  }

  if (result.notes.empty()) return fail(line_no, "no bass notes");
  out = result;
  return true;
}

bool parseCompactBassLine(const std::string& text, const KeySignature& key, FiguredBassLine& out,
                          std::string* error) {
  FiguredBassLine result;
  result.key = key;
  for (const auto& token : splitWhitespace(text)) {
    BassNote note;
    size_t colon = token.find(':');
    std::string pitch_text = token.substr(0, colon);
    if (!parseSpelledPitch(pitch_text, note.pitch)) {
      if (error) *error = "invalid bass pitch '" + pitch_text + "'";
      return false;
    }
    if (colon != std::string::npos) note.figure = token.substr(colon + 1);
    result.notes.push_back(note);
  }
  if (result.notes.empty()) {
    if (error) *error = "no bass notes";
    return false;
  }
  out = result;
  return true;
}

}  // namespace figbass
