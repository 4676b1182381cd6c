// Implementation of figure notation parsing.

#include "figured_bass/notation.h"

#include <cctype>
#include <cstddef>

namespace figbass {

namespace {

struct ShorthandRule {
  std::vector<int> from;
  std::vector<int> to;
};

/// Figures as written (0 = no number) mapped to the full interval set.
const std::vector<ShorthandRule>& shorthandRules() {
  static const std::vector<ShorthandRule> kRules = {
      {{0}, {5, 3}},
      {{5}, {5, 3}},
      {{6}, {6, 3}},
      {{7}, {7, 5, 3}},
      {{9}, {9, 7, 5, 3}},
      {{11}, {11, 9, 7, 5, 3}},
      {{13}, {13, 11, 9, 7, 5, 3}},
      {{6, 5}, {6, 5, 3}},
      {{4, 3}, {6, 4, 3}},
      {{4, 2}, {6, 4, 2}},
      {{2}, {6, 4, 2}},
  };
  return kRules;
}

std::string trim(const std::string& str) {
  size_t begin = 0;
  size_t end = str.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) --end;
  return str.substr(begin, end - begin);
}

bool setError(std::string* error, const std::string& message) {
  if (error) *error = message;
  return false;
}

/// @brief Parse one comma-separated token: [modifier]number[modifier].
bool parseToken(const std::string& token, FigureEntry& entry, std::string* error) {
  size_t pos = 0;
  std::string prefix;
  while (pos < token.size() && !std::isdigit(static_cast<unsigned char>(token[pos]))) {
    prefix += token[pos++];
  }
  int number = 0;
  size_t digits = 0;
  while (pos < token.size() && std::isdigit(static_cast<unsigned char>(token[pos]))) {
    number = number * 10 + (token[pos++] - '0');
    ++digits;
  }
  std::string suffix = token.substr(pos);

  if (!prefix.empty() && !suffix.empty()) {
    return setError(error, "figure '" + token + "' has modifiers on both sides");
  }
  if (digits > 0 && (number < 1 || number > 13)) {
    return setError(error, "figure number out of range in '" + token + "'");
  }
  std::string mod_text = prefix.empty() ? suffix : prefix;
  if (digits == 0 && mod_text.empty()) {
    return setError(error, "empty figure in list");
  }
  FigureModifier modifier;
  if (!mod_text.empty() && !parseFigureModifier(mod_text, modifier)) {
    return setError(error, "unknown modifier '" + mod_text + "'");
  }
  entry.number = number;
  entry.modifier = modifier;
  return true;
}

}  // namespace

SpelledPitchClass FigureModifier::apply(const SpelledPitchClass& name) const {
  if (!present) return name;
  SpelledPitchClass result = name;
  if (isNatural() || name.alter == 0) {
    result.alter = alter;
  } else {
    result.alter = name.alter + alter;
  }
  return result;
}

bool parseFigureModifier(const std::string& text, FigureModifier& out) {
  static const struct {
    const char* text;
    int alter;
  } kModifiers[] = {
      {"#", 1},  {"##", 2}, {"###", 3}, {"+", 1},   {"++", 2}, {"\\", 1},
      {"-", -1}, {"--", -2}, {"---", -3}, {"b", -1}, {"bb", -2}, {"/", -1},
      {"n", 0},
  };
  for (const auto& entry : kModifiers) {
    if (text == entry.text) {
      out.present = true;
      out.alter = entry.alter;
      out.text = text;
      return true;
    }
  }
  return false;
}

bool Figure::hasNumber(int number) const {
  for (const auto& entry : entries) {
    if (entry.number == number) return true;
  }
  return false;
}

bool parseFigure(const std::string& notation, Figure& out, std::string* error) {
  Figure result;
  result.notation = notation;

  std::string trimmed = trim(notation);
  if (trimmed.empty()) {
    result.written.push_back(FigureEntry{});
  } else {
    size_t start = 0;
    while (start <= trimmed.size()) {
      size_t comma = trimmed.find(',', start);
      if (comma == std::string::npos) comma = trimmed.size();
      FigureEntry entry;
      if (!parseToken(trim(trimmed.substr(start, comma - start)), entry, error)) return false;
      result.written.push_back(entry);
      start = comma + 1;
    }
  }

  std::vector<int> written_numbers;
  for (const auto& entry : result.written) written_numbers.push_back(entry.number);

  std::vector<int> expanded;
  for (const auto& rule : shorthandRules()) {
    if (rule.from == written_numbers) expanded = rule.to;
  }
  if (expanded.empty()) {
    for (int number : written_numbers) expanded.push_back(number == 0 ? 3 : number);
  }

  for (int number : expanded) {
    FigureEntry entry;
    entry.number = number;
    for (const auto& written : result.written) {
      int effective = written.number == 0 ? 3 : written.number;
      if (effective == number && written.modifier.present) entry.modifier = written.modifier;
    }
    result.entries.push_back(entry);
  }

  out = result;
  return true;
}

}  // namespace figbass
