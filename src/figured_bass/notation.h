// Figure notation parsing -- turns figure strings such as "6,4", "#" or
// "6,-5" into required intervals above the bass with accidental modifiers.

#ifndef FIGBASS_FIGURED_BASS_NOTATION_H
#define FIGBASS_FIGURED_BASS_NOTATION_H

#include <string>
#include <vector>

#include "core/pitch_utils.h"

namespace figbass {

/// @brief An accidental modifier attached to a figure ("#", "b", "n", "+", ...).
struct FigureModifier {
  bool present = false;
  int alter = 0;     ///< Semitone alteration; 0 with present == true is a natural.
  std::string text;  ///< Modifier as written.

  /// @brief True for an explicit natural sign.
  bool isNatural() const { return present && alter == 0; }

  /// @brief Apply the modifier to a scale pitch name.
  ///
  /// A natural, or a pitch without an accidental, takes the modifier's
  /// accidental; otherwise the alterations add (so "#" on B-flat gives B).
  SpelledPitchClass apply(const SpelledPitchClass& name) const;
};

/// @brief Parse a modifier string.
/// @param text One of #, ##, ###, -, --, b, bb, n, +, ++, \\ or /.
/// @param out Parsed modifier, written only on success.
/// @return False for unknown modifier text.
bool parseFigureModifier(const std::string& text, FigureModifier& out);

/// @brief One interval above the bass (number 1-13) with its modifier.
struct FigureEntry {
  int number = 0;  ///< 0 only in Figure::written, meaning "no number given".
  FigureModifier modifier;
};

/// @brief A parsed figure: the entries as written and the shorthand-expanded set.
struct Figure {
  std::string notation;             ///< Original figure string.
  std::vector<FigureEntry> written; ///< Entries as written (number 0 = absent).
  std::vector<FigureEntry> entries; ///< Expanded entries, numbers always 1-13.

  /// @brief True if the expanded figure contains the given number.
  bool hasNumber(int number) const;
};

/// @brief Parse a comma-separated figure string and expand shorthand.
///
/// Shorthand: "" and "5" -> 5,3; "6" -> 6,3; "7" -> 7,5,3; "9" -> 9,7,5,3;
/// "11" and "13" likewise; "6,5" -> 6,5,3; "4,3" -> 6,4,3; "4,2" and "2" ->
/// 6,4,2. Any other absent number means 3, so "#" raises the third.
///
/// @param notation Figure string ("" for a root-position triad).
/// @param out Parsed figure, written only on success.
/// @param error If non-null, receives a message on failure.
/// @return False on malformed figures.
bool parseFigure(const std::string& notation, Figure& out, std::string* error = nullptr);

}  // namespace figbass

#endif  // FIGBASS_FIGURED_BASS_NOTATION_H
