// Figured bass line input -- a key plus bass notes with figures, parsed from
// a small line-oriented text format.

#ifndef FIGBASS_FIGURED_BASS_FIGURED_BASS_LINE_H
#define FIGBASS_FIGURED_BASS_FIGURED_BASS_LINE_H

#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/pitch_utils.h"
#include "harmony/key.h"

namespace figbass {

/// @brief An upper voice pinned to one pitch over a bass note.
struct FixedPitch {
  std::string label;  ///< Voice label.
  SpelledPitch pitch;
};

/// @brief One bass note with its figure.
struct BassNote {
  SpelledPitch pitch;
  Tick duration = kQuarterNote;
  std::string figure;  ///< Figure notation, "" for a root-position triad.
  std::vector<FixedPitch> fixed_pitches;
};

/// @brief A figured bass line in a key.
struct FiguredBassLine {
  KeySignature key;
  std::vector<BassNote> notes;

  /// @brief Sum of note durations.
  Tick totalDuration() const;
};

/// @brief Parse the text input format.
///
/// @code
///   # comment
///   key D_major
///   D3  1   _
///   E3  1   6,-5
///   F#3 2   6    S=A4
/// @endcode
///
/// A note line is "<pitch> <quarter-length> [figure] [LABEL=<pitch> ...]";
/// "_" or a missing figure means the empty figure. Quarter lengths may be
/// fractional ("0.5"). The key directive may appear once, before any note.
/// A line whose first token starts with '#' is a comment.
///
/// @param text Input text.
/// @param out Parsed line, written only on success.
/// @param error If non-null, receives "line N: ..." on failure.
/// @return False on malformed input or an empty line.
bool parseFiguredBassLine(const std::string& text, FiguredBassLine& out,
                          std::string* error = nullptr);

/// @brief Parse a compact one-line bass: "C3 F3:6 G3:7 C3", quarter notes.
/// @param text Whitespace-separated "<pitch>[:<figure>]" items.
/// @param key Key of the line.
/// @param out Parsed line, written only on success.
/// @param error If non-null, receives a message on failure.
bool parseCompactBassLine(const std::string& text, const KeySignature& key, FiguredBassLine& out,
                          std::string* error = nullptr);

}  // namespace figbass

#endif  // FIGBASS_FIGURED_BASS_FIGURED_BASS_LINE_H
