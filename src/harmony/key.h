// Key signature representation for figured-bass realization.

#ifndef FIGBASS_HARMONY_KEY_H
#define FIGBASS_HARMONY_KEY_H

#include <string>

#include "core/basic_types.h"
#include "core/pitch_utils.h"

namespace figbass {

/// @brief A key combining a spelled tonic with a diatonic mode.
///
/// The tonic is spelled (G-flat major and F-sharp major are different keys)
/// because figure realization works on letter names.
struct KeySignature {
  SpelledPitchClass tonic;
  ScaleMode mode = ScaleMode::Major;

  /// @brief Equality comparison.
  bool operator==(const KeySignature& other) const {
    return tonic == other.tonic && mode == other.mode;
  }

  /// @brief Inequality comparison.
  bool operator!=(const KeySignature& other) const {
    return !(*this == other);
  }
};

/// @brief Parse a key signature from a string.
/// @param str Key string such as "C_major", "f#_minor", "Bb_dorian" or "E"
///        (mode defaults to major when the underscore part is missing).
/// @param out Parsed key, written only on success.
/// @return True on success.
bool keySignatureFromString(const std::string& str, KeySignature& out);

/// @brief Format a key signature as "<Tonic>_<mode>" (e.g. "F#_minor").
std::string keySignatureToString(const KeySignature& key_sig);

/// @brief Spelled pitch class of a scale degree in this key.
/// @param key_sig The key.
/// @param degree Scale degree 0-6 (0 = tonic).
SpelledPitchClass pitchNameForDegree(const KeySignature& key_sig, int degree);

/// @brief Scale degree (0-6) of a spelled note's letter in this key.
int degreeOfPitchName(const KeySignature& key_sig, const SpelledPitchClass& name);

}  // namespace figbass

#endif  // FIGBASS_HARMONY_KEY_H
