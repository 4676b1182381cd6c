// Chord types and spelled chord analysis for figured-bass harmony.

#ifndef FIGBASS_HARMONY_CHORD_TYPES_H
#define FIGBASS_HARMONY_CHORD_TYPES_H

#include <cstdint>
#include <vector>

#include "core/pitch_utils.h"

namespace figbass {

/// Quality of a chord built over a figured bass note.
enum class ChordQuality : uint8_t {
  Major,
  Minor,
  Diminished,
  Augmented,
  Dominant7,     // Major triad + minor seventh
  Diminished7,   // Fully diminished seventh (dim3 + dim3 + dim3)
  ItalianSixth,  // b6, 1, #4 above the tonic (bass, M3, A6)
  FrenchSixth,   // Italian + A4 above the bass
  GermanSixth,   // Italian + P5 above the bass
  SwissSixth,    // Italian + doubly augmented 4th above the bass
  Other
};

/// @brief Convert ChordQuality to a human-readable string.
/// @param quality The chord quality.
/// @return Null-terminated string such as "Major", "Dominant7".
const char* chordQualityToString(ChordQuality quality);

/// @brief Result of analyzing a set of spelled chord tones over a bass.
///
/// Members are identified by letter distance from the root (third = 2 letters,
/// fifth = 4, seventh = 6). Augmented sixth chords are recognized by their
/// intervals above the bass, which must be the lowered sixth degree.
struct ChordAnalysis {
  ChordQuality quality = ChordQuality::Other;
  SpelledPitchClass bass;
  bool has_root = false;
  SpelledPitchClass root;
  bool has_third = false;
  SpelledPitchClass third;
  bool has_fifth = false;
  SpelledPitchClass fifth;
  bool has_seventh = false;
  SpelledPitchClass seventh;
  int inversion = 0;  ///< 0 = root position, 1 = first, 2 = second, 3 = third.

  /// @brief True for a major or minor triad.
  bool isConsonantTriad() const {
    return quality == ChordQuality::Major || quality == ChordQuality::Minor;
  }

  /// @brief True for any augmented sixth variety.
  bool isAugmentedSixth() const {
    return quality == ChordQuality::ItalianSixth || quality == ChordQuality::FrenchSixth ||
           quality == ChordQuality::GermanSixth || quality == ChordQuality::SwissSixth;
  }
};

/// @brief Analyze distinct spelled pitch names sounding over a bass.
/// @param names Chord pitch names including the bass name (duplicates ignored).
/// @param bass Spelled bass pitch class.
/// @return Analysis; quality Other and has_root false when no tertian root exists.
ChordAnalysis analyzeChord(const std::vector<SpelledPitchClass>& names,
                           const SpelledPitchClass& bass);

}  // namespace figbass

#endif  // FIGBASS_HARMONY_CHORD_TYPES_H
