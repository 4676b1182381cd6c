// Interval utilities -- compound interval reduction and perfect-consonance
// queries used by the voice-leading rules.

#ifndef FIGBASS_CORE_INTERVAL_H
#define FIGBASS_CORE_INTERVAL_H

#include "core/pitch_utils.h"

namespace figbass {
namespace interval_util {

/// @brief Reduce a compound interval to its simple equivalent (0-11).
/// @param semitones Interval size in semitones (may be negative or compound).
/// @return Simple interval in range [0, 11].
///
/// Examples: 19 (compound 5th) -> 7, -3 -> 3, 24 (double octave) -> 0.
int compoundToSimple(int semitones);

/// @brief Check whether an interval is a perfect consonance (P1, P5, P8).
/// @param semitones Interval size in semitones (compound intervals are reduced).
bool isPerfectConsonance(int semitones);

/// @brief Check whether an interval reduces to a perfect fifth.
inline bool isPerfectFifthClass(int semitones) {
  return compoundToSimple(semitones) == interval::kPerfect5th;
}

/// @brief Check whether an interval reduces to a unison or octave.
inline bool isOctaveClass(int semitones) {
  return compoundToSimple(semitones) == interval::kUnison;
}

}  // namespace interval_util
}  // namespace figbass

#endif  // FIGBASS_CORE_INTERVAL_H
