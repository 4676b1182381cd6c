// Scale degree utilities -- mode interval tables and spelled degree lookup.

#ifndef FIGBASS_CORE_SCALE_H
#define FIGBASS_CORE_SCALE_H

#include <cstdint>

#include "core/basic_types.h"
#include "core/pitch_utils.h"

namespace figbass {

// ---------------------------------------------------------------------------
// Mode interval arrays (semitones from tonic, 7 degrees)
// ---------------------------------------------------------------------------

constexpr int kScaleMajor[7] = {0, 2, 4, 5, 7, 9, 11};
constexpr int kScaleNaturalMinor[7] = {0, 2, 3, 5, 7, 8, 10};
constexpr int kScaleDorian[7] = {0, 2, 3, 5, 7, 9, 10};
constexpr int kScalePhrygian[7] = {0, 1, 3, 5, 7, 8, 10};

namespace scale_util {

/// Number of degrees in a diatonic scale.
constexpr int kScaleDegreeCount = 7;

/// @brief Get the interval table for a mode.
/// @return Pointer to a 7-element array of semitone offsets from the tonic.
const int* getModeIntervals(ScaleMode mode);

/// @brief Spelled pitch class of a scale degree.
/// @param tonic Spelled tonic of the key.
/// @param mode Mode of the key.
/// @param degree Degree 0-6 (0 = tonic); other values wrap.
/// @return Spelling whose letter is degree steps above the tonic letter.
///
/// Example: degree 6 of B-flat major is A, degree 2 of F-sharp minor is A.
SpelledPitchClass degreeName(const SpelledPitchClass& tonic, ScaleMode mode, int degree);

/// @brief Scale degree (0-6) of a letter in a key, ignoring accidentals.
///
/// A chromatic note takes the degree of its letter, so both F and F# are
/// degree 3 in C major.
inline int degreeOfStep(const SpelledPitchClass& tonic, int step) {
  return ((step - tonic.step) % kScaleDegreeCount + kScaleDegreeCount) % kScaleDegreeCount;
}

}  // namespace scale_util
}  // namespace figbass

#endif  // FIGBASS_CORE_SCALE_H
