// Possibility model and single/consecutive possibility predicates.

#ifndef FIGBASS_FIGURED_BASS_POSSIBILITY_H
#define FIGBASS_FIGURED_BASS_POSSIBILITY_H

#include <cstdint>
#include <vector>

#include "figured_bass/realizer_scale.h"

namespace figbass {

/// @brief One realization of a slot: a sounding MIDI pitch per voice.
///
/// Index 0 is the highest voice in sorted voice order; the last entry is the
/// bass. A possibility is never mutated once generated.
using Possibility = std::vector<uint8_t>;

/// @brief Pitch classes sounding in a possibility.
PitchClassMask possibilityPitchClasses(const Possibility& possib);

// ---------------------------------------------------------------------------
// Single possibility predicates
// ---------------------------------------------------------------------------

/// @brief True if some required pitch class is missing.
bool isIncomplete(const Possibility& possib, PitchClassMask required);

/// @brief True if some voice sounds below the voice after it.
bool hasVoiceCrossing(const Possibility& possib);

/// @brief True if two upper voices sound the same pitch.
bool hasUpperUnison(const Possibility& possib);

/// @brief True if adjacent voices are within their spacing limits.
/// @param possib Possibility, high to low.
/// @param max_separation Per voice (same indexing): max semitones to the
///        voice immediately above. Entry 0 is ignored.
bool isSpacingWithinLimits(const Possibility& possib, const std::vector<int>& max_separation);

/// @brief True if the upper voices span at most max_semitones.
bool upperPartsWithinLimit(const Possibility& possib, int max_semitones);

/// @brief True if a raised pitch class sounds in more than one voice.
bool hasRaisedToneDoubled(const Possibility& possib, PitchClassMask raised);

// ---------------------------------------------------------------------------
// Consecutive possibility predicates
// ---------------------------------------------------------------------------

/// @brief True if every voice moves at most its limit.
/// @param possib_a Earlier possibility.
/// @param possib_b Later possibility (same size).
/// @param max_leap Per voice limit in semitones, -1 for unrestricted.
bool partMovementsWithinLimits(const Possibility& possib_a, const Possibility& possib_b,
                               const std::vector<int>& max_leap);

}  // namespace figbass

#endif  // FIGBASS_FIGURED_BASS_POSSIBILITY_H
