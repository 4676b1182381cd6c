// Implementation of possibility predicates.

#include "figured_bass/possibility.h"

#include <algorithm>
#include <cstdlib>

#include "core/pitch_utils.h"

namespace figbass {

PitchClassMask possibilityPitchClasses(const Possibility& possib) {
  PitchClassMask mask = 0;
  for (uint8_t pitch : possib) mask |= pitchClassBit(getPitchClass(pitch));
  return mask;
}

bool isIncomplete(const Possibility& possib, PitchClassMask required) {
  return (possibilityPitchClasses(possib) & required) != required;
}

bool hasVoiceCrossing(const Possibility& possib) {
  for (size_t idx = 1; idx < possib.size(); ++idx) {
    if (possib[idx - 1] < possib[idx]) return true;
  }
  return false;
}

bool hasUpperUnison(const Possibility& possib) {
  if (possib.size() < 3) return false;
  size_t num_upper = possib.size() - 1;
  for (size_t idx = 0; idx < num_upper; ++idx) {
    for (size_t other = idx + 1; other < num_upper; ++other) {
      if (possib[idx] == possib[other]) return true;
    }
  }
  return false;
}

bool isSpacingWithinLimits(const Possibility& possib, const std::vector<int>& max_separation) {
  for (size_t idx = 1; idx < possib.size() && idx < max_separation.size(); ++idx) {
    if (absoluteInterval(possib[idx - 1], possib[idx]) > max_separation[idx]) return false;
  }
  return true;
}

bool upperPartsWithinLimit(const Possibility& possib, int max_semitones) {
  if (possib.size() < 2) return true;
  auto upper_end = possib.end() - 1;
  auto [low, high] = std::minmax_element(possib.begin(), upper_end);
  return static_cast<int>(*high) - static_cast<int>(*low) <= max_semitones;
}

bool hasRaisedToneDoubled(const Possibility& possib, PitchClassMask raised) {
  if (raised == 0) return false;
  PitchClassMask seen = 0;
  for (uint8_t pitch : possib) {
    PitchClassMask bit = pitchClassBit(getPitchClass(pitch));
    if ((raised & bit) == 0) continue;
    if (seen & bit) return true;
    seen |= bit;
  }
  return false;
}

bool partMovementsWithinLimits(const Possibility& possib_a, const Possibility& possib_b,
                               const std::vector<int>& max_leap) {
  size_t count = std::min(possib_a.size(), possib_b.size());
  for (size_t idx = 0; idx < count && idx < max_leap.size(); ++idx) {
    if (max_leap[idx] < 0) continue;
    if (absoluteInterval(possib_a[idx], possib_b[idx]) > max_leap[idx]) return false;
  }
  return true;
}

}  // namespace figbass
