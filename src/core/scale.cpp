// Implementation of scale degree utilities.

#include "core/scale.h"

namespace figbass {
namespace scale_util {

const int* getModeIntervals(ScaleMode mode) {
  switch (mode) {
    case ScaleMode::Major:    return kScaleMajor;
    case ScaleMode::Minor:    return kScaleNaturalMinor;
    case ScaleMode::Dorian:   return kScaleDorian;
    case ScaleMode::Phrygian: return kScalePhrygian;
  }
  return kScaleMajor;  // Fallback
}

SpelledPitchClass degreeName(const SpelledPitchClass& tonic, ScaleMode mode, int degree) {
  int normalized = ((degree % kScaleDegreeCount) + kScaleDegreeCount) % kScaleDegreeCount;
  const int* intervals = getModeIntervals(mode);
  return transposeSpelled(tonic, normalized, intervals[normalized]);
}

}  // namespace scale_util
}  // namespace figbass
