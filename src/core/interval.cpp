// Implementation of interval utilities.

#include "core/interval.h"

#include <cstdlib>

namespace figbass {
namespace interval_util {

int compoundToSimple(int semitones) {
  int abs_val = std::abs(semitones);
  return abs_val % 12;
}

bool isPerfectConsonance(int semitones) {
  int simple = compoundToSimple(semitones);
  return simple == interval::kUnison || simple == interval::kPerfect5th;
}

}  // namespace interval_util
}  // namespace figbass
