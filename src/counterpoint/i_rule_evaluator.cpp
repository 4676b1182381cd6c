// Implementation of free functions declared in i_rule_evaluator.h.

#include "counterpoint/i_rule_evaluator.h"

namespace figbass {

const char* motionTypeToString(MotionType type) {
  switch (type) {
    case MotionType::Parallel: return "parallel";
    case MotionType::Similar:  return "similar";
    case MotionType::Contrary: return "contrary";
    case MotionType::Oblique:  return "oblique";
  }
  return "unknown";
}

}  // namespace figbass
