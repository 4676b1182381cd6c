/// @file
/// @brief Implementation of VoiceLeadingEvaluator.

#include "counterpoint/voice_leading_evaluator.h"

#include <algorithm>

#include "core/interval.h"
#include "core/pitch_utils.h"

namespace figbass {

// ---------------------------------------------------------------------------
// Motion classification
// ---------------------------------------------------------------------------

MotionType VoiceLeadingEvaluator::classifyMotion(uint8_t prev1, uint8_t curr1,
                                                 uint8_t prev2, uint8_t curr2) const {
  int dir1 = directedInterval(prev1, curr1);
  int dir2 = directedInterval(prev2, curr2);

  if (dir1 == 0 || dir2 == 0) {
    return MotionType::Oblique;
  }
  if ((dir1 > 0) != (dir2 > 0)) {
    return MotionType::Contrary;
  }
  if (absoluteInterval(prev1, prev2) == absoluteInterval(curr1, curr2)) {
    return MotionType::Parallel;
  }
  return MotionType::Similar;
}

bool VoiceLeadingEvaluator::movesTogether(uint8_t prev1, uint8_t curr1,
                                          uint8_t prev2, uint8_t curr2) const {
  MotionType motion = classifyMotion(prev1, curr1, prev2, curr2);
  return motion == MotionType::Parallel || motion == MotionType::Similar;
}

// ---------------------------------------------------------------------------
// Parallel perfects
// ---------------------------------------------------------------------------

bool VoiceLeadingEvaluator::isParallelFifth(uint8_t prev1, uint8_t curr1,
                                            uint8_t prev2, uint8_t curr2) const {
  if (!isParallelFifths(absoluteInterval(prev1, prev2), absoluteInterval(curr1, curr2))) {
    return false;
  }
  return movesTogether(prev1, curr1, prev2, curr2);
}

bool VoiceLeadingEvaluator::isParallelOctave(uint8_t prev1, uint8_t curr1,
                                             uint8_t prev2, uint8_t curr2) const {
  if (!isParallelOctaves(absoluteInterval(prev1, prev2), absoluteInterval(curr1, curr2))) {
    return false;
  }
  return movesTogether(prev1, curr1, prev2, curr2);
}

// ---------------------------------------------------------------------------
// Hidden perfects
// ---------------------------------------------------------------------------

bool VoiceLeadingEvaluator::isHiddenFifth(uint8_t prev1, uint8_t curr1,
                                          uint8_t prev2, uint8_t curr2) const {
  if (!interval_util::isPerfectFifthClass(absoluteInterval(curr1, curr2))) return false;
  // Arriving from a fifth is a parallel fifth, not a hidden one.
  if (interval_util::isPerfectFifthClass(absoluteInterval(prev1, prev2))) return false;
  return movesTogether(prev1, curr1, prev2, curr2);
}

bool VoiceLeadingEvaluator::isHiddenOctave(uint8_t prev1, uint8_t curr1,
                                           uint8_t prev2, uint8_t curr2) const {
  if (!interval_util::isOctaveClass(absoluteInterval(curr1, curr2))) return false;
  if (interval_util::isOctaveClass(absoluteInterval(prev1, prev2))) return false;
  return movesTogether(prev1, curr1, prev2, curr2);
}

// ---------------------------------------------------------------------------
// Voice overlap
// ---------------------------------------------------------------------------

bool VoiceLeadingEvaluator::isVoiceOverlap(uint8_t prev_upper, uint8_t curr_upper,
                                           uint8_t prev_lower, uint8_t curr_lower) const {
  return curr_lower > prev_upper || curr_upper < prev_lower;
}

// ---------------------------------------------------------------------------
// Progression validation
// ---------------------------------------------------------------------------

std::vector<RuleViolation> VoiceLeadingEvaluator::validate(
    const std::vector<std::vector<uint8_t>>& progression) const {
  std::vector<RuleViolation> violations;

  auto report = [&violations](size_t upper, size_t lower, size_t slot, const char* rule) {
    RuleViolation violation;
    violation.voice1 = static_cast<VoiceId>(upper);
    violation.voice2 = static_cast<VoiceId>(lower);
    violation.slot = slot;
    violation.rule = rule;
    violations.push_back(violation);
  };

  for (size_t slot = 1; slot < progression.size(); ++slot) {
    const auto& prev = progression[slot - 1];
    const auto& curr = progression[slot];
    size_t num_voices = std::min(prev.size(), curr.size());
    if (num_voices < 2) continue;

    for (size_t upper = 0; upper + 1 < num_voices; ++upper) {
      for (size_t lower = upper + 1; lower < num_voices; ++lower) {
        if (isParallelFifth(prev[upper], curr[upper], prev[lower], curr[lower])) {
          report(upper, lower, slot, "parallel_fifths");
        }
        if (isParallelOctave(prev[upper], curr[upper], prev[lower], curr[lower])) {
          report(upper, lower, slot, "parallel_octaves");
        }
      }
      if (isVoiceOverlap(prev[upper], curr[upper], prev[upper + 1], curr[upper + 1])) {
        report(upper, upper + 1, slot, "voice_overlap");
      }
    }

    size_t bass = num_voices - 1;
    if (isHiddenFifth(prev[0], curr[0], prev[bass], curr[bass])) {
      report(0, bass, slot, "hidden_fifths");
    }
    if (isHiddenOctave(prev[0], curr[0], prev[bass], curr[bass])) {
      report(0, bass, slot, "hidden_octaves");
    }
  }
  return violations;
}

}  // namespace figbass
