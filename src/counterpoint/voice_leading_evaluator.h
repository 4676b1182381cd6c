// Common-practice voice-leading evaluator used for figured-bass movements.

#ifndef FIGBASS_COUNTERPOINT_VOICE_LEADING_EVALUATOR_H
#define FIGBASS_COUNTERPOINT_VOICE_LEADING_EVALUATOR_H

#include "counterpoint/i_rule_evaluator.h"

namespace figbass {

/// @brief Rule evaluator for four-part (and similar) chorale texture.
///
/// Perfect intervals are judged by pitch-class distance, so compound fifths
/// and octaves count. Hidden perfects have no "upper voice by step"
/// exemption.
class VoiceLeadingEvaluator : public IRuleEvaluator {
 public:
  MotionType classifyMotion(uint8_t prev1, uint8_t curr1,
                            uint8_t prev2, uint8_t curr2) const override;

  bool isParallelFifth(uint8_t prev1, uint8_t curr1,
                       uint8_t prev2, uint8_t curr2) const override;

  bool isParallelOctave(uint8_t prev1, uint8_t curr1,
                        uint8_t prev2, uint8_t curr2) const override;

  bool isHiddenFifth(uint8_t prev1, uint8_t curr1,
                     uint8_t prev2, uint8_t curr2) const override;

  bool isHiddenOctave(uint8_t prev1, uint8_t curr1,
                      uint8_t prev2, uint8_t curr2) const override;

  bool isVoiceOverlap(uint8_t prev_upper, uint8_t curr_upper,
                      uint8_t prev_lower, uint8_t curr_lower) const override;

  std::vector<RuleViolation> validate(
      const std::vector<std::vector<uint8_t>>& progression) const override;

 private:
  /// Both voices move, in the same direction.
  bool movesTogether(uint8_t prev1, uint8_t curr1, uint8_t prev2, uint8_t curr2) const;
};

}  // namespace figbass

#endif  // FIGBASS_COUNTERPOINT_VOICE_LEADING_EVALUATOR_H
