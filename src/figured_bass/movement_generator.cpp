// Implementation of movement generation between adjacent slots.

#include "figured_bass/movement_generator.h"

#include <algorithm>
#include <utility>

namespace figbass {

MovementGenerator::MovementGenerator(const IRuleEvaluator& evaluator, const Rules& rules,
                                     const std::vector<Voice>& voices)
    : evaluator_(evaluator), rules_(rules) {
  for (const auto& voice : voices) max_leap_.push_back(rules.maxLeapFor(voice.label));
}

bool MovementGenerator::passesConsecutiveRules(const Possibility& possib_a,
                                               const Possibility& possib_b) const {
  size_t num_voices = possib_a.size();
  if (num_voices != possib_b.size() || num_voices < 2) return false;

  if (!partMovementsWithinLimits(possib_a, possib_b, max_leap_)) return false;

  if (rules_.forbid_voice_overlap) {
    // Ordered voices only need their neighbours checked; once voices may
    // cross, every pair can overlap.
    for (size_t upper = 0; upper + 1 < num_voices; ++upper) {
      size_t last = rules_.forbid_voice_crossing ? upper + 2 : num_voices;
      for (size_t lower = upper + 1; lower < last; ++lower) {
        if (evaluator_.isVoiceOverlap(possib_a[upper], possib_b[upper], possib_a[lower],
                                      possib_b[lower])) {
          return false;
        }
      }
    }
  }

  if (rules_.forbid_parallel_fifths || rules_.forbid_parallel_octaves) {
    for (size_t upper = 0; upper + 1 < num_voices; ++upper) {
      for (size_t lower = upper + 1; lower < num_voices; ++lower) {
        uint8_t prev1 = possib_a[upper];
        uint8_t curr1 = possib_b[upper];
        uint8_t prev2 = possib_a[lower];
        uint8_t curr2 = possib_b[lower];
        if (rules_.forbid_parallel_fifths &&
            evaluator_.isParallelFifth(prev1, curr1, prev2, curr2)) {
          return false;
        }
        if (rules_.forbid_parallel_octaves &&
            evaluator_.isParallelOctave(prev1, curr1, prev2, curr2)) {
          return false;
        }
      }
    }
  }

  // Hidden perfects only between the outer voices.
  size_t bass = num_voices - 1;
  if (rules_.forbid_hidden_fifths &&
      evaluator_.isHiddenFifth(possib_a[0], possib_b[0], possib_a[bass], possib_b[bass])) {
    return false;
  }
  if (rules_.forbid_hidden_octaves &&
      evaluator_.isHiddenOctave(possib_a[0], possib_b[0], possib_a[bass], possib_b[bass])) {
    return false;
  }
  return true;
}

bool MovementGenerator::isLegalMovement(const ResolutionPlan& plan, const Possibility& possib_a,
                                        const Possibility& possib_b) const {
  switch (plan.method) {
    case ResolutionMethod::Prescribed:
      if (!followsResolution(plan, possib_a, possib_b)) return false;
      return !rules_.apply_consecutive_rules_to_resolution ||
             passesConsecutiveRules(possib_a, possib_b);
    case ResolutionMethod::ItalianSixth:
      return passesConsecutiveRules(possib_a, possib_b) &&
             isItalianSixthResolution(plan, possib_a, possib_b);
    case ResolutionMethod::Ordinary:
      break;
  }
  return passesConsecutiveRules(possib_a, possib_b);
}

size_t MovementGenerator::generateMovements(const ResolutionPlan& plan, Segment& a,
                                            const Segment& b) const {
  const std::vector<Possibility>& targets = b.realizations();
  size_t edges = 0;
  for (size_t idx_a = 0; idx_a < a.numRealizations(); ++idx_a) {
    std::vector<uint32_t> successors;
    if (!a.isAlive(idx_a)) {
      a.setSuccessors(idx_a, successors);
      continue;
    }
    const Possibility& possib_a = a.realization(idx_a);

    if (plan.method == ResolutionMethod::Prescribed) {
      Possibility resolved;
      if (resolvePossibility(plan, possib_a, resolved)) {
        resolved.back() = b.bassMidi();
        auto iter = std::lower_bound(targets.begin(), targets.end(), resolved);
        if (iter != targets.end() && *iter == resolved) {
          size_t idx_b = static_cast<size_t>(iter - targets.begin());
          if (b.isAlive(idx_b) && isLegalMovement(plan, possib_a, *iter)) {
            successors.push_back(static_cast<uint32_t>(idx_b));
          }
        }
      }
    } else {
      for (size_t idx_b = 0; idx_b < targets.size(); ++idx_b) {
        if (!b.isAlive(idx_b)) continue;
        if (isLegalMovement(plan, possib_a, targets[idx_b])) {
          successors.push_back(static_cast<uint32_t>(idx_b));
        }
      }
    }
    edges += successors.size();
    a.setSuccessors(idx_a, std::move(successors));
  }
  return edges;
}

}  // namespace figbass
