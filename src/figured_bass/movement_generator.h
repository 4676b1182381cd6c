// Movement generation -- the legal-motion relation between the realizations
// of two adjacent slots.

#ifndef FIGBASS_FIGURED_BASS_MOVEMENT_GENERATOR_H
#define FIGBASS_FIGURED_BASS_MOVEMENT_GENERATOR_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "counterpoint/i_rule_evaluator.h"
#include "figured_bass/possibility.h"
#include "figured_bass/resolution.h"
#include "figured_bass/rules.h"
#include "figured_bass/segment.h"
#include "figured_bass/voice.h"

namespace figbass {

/// @brief Decides which realization pairs of adjacent slots may follow each other.
///
/// A check reads only the two possibilities, the rule snapshot and the
/// resolution plan of the slot pair.
class MovementGenerator {
 public:
  /// @param evaluator Voice-leading rule evaluator (parallel/hidden/overlap tests).
  /// @param rules Rule snapshot.
  /// @param voices Sorted voices (labels give part movement limits).
  MovementGenerator(const IRuleEvaluator& evaluator, const Rules& rules,
                    const std::vector<Voice>& voices);

  /// @brief Ordinary consecutive rules (parallels, hidden perfects on the
  ///        outer voices, overlap, part movement limits).
  bool passesConsecutiveRules(const Possibility& possib_a, const Possibility& possib_b) const;

  /// @brief True if possib_a may move to possib_b under the plan.
  bool isLegalMovement(const ResolutionPlan& plan, const Possibility& possib_a,
                       const Possibility& possib_b) const;

  /// @brief Compute the adjacency from every live realization of a into b.
  ///
  /// Prescribed resolutions are looked up directly in b's sorted
  /// realizations; other plans test every pair.
  ///
  /// @return Number of edges created.
  size_t generateMovements(const ResolutionPlan& plan, Segment& a, const Segment& b) const;

 private:
  const IRuleEvaluator& evaluator_;
  const Rules& rules_;
  std::vector<int> max_leap_;  // Per voice index, -1 when unrestricted.
};

}  // namespace figbass

#endif  // FIGBASS_FIGURED_BASS_MOVEMENT_GENERATOR_H
