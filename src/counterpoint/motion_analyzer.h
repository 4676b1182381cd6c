// Voice-pair motion analysis -- classifies successive intervals of a
// realized progression and computes motion statistics.

#ifndef FIGBASS_COUNTERPOINT_MOTION_ANALYZER_H
#define FIGBASS_COUNTERPOINT_MOTION_ANALYZER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "counterpoint/i_rule_evaluator.h"

namespace figbass {

/// @brief Analyzes motion patterns between voices of a realized progression.
///
/// Uses an IRuleEvaluator to classify each successive interval pair, then
/// tallies the results into a MotionStats summary.
class MotionAnalyzer {
 public:
  /// @brief Construct an analyzer using the given rule evaluator.
  explicit MotionAnalyzer(const IRuleEvaluator& rules);

  /// @brief Classify motion between two successive pitch pairs.
  MotionType classifyMotion(uint8_t prev1, uint8_t curr1,
                            uint8_t prev2, uint8_t curr2) const;

  /// Aggregate motion statistics.
  struct MotionStats {
    int parallel = 0;
    int similar = 0;
    int contrary = 0;
    int oblique = 0;

    int total() const { return parallel + similar + contrary + oblique; }

    /// @brief Ratio of contrary motion.
    /// @return Value in [0.0, 1.0], or 0.0 if total is 0.
    float contraryRatio() const;

    MotionStats& operator+=(const MotionStats& other);
  };

  /// @brief Analyze consecutive chords for one voice pair.
  /// @param progression Chords with one pitch per voice (high to low).
  /// @param voice1 Index of the first voice.
  /// @param voice2 Index of the second voice.
  /// @return Statistics; chord pairs where neither voice moves are skipped.
  MotionStats analyzeVoicePair(const std::vector<std::vector<uint8_t>>& progression,
                               size_t voice1, size_t voice2) const;

  /// @brief Sum of analyzeVoicePair over every voice pair.
  MotionStats analyzeProgression(const std::vector<std::vector<uint8_t>>& progression) const;

  /// @brief Outer-voice motion of each chord change, space separated.
  ///
  /// Each step is named by motionTypeToString(); a trailing '*' marks
  /// arrival on a perfect consonance (unison, fifth or octave), e.g.
  /// "contrary similar* oblique".
  std::string describeOuterVoices(const std::vector<std::vector<uint8_t>>& progression) const;

 private:
  const IRuleEvaluator& rules_;
};

}  // namespace figbass

#endif  // FIGBASS_COUNTERPOINT_MOTION_ANALYZER_H
