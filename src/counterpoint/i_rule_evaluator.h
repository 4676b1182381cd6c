// Pure abstract interface for voice-leading rule evaluation between two
// consecutive chords.

#ifndef FIGBASS_COUNTERPOINT_I_RULE_EVALUATOR_H
#define FIGBASS_COUNTERPOINT_I_RULE_EVALUATOR_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace figbass {

// ---------------------------------------------------------------------------
// Motion classification
// ---------------------------------------------------------------------------

/// @brief Voice-pair motion type between two successive intervals.
enum class MotionType : uint8_t {
  Parallel,  // Same direction, same interval size
  Similar,   // Same direction, different interval size
  Contrary,  // Opposite directions
  Oblique    // One voice stationary (or both)
};

/// @brief Convert MotionType to a human-readable string.
/// @param type The motion type value.
/// @return Null-terminated C string (e.g. "parallel").
const char* motionTypeToString(MotionType type);

// ---------------------------------------------------------------------------
// Rule violation descriptor
// ---------------------------------------------------------------------------

/// @brief A single voice-leading violation found in a realized progression.
struct RuleViolation {
  VoiceId voice1 = 0;      ///< Upper voice of the pair (index in sorted voices).
  VoiceId voice2 = 0;      ///< Lower voice of the pair.
  size_t slot = 0;         ///< Index of the chord the violation arrives at.
  std::string rule;        ///< Rule name (e.g. "parallel_fifths").
};

// ---------------------------------------------------------------------------
// Abstract interface
// ---------------------------------------------------------------------------

/// @brief Abstract interface for voice-leading rule evaluation.
///
/// Every query takes the previous and current pitch of two voices. Voice 1
/// is the upper voice of the pair. Implementations decide what counts as a
/// parallel, hidden or overlapping motion.
class IRuleEvaluator {
 public:
  virtual ~IRuleEvaluator() = default;

  /// @brief Classify the motion between two successive pitch pairs.
  virtual MotionType classifyMotion(uint8_t prev1, uint8_t curr1,
                                    uint8_t prev2, uint8_t curr2) const = 0;

  /// @brief Both voices move in the same direction from a fifth to a fifth.
  virtual bool isParallelFifth(uint8_t prev1, uint8_t curr1,
                               uint8_t prev2, uint8_t curr2) const = 0;

  /// @brief Both voices move in the same direction from an octave/unison
  ///        to an octave/unison.
  virtual bool isParallelOctave(uint8_t prev1, uint8_t curr1,
                                uint8_t prev2, uint8_t curr2) const = 0;

  /// @brief Similar motion into a fifth from a different interval.
  virtual bool isHiddenFifth(uint8_t prev1, uint8_t curr1,
                             uint8_t prev2, uint8_t curr2) const = 0;

  /// @brief Similar motion into an octave/unison from a different interval.
  virtual bool isHiddenOctave(uint8_t prev1, uint8_t curr1,
                              uint8_t prev2, uint8_t curr2) const = 0;

  /// @brief Adjacent voices overlap: the lower voice moves above the previous
  ///        upper pitch, or the upper voice below the previous lower pitch.
  virtual bool isVoiceOverlap(uint8_t prev_upper, uint8_t curr_upper,
                              uint8_t prev_lower, uint8_t curr_lower) const = 0;

  /// @brief Validate every consecutive chord pair of a progression.
  /// @param progression Chords, each with one pitch per voice (high to low).
  /// @return All parallel-perfect, hidden-perfect (outer voices) and
  ///         overlap violations found.
  virtual std::vector<RuleViolation> validate(
      const std::vector<std::vector<uint8_t>>& progression) const = 0;
};

}  // namespace figbass

#endif  // FIGBASS_COUNTERPOINT_I_RULE_EVALUATOR_H
