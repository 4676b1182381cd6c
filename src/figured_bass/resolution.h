// Special chord resolutions -- dominant sevenths, diminished sevenths and
// augmented sixths resolve by prescribed semitone motion in the upper voices.

#ifndef FIGBASS_FIGURED_BASS_RESOLUTION_H
#define FIGBASS_FIGURED_BASS_RESOLUTION_H

#include <cstdint>
#include <string>
#include <vector>

#include "figured_bass/possibility.h"
#include "figured_bass/rules.h"
#include "harmony/chord_types.h"

namespace figbass {

/// Kind of resolution a slot demands of the slot after it.
enum class ResolutionKind : uint8_t {
  None,
  DominantSeventh,
  DiminishedSeventh,
  AugmentedSixth,         // French, German or Swiss
  ItalianAugmentedSixth   // Checked as a consecutive rule, not prescribed
};

/// @brief Convert ResolutionKind to a string such as "DominantSeventh".
const char* resolutionKindToString(ResolutionKind kind);

/// @brief Members of a dominant or diminished seventh chord.
struct SeventhChordMembers {
  SpelledPitchClass root;
  SpelledPitchClass third;
  SpelledPitchClass fifth;
  SpelledPitchClass seventh;
  int inversion = 0;
};

/// @brief Members of an augmented sixth chord, named by function.
struct AugmentedSixthMembers {
  ChordQuality quality = ChordQuality::ItalianSixth;
  SpelledPitchClass bass;   ///< Lowered sixth degree.
  SpelledPitchClass sixth;  ///< Augmented sixth above the bass (raised fourth).
  SpelledPitchClass tonic;  ///< Major third above the bass.
  bool has_other = false;   ///< False for the Italian sixth.
  SpelledPitchClass other;  ///< French A4, German P5 or Swiss AA4 above the bass.
};

/// @brief Closed tagged requirement carried by a slot.
///
/// Only the member block matching the kind is meaningful.
struct ResolutionRequirement {
  ResolutionKind kind = ResolutionKind::None;
  SeventhChordMembers seventh;     ///< DominantSeventh, DiminishedSeventh.
  AugmentedSixthMembers aug_sixth; ///< AugmentedSixth, ItalianAugmentedSixth.
};

/// @brief Requirement implied by a chord under the given rules.
///
/// A chord quality whose "resolve ... properly" option is off yields None.
ResolutionRequirement resolutionRequirementFor(const ChordAnalysis& analysis, const Rules& rules);

/// How movements out of a slot are judged.
enum class ResolutionMethod : uint8_t {
  Ordinary,     // Consecutive rules only
  Prescribed,   // Upper voices must follow the listed motions
  ItalianSixth  // Consecutive rules plus the Italian sixth rule
};

/// @brief Semitone motion for every upper voice sounding a pitch class.
struct PitchClassMotion {
  int pitch_class = 0;
  int semitones = 0;
};

/// @brief Resolution decided for one pair of adjacent slots.
struct ResolutionPlan {
  ResolutionMethod method = ResolutionMethod::Ordinary;
  std::string description;                ///< e.g. "dominant seventh to major tonic".
  std::vector<PitchClassMotion> motions;  ///< Prescribed: unlisted pitch classes stay.
  bool relax_target_completeness = false; ///< The later slot may omit chord tones.

  // ItalianSixth parameters (pitch classes).
  int italian_bass_pc = 0;
  int italian_sixth_pc = 0;
  int italian_tonic_pc = 0;
  bool restrict_doublings = true;
};

/// @brief Decide how a slot with the given requirement moves into a chord.
///
/// The first matching target wins. A requirement with no matching target
/// falls back to Ordinary.
///
/// @param requirement Requirement of the earlier slot.
/// @param target Analysis of the later slot's chord.
/// @param rules Rule snapshot (dim7 doubling options, Italian doublings).
ResolutionPlan planResolution(const ResolutionRequirement& requirement,
                              const ChordAnalysis& target, const Rules& rules);

/// @brief Upper voices of a moved by the plan's motions; the bass is copied.
/// @param plan A Prescribed plan.
/// @param possib_a Earlier possibility.
/// @param out Resolved possibility, written only on success.
/// @return False if a resolved pitch leaves MIDI 0-127.
bool resolvePossibility(const ResolutionPlan& plan, const Possibility& possib_a,
                        Possibility& out);

/// @brief True if every upper voice of b equals the prescribed resolution of a.
bool followsResolution(const ResolutionPlan& plan, const Possibility& possib_a,
                       const Possibility& possib_b);

/// @brief True if a to b resolves an Italian augmented sixth properly.
///
/// The tonic tone stays or moves up a major third, minor third, major second
/// or down a minor second; the augmented sixth rises a semitone (in at most
/// one voice when doublings are restricted); the bass falls a semitone; an
/// upper doubling of the bass is forbidden when restricted and otherwise
/// also falls a semitone.
bool isItalianSixthResolution(const ResolutionPlan& plan, const Possibility& possib_a,
                              const Possibility& possib_b);

}  // namespace figbass

#endif  // FIGBASS_FIGURED_BASS_RESOLUTION_H
