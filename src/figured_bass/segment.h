// Chord slot -- one bass note with its figure, chord and legal realizations.

#ifndef FIGBASS_FIGURED_BASS_SEGMENT_H
#define FIGBASS_FIGURED_BASS_SEGMENT_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/pitch_utils.h"
#include "figured_bass/notation.h"
#include "figured_bass/possibility.h"
#include "figured_bass/realization_cache.h"
#include "figured_bass/realize_error.h"
#include "figured_bass/realizer_scale.h"
#include "figured_bass/resolution.h"
#include "figured_bass/rules.h"
#include "figured_bass/voice.h"
#include "harmony/chord_types.h"

namespace figbass {

/// Marker for an upper voice without a fixed pitch.
constexpr int kNoFixedPitch = -1;

/// @brief One slot of the chain: a bass note and its realizations.
///
/// Realization indices are stable from generation on. Pruning only clears
/// alive flags and removes adjacency entries; it never reorders.
class Segment {
 public:
  /// @brief Prepare a slot.
  /// @param index Position in the chain.
  /// @param bass Spelled bass pitch (sounding).
  /// @param figure Parsed figure.
  /// @param scale Scale service of the request's key.
  /// @param rules Rule snapshot (decides the resolution requirement).
  Segment(size_t index, const SpelledPitch& bass, const Figure& figure,
          const FiguredBassScale& scale, const Rules& rules);

  /// @brief Fix an upper voice to one sounding pitch.
  /// @param voice_index Index into the sorted voice list (not the bass).
  /// @param pitch MIDI pitch; it need not be a chord tone.
  void fixVoice(size_t voice_index, int pitch);

  /// @brief Allow this slot to omit chord tones (set by a preceding V7).
  void relaxCompleteness() { completeness_relaxed_ = true; }
  bool isCompletenessRelaxed() const { return completeness_relaxed_; }

  /// @brief Pitch classes every realization must sound under the rules.
  PitchClassMask requiredPitchClasses(const Rules& rules) const;

  /// @brief Generate all legal realizations, in lexicographic order.
  ///
  /// Upper voice candidates are the chord pitches in the voice's sounding
  /// range at or above the bass (a fixed voice has its single pitch). The
  /// search assigns voices from the highest down and prunes a partial
  /// assignment as soon as spacing, crossing, unison, upper separation or
  /// raised-tone doubling fails, or when the voices left cannot supply the
  /// missing required pitch classes.
  ///
  /// @param voices Sorted voices; the last is the bass.
  /// @param rules Rule snapshot.
  /// @param cache Request-scoped cache.
  /// @param error Receives SlotInfeasible or RealizationCapExceeded.
  /// @return False on error; realizations are then left empty.
  bool generateRealizations(const std::vector<Voice>& voices, const Rules& rules,
                            RealizationCache& cache, RealizeError* error);

  // --- Chain bookkeeping ---

  void setSuccessors(size_t realization, std::vector<uint32_t> successors);
  std::vector<uint32_t>& mutableSuccessors(size_t realization) { return successors_[realization]; }
  const std::vector<uint32_t>& successors(size_t realization) const {
    return successors_[realization];
  }
  void markDead(size_t realization);

  // --- Accessors ---

  size_t index() const { return index_; }
  const SpelledPitch& bass() const { return bass_; }
  uint8_t bassMidi() const { return static_cast<uint8_t>(bass_.midi()); }
  const Figure& figure() const { return figure_; }
  const ChordPitchNames& pitchNames() const { return pitch_names_; }
  const ChordAnalysis& analysis() const { return analysis_; }
  const ResolutionRequirement& requirement() const { return requirement_; }
  const std::vector<int>& fixedPitches() const { return fixed_; }

  const std::vector<Possibility>& realizations() const { return realizations_; }
  const Possibility& realization(size_t idx) const { return realizations_[idx]; }
  size_t numRealizations() const { return realizations_.size(); }
  bool isAlive(size_t idx) const { return idx < alive_.size() && alive_[idx]; }
  size_t numAlive() const { return num_alive_; }

  /// @brief "C3 '6,4'" style description for messages.
  std::string describe() const;

 private:
  size_t index_ = 0;
  SpelledPitch bass_;
  Figure figure_;
  ChordPitchNames pitch_names_;
  ChordAnalysis analysis_;
  ResolutionRequirement requirement_;
  std::vector<int> fixed_;  // Per upper voice; kNoFixedPitch when free.
  bool completeness_relaxed_ = false;

  std::vector<Possibility> realizations_;
  std::vector<bool> alive_;
  size_t num_alive_ = 0;
  std::vector<std::vector<uint32_t>> successors_;
};

}  // namespace figbass

#endif  // FIGBASS_FIGURED_BASS_SEGMENT_H
