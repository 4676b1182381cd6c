// Scale service for figured-bass realization -- maps a bass note and figure
// to chord pitch names in a key, and chord pitch names to concrete pitches.

#ifndef FIGBASS_FIGURED_BASS_REALIZER_SCALE_H
#define FIGBASS_FIGURED_BASS_REALIZER_SCALE_H

#include <cstdint>
#include <vector>

#include "core/pitch_utils.h"
#include "figured_bass/notation.h"
#include "harmony/key.h"

namespace figbass {

/// Bit mask over pitch classes (bit n set = pitch class n).
using PitchClassMask = uint16_t;

/// @brief One chord tone implied by a figure.
struct ChordMember {
  int number = 1;            ///< Figure number above the bass (1 = the bass itself).
  SpelledPitchClass name;
  bool raised = false;       ///< True if a figure accidental raised the scale tone.
};

/// @brief Chord tones over one bass note, bass first.
struct ChordPitchNames {
  SpelledPitchClass bass;
  std::vector<ChordMember> members;

  /// @brief Distinct spelled names, bass first.
  std::vector<SpelledPitchClass> names() const;

  /// @brief Pitch classes of all members.
  PitchClassMask pitchClassMask() const;

  /// @brief Pitch classes of members raised by an accidental.
  PitchClassMask raisedMask() const;
};

/// @brief Scale service bound to one key.
class FiguredBassScale {
 public:
  explicit FiguredBassScale(const KeySignature& key);

  /// @brief Chord pitch names implied by a figure over a bass note.
  ///
  /// The bass's own spelling is always a member. Figure number n yields the
  /// scale pitch (bassDegree + n - 1) mod 7 with the figure's modifier
  /// applied; a chromatic bass uses the degree of its letter.
  ChordPitchNames chordPitchNames(const SpelledPitchClass& bass, const Figure& figure) const;

  /// @brief All pitches in [low, high] whose pitch class is in the mask, ascending.
  static std::vector<uint8_t> pitchesForScaleDegrees(PitchClassMask mask, int low, int high);

  const KeySignature& key() const { return key_; }

 private:
  KeySignature key_;
};

/// @brief Bit for a single pitch class.
inline PitchClassMask pitchClassBit(int pitch_class) {
  return static_cast<PitchClassMask>(1u << (((pitch_class % 12) + 12) % 12));
}

/// @brief Number of pitch classes set in a mask.
int pitchClassCount(PitchClassMask mask);

}  // namespace figbass

#endif  // FIGBASS_FIGURED_BASS_REALIZER_SCALE_H
