// Voice and pitch-range model for figured-bass realization.

#ifndef FIGBASS_FIGURED_BASS_VOICE_H
#define FIGBASS_FIGURED_BASS_VOICE_H

#include <cstdint>
#include <string>
#include <vector>

namespace figbass {

/// Separation value meaning "no limit to the voice above".
constexpr int kUnlimitedSeparation = 127;

/// @brief Inclusive MIDI pitch range, ordered lexicographically on (lowest, highest).
struct PitchRange {
  int lowest = 0;
  int highest = 127;

  /// @brief True if lowest <= pitch <= highest.
  bool contains(int pitch) const { return pitch >= lowest && pitch <= highest; }

  /// @brief Keep the pitches inside the range, preserving order.
  std::vector<uint8_t> filter(const std::vector<uint8_t>& pitches) const;

  bool operator<(const PitchRange& other) const {
    if (lowest != other.lowest) return lowest < other.lowest;
    return highest < other.highest;
  }
  bool operator==(const PitchRange& other) const {
    return lowest == other.lowest && highest == other.highest;
  }
};

/// @brief One part of the realization (soprano, alto, right-hand voice, bass...).
struct Voice {
  std::string label;
  PitchRange range;              ///< Written range.
  int transposition = 0;         ///< Semitones from written to sounding pitch.
  int max_separation = 12;       ///< Max semitones to the voice immediately above.
  std::string clef = "treble";   ///< Used only by renderers.

  /// @brief Written range shifted by the transposition.
  PitchRange soundingRange() const {
    return PitchRange{range.lowest + transposition, range.highest + transposition};
  }
};

/// @brief Strict ordering used to sort voices high to low.
/// @return True if lhs sorts before rhs: higher sounding range first, ties
///         broken by label in ascending order.
bool voiceSortsBefore(const Voice& lhs, const Voice& rhs);

/// @brief Sort voices high to low in place. The last voice is the bass.
void sortVoices(std::vector<Voice>& voices);

/// @brief Check a voice list before a realization request.
/// @param voices Voice list (any order).
/// @param error If non-null, receives the first problem found.
/// @return False if fewer than two voices, labels are empty or repeated,
///         a range is inverted, or a sounding range leaves MIDI 0-127.
bool validateVoices(const std::vector<Voice>& voices, std::string* error = nullptr);

/// @brief Keyboard texture: num_upper right-hand voices labelled "1".."n"
///        spanning A0-B5, plus a bass voice "B" with no spacing limit.
std::vector<Voice> keyboardVoices(int num_upper = 3);

/// @brief Four-part chorale texture (S, A, T, B) with typical vocal ranges.
std::vector<Voice> choraleVoices();

/// @brief Parse a voice list description.
///
/// Accepts "keyboard", "chorale", a voice count ("4" = keyboard with three
/// upper voices), or a comma list of LABEL=LOW-HIGH[/SEP] entries with
/// spelled pitches, e.g. "S=C4-G5,A=G3-D5,T=C3-G4,B=E2-D4/24".
///
/// @param text Description.
/// @param out Sorted voices, written only on success.
/// @param error If non-null, receives a message on failure.
bool voicesFromString(const std::string& text, std::vector<Voice>& out,
                      std::string* error = nullptr);

}  // namespace figbass

#endif  // FIGBASS_FIGURED_BASS_VOICE_H
