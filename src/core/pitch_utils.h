// Pitch utilities -- interval constants, spelled pitch names, MIDI
// conversion, and parallel-perfect checks.

#ifndef FIGBASS_CORE_PITCH_UTILS_H
#define FIGBASS_CORE_PITCH_UTILS_H

#include <cstdint>
#include <string>

#include "core/basic_types.h"

namespace figbass {

// ---------------------------------------------------------------------------
// Interval constants (semitones)
// ---------------------------------------------------------------------------

namespace interval {

constexpr int kUnison = 0;
constexpr int kMinor2nd = 1;
constexpr int kMajor2nd = 2;
constexpr int kMinor3rd = 3;
constexpr int kMajor3rd = 4;
constexpr int kPerfect4th = 5;
constexpr int kTritone = 6;
constexpr int kPerfect5th = 7;
constexpr int kMinor6th = 8;
constexpr int kMajor6th = 9;
constexpr int kMinor7th = 10;
constexpr int kMajor7th = 11;
constexpr int kOctave = 12;

}  // namespace interval

// ---------------------------------------------------------------------------
// Note names
// ---------------------------------------------------------------------------

/// Note names for pitch classes 0-11 (C=0).
constexpr const char* kNoteNames[] = {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};

/// Letter names indexed by diatonic step (C=0 ... B=6).
constexpr char kStepLetters[7] = {'C', 'D', 'E', 'F', 'G', 'A', 'B'};

/// Pitch class of each natural letter (C=0 ... B=6).
constexpr int kStepPitchClass[7] = {0, 2, 4, 5, 7, 9, 11};

/// Number of diatonic letters.
constexpr int kNumSteps = 7;

// ---------------------------------------------------------------------------
// Spelled pitches
// ---------------------------------------------------------------------------

/// @brief A pitch name without octave: diatonic letter plus alteration.
///
/// Two spellings with the same pitch class (F# and Gb) are different
/// SpelledPitchClass values; chord analysis depends on the letter.
struct SpelledPitchClass {
  int step = 0;   ///< Diatonic letter, C=0 ... B=6.
  int alter = 0;  ///< Semitone alteration, +1 = sharp, -1 = flat.

  /// @brief Pitch class 0-11 of this spelling.
  int pitchClass() const {
    return ((kStepPitchClass[step] + alter) % 12 + 12) % 12;
  }

  bool operator==(const SpelledPitchClass& other) const {
    return step == other.step && alter == other.alter;
  }
  bool operator!=(const SpelledPitchClass& other) const { return !(*this == other); }
};

/// @brief A spelled pitch with octave (C4 = middle C).
struct SpelledPitch {
  SpelledPitchClass name;
  int octave = 4;

  /// @brief MIDI note number; may fall outside 0-127 for extreme spellings.
  int midi() const {
    return (octave + 1) * 12 + kStepPitchClass[name.step] + name.alter;
  }
};

/// @brief Parse a pitch name without octave ("C", "f#", "Bb", "E-").
/// @param str Text to parse.
/// @param out Result, written only on success.
/// @return True on success.
bool parseSpelledPitchClass(const std::string& str, SpelledPitchClass& out);

/// @brief Parse a pitch name with octave ("C4", "F#3", "Bb2", "E-3").
/// @param str Text to parse.
/// @param out Result, written only on success.
/// @return True if the text is a pitch whose MIDI number lies in 0-127.
bool parseSpelledPitch(const std::string& str, SpelledPitch& out);

/// @brief Format a spelled pitch class ("F#", "Bb", "Cbb").
std::string spelledPitchClassToString(const SpelledPitchClass& name);

/// @brief Format a spelled pitch with octave ("F#3").
std::string spelledPitchToString(const SpelledPitch& pitch);

/// @brief Letter distance from one spelling up to another (0-6).
inline int stepDistance(const SpelledPitchClass& from, const SpelledPitchClass& to) {
  return ((to.step - from.step) % kNumSteps + kNumSteps) % kNumSteps;
}

/// @brief Transpose a spelling by a letter count and a semitone count.
/// @param name Starting spelling.
/// @param steps Letter distance (e.g. 3 for a fourth).
/// @param semitones Semitone distance (e.g. 5 for a perfect fourth).
/// @return Spelling whose letter is steps above and pitch class semitones above.
SpelledPitchClass transposeSpelled(const SpelledPitchClass& name, int steps, int semitones);

// ---------------------------------------------------------------------------
// MIDI pitch functions
// ---------------------------------------------------------------------------

/// @brief Extract pitch class (0-11) from a MIDI note number.
/// @param pitch MIDI note number (0-127).
/// @return Pitch class where C=0, C#=1, ..., B=11.
inline int getPitchClass(uint8_t pitch) {
  return static_cast<int>(pitch) % 12;
}

/// @brief Get octave number from MIDI note number.
/// @param pitch MIDI note number.
/// @return Octave number (C4 = octave 4, MIDI 60).
inline int getOctave(uint8_t pitch) {
  return static_cast<int>(pitch) / 12 - 1;
}

/// @brief Convert MIDI pitch to a sharp-spelled name (e.g. 60 -> "C4").
std::string pitchToNoteName(uint8_t pitch);

/// @brief Signed interval from one pitch to another in semitones.
inline int directedInterval(uint8_t from, uint8_t to) {
  return static_cast<int>(to) - static_cast<int>(from);
}

/// @brief Absolute interval between two pitches in semitones.
int absoluteInterval(uint8_t pitch_a, uint8_t pitch_b);

/// @brief Check if two successive intervals are both perfect fifths (mod 12).
/// @param interval1 First interval in semitones (between two voices).
/// @param interval2 Second interval in semitones (between same two voices).
bool isParallelFifths(int interval1, int interval2);

/// @brief Check if two successive intervals are both octaves/unisons (mod 12).
bool isParallelOctaves(int interval1, int interval2);

}  // namespace figbass

#endif  // FIGBASS_CORE_PITCH_UTILS_H
