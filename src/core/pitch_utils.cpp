// Implementation of pitch utility functions.

#include "core/pitch_utils.h"

#include <cctype>
#include <cstdlib>

#include "core/interval.h"

namespace figbass {

namespace {

/// @brief Parse the letter and accidentals at the front of a pitch string.
/// @param str Input text.
/// @param pos Advanced past the parsed characters.
/// @param out Parsed pitch class.
/// @return False if no letter is present.
bool parseNameAt(const std::string& str, size_t& pos, SpelledPitchClass& out) {
  if (pos >= str.size()) return false;
  char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(str[pos])));
  int step = -1;
  for (int idx = 0; idx < kNumSteps; ++idx) {
    if (kStepLetters[idx] == letter) step = idx;
  }
  if (step < 0) return false;
  ++pos;

  int alter = 0;
  while (pos < str.size()) {
    char chr = str[pos];
    if (chr == '#') {
      ++alter;
    } else if (chr == 'b' || chr == '-') {
      --alter;
    } else {
      break;
    }
    ++pos;
  }
  // Triple alterations are accepted, anything beyond is a typo.
  if (alter > 3 || alter < -3) return false;

  out.step = step;
  out.alter = alter;
  return true;
}

}  // namespace

bool parseSpelledPitchClass(const std::string& str, SpelledPitchClass& out) {
  size_t pos = 0;
  SpelledPitchClass parsed;
  if (!parseNameAt(str, pos, parsed)) return false;
  if (pos != str.size()) return false;
  out = parsed;
  return true;
}

bool parseSpelledPitch(const std::string& str, SpelledPitch& out) {
  size_t pos = 0;
  SpelledPitch parsed;
  if (!parseNameAt(str, pos, parsed.name)) return false;
  if (pos >= str.size()) return false;

  int octave = 0;
  size_t digits = 0;
  while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
    octave = octave * 10 + (str[pos] - '0');
    ++pos;
    ++digits;
  }
  if (digits == 0 || digits > 2 || pos != str.size()) return false;
  parsed.octave = octave;

  int midi = parsed.midi();
  if (midi < kMidiPitchMin || midi > kMidiPitchMax) return false;
  out = parsed;
  return true;
}

std::string spelledPitchClassToString(const SpelledPitchClass& name) {
  std::string result(1, kStepLetters[name.step]);
  if (name.alter > 0) result.append(static_cast<size_t>(name.alter), '#');
  if (name.alter < 0) result.append(static_cast<size_t>(-name.alter), 'b');
  return result;
}

std::string spelledPitchToString(const SpelledPitch& pitch) {
  return spelledPitchClassToString(pitch.name) + std::to_string(pitch.octave);
}

SpelledPitchClass transposeSpelled(const SpelledPitchClass& name, int steps, int semitones) {
  SpelledPitchClass result;
  result.step = ((name.step + steps) % kNumSteps + kNumSteps) % kNumSteps;
  int target_pc = ((name.pitchClass() + semitones) % 12 + 12) % 12;
  int alter = ((target_pc - kStepPitchClass[result.step]) % 12 + 12) % 12;
  if (alter > 6) alter -= 12;
  result.alter = alter;
  return result;
}

std::string pitchToNoteName(uint8_t pitch) {
  int pitch_class = getPitchClass(pitch);
  int octave = getOctave(pitch);
  return std::string(kNoteNames[pitch_class]) + std::to_string(octave);
}

int absoluteInterval(uint8_t pitch_a, uint8_t pitch_b) {
  return std::abs(static_cast<int>(pitch_a) - static_cast<int>(pitch_b));
}

bool isParallelFifths(int interval1, int interval2) {
  int norm1 = interval_util::compoundToSimple(interval1);
  int norm2 = interval_util::compoundToSimple(interval2);
  return (norm1 == interval::kPerfect5th) && (norm2 == interval::kPerfect5th);
}

bool isParallelOctaves(int interval1, int interval2) {
  int norm1 = interval_util::compoundToSimple(interval1);
  int norm2 = interval_util::compoundToSimple(interval2);
  return (norm1 == interval::kUnison) && (norm2 == interval::kUnison);
}

}  // namespace figbass
