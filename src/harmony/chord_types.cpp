// Implementation of spelled chord analysis.

#include "harmony/chord_types.h"

namespace figbass {

const char* chordQualityToString(ChordQuality quality) {
  switch (quality) {
    case ChordQuality::Major:        return "Major";
    case ChordQuality::Minor:        return "Minor";
    case ChordQuality::Diminished:   return "Diminished";
    case ChordQuality::Augmented:    return "Augmented";
    case ChordQuality::Dominant7:    return "Dominant7";
    case ChordQuality::Diminished7:  return "Diminished7";
    case ChordQuality::ItalianSixth: return "ItalianSixth";
    case ChordQuality::FrenchSixth:  return "FrenchSixth";
    case ChordQuality::GermanSixth:  return "GermanSixth";
    case ChordQuality::SwissSixth:   return "SwissSixth";
    case ChordQuality::Other:        return "Other";
  }
  return "Other";
}

namespace {

/// Semitones from one spelling up to another (0-11).
int semitonesAbove(const SpelledPitchClass& from, const SpelledPitchClass& to) {
  return ((to.pitchClass() - from.pitchClass()) % 12 + 12) % 12;
}

std::vector<SpelledPitchClass> distinctNames(const std::vector<SpelledPitchClass>& names,
                                             const SpelledPitchClass& bass) {
  std::vector<SpelledPitchClass> result;
  result.push_back(bass);
  for (const auto& name : names) {
    bool seen = false;
    for (const auto& existing : result) {
      if (existing == name) seen = true;
    }
    if (!seen) result.push_back(name);
  }
  return result;
}

/// @brief Classify augmented sixth chords from intervals above the bass.
ChordQuality augmentedSixthQuality(const std::vector<SpelledPitchClass>& names,
                                   const SpelledPitchClass& bass) {
  bool has_sixth = false;
  bool has_third = false;
  bool has_french = false;
  bool has_german = false;
  bool has_swiss = false;
  for (const auto& name : names) {
    if (name == bass) continue;
    int steps = stepDistance(bass, name);
    int semis = semitonesAbove(bass, name);
    if (steps == 5 && semis == 10) {
      has_sixth = true;
    } else if (steps == 2 && semis == 4) {
      has_third = true;
    } else if (steps == 3 && semis == 6) {
      has_french = true;
    } else if (steps == 4 && semis == 7) {
      has_german = true;
    } else if (steps == 3 && semis == 7) {
      has_swiss = true;
    } else {
      return ChordQuality::Other;
    }
  }
  if (!has_sixth || !has_third) return ChordQuality::Other;
  int extras = (has_french ? 1 : 0) + (has_german ? 1 : 0) + (has_swiss ? 1 : 0);
  if (extras == 0) return ChordQuality::ItalianSixth;
  if (extras > 1) return ChordQuality::Other;
  if (has_french) return ChordQuality::FrenchSixth;
  if (has_german) return ChordQuality::GermanSixth;
  return ChordQuality::SwissSixth;
}

/// @brief Find the member from which every other member is a letter third,
///        fifth or seventh above, each distance used at most once.
bool findTertianRoot(const std::vector<SpelledPitchClass>& names, SpelledPitchClass& root) {
  for (const auto& candidate : names) {
    bool used[7] = {false, false, false, false, false, false, false};
    bool valid = true;
    for (const auto& name : names) {
      int steps = stepDistance(candidate, name);
      if ((steps % 2) != 0 || used[steps]) {
        valid = false;
        break;
      }
      used[steps] = true;
    }
    if (valid) {
      root = candidate;
      return true;
    }
  }
  return false;
}

}  // namespace

ChordAnalysis analyzeChord(const std::vector<SpelledPitchClass>& names,
                           const SpelledPitchClass& bass) {
  ChordAnalysis result;
  result.bass = bass;
  std::vector<SpelledPitchClass> members = distinctNames(names, bass);

  // Augmented sixths are spelled with a diminished third, so check them first.
  ChordQuality aug_quality = augmentedSixthQuality(members, bass);

  SpelledPitchClass root;
  if (findTertianRoot(members, root)) {
    result.has_root = true;
    result.root = root;
    for (const auto& name : members) {
      switch (stepDistance(root, name)) {
        case 2: result.has_third = true; result.third = name; break;
        case 4: result.has_fifth = true; result.fifth = name; break;
        case 6: result.has_seventh = true; result.seventh = name; break;
        default: break;
      }
    }
    result.inversion = stepDistance(root, bass) / 2;
  }

  if (aug_quality != ChordQuality::Other) {
    result.quality = aug_quality;
    return result;
  }
  if (!result.has_root || !result.has_third || !result.has_fifth) return result;

  int third = semitonesAbove(root, result.third);
  int fifth = semitonesAbove(root, result.fifth);
  if (!result.has_seventh && members.size() == 3) {
    if (third == 4 && fifth == 7) result.quality = ChordQuality::Major;
    if (third == 3 && fifth == 7) result.quality = ChordQuality::Minor;
    if (third == 3 && fifth == 6) result.quality = ChordQuality::Diminished;
    if (third == 4 && fifth == 8) result.quality = ChordQuality::Augmented;
  } else if (result.has_seventh && members.size() == 4) {
    int seventh = semitonesAbove(root, result.seventh);
    if (third == 4 && fifth == 7 && seventh == 10) result.quality = ChordQuality::Dominant7;
    if (third == 3 && fifth == 6 && seventh == 9) result.quality = ChordQuality::Diminished7;
  }
  return result;
}

}  // namespace figbass
