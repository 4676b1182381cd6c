// Implementation of special chord resolutions.

#include "figured_bass/resolution.h"

#include "core/basic_types.h"

namespace figbass {

const char* resolutionKindToString(ResolutionKind kind) {
  switch (kind) {
    case ResolutionKind::None:                  return "None";
    case ResolutionKind::DominantSeventh:       return "DominantSeventh";
    case ResolutionKind::DiminishedSeventh:     return "DiminishedSeventh";
    case ResolutionKind::AugmentedSixth:        return "AugmentedSixth";
    case ResolutionKind::ItalianAugmentedSixth: return "ItalianAugmentedSixth";
  }
  return "None";
}

ResolutionRequirement resolutionRequirementFor(const ChordAnalysis& analysis, const Rules& rules) {
  ResolutionRequirement req;
  if (analysis.quality == ChordQuality::Dominant7 || analysis.quality == ChordQuality::Diminished7) {
    bool dominant = analysis.quality == ChordQuality::Dominant7;
    if (dominant && !rules.resolve_dominant_seventh_properly) return req;
    if (!dominant && !rules.resolve_diminished_seventh_properly) return req;
    req.kind = dominant ? ResolutionKind::DominantSeventh : ResolutionKind::DiminishedSeventh;
    req.seventh.root = analysis.root;
    req.seventh.third = analysis.third;
    req.seventh.fifth = analysis.fifth;
    req.seventh.seventh = analysis.seventh;
    req.seventh.inversion = analysis.inversion;
    return req;
  }

  if (!analysis.isAugmentedSixth() || !rules.resolve_augmented_sixth_properly) return req;
  AugmentedSixthMembers& members = req.aug_sixth;
  members.quality = analysis.quality;
  members.bass = analysis.bass;
  members.sixth = transposeSpelled(analysis.bass, 5, interval::kMinor7th);
  members.tonic = transposeSpelled(analysis.bass, 2, interval::kMajor3rd);
  switch (analysis.quality) {
    case ChordQuality::FrenchSixth:
      members.has_other = true;
      members.other = transposeSpelled(analysis.bass, 3, interval::kTritone);
      break;
    case ChordQuality::GermanSixth:
      members.has_other = true;
      members.other = transposeSpelled(analysis.bass, 4, interval::kPerfect5th);
      break;
    case ChordQuality::SwissSixth:
      members.has_other = true;
      members.other = transposeSpelled(analysis.bass, 3, interval::kPerfect5th);
      break;
    default:
      break;
  }
  req.kind = members.has_other ? ResolutionKind::AugmentedSixth
                               : ResolutionKind::ItalianAugmentedSixth;
  return req;
}

namespace {

void addMotion(ResolutionPlan& plan, const SpelledPitchClass& name, int semitones) {
  PitchClassMotion motion;
  motion.pitch_class = name.pitchClass();
  motion.semitones = semitones;
  plan.motions.push_back(motion);
}

ResolutionPlan prescribed(const char* description) {
  ResolutionPlan plan;
  plan.method = ResolutionMethod::Prescribed;
  plan.description = description;
  return plan;
}

bool isMajor(const ChordAnalysis& chord) { return chord.quality == ChordQuality::Major; }
bool isMinor(const ChordAnalysis& chord) { return chord.quality == ChordQuality::Minor; }

ResolutionPlan planDominantSeventh(const SeventhChordMembers& dom, const ChordAnalysis& target) {
  ResolutionPlan ordinary;
  SpelledPitchClass tonic = transposeSpelled(dom.root, 3, interval::kPerfect4th);
  SpelledPitchClass subdominant = transposeSpelled(tonic, 3, interval::kPerfect4th);
  SpelledPitchClass major_submediant = transposeSpelled(tonic, 5, interval::kMajor6th);
  SpelledPitchClass minor_submediant = transposeSpelled(tonic, 5, interval::kMinor6th);
  bool v43_to_i6 = dom.inversion == 2 && target.inversion == 1;
  bool root_position = dom.inversion == 0;

  // V7 -> I is normally incomplete (missing fifth).
  bool relax = root_position && target.has_root && target.root == tonic &&
               target.isConsonantTriad();
  ordinary.relax_target_completeness = relax;
  if (!target.has_root) return ordinary;

  ResolutionPlan plan;
  if (target.root == tonic && isMajor(target)) {
    plan = prescribed("dominant seventh to major tonic");
    // The root moves to the tonic only in the bass; upper roots stay.
    addMotion(plan, dom.third, 1);
    addMotion(plan, dom.fifth, v43_to_i6 ? 2 : -2);
    addMotion(plan, dom.seventh, v43_to_i6 ? 2 : -1);
  } else if (target.root == tonic && isMinor(target)) {
    plan = prescribed("dominant seventh to minor tonic");
    addMotion(plan, dom.third, 1);
    addMotion(plan, dom.fifth, v43_to_i6 ? 1 : -2);
    addMotion(plan, dom.seventh, v43_to_i6 ? 2 : -2);
  } else if (target.root == major_submediant && isMinor(target) && root_position) {
    plan = prescribed("dominant seventh to minor submediant");
    addMotion(plan, dom.root, 2);
    addMotion(plan, dom.third, 1);
    addMotion(plan, dom.fifth, -2);
    addMotion(plan, dom.seventh, -1);
  } else if (target.root == minor_submediant && isMajor(target) && root_position) {
    plan = prescribed("dominant seventh to major submediant");
    addMotion(plan, dom.root, 1);
    addMotion(plan, dom.third, 1);
    addMotion(plan, dom.fifth, -2);
    addMotion(plan, dom.seventh, -2);
  } else if (target.root == subdominant && isMajor(target) && root_position) {
    plan = prescribed("dominant seventh to major subdominant");
    addMotion(plan, dom.root, 2);
    addMotion(plan, dom.third, 1);
    addMotion(plan, dom.fifth, -2);
  } else if (target.root == subdominant && isMinor(target) && root_position) {
    plan = prescribed("dominant seventh to minor subdominant");
    addMotion(plan, dom.root, 1);
    addMotion(plan, dom.third, 1);
    addMotion(plan, dom.fifth, -2);
  } else {
    return ordinary;
  }
  plan.relax_target_completeness = relax;
  return plan;
}

ResolutionPlan planDiminishedSeventh(const SeventhChordMembers& dim, const ChordAnalysis& target,
                                     const Rules& rules) {
  ResolutionPlan ordinary;
  if (!target.has_root) return ordinary;
  SpelledPitchClass tonic = transposeSpelled(dim.root, 1, interval::kMinor2nd);
  SpelledPitchClass subdominant = transposeSpelled(tonic, 3, interval::kPerfect4th);

  bool doubled_root = rules.doubled_root_in_dim7;
  if (rules.dim7_doubling_from_context && dim.inversion == 1) {
    if (target.inversion == 0) doubled_root = true;
    if (target.inversion == 1) doubled_root = false;
  }

  ResolutionPlan plan;
  if (target.root == tonic && isMajor(target)) {
    plan = prescribed(doubled_root ? "diminished seventh to major tonic (doubled root)"
                                   : "diminished seventh to major tonic (doubled third)");
    addMotion(plan, dim.root, 1);
    addMotion(plan, dim.third, doubled_root ? -2 : 2);
    addMotion(plan, dim.fifth, -1);
    addMotion(plan, dim.seventh, -1);
  } else if (target.root == tonic && isMinor(target)) {
    plan = prescribed(doubled_root ? "diminished seventh to minor tonic (doubled root)"
                                   : "diminished seventh to minor tonic (doubled third)");
    addMotion(plan, dim.root, 1);
    addMotion(plan, dim.third, doubled_root ? -2 : 1);
    addMotion(plan, dim.fifth, -2);
    addMotion(plan, dim.seventh, -1);
  } else if (target.root == subdominant && isMajor(target)) {
    plan = prescribed("diminished seventh to major subdominant");
    addMotion(plan, dim.root, 1);
    addMotion(plan, dim.third, -2);
    addMotion(plan, dim.seventh, 1);
  } else if (target.root == subdominant && isMinor(target)) {
    plan = prescribed("diminished seventh to minor subdominant");
    addMotion(plan, dim.root, 1);
    addMotion(plan, dim.third, -2);
  } else {
    return ordinary;
  }
  return plan;
}

ResolutionPlan planAugmentedSixth(const AugmentedSixthMembers& aug, const ChordAnalysis& target) {
  ResolutionPlan ordinary;
  SpelledPitchClass dominant = transposeSpelled(aug.tonic, 4, interval::kPerfect5th);
  bool tonic_six_four = target.inversion == 2 && target.has_root && target.root == aug.tonic;
  bool french = aug.quality == ChordQuality::FrenchSixth;

  ResolutionPlan plan;
  if (tonic_six_four && isMajor(target)) {
    plan = prescribed("augmented sixth to major tonic six-four");
    addMotion(plan, aug.other, french ? 2 : 1);
  } else if (tonic_six_four && isMinor(target)) {
    plan = prescribed("augmented sixth to minor tonic six-four");
    addMotion(plan, aug.other, french ? 1 : 0);
  } else if (target.bass == dominant && isMajor(target)) {
    plan = prescribed("augmented sixth to dominant");
    addMotion(plan, aug.tonic, -1);
    addMotion(plan, aug.other, french ? 0 : -1);
  } else {
    return ordinary;
  }
  addMotion(plan, aug.bass, -1);
  addMotion(plan, aug.sixth, 1);
  return plan;
}

ResolutionPlan planItalianSixth(const AugmentedSixthMembers& aug, const Rules& rules) {
  ResolutionPlan plan;
  plan.method = ResolutionMethod::ItalianSixth;
  plan.description = "Italian augmented sixth";
  plan.italian_bass_pc = aug.bass.pitchClass();
  plan.italian_sixth_pc = aug.sixth.pitchClass();
  plan.italian_tonic_pc = aug.tonic.pitchClass();
  plan.restrict_doublings = rules.restrict_doublings_in_italian_a6_resolution;
  return plan;
}

}  // namespace

ResolutionPlan planResolution(const ResolutionRequirement& requirement,
                              const ChordAnalysis& target, const Rules& rules) {
  switch (requirement.kind) {
    case ResolutionKind::DominantSeventh:
      return planDominantSeventh(requirement.seventh, target);
    case ResolutionKind::DiminishedSeventh:
      return planDiminishedSeventh(requirement.seventh, target, rules);
    case ResolutionKind::AugmentedSixth:
      return planAugmentedSixth(requirement.aug_sixth, target);
    case ResolutionKind::ItalianAugmentedSixth:
      return planItalianSixth(requirement.aug_sixth, rules);
    case ResolutionKind::None:
      break;
  }
  return ResolutionPlan();
}

bool resolvePossibility(const ResolutionPlan& plan, const Possibility& possib_a,
                        Possibility& out) {
  Possibility resolved = possib_a;
  if (resolved.empty()) {
    out = resolved;
    return true;
  }
  for (size_t idx = 0; idx + 1 < resolved.size(); ++idx) {
    int pitch = resolved[idx];
    for (const auto& motion : plan.motions) {
      if (getPitchClass(resolved[idx]) == motion.pitch_class) {
        pitch += motion.semitones;
        break;
      }
    }
    if (pitch < kMidiPitchMin || pitch > kMidiPitchMax) return false;
    resolved[idx] = static_cast<uint8_t>(pitch);
  }
  out = resolved;
  return true;
}

bool followsResolution(const ResolutionPlan& plan, const Possibility& possib_a,
                       const Possibility& possib_b) {
  if (possib_a.size() != possib_b.size()) return false;
  Possibility resolved;
  if (!resolvePossibility(plan, possib_a, resolved)) return false;
  for (size_t idx = 0; idx + 1 < resolved.size(); ++idx) {
    if (resolved[idx] != possib_b[idx]) return false;
  }
  return true;
}

bool isItalianSixthResolution(const ResolutionPlan& plan, const Possibility& possib_a,
                              const Possibility& possib_b) {
  if (possib_a.size() != possib_b.size() || possib_a.empty()) return false;
  uint8_t bass_a = possib_a.back();
  bool sixth_resolved = false;
  for (size_t idx = 0; idx < possib_a.size(); ++idx) {
    int pitch_class = getPitchClass(possib_a[idx]);
    int motion = directedInterval(possib_a[idx], possib_b[idx]);
    if (pitch_class == plan.italian_tonic_pc) {
      if (motion != 0 && motion != 4 && motion != 3 && motion != 2 && motion != -1) return false;
    } else if (pitch_class == plan.italian_bass_pc && possib_a[idx] == bass_a) {
      if (motion != -1) return false;
    } else if (pitch_class == plan.italian_sixth_pc) {
      if (sixth_resolved && plan.restrict_doublings) return false;
      if (motion != 1) return false;
      sixth_resolved = true;
    } else if (pitch_class == plan.italian_bass_pc) {
      if (plan.restrict_doublings) return false;
      if (motion != -1) return false;
    }
  }
  return true;
}

}  // namespace figbass
