// Implementation of the figured-bass scale service.

#include "figured_bass/realizer_scale.h"

#include <algorithm>

namespace figbass {

std::vector<SpelledPitchClass> ChordPitchNames::names() const {
  std::vector<SpelledPitchClass> result;
  result.push_back(bass);
  for (const auto& member : members) {
    if (std::find(result.begin(), result.end(), member.name) == result.end()) {
      result.push_back(member.name);
    }
  }
  return result;
}

PitchClassMask ChordPitchNames::pitchClassMask() const {
  PitchClassMask mask = pitchClassBit(bass.pitchClass());
  for (const auto& member : members) mask |= pitchClassBit(member.name.pitchClass());
  return mask;
}

PitchClassMask ChordPitchNames::raisedMask() const {
  PitchClassMask mask = 0;
  for (const auto& member : members) {
    if (member.raised) mask |= pitchClassBit(member.name.pitchClass());
  }
  return mask;
}

FiguredBassScale::FiguredBassScale(const KeySignature& key) : key_(key) {}

ChordPitchNames FiguredBassScale::chordPitchNames(const SpelledPitchClass& bass,
                                                  const Figure& figure) const {
  ChordPitchNames result;
  result.bass = bass;

  ChordMember bass_member;
  bass_member.number = 1;
  bass_member.name = bass;
  result.members.push_back(bass_member);

  int bass_degree = degreeOfPitchName(key_, bass);
  for (const auto& entry : figure.entries) {
    SpelledPitchClass diatonic = pitchNameForDegree(key_, bass_degree + entry.number - 1);
    ChordMember member;
    member.number = entry.number;
    member.name = entry.modifier.apply(diatonic);
    member.raised = member.name.alter > diatonic.alter;
    result.members.push_back(member);
  }
  return result;
}

std::vector<uint8_t> FiguredBassScale::pitchesForScaleDegrees(PitchClassMask mask, int low,
                                                              int high) {
  std::vector<uint8_t> result;
  int first = std::max(low, kMidiPitchMin);
  int last = std::min(high, kMidiPitchMax);
  for (int pitch = first; pitch <= last; ++pitch) {
    if (mask & pitchClassBit(pitch % 12)) result.push_back(static_cast<uint8_t>(pitch));
  }
  return result;
}

int pitchClassCount(PitchClassMask mask) {
  int count = 0;
  for (int pc = 0; pc < 12; ++pc) {
    if (mask & pitchClassBit(pc)) ++count;
  }
  return count;
}

}  // namespace figbass
