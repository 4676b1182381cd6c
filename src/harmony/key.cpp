// Implementation of key signature parsing and degree lookup.

#include "harmony/key.h"

#include "core/scale.h"

namespace figbass {

bool keySignatureFromString(const std::string& str, KeySignature& out) {
  KeySignature result;

  auto underscore_pos = str.find('_');
  std::string note_part = str.substr(0, underscore_pos);
  if (!parseSpelledPitchClass(note_part, result.tonic)) return false;

  if (underscore_pos != std::string::npos) {
    std::string mode_part = str.substr(underscore_pos + 1);
    if (!scaleModeFromString(mode_part, result.mode)) return false;
  }

  out = result;
  return true;
}

std::string keySignatureToString(const KeySignature& key_sig) {
  return spelledPitchClassToString(key_sig.tonic) + "_" + scaleModeToString(key_sig.mode);
}

SpelledPitchClass pitchNameForDegree(const KeySignature& key_sig, int degree) {
  return scale_util::degreeName(key_sig.tonic, key_sig.mode, degree);
}

int degreeOfPitchName(const KeySignature& key_sig, const SpelledPitchClass& name) {
  return scale_util::degreeOfStep(key_sig.tonic, name.step);
}

}  // namespace figbass
