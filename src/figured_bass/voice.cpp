// Implementation of the voice and range model.

#include "figured_bass/voice.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>

#include "core/basic_types.h"
#include "core/pitch_utils.h"

namespace figbass {

std::vector<uint8_t> PitchRange::filter(const std::vector<uint8_t>& pitches) const {
  std::vector<uint8_t> result;
  for (uint8_t pitch : pitches) {
    if (contains(pitch)) result.push_back(pitch);
  }
  return result;
}

bool voiceSortsBefore(const Voice& lhs, const Voice& rhs) {
  PitchRange lhs_range = lhs.soundingRange();
  PitchRange rhs_range = rhs.soundingRange();
  if (rhs_range < lhs_range) return true;
  if (lhs_range < rhs_range) return false;
  return lhs.label < rhs.label;
}

void sortVoices(std::vector<Voice>& voices) {
  std::stable_sort(voices.begin(), voices.end(), voiceSortsBefore);
}

bool validateVoices(const std::vector<Voice>& voices, std::string* error) {
  auto fail = [error](const std::string& message) {
    if (error) *error = message;
    return false;
  };
  if (voices.size() < 2) return fail("at least two voices (one upper voice and the bass) are required");

  std::set<std::string> labels;
  for (const auto& voice : voices) {
    if (voice.label.empty()) return fail("voice label must not be empty");
    if (!labels.insert(voice.label).second) return fail("duplicate voice label '" + voice.label + "'");
    if (voice.range.lowest > voice.range.highest) {
      return fail("voice '" + voice.label + "' has an inverted range");
    }
    PitchRange sounding = voice.soundingRange();
    if (sounding.lowest < kMidiPitchMin || sounding.highest > kMidiPitchMax) {
      return fail("voice '" + voice.label + "' sounds outside MIDI 0-127");
    }
    if (voice.max_separation < 0) {
      return fail("voice '" + voice.label + "' has a negative max separation");
    }
  }
  return true;
}

std::vector<Voice> keyboardVoices(int num_upper) {
  std::vector<Voice> voices;
  for (int idx = 1; idx <= num_upper; ++idx) {
    Voice voice;
    voice.label = std::to_string(idx);
    voice.range = PitchRange{21, 83};  // A0-B5
    voice.max_separation = 12;
    voice.clef = "treble";
    voices.push_back(voice);
  }
  Voice bass;
  bass.label = "B";
  bass.range = PitchRange{21, 64};  // A0-E4
  bass.max_separation = kUnlimitedSeparation;
  bass.clef = "bass";
  voices.push_back(bass);
  sortVoices(voices);
  return voices;
}

std::vector<Voice> choraleVoices() {
  std::vector<Voice> voices = {
      {"S", PitchRange{60, 79}, 0, 12, "treble"},      // C4-G5
      {"A", PitchRange{55, 74}, 0, 12, "treble"},      // G3-D5
      {"T", PitchRange{48, 67}, 0, 12, "treble_8vb"},  // C3-G4
      {"B", PitchRange{40, 62}, 0, 24, "bass"},        // E2-D4
  };
  sortVoices(voices);
  return voices;
}

namespace {

/// @brief Parse "LABEL=LOW-HIGH[/SEP]".
bool parseVoiceEntry(const std::string& entry, Voice& voice, std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) *error = message + " in '" + entry + "'";
    return false;
  };
  size_t eq = entry.find('=');
  if (eq == std::string::npos || eq == 0) return fail("expected LABEL=LOW-HIGH");
  voice.label = entry.substr(0, eq);

  std::string rest = entry.substr(eq + 1);
  size_t slash = rest.find('/');
  if (slash != std::string::npos) {
    std::string sep = rest.substr(slash + 1);
    char* end = nullptr;
    long value = std::strtol(sep.c_str(), &end, 10);
    if (sep.empty() || *end != '\0' || value < 0) return fail("bad separation");
    voice.max_separation = static_cast<int>(value);
    rest = rest.substr(0, slash);
  }

  // Pitch names may contain '-' as a flat sign, so split at the first '-'
  // that follows an octave digit.
  size_t dash = std::string::npos;
  for (size_t pos = 1; pos < rest.size(); ++pos) {
    if (rest[pos] == '-' && std::isdigit(static_cast<unsigned char>(rest[pos - 1]))) {
      dash = pos;
      break;
    }
  }
  if (dash == std::string::npos) return fail("expected LOW-HIGH range");
  SpelledPitch low;
  SpelledPitch high;
  if (!parseSpelledPitch(rest.substr(0, dash), low) ||
      !parseSpelledPitch(rest.substr(dash + 1), high)) {
    return fail("bad pitch");
  }
  voice.range = PitchRange{low.midi(), high.midi()};
  voice.clef = low.midi() < kMidiC4 ? "bass" : "treble";
  return true;
}

}  // namespace

bool voicesFromString(const std::string& text, std::vector<Voice>& out, std::string* error) {
  std::vector<Voice> voices;
  if (text == "keyboard") {
    voices = keyboardVoices(3);
  } else if (text == "chorale") {
    voices = choraleVoices();
  } else if (!text.empty() && text.find('=') == std::string::npos) {
    char* end = nullptr;
    long count = std::strtol(text.c_str(), &end, 10);
    if (*end != '\0' || count < 2 || count > 8) {
      if (error) *error = "voice count must be between 2 and 8";
      return false;
    }
    voices = keyboardVoices(static_cast<int>(count) - 1);
  } else {
    size_t start = 0;
    while (start <= text.size()) {
      size_t comma = text.find(',', start);
      if (comma == std::string::npos) comma = text.size();
      Voice voice;
      if (!parseVoiceEntry(text.substr(start, comma - start), voice, error)) return false;
      voices.push_back(voice);
      start = comma + 1;
    }
  }

  if (!validateVoices(voices, error)) return false;
  sortVoices(voices);
  out = voices;
  return true;
}

}  // namespace figbass
