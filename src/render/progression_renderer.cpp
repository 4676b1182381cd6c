// Implementation of progression rendering.

#include "render/progression_renderer.h"

#include <algorithm>

#include "core/gm_program.h"
#include "core/json_helpers.h"
#include "core/pitch_utils.h"
#include "figured_bass/rules.h"
#include "harmony/chord_types.h"
#include "harmony/key.h"

namespace figbass {

namespace {

/// Start tick of every slot.
std::vector<Tick> slotStarts(const FiguredBassLine& line) {
  std::vector<Tick> starts;
  Tick tick = 0;
  for (const auto& note : line.notes) {
    starts.push_back(tick);
    tick += note.duration;
  }
  return starts;
}

void addVoiceNotes(Track& track, const FiguredBassLine& line,
                   const std::vector<Possibility>& progression, size_t voice) {
  std::vector<Tick> starts = slotStarts(line);
  for (size_t slot = 0; slot < progression.size(); ++slot) {
    NoteEvent note;
    note.start_tick = starts[slot];
    note.duration = line.notes[slot].duration;
    note.pitch = progression[slot][voice];
    note.voice = static_cast<VoiceId>(voice);
    track.notes.push_back(note);
  }
}

}  // namespace

bool checkBassFidelity(const FiguredBassLine& line, const std::vector<Voice>& voices,
                       const std::vector<Possibility>& progression, std::string* error) {
  auto fail = [error](const std::string& message) {
    if (error) *error = message;
    return false;
  };
  if (progression.size() != line.notes.size()) {
    return fail("progression has " + std::to_string(progression.size()) + " slots, line has " +
                std::to_string(line.notes.size()) + " notes");
  }
  for (size_t slot = 0; slot < progression.size(); ++slot) {
    const Possibility& possib = progression[slot];
    if (possib.size() != voices.size()) {
      return fail("slot " + std::to_string(slot) + " has " + std::to_string(possib.size()) +
                  " pitches for " + std::to_string(voices.size()) + " voices");
    }
    int expected = line.notes[slot].pitch.midi();
    if (possib.back() != expected) {
      return fail("slot " + std::to_string(slot) + " bass " + pitchToNoteName(possib.back()) +
                  " differs from input " + spelledPitchToString(line.notes[slot].pitch));
    }
  }
  return true;
}

std::string spellPitch(uint8_t pitch, const ChordPitchNames& names) {
  for (const auto& name : names.names()) {
    if (name.pitchClass() != getPitchClass(pitch)) continue;
    SpelledPitch spelled;
    spelled.name = name;
    int letter_pitch = kStepPitchClass[name.step] + name.alter;
    spelled.octave = (static_cast<int>(pitch) - letter_pitch) / 12 - 1;
    return spelledPitchToString(spelled);
  }
  return pitchToNoteName(pitch);
}

std::string formatProgressionText(const Chain& chain, const std::vector<Possibility>& progression) {
  const std::vector<Voice>& voices = chain.voices();
  size_t label_width = 0;
  for (const auto& voice : voices) label_width = std::max(label_width, voice.label.size());

  std::vector<std::vector<std::string>> cells(voices.size());
  std::vector<size_t> widths(progression.size(), 0);
  for (size_t slot = 0; slot < progression.size() && slot < chain.numSlots(); ++slot) {
    const ChordPitchNames& names = chain.slot(slot).pitchNames();
    for (size_t voice = 0; voice < voices.size() && voice < progression[slot].size(); ++voice) {
      std::string cell = spellPitch(progression[slot][voice], names);
      widths[slot] = std::max(widths[slot], cell.size());
      cells[voice].push_back(cell);
    }
  }

  std::string text;
  for (size_t voice = 0; voice < voices.size(); ++voice) {
    std::string line = voices[voice].label;
    line.resize(label_width, ' ');
    for (size_t slot = 0; slot < cells[voice].size(); ++slot) {
      std::string cell = cells[voice][slot];
      cell.resize(widths[slot], ' ');
      line += "  " + cell;
    }
    while (!line.empty() && line.back() == ' ') line.pop_back();
    text += line + "\n";
  }
  return text;
}

RenderResult renderKeyboardTracks(const FiguredBassLine& line, const std::vector<Voice>& voices,
                                  const std::vector<Possibility>& progression) {
  RenderResult result;
  if (!checkBassFidelity(line, voices, progression, &result.error_message)) return result;

  Track right;
  right.channel = 0;
  right.program = GmProgram::kHarpsichord;
  right.name = "Right hand";
  for (size_t voice = 0; voice + 1 < voices.size(); ++voice) {
    addVoiceNotes(right, line, progression, voice);
  }

  Track left;
  left.channel = 1;
  left.program = GmProgram::kHarpsichord;
  left.name = "Left hand";
  addVoiceNotes(left, line, progression, voices.size() - 1);

  result.tracks.push_back(right);
  result.tracks.push_back(left);
  result.success = true;
  return result;
}

RenderResult renderChoraleTracks(const FiguredBassLine& line, const std::vector<Voice>& voices,
                                 const std::vector<Possibility>& progression) {
  RenderResult result;
  if (!checkBassFidelity(line, voices, progression, &result.error_message)) return result;

  uint8_t channel = 0;
  for (size_t voice = 0; voice < voices.size(); ++voice) {
    if (channel == 9) ++channel;  // GM percussion
    Track track;
    track.channel = channel++ & 0x0F;
    track.program = GmProgram::kChoirAahs;
    track.name = voices[voice].label;
    addVoiceNotes(track, line, progression, voice);
    result.tracks.push_back(track);
  }
  result.success = true;
  return result;
}

RenderResult renderTracks(RenderStyle style, const FiguredBassLine& line,
                          const std::vector<Voice>& voices,
                          const std::vector<Possibility>& progression) {
  if (style == RenderStyle::Chorale) return renderChoraleTracks(line, voices, progression);
  return renderKeyboardTracks(line, voices, progression);
}

std::string progressionsToJson(const Chain& chain, uint64_t count,
                               const std::vector<std::vector<Possibility>>& progressions) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("key");
  writer.value(keySignatureToString(chain.key()));

  writer.key("voices");
  writer.beginArray();
  for (const auto& voice : chain.voices()) {
    PitchRange sounding = voice.soundingRange();
    writer.beginObject();
    writer.key("label");
    writer.value(voice.label);
    writer.key("low");
    writer.value(sounding.lowest);
    writer.key("high");
    writer.value(sounding.highest);
    writer.key("max_separation");
    writer.value(voice.max_separation);
    writer.endObject();
  }
  writer.endArray();

  writer.key("rules");
  writeRulesJson(writer, chain.rules());

  writer.key("slots");
  writer.beginArray();
  for (size_t idx = 0; idx < chain.numSlots(); ++idx) {
    const Segment& segment = chain.slot(idx);
    writer.beginObject();
    writer.key("bass");
    writer.value(spelledPitchToString(segment.bass()));
    writer.key("figure");
    writer.value(segment.figure().notation);
    writer.key("chord");
    writer.value(chordQualityToString(segment.analysis().quality));
    writer.key("realizations");
    writer.value(static_cast<uint64_t>(segment.numAlive()));
    writer.endObject();
  }
  writer.endArray();

  writer.key("count");
  writer.value(count);

  writer.key("progressions");
  writer.beginArray();
  for (const auto& progression : progressions) {
    writer.beginArray();
    for (const auto& possib : progression) {
      writer.beginArray();
      for (uint8_t pitch : possib) writer.value(static_cast<int>(pitch));
      writer.endArray();
    }
    writer.endArray();
  }
  writer.endArray();
  writer.endObject();
  return writer.toString();
}

}  // namespace figbass
