// Basic types shared by the figured-bass engine, renderer and MIDI output.

#ifndef FIGBASS_CORE_BASIC_TYPES_H
#define FIGBASS_CORE_BASIC_TYPES_H

#include <cstdint>
#include <string>
#include <vector>

namespace figbass {

/// Tick type for MIDI timing (absolute tick position).
using Tick = uint32_t;

/// Ticks per quarter note (standard MIDI resolution).
constexpr Tick kTicksPerBeat = 480;
constexpr uint8_t kBeatsPerBar = 4;
constexpr Tick kTicksPerBar = kTicksPerBeat * kBeatsPerBar;  // 1920

// ---------------------------------------------------------------------------
// Duration constants (in ticks)
// ---------------------------------------------------------------------------

constexpr Tick kWholeNote = kTicksPerBar;       // 1920
constexpr Tick kHalfNote = kTicksPerBeat * 2;   // 960
constexpr Tick kQuarterNote = kTicksPerBeat;    // 480
constexpr Tick kEighthNote = kTicksPerBeat / 2; // 240

/// MIDI note number of middle C.
constexpr uint8_t kMidiC4 = 60;

/// Lowest and highest valid MIDI note numbers.
constexpr int kMidiPitchMin = 0;
constexpr int kMidiPitchMax = 127;

/// Voice identifier (index into the sorted voice list, 0 = highest).
using VoiceId = uint8_t;

// ---------------------------------------------------------------------------
// Enums
// ---------------------------------------------------------------------------

/// Diatonic mode of a key. Minor is the natural minor.
enum class ScaleMode : uint8_t {
  Major,
  Minor,
  Dorian,
  Phrygian
};

/// @brief Convert ScaleMode to lowercase string ("major", "minor", ...).
const char* scaleModeToString(ScaleMode mode);

/// @brief Parse a mode name (case-insensitive).
/// @param str Mode name such as "major" or "Dorian".
/// @param mode Output mode, written only on success.
/// @return True if the name was recognized.
bool scaleModeFromString(const std::string& str, ScaleMode& mode);

/// Output layout for a realized progression.
enum class RenderStyle : uint8_t {
  Keyboard,  ///< Upper voices in the right hand, bass in the left hand.
  Chorale    ///< One staff/track per voice.
};

/// @brief Convert RenderStyle to string ("keyboard" or "chorale").
const char* renderStyleToString(RenderStyle style);

/// @brief Parse a render style string; unknown values map to Keyboard.
RenderStyle renderStyleFromString(const std::string& str);

// ---------------------------------------------------------------------------
// Data structures
// ---------------------------------------------------------------------------

/// Raw MIDI event (CC, pitch bend, etc.).
struct MidiEvent {
  Tick tick = 0;
  uint8_t status = 0;
  uint8_t data1 = 0;
  uint8_t data2 = 0;
};

/// Note event -- one sounding pitch of one voice.
struct NoteEvent {
  Tick start_tick = 0;
  Tick duration = 0;
  uint8_t pitch = 0;
  uint8_t velocity = 80;
  VoiceId voice = 0;
};

/// Track: a collection of note events on a single MIDI channel.
struct Track {
  uint8_t channel = 0;
  uint8_t program = 0;  // GM program number
  std::string name;
  std::vector<NoteEvent> notes;
  std::vector<MidiEvent> events;  // Raw MIDI events (CC, pitch bend, etc.)
};

/// Tempo change event.
struct TempoEvent {
  Tick tick = 0;
  uint16_t bpm = 120;
};

}  // namespace figbass

#endif  // FIGBASS_CORE_BASIC_TYPES_H
