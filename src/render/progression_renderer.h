// Progression rendering -- text, JSON and MIDI tracks for realized
// progressions.

#ifndef FIGBASS_RENDER_PROGRESSION_RENDERER_H
#define FIGBASS_RENDER_PROGRESSION_RENDERER_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "figured_bass/chain.h"
#include "figured_bass/figured_bass_line.h"
#include "figured_bass/possibility.h"
#include "figured_bass/realizer_scale.h"
#include "figured_bass/voice.h"

namespace figbass {

/// @brief Result of rendering a progression to tracks.
struct RenderResult {
  bool success = false;
  std::string error_message;
  std::vector<Track> tracks;
};

/// @brief Check that a progression fits the line and voices.
/// @return False (with a message) if the length, the voice count or any bass
///         pitch differs from the input line.
bool checkBassFidelity(const FiguredBassLine& line, const std::vector<Voice>& voices,
                       const std::vector<Possibility>& progression, std::string* error);

/// @brief Spell a sounding pitch with a chord member's letter when one matches.
/// @param pitch MIDI pitch.
/// @param names Chord tones of the slot.
/// @return Name with octave, e.g. "F#4" or "Bb3"; sharps for non-chord tones.
std::string spellPitch(uint8_t pitch, const ChordPitchNames& names);

/// @brief One line per voice: label then the spelled pitch of every slot.
/// @param chain Pruned chain (voices and chord spellings).
/// @param progression Possibilities, one per slot.
std::string formatProgressionText(const Chain& chain, const std::vector<Possibility>& progression);

/// @brief Keyboard texture: upper voices in a right-hand track, bass in a
///        left-hand track.
RenderResult renderKeyboardTracks(const FiguredBassLine& line, const std::vector<Voice>& voices,
                                  const std::vector<Possibility>& progression);

/// @brief Chorale texture: one track per voice, named by its label.
RenderResult renderChoraleTracks(const FiguredBassLine& line, const std::vector<Voice>& voices,
                                 const std::vector<Possibility>& progression);

/// @brief Render in the given style.
RenderResult renderTracks(RenderStyle style, const FiguredBassLine& line,
                          const std::vector<Voice>& voices,
                          const std::vector<Possibility>& progression);

/// @brief JSON document with key, voices, rules, count and progressions.
///
/// Each progression is an array of slots; each slot an array of MIDI
/// pitches high to low.
std::string progressionsToJson(const Chain& chain, uint64_t count,
                               const std::vector<std::vector<Possibility>>& progressions);

}  // namespace figbass

#endif  // FIGBASS_RENDER_PROGRESSION_RENDERER_H
