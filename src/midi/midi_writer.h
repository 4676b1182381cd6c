// MIDI writer for realized progressions. Writes SMF Type 1 files from Track
// objects.

#ifndef FIGBASS_MIDI_MIDI_WRITER_H
#define FIGBASS_MIDI_MIDI_WRITER_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "harmony/key.h"

namespace figbass {

/// @brief Key signature meta-event values for a key.
/// @param key The key (modes use the signature of their relative major).
/// @param sharps_flats Receives -7..7 (negative = flats).
/// @param minor Receives true for the minor mode only.
/// @return False if the key needs more than seven sharps or flats.
bool keySignatureAccidentals(const KeySignature& key, int& sharps_flats, bool& minor);

/// @brief MIDI file writer that produces Standard MIDI File (SMF) Type 1 output.
///
/// Track 0 carries the track name "FIGBASS", tempo, time signature, key
/// signature and an optional "FIGBASS:" text event; every non-empty Track
/// follows as its own MTrk chunk. Pitches are written as given (sounding).
class MidiWriter {
 public:
  MidiWriter();

  /// @brief Build complete MIDI data from tracks.
  /// @param tracks Tracks with notes and raw events.
  /// @param tempo_events Tempo map; empty means 120 BPM.
  /// @param key Key for the key signature meta-event.
  /// @param metadata Optional JSON text to embed (e.g. the rules snapshot).
  void build(const std::vector<Track>& tracks, const std::vector<TempoEvent>& tempo_events,
             const KeySignature& key, const std::string& metadata = "");

  /// @brief Binary MIDI data after build().
  std::vector<uint8_t> toBytes() const;

  /// @brief Write built MIDI data to a file.
  /// @return True if the file was written successfully.
  bool writeToFile(const std::string& path) const;

 private:
  std::vector<uint8_t> data_;

  void writeHeader(uint16_t num_tracks, uint16_t division);
  void writeTrack(const Track& track);
  void writeMetadataTrack(const std::vector<TempoEvent>& tempo_events, const KeySignature& key,
                          const std::string& metadata);
  void appendChunk(const std::vector<uint8_t>& track_buf);
};

}  // namespace figbass

#endif  // FIGBASS_MIDI_MIDI_WRITER_H
