// SMF Type 1 MIDI file writer.

#include "midi/midi_writer.h"

#include <algorithm>
#include <cstdio>
#include <iterator>

#include "midi/midi_stream.h"

namespace figbass {

namespace {

/// @brief Internal event representation for sorting before writing.
struct WriteEvent {
  uint32_t tick = 0;
  uint8_t status = 0;
  uint8_t data1 = 0;
  uint8_t data2 = 0;
  int priority = 0;  // Lower = earlier at same tick (note-off before note-on)
};

/// Position on the circle of fifths of each natural letter (C=0 ... B=6).
constexpr int kLetterFifths[7] = {0, 2, 4, -1, 1, 3, 5};

void writeEndOfTrack(std::vector<uint8_t>& buf) {
  writeVariableLength(buf, 0);
  buf.push_back(0xFF);
  buf.push_back(0x2F);
  buf.push_back(0x00);
}

}  // namespace

bool keySignatureAccidentals(const KeySignature& key, int& sharps_flats, bool& minor) {
  SpelledPitchClass relative_major = key.tonic;
  switch (key.mode) {
    case ScaleMode::Major:
      break;
    case ScaleMode::Minor:
      relative_major = transposeSpelled(key.tonic, 2, interval::kMinor3rd);
      break;
    case ScaleMode::Dorian:
      relative_major = transposeSpelled(key.tonic, 6, interval::kMinor7th);
      break;
    case ScaleMode::Phrygian:
      relative_major = transposeSpelled(key.tonic, 5, interval::kMinor6th);
      break;
  }
  int fifths = kLetterFifths[relative_major.step] + 7 * relative_major.alter;
  if (fifths < -7 || fifths > 7) return false;
  sharps_flats = fifths;
  minor = key.mode == ScaleMode::Minor;
  return true;
}

MidiWriter::MidiWriter() = default;

void MidiWriter::build(const std::vector<Track>& tracks,
                       const std::vector<TempoEvent>& tempo_events, const KeySignature& key,
                       const std::string& metadata) {
  data_.clear();

  uint16_t num_content_tracks = 0;
  for (const auto& track : tracks) {
    if (!track.notes.empty() || !track.events.empty()) ++num_content_tracks;
  }

  writeHeader(static_cast<uint16_t>(num_content_tracks + 1), kTicksPerBeat);
  writeMetadataTrack(tempo_events, key, metadata);
  for (const auto& track : tracks) {
    if (!track.notes.empty() || !track.events.empty()) writeTrack(track);
  }
}

std::vector<uint8_t> MidiWriter::toBytes() const {
  return data_;
}

bool MidiWriter::writeToFile(const std::string& path) const {
  FILE* file = std::fopen(path.c_str(), "wb");
  if (!file) return false;
  size_t written = std::fwrite(data_.data(), 1, data_.size(), file);
  bool closed = std::fclose(file) == 0;
  return closed && written == data_.size();
}

void MidiWriter::writeHeader(uint16_t num_tracks, uint16_t division) {
  writeChunkTag(data_, "MThd");
  writeBE32(data_, 6);
  writeBE16(data_, 1);  // Format 1 (multi-track)
  writeBE16(data_, num_tracks);
  writeBE16(data_, division);
}

void MidiWriter::appendChunk(const std::vector<uint8_t>& track_buf) {
  writeChunkTag(data_, "MTrk");
  writeBE32(data_, static_cast<uint32_t>(track_buf.size()));
  data_.insert(data_.end(), track_buf.begin(), track_buf.end());
}

void MidiWriter::writeTrack(const Track& track) {
  std::vector<uint8_t> track_buf;

  writeVariableLength(track_buf, 0);
  track_buf.push_back(static_cast<uint8_t>(0xC0 | (track.channel & 0x0F)));
  track_buf.push_back(track.program & 0x7F);
  if (!track.name.empty()) writeTextMetaEvent(track_buf, 0x03, track.name);

  std::vector<WriteEvent> events;
  events.reserve(track.notes.size() * 2 + track.events.size());
  for (const auto& note : track.notes) {
    WriteEvent on_event;
    on_event.tick = note.start_tick;
    on_event.status = static_cast<uint8_t>(0x90 | (track.channel & 0x0F));
    on_event.data1 = note.pitch;
    on_event.data2 = note.velocity;
    on_event.priority = 1;
    events.push_back(on_event);

    WriteEvent off_event = on_event;
    off_event.tick = note.start_tick + note.duration;
    off_event.status = static_cast<uint8_t>(0x80 | (track.channel & 0x0F));
    off_event.data2 = 0;
    off_event.priority = 0;
    events.push_back(off_event);
  }
  for (const auto& evt : track.events) {
    WriteEvent raw_event;
    raw_event.tick = evt.tick;
    raw_event.status = evt.status;
    raw_event.data1 = evt.data1;
    raw_event.data2 = evt.data2;
    raw_event.priority = 2;
    events.push_back(raw_event);
  }

  // Stable so that repeated pitches keep their note order.
  std::stable_sort(events.begin(), events.end(), [](const WriteEvent& lhs, const WriteEvent& rhs) {
    if (lhs.tick != rhs.tick) return lhs.tick < rhs.tick;
    return lhs.priority < rhs.priority;
  });

  uint32_t prev_tick = 0;
  for (const auto& evt : events) {
    writeVariableLength(track_buf, evt.tick - prev_tick);
    track_buf.push_back(evt.status);
    track_buf.push_back(evt.data1 & 0x7F);
    track_buf.push_back(evt.data2 & 0x7F);
    prev_tick = evt.tick;
  }

  writeEndOfTrack(track_buf);
  appendChunk(track_buf);
}

void MidiWriter::writeMetadataTrack(const std::vector<TempoEvent>& tempo_events,
                                    const KeySignature& key, const std::string& metadata) {
  std::vector<uint8_t> track_buf;
  writeTextMetaEvent(track_buf, 0x03, "FIGBASS");

  std::vector<TempoEvent> sorted_events = tempo_events;
  std::sort(sorted_events.begin(), sorted_events.end(),
            [](const TempoEvent& lhs, const TempoEvent& rhs) { return lhs.tick < rhs.tick; });
  if (sorted_events.empty()) sorted_events.push_back({0, 120});

  uint32_t prev_tick = 0;
  for (const auto& evt : sorted_events) {
    uint32_t usec_per_beat = kMicrosecondsPerMinute / std::max<uint16_t>(evt.bpm, 1);
    writeVariableLength(track_buf, evt.tick - prev_tick);
    track_buf.push_back(0xFF);
    track_buf.push_back(0x51);
    track_buf.push_back(0x03);
    track_buf.push_back(static_cast<uint8_t>((usec_per_beat >> 16) & 0xFF));
    track_buf.push_back(static_cast<uint8_t>((usec_per_beat >> 8) & 0xFF));
    track_buf.push_back(static_cast<uint8_t>(usec_per_beat & 0xFF));
    prev_tick = evt.tick;
  }

  // 4/4: FF 58 04 nn dd cc bb
  writeVariableLength(track_buf, 0);
  const uint8_t time_signature[] = {0xFF, 0x58, 0x04, 0x04, 0x02, 0x18, 0x08};
  track_buf.insert(track_buf.end(), std::begin(time_signature), std::end(time_signature));

  // FF 59 02 sf mi
  int sharps_flats = 0;
  bool minor = false;
  if (keySignatureAccidentals(key, sharps_flats, minor)) {
    writeVariableLength(track_buf, 0);
    track_buf.push_back(0xFF);
    track_buf.push_back(0x59);
    track_buf.push_back(0x02);
    track_buf.push_back(static_cast<uint8_t>(static_cast<int8_t>(sharps_flats)));
    track_buf.push_back(minor ? 1 : 0);
  }

  if (!metadata.empty()) writeTextMetaEvent(track_buf, 0x01, "FIGBASS:" + metadata);

  writeEndOfTrack(track_buf);
  appendChunk(track_buf);
}

}  // namespace figbass
