// Binary SMF helpers -- variable-length quantities and big-endian integers.

#ifndef FIGBASS_MIDI_MIDI_STREAM_H
#define FIGBASS_MIDI_MIDI_STREAM_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace figbass {

/// Microseconds per minute, for tempo meta-events.
constexpr uint32_t kMicrosecondsPerMinute = 60000000;

/// Largest value a MIDI variable-length quantity can hold.
constexpr uint32_t kMaxVariableLength = 0x0FFFFFFF;

/// @brief Append a variable-length quantity (values above the maximum are clamped).
void writeVariableLength(std::vector<uint8_t>& buf, uint32_t value);

/// @brief Decode a variable-length quantity.
/// @param data Byte stream.
/// @param offset Read position, advanced past the quantity.
/// @param max_size Size of the stream.
/// @return Decoded value; stops early at the end of the stream.
uint32_t readVariableLength(const uint8_t* data, size_t& offset, size_t max_size);

void writeBE16(std::vector<uint8_t>& buf, uint16_t value);
void writeBE32(std::vector<uint8_t>& buf, uint32_t value);
uint16_t readBE16(const uint8_t* data, size_t offset);
uint32_t readBE32(const uint8_t* data, size_t offset);

/// @brief Append a four-character chunk tag ("MThd", "MTrk").
void writeChunkTag(std::vector<uint8_t>& buf, const char* tag);

/// @brief Append a meta-event at delta 0 carrying text (FF type len bytes).
void writeTextMetaEvent(std::vector<uint8_t>& buf, uint8_t type, const std::string& text);

}  // namespace figbass

#endif  // FIGBASS_MIDI_MIDI_STREAM_H
