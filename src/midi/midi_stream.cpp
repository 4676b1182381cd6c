// Binary SMF helpers (VLQ, big-endian I/O, chunk tags, text meta-events).

#include "midi/midi_stream.h"

namespace figbass {

void writeVariableLength(std::vector<uint8_t>& buf, uint32_t value) {
  if (value > kMaxVariableLength) value = kMaxVariableLength;

  // Seven bits per byte, most significant group first, high bit = "more".
  int shift = 21;
  while (shift > 0 && ((value >> shift) & 0x7F) == 0) shift -= 7;
  for (; shift > 0; shift -= 7) {
    buf.push_back(static_cast<uint8_t>(((value >> shift) & 0x7F) | 0x80));
  }
  buf.push_back(static_cast<uint8_t>(value & 0x7F));
}

uint32_t readVariableLength(const uint8_t* data, size_t& offset, size_t max_size) {
  uint32_t result = 0;
  for (int count = 0; count < 4 && offset < max_size; ++count) {
    uint8_t byte = data[offset++];
    result = (result << 7) | (byte & 0x7Fu);
    if ((byte & 0x80) == 0) break;
  }
  return result;
}

void writeBE16(std::vector<uint8_t>& buf, uint16_t value) {
  buf.push_back(static_cast<uint8_t>(value >> 8));
  buf.push_back(static_cast<uint8_t>(value & 0xFF));
}

void writeBE32(std::vector<uint8_t>& buf, uint32_t value) {
  writeBE16(buf, static_cast<uint16_t>(value >> 16));
  writeBE16(buf, static_cast<uint16_t>(value & 0xFFFF));
}

uint16_t readBE16(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

uint32_t readBE32(const uint8_t* data, size_t offset) {
  return (static_cast<uint32_t>(readBE16(data, offset)) << 16) | readBE16(data, offset + 2);
}

void writeChunkTag(std::vector<uint8_t>& buf, const char* tag) {
  for (int idx = 0; idx < 4; ++idx) buf.push_back(static_cast<uint8_t>(tag[idx]));
}

void writeTextMetaEvent(std::vector<uint8_t>& buf, uint8_t type, const std::string& text) {
  writeVariableLength(buf, 0);
  buf.push_back(0xFF);
  buf.push_back(type);
  writeVariableLength(buf, static_cast<uint32_t>(text.size()));
  buf.insert(buf.end(), text.begin(), text.end());
}

}  // namespace figbass
