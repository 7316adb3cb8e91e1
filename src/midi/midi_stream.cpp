/// @file
/// @brief Binary MIDI stream helpers (VLQ, big-endian integers, chunks).

#include "midi/midi_stream.h"

namespace band {

void writeVariableLength(std::vector<uint8_t>& buf, uint32_t value) {
  if (value > kMaxVariableLength) {
    value = kMaxVariableLength;
  }

  // 7 bits per byte, least significant group first, then emitted in reverse.
  uint8_t encoded[4];
  int num_bytes = 0;

  encoded[num_bytes++] = static_cast<uint8_t>(value & 0x7F);
  value >>= 7;

  while (value > 0) {
    encoded[num_bytes++] = static_cast<uint8_t>((value & 0x7F) | 0x80);
    value >>= 7;
  }

  for (int idx = num_bytes - 1; idx >= 0; --idx) {
    buf.push_back(encoded[idx]);
  }
}

void writeBE16(std::vector<uint8_t>& buf, uint16_t value) {
  buf.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  buf.push_back(static_cast<uint8_t>(value & 0xFF));
}

void writeBE32(std::vector<uint8_t>& buf, uint32_t value) {
  buf.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
  buf.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  buf.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  buf.push_back(static_cast<uint8_t>(value & 0xFF));
}

void writeChunk(std::vector<uint8_t>& buf, const char* id, const std::vector<uint8_t>& body) {
  for (int idx = 0; idx < 4; ++idx) {
    buf.push_back(static_cast<uint8_t>(id[idx]));
  }
  writeBE32(buf, static_cast<uint32_t>(body.size()));
  buf.insert(buf.end(), body.begin(), body.end());
}

}  // namespace band
