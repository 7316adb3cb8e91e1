// Byte-level helpers for Standard MIDI File output (variable-length
// quantities, big-endian integers).

#ifndef BAND_MIDI_MIDI_STREAM_H
#define BAND_MIDI_MIDI_STREAM_H

#include <cstdint>
#include <vector>

namespace band {

/// Microseconds per minute constant for MIDI tempo meta-events.
constexpr uint32_t kMicrosecondsPerMinute = 60000000;

/// Largest value a variable-length quantity can carry.
constexpr uint32_t kMaxVariableLength = 0x0FFFFFFF;

/// @brief Write a variable-length quantity (VLQ) to a byte buffer.
/// @param buf Destination buffer (bytes are appended).
/// @param value The unsigned value to encode; clamped to kMaxVariableLength.
void writeVariableLength(std::vector<uint8_t>& buf, uint32_t value);

/// @brief Append a big-endian uint16.
void writeBE16(std::vector<uint8_t>& buf, uint16_t value);

/// @brief Append a big-endian uint32.
void writeBE32(std::vector<uint8_t>& buf, uint32_t value);

/// @brief Append a 4-character chunk identifier followed by the chunk body.
/// @param buf Destination buffer.
/// @param id Four ASCII characters such as "MTrk".
/// @param body Chunk payload; its size is written as a big-endian uint32.
void writeChunk(std::vector<uint8_t>& buf, const char* id, const std::vector<uint8_t>& body);

}  // namespace band

#endif  // BAND_MIDI_MIDI_STREAM_H
