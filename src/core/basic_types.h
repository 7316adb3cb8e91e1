// Basic types for band MIDI export -- timing, note events, tracks.

#ifndef BAND_CORE_BASIC_TYPES_H
#define BAND_CORE_BASIC_TYPES_H

#include <cstdint>
#include <string>
#include <vector>

namespace band {

/// Tick type for MIDI timing (absolute tick position).
using Tick = uint32_t;

/// Fundamental timing constants.
constexpr Tick kTicksPerBeat = 480;
constexpr uint8_t kBeatsPerBar = 4;
constexpr Tick kTicksPerBar = kTicksPerBeat * kBeatsPerBar;  // 1920

// ---------------------------------------------------------------------------
// Duration constants (based on kTicksPerBeat)
// ---------------------------------------------------------------------------

namespace duration {

constexpr Tick kWholeNote = kTicksPerBar;      // 1920
constexpr Tick kHalfNote = kTicksPerBeat * 2;  // 960
constexpr Tick kQuarterNote = kTicksPerBeat;   // 480

}  // namespace duration

// ---------------------------------------------------------------------------
// Data structures
// ---------------------------------------------------------------------------

/// Note event. Chord voicings become groups of notes sharing start_tick.
struct NoteEvent {
  Tick start_tick = 0;
  Tick duration = 0;
  uint8_t pitch = 0;
  uint8_t velocity = 80;
  uint16_t chord_index = 0;  ///< Position of the owning chord in the progression.
};

/// Track: a collection of note events on a single MIDI channel.
struct Track {
  uint8_t channel = 0;
  uint8_t program = 0;  // GM program number
  std::string name;
  std::vector<NoteEvent> notes;
};

/// Tempo change event.
struct TempoEvent {
  Tick tick = 0;
  uint16_t bpm = 120;
};

}  // namespace band

#endif  // BAND_CORE_BASIC_TYPES_H
