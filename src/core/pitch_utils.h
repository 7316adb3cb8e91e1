// Pitch utilities -- semitone interval constants, pitch class and octave
// arithmetic on MIDI note numbers.

#ifndef BAND_CORE_PITCH_UTILS_H
#define BAND_CORE_PITCH_UTILS_H

#include <cstdint>

namespace band {

// ---------------------------------------------------------------------------
// Interval constants (semitones)
// ---------------------------------------------------------------------------

namespace interval {

constexpr int kUnison = 0;
constexpr int kMinor2nd = 1;
constexpr int kMajor2nd = 2;
constexpr int kMinor3rd = 3;
constexpr int kMajor3rd = 4;
constexpr int kPerfect4th = 5;
constexpr int kTritone = 6;
constexpr int kPerfect5th = 7;
constexpr int kMinor6th = 8;
constexpr int kMajor6th = 9;
constexpr int kMinor7th = 10;
constexpr int kMajor7th = 11;
constexpr int kOctave = 12;

}  // namespace interval

/// Lowest and highest valid MIDI note numbers.
constexpr int kMidiMin = 0;
constexpr int kMidiMax = 127;

// ---------------------------------------------------------------------------
// Pitch utility functions
// ---------------------------------------------------------------------------

/// @brief Extract pitch class (0-11) from a pitch value.
/// @param pitch Pitch value in semitones (may be negative).
/// @return Pitch class where C=0, C#=1, ..., B=11.
inline int getPitchClass(int pitch) {
  return ((pitch % 12) + 12) % 12;
}

/// @brief Get octave number from a pitch value.
/// @param pitch Pitch value in semitones (C4 = 60).
/// @return Octave number, floor-divided so that pitch 11 is octave -1.
inline int getOctave(int pitch) {
  int shifted = pitch - getPitchClass(pitch);
  return shifted / 12 - 1;
}

/// @brief Clamp a pitch value to a valid range.
/// @param pitch Input pitch (may be out of range).
/// @param low Minimum MIDI note number.
/// @param high Maximum MIDI note number.
/// @return Clamped pitch value.
inline uint8_t clampPitch(int pitch, uint8_t low = kMidiMin, uint8_t high = kMidiMax) {
  if (pitch < static_cast<int>(low)) return low;
  if (pitch > static_cast<int>(high)) return high;
  return static_cast<uint8_t>(pitch);
}

/// @brief Calculate the absolute interval between two pitches in semitones.
inline int absoluteInterval(int pitch_a, int pitch_b) {
  int diff = pitch_a - pitch_b;
  return diff < 0 ? -diff : diff;
}

/// @brief Calculate the directed interval (signed) from pitch_a to pitch_b.
/// @return Positive if ascending, negative if descending.
inline int directedInterval(int pitch_a, int pitch_b) {
  return pitch_b - pitch_a;
}

}  // namespace band

#endif  // BAND_CORE_PITCH_UTILS_H
