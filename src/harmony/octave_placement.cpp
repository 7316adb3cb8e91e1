// Implementation of octave placement and chord distance metrics.

#include "harmony/octave_placement.h"

#include <cmath>

#include "core/pitch_utils.h"

namespace band {

// Sums are accumulated as integers in chord order and divided once, so the
// results do not depend on floating-point summation order.

double pitchCenter(const Chord& chord) {
  if (chord.empty()) return 0.0;
  long sum = 0;
  for (const auto& pitch : chord.pitches()) {
    sum += pitch.midi();
  }
  return static_cast<double>(sum) / static_cast<double>(chord.size());
}

double meanDistance(const Chord& chord, const Pitch& reference) {
  if (chord.empty()) return 0.0;
  long sum = 0;
  int ref = reference.midi();
  for (const auto& pitch : chord.pitches()) {
    sum += directedInterval(ref, pitch.midi());
  }
  return static_cast<double>(sum) / static_cast<double>(chord.size());
}

double meanAbsoluteDeviation(const Chord& chord, const Pitch& reference) {
  if (chord.empty()) return 0.0;
  long sum = 0;
  int ref = reference.midi();
  for (const auto& pitch : chord.pitches()) {
    sum += absoluteInterval(pitch.midi(), ref);
  }
  return static_cast<double>(sum) / static_cast<double>(chord.size());
}

Chord moveChordNear(const Chord& chord, const Pitch& anchor) {
  Chord result = chord;
  double dist = meanDistance(result, anchor);
  while (std::abs(dist) > kChordPlacementWindow) {
    result = result.transpose(dist < 0 ? interval::kOctave : -interval::kOctave);
    dist = meanDistance(result, anchor);
  }
  return result;
}

Pitch movePitchNear(const Pitch& pitch, const Pitch& reference) {
  Pitch result = pitch;
  int ref = reference.midi();
  while (absoluteInterval(result.midi(), ref) > kPitchPlacementWindow) {
    result = result.transpose(result.midi() < ref ? interval::kOctave : -interval::kOctave);
  }
  return result;
}

}  // namespace band
