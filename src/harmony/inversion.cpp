// Implementation of closed position, inversion rotation, and best fit.

#include "harmony/inversion.h"

#include <utility>

#include "core/pitch_utils.h"
#include "harmony/octave_placement.h"

namespace band {

Chord closedPosition(const Chord& chord) {
  if (chord.size() < 2) return chord;

  const int low = chord.lowest().midi();
  std::vector<Pitch> folded;
  folded.reserve(chord.size());
  for (const auto& pitch : chord.pitches()) {
    int offset = directedInterval(low, pitch.midi());
    int octaves = offset / interval::kOctave;  // offset >= 0
    folded.push_back(pitch.transpose(-octaves * interval::kOctave));
  }
  return Chord(std::move(folded)).sortedAscending();
}

Chord invert(const Chord& chord) {
  if (chord.empty()) return chord;

  std::vector<Pitch> rotated(chord.pitches().begin() + 1, chord.pitches().end());
  rotated.push_back(chord.pitches().front().transpose(interval::kOctave));
  return Chord(std::move(rotated));
}

std::vector<Chord> allInversions(const Chord& chord) {
  std::vector<Chord> result;
  result.reserve(chord.size());

  Chord current = chord;
  for (size_t idx = 0; idx < chord.size(); ++idx) {
    result.push_back(current);
    current = invert(current);
  }
  return result;
}

size_t selectBestFit(const std::vector<Chord>& candidates, const Pitch& anchor) {
  size_t best_idx = 0;
  double best_score = 0.0;
  for (size_t idx = 0; idx < candidates.size(); ++idx) {
    double score = meanAbsoluteDeviation(candidates[idx], anchor);
    if (idx == 0 || score < best_score) {
      best_score = score;
      best_idx = idx;
    }
  }
  return best_idx;
}

}  // namespace band
