// Implementation of the concrete chord collection.

#include "harmony/chord.h"

#include <algorithm>
#include <utility>

namespace band {

Chord::Chord(std::vector<Pitch> pitches) : pitches_(std::move(pitches)) {}

const Pitch& Chord::lowest() const {
  return *std::min_element(pitches_.begin(), pitches_.end(),
                           [](const Pitch& lhs, const Pitch& rhs) {
                             return lhs.midi() < rhs.midi();
                           });
}

const Pitch& Chord::highest() const {
  return *std::max_element(pitches_.begin(), pitches_.end(),
                           [](const Pitch& lhs, const Pitch& rhs) {
                             return lhs.midi() < rhs.midi();
                           });
}

std::vector<int> Chord::midiValues() const {
  std::vector<int> values;
  values.reserve(pitches_.size());
  for (const auto& pitch : pitches_) {
    values.push_back(pitch.midi());
  }
  return values;
}

Chord Chord::transpose(int semitones) const {
  std::vector<Pitch> moved;
  moved.reserve(pitches_.size());
  for (const auto& pitch : pitches_) {
    moved.push_back(pitch.transpose(semitones));
  }
  return Chord(std::move(moved));
}

Chord Chord::sortedAscending() const {
  std::vector<Pitch> sorted = pitches_;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const Pitch& lhs, const Pitch& rhs) {
                     return lhs.midi() < rhs.midi();
                   });
  return Chord(std::move(sorted));
}

Chord Chord::withPitch(const Pitch& pitch) const {
  std::vector<Pitch> extended = pitches_;
  extended.push_back(pitch);
  return Chord(std::move(extended)).sortedAscending();
}

std::string Chord::toString() const {
  std::string result = "<";
  for (size_t idx = 0; idx < pitches_.size(); ++idx) {
    if (idx > 0) result += ' ';
    result += pitches_[idx].name();
  }
  result += '>';
  return result;
}

}  // namespace band
