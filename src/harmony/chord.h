// Concrete chord -- an ordered collection of spelled pitches.

#ifndef BAND_HARMONY_CHORD_H
#define BAND_HARMONY_CHORD_H

#include <cstddef>
#include <string>
#include <vector>

#include "core/pitch.h"

namespace band {

/// @brief An ordered collection of pitches.
///
/// Order is significant (inversions are rotations of it). Duplicate pitch
/// values are kept. All operations return new chords.
class Chord {
 public:
  Chord() = default;
  explicit Chord(std::vector<Pitch> pitches);

  const std::vector<Pitch>& pitches() const { return pitches_; }
  size_t size() const { return pitches_.size(); }
  bool empty() const { return pitches_.empty(); }
  const Pitch& operator[](size_t idx) const { return pitches_[idx]; }

  /// @pre !empty()
  const Pitch& lowest() const;
  /// @pre !empty()
  const Pitch& highest() const;

  /// @brief MIDI values in chord order.
  std::vector<int> midiValues() const;

  /// @brief Transpose every pitch by the same semitone count.
  Chord transpose(int semitones) const;

  /// @brief Stable ascending sort by MIDI value (equal values keep their order).
  Chord sortedAscending() const;

  /// @brief Insert a pitch and re-sort ascending.
  Chord withPitch(const Pitch& pitch) const;

  /// @brief Printable form such as "<C4 E4 G4>".
  std::string toString() const;

  bool operator==(const Chord& other) const { return pitches_ == other.pitches_; }
  bool operator!=(const Chord& other) const { return !(*this == other); }

 private:
  std::vector<Pitch> pitches_;
};

}  // namespace band

#endif  // BAND_HARMONY_CHORD_H
