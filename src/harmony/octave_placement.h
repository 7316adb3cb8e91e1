// Octave placement -- chord/pitch distance metrics against a reference pitch
// and pitch-class preserving octave normalization.

#ifndef BAND_HARMONY_OCTAVE_PLACEMENT_H
#define BAND_HARMONY_OCTAVE_PLACEMENT_H

#include "core/pitch.h"
#include "harmony/chord.h"

namespace band {

/// Mean distance window for chord normalization (semitones).
constexpr double kChordPlacementWindow = 12.0;

/// Distance window for single-pitch normalization (semitones).
constexpr int kPitchPlacementWindow = 6;

/// @brief Average MIDI value of the chord's pitches (0.0 for an empty chord).
double pitchCenter(const Chord& chord);

/// @brief Signed mean of (pitch - reference) over the chord.
/// @return Positive when the chord sits above the reference. 0.0 if empty.
double meanDistance(const Chord& chord, const Pitch& reference);

/// @brief Mean absolute deviation of the chord's pitches from the reference.
/// @return Average of |pitch - reference|. 0.0 if empty.
double meanAbsoluteDeviation(const Chord& chord, const Pitch& reference);

/// @brief Shift the whole chord by octaves until its mean distance to the
/// anchor is within +/-12 semitones.
///
/// Idempotent: a chord already inside the window is returned unchanged.
Chord moveChordNear(const Chord& chord, const Pitch& anchor);

/// @brief Shift a pitch by octaves until it lies within 6 semitones of the
/// reference. Idempotent.
Pitch movePitchNear(const Pitch& pitch, const Pitch& reference);

}  // namespace band

#endif  // BAND_HARMONY_OCTAVE_PLACEMENT_H
