// Closed-position rearrangement, inversion enumeration, and best-fit
// inversion selection against an anchor pitch.

#ifndef BAND_HARMONY_INVERSION_H
#define BAND_HARMONY_INVERSION_H

#include <cstddef>
#include <vector>

#include "core/pitch.h"
#include "harmony/chord.h"

namespace band {

/// @brief Rearrange a chord into closed position.
///
/// The lowest pitch stays where it is. Every other pitch is moved by whole
/// octaves into the octave starting at the lowest pitch, [low, low + 11], and
/// the result is sorted ascending (stable for equal values). Pitch classes
/// and spellings are preserved. Among the rotations of the result, the one
/// closest to an anchor is found later by selectBestFit().
Chord closedPosition(const Chord& chord);

/// @brief One inversion step: the first (lowest) pitch moves up an octave to
/// become the last (highest).
Chord invert(const Chord& chord);

/// @brief Every rotation of a chord.
///
/// Entry 0 is the chord itself; entry k is invert() applied k times. An
/// N-pitch chord yields exactly N chords. Inverting entry N-1 once more gives
/// entry 0 transposed up an octave.
std::vector<Chord> allInversions(const Chord& chord);

/// @brief Index of the chord with the lowest mean absolute deviation from
/// the anchor. The first chord wins ties.
/// @return 0 for an empty candidate list.
size_t selectBestFit(const std::vector<Chord>& candidates, const Pitch& anchor);

}  // namespace band

#endif  // BAND_HARMONY_INVERSION_H
