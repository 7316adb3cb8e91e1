// Closed chord voicing: chord-tone selection by importance, trimming to a
// note budget, closed-position rearrangement, and best-fit inversion choice.

#ifndef BAND_HARMONY_CHORD_VOICER_H
#define BAND_HARMONY_CHORD_VOICER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/pitch.h"
#include "harmony/chord.h"
#include "harmony/chord_quality.h"

namespace band {

/// Smallest note budget that still forms a chord.
constexpr int kMinChordNotes = 2;

/// Default note budget for a voicing request.
constexpr int kDefaultMaxNotes = 5;

/// Role of a candidate tone within the chord.
enum class ToneRole : uint8_t {
  Root,
  Third,
  Fifth,
  Upper,
  Extension
};

/// @brief Convert ToneRole to human-readable string.
const char* toneRoleToString(ToneRole role);

/// @brief Importance weight of a tone role; lower weights are dropped first.
///
/// Fifth = 1, root = 3, extension = 7, third = 9, upper (6th/7th) = 9.
int toneImportance(ToneRole role);

/// @brief A candidate pitch for a voicing.
struct ChordTone {
  Pitch pitch;
  ToneRole role = ToneRole::Root;
  int importance = 0;
  size_t order = 0;  ///< Insertion index; breaks importance ties.
};

/// Failure classification for voicing requests.
enum class VoicingError : uint8_t {
  None,
  InsufficientChordSize,  ///< max_notes < kMinChordNotes.
  InvalidPitch            ///< Root, anchor or bass text did not parse.
};

/// @brief Convert VoicingError to human-readable string.
const char* voicingErrorToString(VoicingError error);

/// @brief Parameters for generateClosedChord().
struct VoicingRequest {
  Pitch root = kMiddleC;
  Pitch anchor = kMiddleC;
  int max_notes = kDefaultMaxNotes;
  std::optional<Pitch> bass;  ///< Placed separately, an octave below the anchor.
  bool include_root = true;
  bool verbose = false;  ///< Trace selection steps to stderr.
};

/// @brief Outcome of a voicing request.
struct VoicingResult {
  Chord chord;
  bool success = false;
  VoicingError error = VoicingError::None;
  std::string error_message;
};

/// @brief Build the candidate tones for a chord type above a root.
///
/// Insertion order: third, extensions (canonical order), fifth, root (only
/// if include_root), upper quality (only if present).
std::vector<ChordTone> buildChordTones(const ChordType& type, const Pitch& root,
                                       bool include_root);

/// @brief Drop the least important tones until at most max_notes remain.
///
/// Tones are removed in ascending (importance, order): among equal
/// importance the earlier-inserted tone goes first. Survivors keep their
/// relative order.
std::vector<ChordTone> trimChordTones(std::vector<ChordTone> tones, size_t max_notes);

/// @brief Voice a chord type in closed position as close as possible to the anchor.
///
/// Steps: build and trim candidate tones, sort ascending, move the chord
/// near the anchor, rearrange to closed position, move every inversion near
/// the anchor, keep the inversion with the smallest mean absolute deviation
/// (first wins ties), then add the bass placed within 6 semitones of
/// anchor - 12.
///
/// The result holds min(max_notes, candidate count) pitches, plus one for a bass.
///
/// @param type Chord quality.
/// @param request Root, anchor, note budget, optional bass.
/// @return VoicingResult; fails with InsufficientChordSize if max_notes < 2.
VoicingResult generateClosedChord(const ChordType& type, const VoicingRequest& request);

/// @brief Text overload: pitches are given as spellings such as "D4".
///
/// The note budget is checked first, then each pitch is parsed; a spelling
/// that does not parse fails with InvalidPitch. An empty bass means none.
VoicingResult generateClosedChord(const ChordType& type, const std::string& root,
                                  const std::string& anchor = "C4",
                                  int max_notes = kDefaultMaxNotes,
                                  const std::string& bass = "",
                                  bool include_root = true);

}  // namespace band

#endif  // BAND_HARMONY_CHORD_VOICER_H
