// Progression generator: voices a sequence of chords and lays them out as
// MIDI tracks.

#ifndef BAND_GENERATOR_H
#define BAND_GENERATOR_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/json_parser.h"
#include "core/pitch.h"
#include "harmony/chord.h"
#include "harmony/chord_quality.h"
#include "harmony/chord_voicer.h"

namespace band {

/// @brief Failure classification shared by parsing and generation.
enum class GeneratorError : uint8_t {
  None,
  InsufficientChordSize,
  InvalidPitch,
  InvalidQuality,
  EmptyProgression
};

/// @brief Convert GeneratorError to human-readable string.
const char* generatorErrorToString(GeneratorError error);

/// @brief Map a voicer failure onto the generator's error space.
GeneratorError generatorErrorFromVoicing(VoicingError error);

/// @brief One chord of a progression.
struct ProgressionChord {
  ChordType type = kMajor;
  Pitch root = kMiddleC;
  bool include_root = true;
  std::optional<Pitch> bass;
};

/// @brief Chord symbol such as "D4:m7(9)/D4" (the form progressionChordFromString reads).
std::string progressionChordToString(const ProgressionChord& chord);

/// Tempo range accepted from JSON and the command line.
constexpr int kMinBpm = 20;
constexpr int kMaxBpm = 300;

/// @brief Generation parameters.
struct GeneratorConfig {
  std::vector<ProgressionChord> chords;
  Pitch anchor = kMiddleC;
  int max_notes = kDefaultMaxNotes;
  uint16_t bpm = 120;
  Tick chord_duration = duration::kWholeNote;
  uint8_t program = 0;  ///< GM program; 0 = Acoustic Grand Piano.
  uint8_t velocity = 80;
  bool verbose = false;
};

/// @brief Result of generate().
struct GeneratorResult {
  std::vector<Chord> voicings;  ///< One per input chord, in order.
  std::vector<Track> tracks;
  std::vector<TempoEvent> tempo_events;
  Tick total_duration_ticks = 0;
  bool success = false;
  GeneratorError error = GeneratorError::None;
  std::string error_message;
};

/// @brief Voice every chord of config.chords and place them back to back.
///
/// Each chord is voiced independently with generateClosedChord() against the
/// shared anchor. Chord k starts at k * chord_duration and all of its pitches
/// sound for chord_duration on a single track. The first chord that fails
/// aborts generation with that chord's error; an empty progression fails
/// with EmptyProgression.
GeneratorResult generate(const GeneratorConfig& config);

/// @brief The ii-V-I demo progression in the key of tonic.
///
/// m7(9) on tonic + M2, 7(13) on tonic + P5, maj7(9) on tonic. Roots are
/// omitted from the upper voicing and sounded as the bass instead.
std::vector<ProgressionChord> twoFiveOneProgression(const Pitch& tonic);

/// @brief Outcome of parsing progression text or a JSON config.
template <typename T>
struct ParseResult {
  T value{};
  GeneratorError error = GeneratorError::None;
  std::string error_message;

  bool ok() const { return error == GeneratorError::None; }
};

/// @brief Parse one chord symbol "ROOT:QUALITY[/BASS]".
///
/// ROOT and BASS are pitch spellings ("D4", "Bb3"); QUALITY uses the
/// chordTypeFromString() grammar and may be empty for a major triad. A symbol
/// without ':' is a bare root with a major triad.
ParseResult<ProgressionChord> progressionChordFromString(const std::string& text,
                                                         bool include_root = true);

/// @brief Parse a whitespace-separated list of chord symbols.
ParseResult<std::vector<ProgressionChord>> parseProgression(const std::string& text,
                                                            bool include_root = true);

/// @brief Build a GeneratorConfig from a flat JSON object.
///
/// Keys (all optional): quality, root, anchor, max_notes, bass,
/// include_root, progression, bpm. "progression" takes precedence over the
/// single-chord keys. Unknown keys are ignored, as are a bpm outside
/// [kMinBpm, kMaxBpm] and numbers that do not fit in an int.
ParseResult<GeneratorConfig> configFromJson(const JsonObject& object,
                                            const GeneratorConfig& defaults = {});

/// @brief Serialize voicings and note events as JSON.
std::string buildEventsJson(const GeneratorResult& result, const GeneratorConfig& config);

}  // namespace band

#endif  // BAND_GENERATOR_H
