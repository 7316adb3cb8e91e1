// Named intervals -- spelled interval table (quality + diatonic size),
// compound interval reduction, and semitone naming.

#ifndef BAND_CORE_INTERVAL_H
#define BAND_CORE_INTERVAL_H

#include <cstdint>
#include <optional>
#include <string_view>

#include "core/pitch_utils.h"

namespace band {

/// @brief A spelled interval such as "M3" or "A11".
///
/// steps is the diatonic distance in letter names (0 = unison, 2 = third,
/// 8 = ninth); semitones is the chromatic size. Both are non-negative.
struct NamedInterval {
  const char* name = "P1";
  int8_t steps = 0;
  int8_t semitones = 0;

  constexpr bool operator==(const NamedInterval& other) const {
    return steps == other.steps && semitones == other.semitones;
  }
  constexpr bool operator!=(const NamedInterval& other) const {
    return !(*this == other);
  }
};

namespace named_interval {

constexpr NamedInterval kP1{"P1", 0, interval::kUnison};
constexpr NamedInterval kM2{"M2", 1, interval::kMajor2nd};
constexpr NamedInterval km3{"m3", 2, interval::kMinor3rd};
constexpr NamedInterval kM3{"M3", 2, interval::kMajor3rd};
constexpr NamedInterval kP4{"P4", 3, interval::kPerfect4th};
constexpr NamedInterval kd5{"d5", 4, interval::kTritone};
constexpr NamedInterval kP5{"P5", 4, interval::kPerfect5th};
constexpr NamedInterval kA5{"A5", 4, interval::kMinor6th};
constexpr NamedInterval kM6{"M6", 5, interval::kMajor6th};
constexpr NamedInterval kd7{"d7", 6, interval::kMajor6th};
constexpr NamedInterval km7{"m7", 6, interval::kMinor7th};
constexpr NamedInterval kM7{"M7", 6, interval::kMajor7th};
constexpr NamedInterval kP8{"P8", 7, interval::kOctave};
constexpr NamedInterval km9{"m9", 8, interval::kOctave + interval::kMinor2nd};
constexpr NamedInterval kM9{"M9", 8, interval::kOctave + interval::kMajor2nd};
constexpr NamedInterval kA9{"A9", 8, interval::kOctave + interval::kMinor3rd};
constexpr NamedInterval kP11{"P11", 10, interval::kOctave + interval::kPerfect4th};
constexpr NamedInterval kA11{"A11", 10, interval::kOctave + interval::kTritone};
constexpr NamedInterval km13{"m13", 12, interval::kOctave + interval::kMinor6th};
constexpr NamedInterval kM13{"M13", 12, interval::kOctave + interval::kMajor6th};

}  // namespace named_interval

/// @brief Look up a spelled interval by its short name.
/// @param name Name such as "m3", "P5", "A9", "M13" (case-sensitive quality).
/// @return The interval, or std::nullopt if the name is not in the table.
std::optional<NamedInterval> intervalFromName(std::string_view name);

namespace interval_util {

/// @brief Get a human-readable name for an interval in semitones.
/// @param semitones Interval size (may be negative or compound).
/// @return Null-terminated string such as "Perfect 5th", "Minor 3rd".
const char* intervalName(int semitones);

/// @brief Reduce a compound interval to its simple equivalent (0-11).
/// @param semitones Interval size in semitones (may be negative or compound).
/// @return Simple interval in range [0, 11].
///
/// Examples: 19 (compound 5th) -> 7, -3 -> 3, 24 (double octave) -> 0.
int compoundToSimple(int semitones);

}  // namespace interval_util
}  // namespace band

#endif  // BAND_CORE_INTERVAL_H
