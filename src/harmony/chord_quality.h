// Chord quality descriptors -- third/fifth/upper qualities, harmonic
// extensions, their interval table, and the immutable ChordType value.

#ifndef BAND_HARMONY_CHORD_QUALITY_H
#define BAND_HARMONY_CHORD_QUALITY_H

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include "core/interval.h"

namespace band {

/// Quality of the chord's third (or its suspension replacement).
enum class ThirdQuality : uint8_t {
  Major,
  Minor,
  Sus4,
  Sus2
};

/// Quality of the chord's fifth.
enum class FifthQuality : uint8_t {
  Perfect,
  Diminished,
  Augmented
};

/// Sixth or seventh stacked above the triad.
///
/// Dominant and minor sevenths are the same interval; MinorSeventh is an
/// alias of DominantSeventh and the two cannot be told apart.
enum class UpperQuality : uint8_t {
  None,
  Sixth,
  DominantSeventh,
  MinorSeventh = DominantSeventh,
  MajorSeventh,
  DiminishedSeventh
};

/// Harmonic extensions in the 9th/11th/13th family.
enum class Harmony : uint8_t {
  MinorNinth,
  MajorNinth,
  SharpNinth,
  Eleventh,
  SharpEleventh,
  MinorThirteenth,
  MajorThirteenth
};

/// Number of Harmony values; all of them fit in one bitmask byte.
constexpr int kHarmonyCount = 7;

/// All harmonies in canonical (ascending interval) order.
constexpr Harmony kAllHarmonies[kHarmonyCount] = {
    Harmony::MinorNinth,    Harmony::MajorNinth,      Harmony::SharpNinth,
    Harmony::Eleventh,      Harmony::SharpEleventh,   Harmony::MinorThirteenth,
    Harmony::MajorThirteenth};

/// @name Interval table
/// Each quality resolves to a spelled interval above the root.
/// @{
NamedInterval intervalFor(ThirdQuality quality);
NamedInterval intervalFor(FifthQuality quality);
/// @pre quality != UpperQuality::None (returns P1 for None).
NamedInterval intervalFor(UpperQuality quality);
NamedInterval intervalFor(Harmony harmony);
/// @}

/// @name String conversion
/// @{
const char* thirdQualityToString(ThirdQuality quality);
const char* fifthQualityToString(FifthQuality quality);
const char* upperQualityToString(UpperQuality quality);
/// @return Extension symbol such as "b9", "#11", "13".
const char* harmonyToString(Harmony harmony);
/// @return Harmony for a symbol such as "b9" or "#11", or std::nullopt.
std::optional<Harmony> harmonyFromString(const std::string& str);
/// @}

/// @brief Immutable chord quality descriptor.
///
/// Combinators never modify the receiver; each returns a new ChordType with
/// one replaced upper quality or a union of harmonic extensions. Extensions
/// form a set stored as a bitmask, so adding one twice has no effect.
/// Conflicting combinations (e.g. both 9 and b9) are accepted as given.
class ChordType {
 public:
  constexpr explicit ChordType(ThirdQuality third,
                               FifthQuality fifth = FifthQuality::Perfect,
                               UpperQuality upper = UpperQuality::None,
                               uint8_t harmony_mask = 0)
      : third_(third), fifth_(fifth), upper_(upper), harmony_mask_(harmony_mask) {}

  constexpr ThirdQuality thirdQuality() const { return third_; }
  constexpr FifthQuality fifthQuality() const { return fifth_; }
  constexpr UpperQuality upperQuality() const { return upper_; }
  constexpr bool hasUpperQuality() const { return upper_ != UpperQuality::None; }
  constexpr uint8_t harmonyMask() const { return harmony_mask_; }

  constexpr bool hasHarmony(Harmony harmony) const {
    return (harmony_mask_ & bit(harmony)) != 0;
  }

  /// @brief Extensions in canonical order (b9, 9, #9, 11, #11, b13, 13).
  std::vector<Harmony> harmonies() const;

  constexpr ChordType withHarmonies(Harmony harmony) const {
    return ChordType(third_, fifth_, upper_, static_cast<uint8_t>(harmony_mask_ | bit(harmony)));
  }

  ChordType withHarmonies(std::initializer_list<Harmony> harmonies) const;

  constexpr ChordType withUpperQuality(UpperQuality upper) const {
    return ChordType(third_, fifth_, upper, harmony_mask_);
  }

  /// @name Shorthand combinators
  /// @{
  constexpr ChordType addDom7() const { return withUpperQuality(UpperQuality::DominantSeventh); }
  constexpr ChordType addMin7() const { return addDom7(); }
  constexpr ChordType addMaj7() const { return withUpperQuality(UpperQuality::MajorSeventh); }
  constexpr ChordType addDim7() const { return withUpperQuality(UpperQuality::DiminishedSeventh); }
  constexpr ChordType addSixth() const { return withUpperQuality(UpperQuality::Sixth); }
  constexpr ChordType addMin9() const { return withHarmonies(Harmony::MinorNinth); }
  constexpr ChordType addMaj9() const { return withHarmonies(Harmony::MajorNinth); }
  constexpr ChordType addSharp9() const { return withHarmonies(Harmony::SharpNinth); }
  constexpr ChordType add11() const { return withHarmonies(Harmony::Eleventh); }
  constexpr ChordType addSharp11() const { return withHarmonies(Harmony::SharpEleventh); }
  constexpr ChordType addMin13() const { return withHarmonies(Harmony::MinorThirteenth); }
  constexpr ChordType addMaj13() const { return withHarmonies(Harmony::MajorThirteenth); }
  /// @}

  constexpr bool operator==(const ChordType& other) const {
    return third_ == other.third_ && fifth_ == other.fifth_ && upper_ == other.upper_ &&
           harmony_mask_ == other.harmony_mask_;
  }
  constexpr bool operator!=(const ChordType& other) const { return !(*this == other); }

 private:
  static constexpr uint8_t bit(Harmony harmony) {
    return static_cast<uint8_t>(1u << static_cast<uint8_t>(harmony));
  }

  ThirdQuality third_;
  FifthQuality fifth_;
  UpperQuality upper_;
  uint8_t harmony_mask_;
};

/// @name Named chord qualities
/// @{
constexpr ChordType kMajor{ThirdQuality::Major};
constexpr ChordType kMinor{ThirdQuality::Minor};
constexpr ChordType kDiminished{ThirdQuality::Minor, FifthQuality::Diminished};
constexpr ChordType kSus2{ThirdQuality::Sus2};
constexpr ChordType kSus4{ThirdQuality::Sus4};

constexpr ChordType kMajorSeventh = kMajor.addMaj7();
constexpr ChordType kMinorSeventh = kMinor.addMin7();
constexpr ChordType kDiminishedSeventh = kDiminished.addDim7();
constexpr ChordType kDominantSeventh = kMajor.addDom7();
constexpr ChordType kSus4Seventh = kSus4.addDom7();
/// @}

/// @brief Format a chord type as a chord symbol suffix.
/// @return Strings such as "" (major), "m7(9)", "7(13)", "maj7(9)", "dim7", "7sus4".
std::string chordTypeToString(const ChordType& type);

/// @brief Parse a chord symbol suffix produced by chordTypeToString().
///
/// Grammar: base ("", "maj", "m", "min", "dim", "dim7", "aug", "sus2",
/// "sus4"), upper ("6", "7", "maj7", "bb7"), optional trailing "sus2"/"sus4",
/// optional "(ext,ext,...)" with ext in b5 #5 b9 9 #9 11 #11 b13 13.
/// "major", "minor" and "diminished" are accepted as whole words.
/// @return Parsed ChordType, or std::nullopt if any part is unrecognized.
std::optional<ChordType> chordTypeFromString(const std::string& str);

}  // namespace band

#endif  // BAND_HARMONY_CHORD_QUALITY_H
