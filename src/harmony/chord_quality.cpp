// Implementation of chord quality interval lookups, ChordType combinators,
// and chord symbol conversion.

#include "harmony/chord_quality.h"

#include <string_view>

namespace band {

// ---------------------------------------------------------------------------
// Interval table
// ---------------------------------------------------------------------------

NamedInterval intervalFor(ThirdQuality quality) {
  switch (quality) {
    case ThirdQuality::Major: return named_interval::kM3;
    case ThirdQuality::Minor: return named_interval::km3;
    case ThirdQuality::Sus4:  return named_interval::kP4;
    case ThirdQuality::Sus2:  return named_interval::kM2;
  }
  return named_interval::kM3;
}

NamedInterval intervalFor(FifthQuality quality) {
  switch (quality) {
    case FifthQuality::Perfect:    return named_interval::kP5;
    case FifthQuality::Diminished: return named_interval::kd5;
    case FifthQuality::Augmented:  return named_interval::kA5;
  }
  return named_interval::kP5;
}

NamedInterval intervalFor(UpperQuality quality) {
  switch (quality) {
    case UpperQuality::None:              return named_interval::kP1;
    case UpperQuality::Sixth:             return named_interval::kM6;
    case UpperQuality::DominantSeventh:   return named_interval::km7;
    case UpperQuality::MajorSeventh:      return named_interval::kM7;
    case UpperQuality::DiminishedSeventh: return named_interval::kd7;
  }
  return named_interval::kP1;
}

NamedInterval intervalFor(Harmony harmony) {
  switch (harmony) {
    case Harmony::MinorNinth:      return named_interval::km9;
    case Harmony::MajorNinth:      return named_interval::kM9;
    case Harmony::SharpNinth:      return named_interval::kA9;
    case Harmony::Eleventh:        return named_interval::kP11;
    case Harmony::SharpEleventh:   return named_interval::kA11;
    case Harmony::MinorThirteenth: return named_interval::km13;
    case Harmony::MajorThirteenth: return named_interval::kM13;
  }
  return named_interval::kM9;
}

// ---------------------------------------------------------------------------
// String conversion
// ---------------------------------------------------------------------------

const char* thirdQualityToString(ThirdQuality quality) {
  switch (quality) {
    case ThirdQuality::Major: return "maj";
    case ThirdQuality::Minor: return "min";
    case ThirdQuality::Sus4:  return "sus4";
    case ThirdQuality::Sus2:  return "sus2";
  }
  return "maj";
}

const char* fifthQualityToString(FifthQuality quality) {
  switch (quality) {
    case FifthQuality::Perfect:    return "perfect";
    case FifthQuality::Diminished: return "dim";
    case FifthQuality::Augmented:  return "aug";
  }
  return "perfect";
}

const char* upperQualityToString(UpperQuality quality) {
  switch (quality) {
    case UpperQuality::None:              return "none";
    case UpperQuality::Sixth:             return "6";
    case UpperQuality::DominantSeventh:   return "b7";
    case UpperQuality::MajorSeventh:      return "7";
    case UpperQuality::DiminishedSeventh: return "bb7";
  }
  return "none";
}

const char* harmonyToString(Harmony harmony) {
  switch (harmony) {
    case Harmony::MinorNinth:      return "b9";
    case Harmony::MajorNinth:      return "9";
    case Harmony::SharpNinth:      return "#9";
    case Harmony::Eleventh:        return "11";
    case Harmony::SharpEleventh:   return "#11";
    case Harmony::MinorThirteenth: return "b13";
    case Harmony::MajorThirteenth: return "13";
  }
  return "9";
}

std::optional<Harmony> harmonyFromString(const std::string& str) {
  for (Harmony harmony : kAllHarmonies) {
    if (str == harmonyToString(harmony)) return harmony;
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// ChordType
// ---------------------------------------------------------------------------

std::vector<Harmony> ChordType::harmonies() const {
  std::vector<Harmony> result;
  for (Harmony harmony : kAllHarmonies) {
    if (hasHarmony(harmony)) result.push_back(harmony);
  }
  return result;
}

ChordType ChordType::withHarmonies(std::initializer_list<Harmony> harmonies) const {
  ChordType result = *this;
  for (Harmony harmony : harmonies) {
    result = result.withHarmonies(harmony);
  }
  return result;
}

std::string chordTypeToString(const ChordType& type) {
  std::string result;
  std::vector<std::string> paren_tokens;

  ThirdQuality third = type.thirdQuality();
  FifthQuality fifth = type.fifthQuality();
  UpperQuality upper = type.upperQuality();
  bool is_sus = (third == ThirdQuality::Sus2 || third == ThirdQuality::Sus4);

  // Base: a diminished triad keeps "dim" only without a non-diminished
  // seventh; m7(b5) is spelled from the minor base.
  bool dim_base = third == ThirdQuality::Minor && fifth == FifthQuality::Diminished &&
                  (upper == UpperQuality::None || upper == UpperQuality::DiminishedSeventh);
  bool aug_base = third == ThirdQuality::Major && fifth == FifthQuality::Augmented;

  if (dim_base) {
    result = (upper == UpperQuality::DiminishedSeventh) ? "dim7" : "dim";
  } else if (aug_base) {
    result = "aug";
  } else if (third == ThirdQuality::Minor) {
    result = "m";
  }

  if (!dim_base || upper != UpperQuality::DiminishedSeventh) {
    switch (upper) {
      case UpperQuality::None: break;
      case UpperQuality::Sixth: result += "6"; break;
      case UpperQuality::DominantSeventh: result += "7"; break;
      case UpperQuality::MajorSeventh: result += "maj7"; break;
      case UpperQuality::DiminishedSeventh: result += "bb7"; break;
    }
  }

  if (is_sus) {
    result += (third == ThirdQuality::Sus4) ? "sus4" : "sus2";
  }

  if (!dim_base && !aug_base) {
    if (fifth == FifthQuality::Diminished) paren_tokens.push_back("b5");
    if (fifth == FifthQuality::Augmented) paren_tokens.push_back("#5");
  }
  for (Harmony harmony : type.harmonies()) {
    paren_tokens.push_back(harmonyToString(harmony));
  }

  if (!paren_tokens.empty()) {
    result += '(';
    for (size_t idx = 0; idx < paren_tokens.size(); ++idx) {
      if (idx > 0) result += ',';
      result += paren_tokens[idx];
    }
    result += ')';
  }
  return result;
}

namespace {

/// Consume `token` at `pos` if present.
bool consume(const std::string& str, size_t& pos, const char* token) {
  std::string_view view(token);
  if (str.compare(pos, view.size(), view) != 0) return false;
  pos += view.size();
  return true;
}

}  // namespace

std::optional<ChordType> chordTypeFromString(const std::string& str) {
  ThirdQuality third = ThirdQuality::Major;
  FifthQuality fifth = FifthQuality::Perfect;
  UpperQuality upper = UpperQuality::None;
  uint8_t mask = 0;

  if (str == "major") return kMajor;
  if (str == "minor") return kMinor;
  if (str == "diminished") return kDiminished;

  size_t pos = 0;

  // Base triad.
  if (consume(str, pos, "dim7")) {
    third = ThirdQuality::Minor;
    fifth = FifthQuality::Diminished;
    upper = UpperQuality::DiminishedSeventh;
  } else if (consume(str, pos, "dim")) {
    third = ThirdQuality::Minor;
    fifth = FifthQuality::Diminished;
  } else if (consume(str, pos, "aug")) {
    fifth = FifthQuality::Augmented;
  } else if (str.compare(pos, 4, "maj7") == 0) {
    // Major base; "maj7" is read as the upper quality below.
  } else if (consume(str, pos, "maj")) {
    // Explicit major base.
  } else if (consume(str, pos, "min") || consume(str, pos, "m")) {
    third = ThirdQuality::Minor;
  } else if (consume(str, pos, "sus4")) {
    third = ThirdQuality::Sus4;
  } else if (consume(str, pos, "sus2")) {
    third = ThirdQuality::Sus2;
  }

  // Upper quality.
  if (upper == UpperQuality::None) {
    if (consume(str, pos, "maj7")) {
      upper = UpperQuality::MajorSeventh;
    } else if (consume(str, pos, "bb7")) {
      upper = UpperQuality::DiminishedSeventh;
    } else if (consume(str, pos, "7")) {
      upper = UpperQuality::DominantSeventh;
    } else if (consume(str, pos, "6")) {
      upper = UpperQuality::Sixth;
    }
  }

  // Trailing suspension ("7sus4").
  if (third == ThirdQuality::Major && fifth == FifthQuality::Perfect) {
    if (consume(str, pos, "sus4")) {
      third = ThirdQuality::Sus4;
    } else if (consume(str, pos, "sus2")) {
      third = ThirdQuality::Sus2;
    }
  }

  // Parenthesized alterations and extensions.
  if (consume(str, pos, "(")) {
    size_t close = str.find(')', pos);
    if (close == std::string::npos) return std::nullopt;
    std::string body = str.substr(pos, close - pos);
    pos = close + 1;

    size_t start = 0;
    while (start <= body.size()) {
      size_t comma = body.find(',', start);
      if (comma == std::string::npos) comma = body.size();
      std::string token = body.substr(start, comma - start);
      if (token == "b5") {
        fifth = FifthQuality::Diminished;
      } else if (token == "#5") {
        fifth = FifthQuality::Augmented;
      } else {
        auto harmony = harmonyFromString(token);
        if (!harmony) return std::nullopt;
        mask = static_cast<uint8_t>(mask | (1u << static_cast<uint8_t>(*harmony)));
      }
      start = comma + 1;
    }
  }

  if (pos != str.size()) return std::nullopt;
  return ChordType(third, fifth, upper, mask);
}

}  // namespace band
