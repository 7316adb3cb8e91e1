/// @file
/// @brief Named interval table and semitone interval naming.

#include "core/interval.h"

#include <cstdlib>

namespace band {

namespace {

/// Every interval accepted by intervalFromName(). m2, A2, A4 and m6 are not
/// chord-tone intervals and only serve textual transposition.
constexpr NamedInterval kIntervalTable[] = {
    named_interval::kP1,
    {"m2", 1, interval::kMinor2nd},
    named_interval::kM2,
    {"A2", 1, interval::kMinor3rd},
    named_interval::km3,
    named_interval::kM3,
    named_interval::kP4,
    {"A4", 3, interval::kTritone},
    named_interval::kd5,
    named_interval::kP5,
    named_interval::kA5,
    {"m6", 5, interval::kMinor6th},
    named_interval::kM6,
    named_interval::kd7,
    named_interval::km7,
    named_interval::kM7,
    named_interval::kP8,
    named_interval::km9,
    named_interval::kM9,
    named_interval::kA9,
    named_interval::kP11,
    named_interval::kA11,
    named_interval::km13,
    named_interval::kM13,
};

/// @brief Human-readable interval names indexed by simple interval (0-11 semitones).
constexpr const char* kIntervalNames[12] = {
    "Perfect Unison",  // 0
    "Minor 2nd",       // 1
    "Major 2nd",       // 2
    "Minor 3rd",       // 3
    "Major 3rd",       // 4
    "Perfect 4th",     // 5
    "Tritone",         // 6
    "Perfect 5th",     // 7
    "Minor 6th",       // 8
    "Major 6th",       // 9
    "Minor 7th",       // 10
    "Major 7th"        // 11
};

}  // namespace

std::optional<NamedInterval> intervalFromName(std::string_view name) {
  for (const auto& entry : kIntervalTable) {
    if (name == entry.name) return entry;
  }
  return std::nullopt;
}

namespace interval_util {

int compoundToSimple(int semitones) {
  return std::abs(semitones) % 12;
}

const char* intervalName(int semitones) {
  return kIntervalNames[compoundToSimple(semitones)];
}

}  // namespace interval_util
}  // namespace band
