// Spelled pitch value type -- letter, accidental and octave with a MIDI value,
// text parsing, and transposition by semitones or named interval.

#ifndef BAND_CORE_PITCH_H
#define BAND_CORE_PITCH_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "core/interval.h"

namespace band {

/// Diatonic letter name.
enum class Step : uint8_t { C = 0, D, E, F, G, A, B };

/// @brief Semitones of the natural step above C (C=0, D=2, ..., B=11).
int stepSemitones(Step step);

/// @brief Letter for a step ('C'..'B').
char stepLetter(Step step);

/// @brief An absolute pitch at semitone resolution with its spelling.
///
/// Immutable: every transposition returns a new Pitch. The MIDI value is
/// (octave + 1) * 12 + natural(step) + alter, so C4 = 60 and B#3 = 60.
/// Values outside 0-127 are representable; clamping happens at MIDI export.
class Pitch {
 public:
  /// Default pitch is C4.
  constexpr Pitch() = default;
  constexpr Pitch(Step step, int alter, int octave)
      : step_(step), alter_(static_cast<int8_t>(alter)), octave_(static_cast<int8_t>(octave)) {}

  /// @brief Parse a pitch spelling such as "C4", "F#3", "Bb5", "Ebb2", "c".
  ///
  /// Grammar: letter A-G (any case), up to two '#' or up to two 'b',
  /// optional signed octave of at most two digits (default 4).
  /// @return Parsed pitch, or std::nullopt on malformed text.
  static std::optional<Pitch> fromString(std::string_view text);

  /// @brief Build a pitch from a MIDI value using sharp spelling.
  static Pitch fromMidi(int midi);

  Step step() const { return step_; }
  int alter() const { return alter_; }
  int octave() const { return octave_; }

  /// @brief MIDI-style integer value (C4 = 60).
  int midi() const;

  /// @brief Spelled name, e.g. "C#4", "Bb3".
  std::string name() const;

  /// @brief Transpose by a signed semitone count.
  ///
  /// Whole-octave amounts keep the spelling; other amounts respell with
  /// sharps via fromMidi().
  Pitch transpose(int semitones) const;

  /// @brief Transpose upward by a spelled interval, keeping correct spelling.
  ///
  /// The letter advances by interval.steps and the accidental absorbs the
  /// difference: D4 + m3 = F4, C4 + A5 = G#4, E4 + M3 = G#4.
  Pitch transpose(const NamedInterval& interval) const;

  /// @brief True if both pitches sound the same MIDI value.
  bool sameMidi(const Pitch& other) const { return midi() == other.midi(); }

  /// Equality compares spelling and octave (C#4 != Db4).
  bool operator==(const Pitch& other) const {
    return step_ == other.step_ && alter_ == other.alter_ && octave_ == other.octave_;
  }
  bool operator!=(const Pitch& other) const { return !(*this == other); }

 private:
  Step step_ = Step::C;
  int8_t alter_ = 0;
  int8_t octave_ = 4;
};

/// Default anchor pitch for voicing requests.
constexpr Pitch kMiddleC{Step::C, 0, 4};

}  // namespace band

#endif  // BAND_CORE_PITCH_H
