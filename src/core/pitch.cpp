// Implementation of the spelled pitch value type.

#include "core/pitch.h"

#include <cctype>

#include "core/pitch_utils.h"

namespace band {

namespace {

constexpr int kStepSemitones[7] = {0, 2, 4, 5, 7, 9, 11};
constexpr char kStepLetters[7] = {'C', 'D', 'E', 'F', 'G', 'A', 'B'};

/// Longest accidental run accepted by fromString() ("##" or "bb").
constexpr int kMaxAccidentals = 2;

/// Sharp spelling for each pitch class: step index and alter.
constexpr struct {
  Step step;
  int alter;
} kSharpSpelling[12] = {
    {Step::C, 0}, {Step::C, 1}, {Step::D, 0}, {Step::D, 1},
    {Step::E, 0}, {Step::F, 0}, {Step::F, 1}, {Step::G, 0},
    {Step::G, 1}, {Step::A, 0}, {Step::A, 1}, {Step::B, 0}};

/// Floor division for possibly negative numerators.
int floorDiv(int num, int den) {
  int quot = num / den;
  if ((num % den != 0) && ((num < 0) != (den < 0))) --quot;
  return quot;
}

}  // namespace

int stepSemitones(Step step) {
  return kStepSemitones[static_cast<int>(step)];
}

char stepLetter(Step step) {
  return kStepLetters[static_cast<int>(step)];
}

std::optional<Pitch> Pitch::fromString(std::string_view text) {
  if (text.empty()) return std::nullopt;

  size_t pos = 0;
  char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(text[pos])));
  int step_index = -1;
  for (int idx = 0; idx < 7; ++idx) {
    if (kStepLetters[idx] == letter) {
      step_index = idx;
      break;
    }
  }
  if (step_index < 0) return std::nullopt;
  ++pos;

  int alter = 0;
  if (pos < text.size() && text[pos] == '#') {
    while (pos < text.size() && text[pos] == '#') {
      ++alter;
      ++pos;
    }
  } else {
    while (pos < text.size() && text[pos] == 'b') {
      --alter;
      ++pos;
    }
  }
  if (alter > kMaxAccidentals || alter < -kMaxAccidentals) return std::nullopt;

  int octave = 4;
  if (pos < text.size()) {
    bool negative = false;
    if (text[pos] == '-') {
      negative = true;
      ++pos;
    }
    if (pos >= text.size()) return std::nullopt;
    int value = 0;
    int digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      value = value * 10 + (text[pos] - '0');
      ++pos;
      if (++digits > 2) return std::nullopt;
    }
    if (digits == 0 || pos != text.size()) return std::nullopt;
    octave = negative ? -value : value;
  }

  return Pitch(static_cast<Step>(step_index), alter, octave);
}

Pitch Pitch::fromMidi(int midi) {
  const auto& spelling = kSharpSpelling[getPitchClass(midi)];
  return Pitch(spelling.step, spelling.alter, getOctave(midi));
}

int Pitch::midi() const {
  return (static_cast<int>(octave_) + 1) * 12 + stepSemitones(step_) + alter_;
}

std::string Pitch::name() const {
  std::string result(1, stepLetter(step_));
  if (alter_ > 0) {
    result.append(static_cast<size_t>(alter_), '#');
  } else if (alter_ < 0) {
    result.append(static_cast<size_t>(-alter_), 'b');
  }
  result += std::to_string(octave_);
  return result;
}

Pitch Pitch::transpose(int semitones) const {
  if (semitones % interval::kOctave == 0) {
    return Pitch(step_, alter_, octave_ + semitones / interval::kOctave);
  }
  return fromMidi(midi() + semitones);
}

Pitch Pitch::transpose(const NamedInterval& iv) const {
  int raw_step = static_cast<int>(step_) + iv.steps;
  int new_octave = octave_ + floorDiv(raw_step, 7);
  auto new_step = static_cast<Step>(raw_step - floorDiv(raw_step, 7) * 7);

  int target = midi() + iv.semitones;
  int natural = (new_octave + 1) * 12 + stepSemitones(new_step);
  return Pitch(new_step, target - natural, new_octave);
}

}  // namespace band
