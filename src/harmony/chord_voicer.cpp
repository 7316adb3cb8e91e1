// Closed chord voicing implementation.

#include "harmony/chord_voicer.h"

#include <algorithm>
#include <cstdio>
#include <utility>

#include "core/pitch_utils.h"
#include "harmony/inversion.h"
#include "harmony/octave_placement.h"

namespace band {

namespace {

/// Importance weights. The third and the 6th/7th define the chord's color
/// and are kept longest; the fifth is dropped first.
constexpr int kFifthImportance = 1;
constexpr int kRootImportance = 3;
constexpr int kExtensionImportance = 7;
constexpr int kThirdImportance = 9;
constexpr int kUpperImportance = 9;

void appendTone(std::vector<ChordTone>& tones, const Pitch& pitch, ToneRole role) {
  ChordTone tone;
  tone.pitch = pitch;
  tone.role = role;
  tone.importance = toneImportance(role);
  tone.order = tones.size();
  tones.push_back(tone);
}

VoicingResult makeFailure(VoicingError error, const std::string& detail) {
  VoicingResult result;
  result.success = false;
  result.error = error;
  result.error_message = detail;
  return result;
}

VoicingResult sizeFailure(int max_notes) {
  return makeFailure(VoicingError::InsufficientChordSize,
                     "max_notes must be at least " + std::to_string(kMinChordNotes) +
                         " (got " + std::to_string(max_notes) + ")");
}

}  // namespace

const char* toneRoleToString(ToneRole role) {
  switch (role) {
    case ToneRole::Root:      return "root";
    case ToneRole::Third:     return "third";
    case ToneRole::Fifth:     return "fifth";
    case ToneRole::Upper:     return "upper";
    case ToneRole::Extension: return "extension";
  }
  return "unknown";
}

int toneImportance(ToneRole role) {
  switch (role) {
    case ToneRole::Root:      return kRootImportance;
    case ToneRole::Third:     return kThirdImportance;
    case ToneRole::Fifth:     return kFifthImportance;
    case ToneRole::Upper:     return kUpperImportance;
    case ToneRole::Extension: return kExtensionImportance;
  }
  return 0;
}

const char* voicingErrorToString(VoicingError error) {
  switch (error) {
    case VoicingError::None:                  return "none";
    case VoicingError::InsufficientChordSize: return "insufficient chord size";
    case VoicingError::InvalidPitch:          return "invalid pitch";
  }
  return "unknown";
}

std::vector<ChordTone> buildChordTones(const ChordType& type, const Pitch& root,
                                       bool include_root) {
  std::vector<ChordTone> tones;
  appendTone(tones, root.transpose(intervalFor(type.thirdQuality())), ToneRole::Third);
  for (Harmony harmony : type.harmonies()) {
    appendTone(tones, root.transpose(intervalFor(harmony)), ToneRole::Extension);
  }
  appendTone(tones, root.transpose(intervalFor(type.fifthQuality())), ToneRole::Fifth);
  if (include_root) {
    appendTone(tones, root, ToneRole::Root);
  }
  if (type.hasUpperQuality()) {
    appendTone(tones, root.transpose(intervalFor(type.upperQuality())), ToneRole::Upper);
  }
  return tones;
}

std::vector<ChordTone> trimChordTones(std::vector<ChordTone> tones, size_t max_notes) {
  while (tones.size() > max_notes) {
    auto weakest = std::min_element(tones.begin(), tones.end(),
                                    [](const ChordTone& lhs, const ChordTone& rhs) {
                                      if (lhs.importance != rhs.importance) {
                                        return lhs.importance < rhs.importance;
                                      }
                                      return lhs.order < rhs.order;
                                    });
    tones.erase(weakest);
  }
  return tones;
}

VoicingResult generateClosedChord(const ChordType& type, const VoicingRequest& request) {
  if (request.max_notes < kMinChordNotes) return sizeFailure(request.max_notes);

  auto tones = buildChordTones(type, request.root, request.include_root);
  if (request.verbose) {
    std::fprintf(stderr, "[generateClosedChord] %s%s: %zu candidates\n",
                 request.root.name().c_str(), chordTypeToString(type).c_str(), tones.size());
    for (const auto& tone : tones) {
      std::fprintf(stderr, "[generateClosedChord]   %-9s %-5s importance=%d\n",
                   toneRoleToString(tone.role), tone.pitch.name().c_str(), tone.importance);
    }
  }

  std::vector<ChordTone> kept = trimChordTones(tones, static_cast<size_t>(request.max_notes));
  if (request.verbose) {
    for (const auto& tone : tones) {
      bool survived = std::any_of(kept.begin(), kept.end(), [&tone](const ChordTone& other) {
        return other.order == tone.order;
      });
      if (!survived) {
        std::fprintf(stderr, "[generateClosedChord]   dropped %-9s %-5s importance=%d\n",
                     toneRoleToString(tone.role), tone.pitch.name().c_str(), tone.importance);
      }
    }
  }
  tones = std::move(kept);

  std::vector<Pitch> selected;
  selected.reserve(tones.size());
  for (const auto& tone : tones) {
    selected.push_back(tone.pitch);
  }
  Chord base = Chord(std::move(selected)).sortedAscending();

  base = moveChordNear(base, request.anchor);
  base = closedPosition(base);

  std::vector<Chord> inversions = allInversions(base);
  for (auto& inversion : inversions) {
    inversion = moveChordNear(inversion, request.anchor);
  }
  size_t best_idx = selectBestFit(inversions, request.anchor);

  if (request.verbose) {
    for (size_t idx = 0; idx < inversions.size(); ++idx) {
      std::fprintf(stderr, "[generateClosedChord]   inversion %zu %s mad=%.3f%s\n", idx,
                   inversions[idx].toString().c_str(),
                   meanAbsoluteDeviation(inversions[idx], request.anchor),
                   idx == best_idx ? " *" : "");
    }
  }

  VoicingResult result;
  result.chord = inversions[best_idx];
  if (request.bass) {
    Pitch bass = movePitchNear(*request.bass, request.anchor.transpose(-interval::kOctave));
    result.chord = result.chord.withPitch(bass);
  }
  result.success = true;
  return result;
}

VoicingResult generateClosedChord(const ChordType& type, const std::string& root,
                                  const std::string& anchor, int max_notes,
                                  const std::string& bass, bool include_root) {
  if (max_notes < kMinChordNotes) return sizeFailure(max_notes);

  VoicingRequest request;
  request.max_notes = max_notes;
  request.include_root = include_root;

  auto root_pitch = Pitch::fromString(root);
  if (!root_pitch) {
    return makeFailure(VoicingError::InvalidPitch, "cannot parse root pitch '" + root + "'");
  }
  request.root = *root_pitch;

  auto anchor_pitch = Pitch::fromString(anchor);
  if (!anchor_pitch) {
    return makeFailure(VoicingError::InvalidPitch, "cannot parse anchor pitch '" + anchor + "'");
  }
  request.anchor = *anchor_pitch;

  if (!bass.empty()) {
    auto bass_pitch = Pitch::fromString(bass);
    if (!bass_pitch) {
      return makeFailure(VoicingError::InvalidPitch, "cannot parse bass pitch '" + bass + "'");
    }
    request.bass = *bass_pitch;
  }

  return generateClosedChord(type, request);
}

}  // namespace band
