// Progression generator: voicing, track layout, text and JSON input.

#include "generator.h"

#include <cstdio>
#include <sstream>
#include <utility>

#include "core/interval.h"
#include "core/json_helpers.h"
#include "core/pitch_utils.h"

namespace band {

namespace {

constexpr uint8_t kChordChannel = 0;

template <typename T>
ParseResult<T> parseFailure(GeneratorError error, std::string message) {
  ParseResult<T> result;
  result.error = error;
  result.error_message = std::move(message);
  return result;
}

/// @brief Parse a required pitch field, reporting its name on failure.
bool readPitch(const std::string& text, const char* field, Pitch& out, GeneratorError& error,
               std::string& message) {
  auto pitch = Pitch::fromString(text);
  if (!pitch) {
    error = GeneratorError::InvalidPitch;
    message = std::string("cannot parse ") + field + " pitch '" + text + "'";
    return false;
  }
  out = *pitch;
  return true;
}

}  // namespace

const char* generatorErrorToString(GeneratorError error) {
  switch (error) {
    case GeneratorError::None:                  return "none";
    case GeneratorError::InsufficientChordSize: return "insufficient chord size";
    case GeneratorError::InvalidPitch:          return "invalid pitch";
    case GeneratorError::InvalidQuality:        return "invalid quality";
    case GeneratorError::EmptyProgression:      return "empty progression";
  }
  return "unknown";
}

GeneratorError generatorErrorFromVoicing(VoicingError error) {
  switch (error) {
    case VoicingError::None:                  return GeneratorError::None;
    case VoicingError::InsufficientChordSize: return GeneratorError::InsufficientChordSize;
    case VoicingError::InvalidPitch:          return GeneratorError::InvalidPitch;
  }
  return GeneratorError::None;
}

std::string progressionChordToString(const ProgressionChord& chord) {
  std::string text = chord.root.name() + ":" + chordTypeToString(chord.type);
  if (chord.bass) {
    text += "/" + chord.bass->name();
  }
  return text;
}

// ---------------------------------------------------------------------------
// Generation
// ---------------------------------------------------------------------------

GeneratorResult generate(const GeneratorConfig& config) {
  GeneratorResult result;
  if (config.chords.empty()) {
    result.error = GeneratorError::EmptyProgression;
    result.error_message = "progression has no chords";
    return result;
  }

  Track track;
  track.channel = kChordChannel;
  track.program = config.program;
  track.name = "Chords";

  Tick tick = 0;
  for (size_t idx = 0; idx < config.chords.size(); ++idx) {
    const ProgressionChord& chord = config.chords[idx];

    VoicingRequest request;
    request.root = chord.root;
    request.anchor = config.anchor;
    request.max_notes = config.max_notes;
    request.bass = chord.bass;
    request.include_root = chord.include_root;
    request.verbose = config.verbose;

    VoicingResult voicing = generateClosedChord(chord.type, request);
    if (!voicing.success) {
      result = GeneratorResult{};
      result.error = generatorErrorFromVoicing(voicing.error);
      result.error_message = "chord " + std::to_string(idx + 1) + " (" +
                             progressionChordToString(chord) + "): " + voicing.error_message;
      return result;
    }

    if (config.verbose) {
      std::fprintf(stderr, "[generate] %zu %s -> %s\n", idx + 1,
                   progressionChordToString(chord).c_str(), voicing.chord.toString().c_str());
    }

    for (const auto& pitch : voicing.chord.pitches()) {
      NoteEvent note;
      note.start_tick = tick;
      note.duration = config.chord_duration;
      note.pitch = static_cast<uint8_t>(clampPitch(pitch.midi()));
      note.velocity = config.velocity;
      note.chord_index = static_cast<uint16_t>(idx);
      track.notes.push_back(note);
    }
    result.voicings.push_back(std::move(voicing.chord));
    tick += config.chord_duration;
  }

  result.tracks.push_back(std::move(track));
  result.tempo_events.push_back({0, config.bpm});
  result.total_duration_ticks = tick;
  result.success = true;
  return result;
}

std::vector<ProgressionChord> twoFiveOneProgression(const Pitch& tonic) {
  auto rootless = [](ChordType type, const Pitch& root) {
    ProgressionChord chord;
    chord.type = type;
    chord.root = root;
    chord.include_root = false;
    chord.bass = root;
    return chord;
  };

  return {
      rootless(kMinorSeventh.addMaj9(), tonic.transpose(named_interval::kM2)),
      rootless(kDominantSeventh.addMaj13(), tonic.transpose(named_interval::kP5)),
      rootless(kMajorSeventh.addMaj9(), tonic),
  };
}

// ---------------------------------------------------------------------------
// Text input
// ---------------------------------------------------------------------------

ParseResult<ProgressionChord> progressionChordFromString(const std::string& text,
                                                         bool include_root) {
  using Result = ParseResult<ProgressionChord>;

  std::string root_text = text;
  std::string quality_text;
  std::string bass_text;

  size_t colon = text.find(':');
  if (colon != std::string::npos) {
    root_text = text.substr(0, colon);
    quality_text = text.substr(colon + 1);
    size_t slash = quality_text.rfind('/');
    if (slash != std::string::npos) {
      bass_text = quality_text.substr(slash + 1);
      quality_text.resize(slash);
    }
  }

  Result result;
  result.value.include_root = include_root;
  if (!readPitch(root_text, "root", result.value.root, result.error, result.error_message)) {
    return result;
  }

  auto type = chordTypeFromString(quality_text);
  if (!type) {
    return parseFailure<ProgressionChord>(GeneratorError::InvalidQuality,
                                          "unknown chord quality '" + quality_text + "' in '" +
                                              text + "'");
  }
  result.value.type = *type;

  if (!bass_text.empty()) {
    Pitch bass;
    if (!readPitch(bass_text, "bass", bass, result.error, result.error_message)) {
      return result;
    }
    result.value.bass = bass;
  }
  return result;
}

ParseResult<std::vector<ProgressionChord>> parseProgression(const std::string& text,
                                                            bool include_root) {
  ParseResult<std::vector<ProgressionChord>> result;
  std::istringstream stream(text);
  std::string token;
  while (stream >> token) {
    auto chord = progressionChordFromString(token, include_root);
    if (!chord.ok()) {
      return parseFailure<std::vector<ProgressionChord>>(chord.error, chord.error_message);
    }
    result.value.push_back(chord.value);
  }
  return result;
}

ParseResult<GeneratorConfig> configFromJson(const JsonObject& object,
                                            const GeneratorConfig& defaults) {
  using Result = ParseResult<GeneratorConfig>;
  Result result;
  GeneratorConfig& config = result.value;
  config = defaults;

  auto find = [&object](const char* key) -> const JsonValue* {
    auto iter = object.find(key);
    return iter == object.end() ? nullptr : &iter->second;
  };

  if (const JsonValue* val = find("anchor")) {
    if (!readPitch(val->asString(), "anchor", config.anchor, result.error,
                   result.error_message)) {
      return result;
    }
  }
  if (const JsonValue* val = find("max_notes")) {
    config.max_notes = val->asInt(config.max_notes);
  }
  if (const JsonValue* val = find("bpm")) {
    int bpm = val->asInt(0);
    if (bpm >= kMinBpm && bpm <= kMaxBpm) {
      config.bpm = static_cast<uint16_t>(bpm);
    }
  }

  bool include_root = true;
  if (const JsonValue* val = find("include_root")) {
    include_root = val->asBool(true);
  }

  if (const JsonValue* val = find("progression")) {
    auto chords = parseProgression(val->asString(), include_root);
    if (!chords.ok()) {
      return parseFailure<GeneratorConfig>(chords.error, chords.error_message);
    }
    config.chords = std::move(chords.value);
    return result;
  }

  const JsonValue* quality = find("quality");
  const JsonValue* root = find("root");
  if (quality == nullptr && root == nullptr) {
    return result;
  }

  ProgressionChord chord;
  chord.include_root = include_root;
  if (root != nullptr &&
      !readPitch(root->asString(), "root", chord.root, result.error, result.error_message)) {
    return result;
  }
  if (quality != nullptr) {
    std::string quality_text = quality->asString();
    auto type = chordTypeFromString(quality_text);
    if (!type) {
      return parseFailure<GeneratorConfig>(GeneratorError::InvalidQuality,
                                           "unknown chord quality '" + quality_text + "'");
    }
    chord.type = *type;
  }
  if (const JsonValue* val = find("bass")) {
    std::string bass_text = val->asString();
    if (!bass_text.empty()) {
      Pitch bass;
      if (!readPitch(bass_text, "bass", bass, result.error, result.error_message)) {
        return result;
      }
      chord.bass = bass;
    }
  }
  config.chords = {chord};
  return result;
}

// ---------------------------------------------------------------------------
// JSON output
// ---------------------------------------------------------------------------

std::string buildEventsJson(const GeneratorResult& result, const GeneratorConfig& config) {
  JsonWriter writer;
  writer.beginObject();

  writer.key("anchor");
  writer.value(config.anchor.name());
  writer.key("max_notes");
  writer.value(config.max_notes);
  writer.key("bpm");
  writer.value(static_cast<int>(config.bpm));
  writer.key("total_ticks");
  writer.value(result.total_duration_ticks);

  writer.key("chords");
  writer.beginArray();
  for (size_t idx = 0; idx < result.voicings.size(); ++idx) {
    const Chord& voicing = result.voicings[idx];
    writer.beginObject();
    if (idx < config.chords.size()) {
      writer.key("symbol");
      writer.value(progressionChordToString(config.chords[idx]));
    }
    writer.key("start_tick");
    writer.value(static_cast<uint32_t>(idx * config.chord_duration));
    writer.key("pitches");
    writer.beginArray();
    for (const auto& pitch : voicing.pitches()) {
      writer.value(pitch.name());
    }
    writer.endArray();
    writer.key("midi");
    writer.beginArray();
    for (int midi : voicing.midiValues()) {
      writer.value(midi);
    }
    writer.endArray();
    writer.endObject();
  }
  writer.endArray();

  writer.key("tracks");
  writer.beginArray();
  for (const auto& track : result.tracks) {
    writer.beginObject();
    writer.key("name");
    writer.value(track.name);
    writer.key("channel");
    writer.value(static_cast<int>(track.channel));
    writer.key("program");
    writer.value(static_cast<int>(track.program));
    writer.key("notes");
    writer.beginArray();
    for (const auto& note : track.notes) {
      writer.beginObject();
      writer.key("pitch");
      writer.value(static_cast<int>(note.pitch));
      writer.key("velocity");
      writer.value(static_cast<int>(note.velocity));
      writer.key("start_tick");
      writer.value(note.start_tick);
      writer.key("duration");
      writer.value(note.duration);
      writer.key("chord");
      writer.value(static_cast<int>(note.chord_index));
      writer.endObject();
    }
    writer.endArray();
    writer.endObject();
  }
  writer.endArray();

  writer.endObject();
  return writer.toString();
}

}  // namespace band
