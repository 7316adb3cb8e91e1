// Implementation of the C API.

#include "band_c.h"

#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "core/json_parser.h"
#include "core/pitch_utils.h"
#include "core/version_info.h"
#include "generator.h"
#include "midi/midi_writer.h"

namespace {

/// @brief Internal state held per BandHandle.
struct BandInstance {
  band::GeneratorConfig config;
  band::GeneratorResult result;
  std::vector<uint8_t> midi_bytes;
  std::string events_json;
  std::string last_error;
  bool has_result = false;
};

BandError toBandError(band::GeneratorError error) {
  switch (error) {
    case band::GeneratorError::None:                  return BAND_OK;
    case band::GeneratorError::InsufficientChordSize: return BAND_ERROR_INSUFFICIENT_CHORD_SIZE;
    case band::GeneratorError::InvalidPitch:          return BAND_ERROR_INVALID_PITCH;
    case band::GeneratorError::InvalidQuality:        return BAND_ERROR_INVALID_QUALITY;
    case band::GeneratorError::EmptyProgression:      return BAND_ERROR_INVALID_PARAM;
  }
  return BAND_ERROR_INVALID_PARAM;
}

/// @brief Default request: a C major triad around middle C.
band::GeneratorConfig defaultConfig() {
  band::GeneratorConfig config;
  config.chords.push_back(band::ProgressionChord{});
  return config;
}

BandError fail(BandInstance* instance, BandError error, const std::string& message) {
  instance->has_result = false;
  instance->result = band::GeneratorResult{};
  instance->midi_bytes.clear();
  instance->events_json.clear();
  instance->last_error = message;
  return error;
}

}  // namespace

extern "C" {

// ============================================================================
// Lifecycle
// ============================================================================

BandHandle band_create(void) {
  return new BandInstance();
}

void band_destroy(BandHandle handle) {
  delete static_cast<BandInstance*>(handle);
}

// ============================================================================
// Generation
// ============================================================================

BandError band_generate_from_json(BandHandle handle, const char* json, size_t length) {
  if (!handle) {
    return BAND_ERROR_INVALID_PARAM;
  }
  auto* instance = static_cast<BandInstance*>(handle);
  if (!json) {
    return fail(instance, BAND_ERROR_INVALID_PARAM, "json is NULL");
  }

  auto object = band::parseJsonObject(json, length);
  if (!object) {
    return fail(instance, BAND_ERROR_INVALID_PARAM, "malformed JSON object");
  }

  auto parsed = band::configFromJson(*object, defaultConfig());
  if (!parsed.ok()) {
    return fail(instance, toBandError(parsed.error), parsed.error_message);
  }
  instance->config = std::move(parsed.value);

  band::GeneratorResult result = band::generate(instance->config);
  if (!result.success) {
    return fail(instance, toBandError(result.error), result.error_message);
  }
  instance->result = std::move(result);

  band::MidiWriter writer;
  writer.build(instance->result.tracks, instance->result.tempo_events);
  instance->midi_bytes = writer.toBytes();
  instance->events_json = band::buildEventsJson(instance->result, instance->config);

  instance->last_error.clear();
  instance->has_result = true;
  return BAND_OK;
}

// ============================================================================
// Output Retrieval
// ============================================================================

size_t band_voicing_count(BandHandle handle) {
  if (!handle) return 0;
  auto* instance = static_cast<BandInstance*>(handle);
  if (!instance->has_result) return 0;
  return instance->result.voicings.size();
}

BandError band_get_voicing(BandHandle handle, size_t index, uint8_t* pitches, size_t capacity,
                           size_t* count) {
  if (count) *count = 0;
  if (!handle) return BAND_ERROR_INVALID_PARAM;
  auto* instance = static_cast<BandInstance*>(handle);
  if (!instance->has_result) return BAND_ERROR_NO_RESULT;
  if (index >= instance->result.voicings.size()) return BAND_ERROR_INVALID_PARAM;

  std::vector<int> midi = instance->result.voicings[index].sortedAscending().midiValues();
  if (pitches) {
    for (size_t idx = 0; idx < midi.size() && idx < capacity; ++idx) {
      pitches[idx] = band::clampPitch(midi[idx]);
    }
  }
  if (count) *count = midi.size();
  return BAND_OK;
}

BandMidiData* band_get_midi(BandHandle handle) {
  if (!handle) return nullptr;
  auto* instance = static_cast<BandInstance*>(handle);
  if (!instance->has_result || instance->midi_bytes.empty()) return nullptr;

  auto* result = static_cast<BandMidiData*>(malloc(sizeof(BandMidiData)));
  if (!result) return nullptr;

  result->size = instance->midi_bytes.size();
  result->data = static_cast<uint8_t*>(malloc(result->size));
  if (!result->data) {
    free(result);
    return nullptr;
  }

  memcpy(result->data, instance->midi_bytes.data(), result->size);
  return result;
}

void band_free_midi(BandMidiData* data) {
  if (data) {
    free(data->data);
    free(data);
  }
}

BandEventData* band_get_events(BandHandle handle) {
  if (!handle) return nullptr;
  auto* instance = static_cast<BandInstance*>(handle);
  if (!instance->has_result) return nullptr;

  auto* result = static_cast<BandEventData*>(malloc(sizeof(BandEventData)));
  if (!result) return nullptr;

  result->length = instance->events_json.size();
  result->json = static_cast<char*>(malloc(result->length + 1));
  if (!result->json) {
    free(result);
    return nullptr;
  }

  memcpy(result->json, instance->events_json.c_str(), result->length + 1);
  return result;
}

void band_free_events(BandEventData* data) {
  if (data) {
    free(data->json);
    free(data);
  }
}

// ============================================================================
// Error Handling
// ============================================================================

const char* band_error_string(BandError error) {
  switch (error) {
    case BAND_OK: return "No error";
    case BAND_ERROR_INVALID_PARAM: return "Invalid parameter";
    case BAND_ERROR_INSUFFICIENT_CHORD_SIZE: return "Chord size too small (max_notes must be >= 2)";
    case BAND_ERROR_INVALID_PITCH: return "Invalid pitch spelling";
    case BAND_ERROR_INVALID_QUALITY: return "Invalid chord quality";
    case BAND_ERROR_NO_RESULT: return "No result available";
  }
  return "Unknown error";
}

const char* band_last_error_message(BandHandle handle) {
  if (!handle) return "";
  return static_cast<BandInstance*>(handle)->last_error.c_str();
}

// ============================================================================
// Utilities
// ============================================================================

const char* band_version(void) {
  return band::kBandVersion;
}

}  // extern "C"
