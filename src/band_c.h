// C API for FFI bindings.

#ifndef BAND_C_H
#define BAND_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Handle and Error Definitions
// ============================================================================

/// @brief Opaque handle to a band generator instance.
typedef void* BandHandle;

/// @brief Error codes returned by API functions.
typedef enum {
  BAND_OK = 0,
  BAND_ERROR_INVALID_PARAM = 1,
  BAND_ERROR_INSUFFICIENT_CHORD_SIZE = 2,
  BAND_ERROR_INVALID_PITCH = 3,
  BAND_ERROR_INVALID_QUALITY = 4,
  BAND_ERROR_NO_RESULT = 5,
} BandError;

// ============================================================================
// Output Data Structures
// ============================================================================

/// @brief MIDI binary output.
typedef struct {
  uint8_t* data;  ///< MIDI binary data
  size_t size;    ///< Size in bytes
} BandMidiData;

/// @brief Event JSON output.
typedef struct {
  char* json;     ///< NUL-terminated JSON string
  size_t length;  ///< String length
} BandEventData;

// ============================================================================
// Lifecycle
// ============================================================================

/// @brief Create a new generator instance.
/// @return Handle (must be freed with band_destroy)
BandHandle band_create(void);

/// @brief Destroy a generator instance. NULL is ignored.
void band_destroy(BandHandle handle);

// ============================================================================
// Generation
// ============================================================================

/// @brief Voice a chord or a progression described by a JSON object.
///
/// JSON fields (all optional):
///   quality: string, chord symbol suffix ("m7(9)", "maj7", "" = major)
///   root: string, pitch spelling (default "C4")
///   anchor: string, pitch spelling (default "C4")
///   max_notes: number (default 5, must be >= 2)
///   bass: string, pitch spelling (default none)
///   include_root: boolean (default true)
///   progression: string, whitespace-separated "ROOT:QUALITY[/BASS]" symbols;
///                overrides quality, root and bass
///   bpm: number (default 120)
///
/// A failed call discards any previous result.
///
/// @param handle Band handle
/// @param json JSON config string
/// @param length Length of the JSON string
/// @return BAND_OK on success
BandError band_generate_from_json(BandHandle handle, const char* json, size_t length);

// ============================================================================
// Output Retrieval
// ============================================================================

/// @brief Number of voiced chords in the last result (0 without a result).
size_t band_voicing_count(BandHandle handle);

/// @brief Copy the MIDI note numbers of one voicing, lowest first.
///
/// Values are clamped to 0-127, matching the notes written to the MIDI data.
/// @param handle Band handle
/// @param index Chord index, below band_voicing_count()
/// @param pitches Destination; may be NULL when capacity is 0
/// @param capacity Number of slots in pitches; at most capacity values are written
/// @param count Receives the number of pitches in the voicing; may be NULL
/// @return BAND_OK, BAND_ERROR_NO_RESULT without a result, or
///         BAND_ERROR_INVALID_PARAM for a bad handle or index
BandError band_get_voicing(BandHandle handle, size_t index, uint8_t* pitches, size_t capacity,
                           size_t* count);

/// @brief Get generated MIDI data.
/// @return MidiData (must be freed with band_free_midi), NULL without a result
BandMidiData* band_get_midi(BandHandle handle);

/// @brief Free MIDI data returned by band_get_midi.
void band_free_midi(BandMidiData* data);

/// @brief Get voicings and note events as JSON.
/// @return EventData (must be freed with band_free_events), NULL without a result
BandEventData* band_get_events(BandHandle handle);

/// @brief Free event data returned by band_get_events.
void band_free_events(BandEventData* data);

// ============================================================================
// Error Handling
// ============================================================================

/// @brief Get error message for error code.
/// @return Error message (static, do not free)
const char* band_error_string(BandError error);

/// @brief Detailed message for the last failed call on this handle.
/// @return Message owned by the handle; empty if the last call succeeded
const char* band_last_error_message(BandHandle handle);

// ============================================================================
// Utilities
// ============================================================================

/// @brief Get library version string (e.g. "0.1.0").
const char* band_version(void);

#ifdef __cplusplus
}
#endif

#endif  // BAND_C_H
