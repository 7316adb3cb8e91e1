// Standard MIDI File (type 1) writer for voiced chord tracks.

#ifndef BAND_MIDI_MIDI_WRITER_H
#define BAND_MIDI_MIDI_WRITER_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace band {

/// @brief Writes Track objects as SMF type 1 data.
///
/// The first MTrk is a conductor track (name "BAND", tempo map, 4/4 time
/// signature, optional "BAND:" text). Each non-empty Track follows with a
/// program change, an optional track name and its note on/off pairs.
class MidiWriter {
 public:
  MidiWriter();

  /// @brief Build complete MIDI data from tracks.
  /// @param tracks Tracks to write; tracks without notes are skipped.
  /// @param tempo_events Tempo map. An empty map writes 120 BPM at tick 0.
  /// @param metadata Optional text embedded in the conductor track.
  void build(const std::vector<Track>& tracks, const std::vector<TempoEvent>& tempo_events,
             const std::string& metadata = "");

  /// @brief Binary MIDI data after build().
  const std::vector<uint8_t>& toBytes() const { return data_; }

  /// @brief Write built MIDI data to a file.
  /// @return True if every byte was written.
  bool writeToFile(const std::string& path) const;

 private:
  std::vector<uint8_t> data_;

  void writeHeader(uint16_t num_tracks, uint16_t division);
  void writeTrack(const Track& track);
  void writeConductorTrack(const std::vector<TempoEvent>& tempo_events,
                           const std::string& metadata);
};

}  // namespace band

#endif  // BAND_MIDI_MIDI_WRITER_H
