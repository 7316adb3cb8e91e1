/// @file
/// @brief SMF type 1 writer implementation.

#include "midi/midi_writer.h"

#include <algorithm>
#include <cstdio>
#include <iterator>

#include "core/pitch_utils.h"
#include "midi/midi_stream.h"

namespace band {

namespace {

constexpr uint16_t kSmfFormat = 1;
constexpr uint32_t kHeaderLength = 6;
constexpr uint8_t kMetaTrackName = 0x03;
constexpr uint8_t kMetaText = 0x01;

/// @brief Channel event staged for sorting before it is written.
struct WriteEvent {
  Tick tick = 0;
  uint8_t status = 0;
  uint8_t data1 = 0;
  uint8_t data2 = 0;
  int priority = 0;  // Lower sorts first at the same tick.
};

void writeMetaText(std::vector<uint8_t>& buf, uint8_t type, const std::string& text) {
  writeVariableLength(buf, 0);
  buf.push_back(0xFF);
  buf.push_back(type);
  writeVariableLength(buf, static_cast<uint32_t>(text.size()));
  buf.insert(buf.end(), text.begin(), text.end());
}

void writeEndOfTrack(std::vector<uint8_t>& buf) {
  writeVariableLength(buf, 0);
  buf.push_back(0xFF);
  buf.push_back(0x2F);
  buf.push_back(0x00);
}

bool hasContent(const Track& track) {
  return !track.notes.empty();
}

}  // namespace

MidiWriter::MidiWriter() = default;

void MidiWriter::build(const std::vector<Track>& tracks,
                       const std::vector<TempoEvent>& tempo_events,
                       const std::string& metadata) {
  data_.clear();

  auto content_tracks = std::count_if(tracks.begin(), tracks.end(), hasContent);
  writeHeader(static_cast<uint16_t>(content_tracks + 1), static_cast<uint16_t>(kTicksPerBeat));
  writeConductorTrack(tempo_events, metadata);

  for (const auto& track : tracks) {
    if (hasContent(track)) {
      writeTrack(track);
    }
  }
}

bool MidiWriter::writeToFile(const std::string& path) const {
  FILE* file = std::fopen(path.c_str(), "wb");
  if (!file) {
    return false;
  }
  size_t written = std::fwrite(data_.data(), 1, data_.size(), file);
  bool closed = std::fclose(file) == 0;
  return closed && written == data_.size();
}

void MidiWriter::writeHeader(uint16_t num_tracks, uint16_t division) {
  const char* magic = "MThd";
  data_.insert(data_.end(), magic, magic + 4);
  writeBE32(data_, kHeaderLength);
  writeBE16(data_, kSmfFormat);
  writeBE16(data_, num_tracks);
  writeBE16(data_, division);
}

void MidiWriter::writeTrack(const Track& track) {
  std::vector<uint8_t> track_buf;
  const uint8_t channel = track.channel & 0x0F;

  // Program change at tick 0.
  writeVariableLength(track_buf, 0);
  track_buf.push_back(static_cast<uint8_t>(0xC0 | channel));
  track_buf.push_back(track.program & 0x7F);

  if (!track.name.empty()) {
    writeMetaText(track_buf, kMetaTrackName, track.name);
  }

  std::vector<WriteEvent> events;
  events.reserve(track.notes.size() * 2);

  for (const auto& note : track.notes) {
    auto pitch = static_cast<uint8_t>(clampPitch(note.pitch));

    // Note-off sorts before note-on so repeated chords do not cut each other.
    events.push_back({note.start_tick, static_cast<uint8_t>(0x90 | channel), pitch,
                      note.velocity, 1});
    events.push_back({note.start_tick + note.duration, static_cast<uint8_t>(0x80 | channel),
                      pitch, 0, 0});
  }

  std::stable_sort(events.begin(), events.end(),
                   [](const WriteEvent& lhs, const WriteEvent& rhs) {
                     if (lhs.tick != rhs.tick) return lhs.tick < rhs.tick;
                     return lhs.priority < rhs.priority;
                   });

  Tick prev_tick = 0;
  for (const auto& evt : events) {
    writeVariableLength(track_buf, evt.tick - prev_tick);
    track_buf.push_back(evt.status);
    track_buf.push_back(evt.data1 & 0x7F);
    track_buf.push_back(evt.data2 & 0x7F);
    prev_tick = evt.tick;
  }

  writeEndOfTrack(track_buf);
  writeChunk(data_, "MTrk", track_buf);
}

void MidiWriter::writeConductorTrack(const std::vector<TempoEvent>& tempo_events,
                                     const std::string& metadata) {
  std::vector<uint8_t> track_buf;
  writeMetaText(track_buf, kMetaTrackName, "BAND");

  std::vector<TempoEvent> sorted_events = tempo_events;
  std::stable_sort(sorted_events.begin(), sorted_events.end(),
                   [](const TempoEvent& lhs, const TempoEvent& rhs) {
                     return lhs.tick < rhs.tick;
                   });
  if (sorted_events.empty()) {
    sorted_events.push_back(TempoEvent{});
  }

  // FF 51 03 tttttt per tempo change.
  Tick prev_tick = 0;
  for (const auto& evt : sorted_events) {
    uint16_t bpm = evt.bpm == 0 ? 1 : evt.bpm;
    uint32_t usec_per_beat = kMicrosecondsPerMinute / bpm;
    writeVariableLength(track_buf, evt.tick - prev_tick);
    track_buf.push_back(0xFF);
    track_buf.push_back(0x51);
    track_buf.push_back(0x03);
    track_buf.push_back(static_cast<uint8_t>((usec_per_beat >> 16) & 0xFF));
    track_buf.push_back(static_cast<uint8_t>((usec_per_beat >> 8) & 0xFF));
    track_buf.push_back(static_cast<uint8_t>(usec_per_beat & 0xFF));
    prev_tick = evt.tick;
  }

  // 4/4: FF 58 04 nn dd cc bb
  writeVariableLength(track_buf, 0);
  const uint8_t time_signature[] = {0xFF, 0x58, 0x04, 0x04, 0x02, 0x18, 0x08};
  track_buf.insert(track_buf.end(), std::begin(time_signature), std::end(time_signature));

  if (!metadata.empty()) {
    writeMetaText(track_buf, kMetaText, "BAND:" + metadata);
  }

  writeEndOfTrack(track_buf);
  writeChunk(data_, "MTrk", track_buf);
}

}  // namespace band
