#ifndef SCOREPLAY_MIDI_WRITER_H
#define SCOREPLAY_MIDI_WRITER_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/measure_traversal.h"
#include "core/score.h"
#include "midi/humanize.h"
#include "midi/track_config.h"

namespace scoreplay {

/// @brief Export settings for MidiWriter::build().
struct ExportOptions {
  /// Events to write verbatim; when absent the score is rendered in strict mode.
  std::optional<std::vector<PlaybackEvent>> use_playback_events;
  ChannelMapping channel_mapping;
  std::optional<HumanizeConfig> humanize;
  uint32_t max_visits = kDefaultMaxVisits;
};

// Writes a score as an SMF Type 1 file: one conductor track (tempo, time
// and key signature) followed by one track per part.
class MidiWriter {
 public:
  MidiWriter() = default;

  // Builds MIDI data from a Score.
  // @param score Score snapshot
  // @param options Event source, channel mapping and humanization
  void build(const Score& score, const ExportOptions& options = {});

  // Returns the MIDI data as a byte vector.
  // @returns MIDI binary data
  const std::vector<uint8_t>& toBytes() const { return data_; }

  // Writes MIDI data to a file.
  // @param path Output file path
  // @returns true on success, false on failure
  bool writeToFile(const std::string& path) const;

 private:
  std::vector<uint8_t> data_;

  // Writes the MIDI file header chunk.
  void writeHeader(uint16_t num_tracks, uint16_t division);

  // Writes the conductor track with tempo/time/key changes at measure starts.
  void writeConductorTrack(const Score& score, uint32_t max_visits);

  // Writes a single part track from sounding notes.
  void writeTrack(const std::vector<NoteEvent>& notes, const std::string& name,
                  uint8_t channel, uint8_t program);

  // Wraps finished track content in an MTrk chunk.
  void writeChunk(const std::vector<uint8_t>& track_data);
};

}  // namespace scoreplay

#endif  // SCOREPLAY_MIDI_WRITER_H
