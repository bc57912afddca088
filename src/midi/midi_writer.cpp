/**
 * @file midi_writer.cpp
 * @brief Implementation of the SMF Type 1 score writer.
 */

#include "midi/midi_writer.h"

#include <algorithm>
#include <fstream>
#include <map>
#include <random>

#include "core/score_index.h"
#include "core/timing_constants.h"
#include "midi/byte_order.h"
#include "midi/sounding_notes.h"
#include "playback/playback_generator.h"

namespace scoreplay {

namespace {

// ============================================================================
// MIDI Metadata Length Limits
// ============================================================================
// Track names are limited to 255 bytes for compatibility with most software.
constexpr size_t kMaxMetaTextLength = 255;

/// Running tempo/meter/key state of the conductor track.
struct ConductorState {
  uint16_t bpm = 120;
  TimeSignature time_signature;
  KeySignature key_signature;

  bool operator!=(const ConductorState& other) const {
    return bpm != other.bpm || time_signature != other.time_signature ||
           key_signature != other.key_signature;
  }
};

uint8_t log2Denominator(uint8_t denominator) {
  uint8_t power = 0;
  while (denominator > 1) {
    denominator >>= 1;
    power++;
  }
  return power;
}

void writeTrackName(std::vector<uint8_t>& track_data, const std::string& name) {
  std::string track_name =
      name.size() > kMaxMetaTextLength ? name.substr(0, kMaxMetaTextLength) : name;
  track_data.push_back(0x00);
  track_data.push_back(0xFF);
  track_data.push_back(0x03);
  writeVariableLength(track_data, static_cast<uint32_t>(track_name.size()));
  for (char c : track_name) {
    track_data.push_back(static_cast<uint8_t>(c));
  }
}

// Tempo, time signature and key signature, in that order, at `delta`.
void writeConductorMeta(std::vector<uint8_t>& track_data, Tick delta,
                        const ConductorState& state) {
  uint32_t microseconds_per_beat = bpmToMicroseconds(state.bpm);
  writeVariableLength(track_data, delta);
  track_data.push_back(0xFF);
  track_data.push_back(0x51);
  track_data.push_back(0x03);
  track_data.push_back((microseconds_per_beat >> 16) & 0xFF);
  track_data.push_back((microseconds_per_beat >> 8) & 0xFF);
  track_data.push_back(microseconds_per_beat & 0xFF);

  track_data.push_back(0x00);
  track_data.push_back(0xFF);
  track_data.push_back(0x58);
  track_data.push_back(0x04);
  track_data.push_back(state.time_signature.numerator);
  track_data.push_back(log2Denominator(state.time_signature.denominator));
  track_data.push_back(0x18);  // Clocks per metronome click
  track_data.push_back(0x08);  // 32nd notes per quarter

  track_data.push_back(0x00);
  track_data.push_back(0xFF);
  track_data.push_back(0x59);
  track_data.push_back(0x02);
  track_data.push_back(static_cast<uint8_t>(state.key_signature.fifths));
  track_data.push_back(state.key_signature.mode == KeyMode::Minor ? 1 : 0);
}

void writeEndOfTrack(std::vector<uint8_t>& track_data) {
  track_data.push_back(0x00);
  track_data.push_back(0xFF);
  track_data.push_back(0x2F);
  track_data.push_back(0x00);
}

}  // namespace

void MidiWriter::writeHeader(uint16_t num_tracks, uint16_t division) {
  // MThd
  data_.push_back('M');
  data_.push_back('T');
  data_.push_back('h');
  data_.push_back('d');

  // Header length = 6
  writeUint32BE(data_, 6);

  // Format = 1
  writeUint16BE(data_, 1);

  // Number of tracks
  writeUint16BE(data_, num_tracks);

  // Division (ticks per quarter note)
  writeUint16BE(data_, division);
}

void MidiWriter::writeChunk(const std::vector<uint8_t>& track_data) {
  data_.push_back('M');
  data_.push_back('T');
  data_.push_back('r');
  data_.push_back('k');

  writeUint32BE(data_, static_cast<uint32_t>(track_data.size()));
  data_.insert(data_.end(), track_data.begin(), track_data.end());
}

void MidiWriter::writeConductorTrack(const Score& score, uint32_t max_visits) {
  std::vector<uint8_t> track_data;

  if (!score.title.empty()) {
    writeTrackName(track_data, score.title);
  }

  ConductorState current;
  const std::vector<Measure>* measures = nullptr;
  if (!score.parts.empty() && !score.parts.front().staves.empty()) {
    measures = &score.parts.front().staves.front().measures;
  }

  if (!measures || measures->empty()) {
    writeConductorMeta(track_data, 0, current);
  } else {
    ResolverResult traversal = resolveMeasureTraversal(*measures, max_visits);
    std::vector<Tick> starts = visitStartTicks(*measures, traversal);

    std::map<std::string, const Measure*> by_id;
    for (const auto& measure : *measures) by_id.emplace(measure.id, &measure);

    Tick prev_time = 0;
    bool emitted = false;
    for (size_t v = 0; v < traversal.order.size(); ++v) {
      auto it = by_id.find(traversal.order[v].measure_id);
      if (it == by_id.end()) continue;
      const Measure& measure = *it->second;

      ConductorState next = current;
      if (measure.tempo_bpm && *measure.tempo_bpm > 0) next.bpm = *measure.tempo_bpm;
      if (measure.time_signature) next.time_signature = *measure.time_signature;
      if (measure.key_signature) next.key_signature = *measure.key_signature;

      if (!emitted || next != current) {
        Tick at = emitted ? starts[v] : 0;
        writeConductorMeta(track_data, at - prev_time, next);
        prev_time = at;
        emitted = true;
      }
      current = next;
    }
    if (!emitted) {
      writeConductorMeta(track_data, 0, current);
    }
  }

  writeEndOfTrack(track_data);
  writeChunk(track_data);
}

void MidiWriter::writeTrack(const std::vector<NoteEvent>& notes, const std::string& name,
                            uint8_t channel, uint8_t program) {
  std::vector<uint8_t> track_data;

  writeTrackName(track_data, name);

  // Program change
  track_data.push_back(0x00);
  track_data.push_back(0xC0 | channel);
  track_data.push_back(program);

  // Convert NoteEvents to note on/off events
  struct Event {
    Tick time;
    uint8_t type;  // 0x90 = note on, 0x80 = note off
    uint8_t pitch;
    uint8_t velocity;
  };
  std::vector<Event> events;
  events.reserve(notes.size() * 2);  // 2 events per note (on + off)

  for (const auto& note : notes) {
    events.push_back({note.start_tick, 0x90, note.note, note.velocity});
    events.push_back({note.endTick(), 0x80, note.note, 0});
  }

  // Sort events by time, with note-off before note-on at same time, so a
  // note ending where another begins is closed before the new one starts.
  std::stable_sort(events.begin(), events.end(), [](const Event& a, const Event& b) {
    if (a.time != b.time) return a.time < b.time;
    return a.type < b.type;
  });

  // Write events with delta times
  Tick prev_time = 0;
  for (const auto& evt : events) {
    Tick delta = evt.time - prev_time;
    prev_time = evt.time;

    writeVariableLength(track_data, delta);
    track_data.push_back((evt.type & 0xF0) | channel);
    track_data.push_back(evt.pitch);
    track_data.push_back(evt.type == 0x90 ? evt.velocity : 0);
  }

  writeEndOfTrack(track_data);
  writeChunk(track_data);
}

void MidiWriter::build(const Score& score, const ExportOptions& options) {
  data_.clear();

  std::vector<PlaybackEvent> generated;
  if (!options.use_playback_events) {
    GeneratorOptions strict;
    strict.expressive = false;
    strict.max_visits = options.max_visits;
    generated = generatePlaybackEvents(score, strict).events;
  }
  const std::vector<PlaybackEvent>& events =
      options.use_playback_events ? *options.use_playback_events : generated;

  ScoreIndex index(score);
  auto per_part = splitEventsByPart(events, index, score.parts.size());
  auto assignments = resolveChannelAssignments(score, options.channel_mapping);

  std::mt19937 rng(options.humanize ? options.humanize->seed : 0);

  writeHeader(static_cast<uint16_t>(score.parts.size() + 1), TICKS_PER_BEAT);
  writeConductorTrack(score, options.max_visits);

  for (size_t p = 0; p < score.parts.size(); ++p) {
    auto& part_events = per_part[p];
    std::stable_sort(part_events.begin(), part_events.end(), playbackEventLess);

    std::vector<NoteEvent> notes = mergeTieChains(part_events, index);
    if (options.humanize) {
      applyHumanization(notes, *options.humanize, rng);
    }
    writeTrack(notes, score.parts[p].name, assignments[p].channel, assignments[p].program);
  }
}

bool MidiWriter::writeToFile(const std::string& path) const {
  std::ofstream file(path, std::ios::binary);
  if (!file) return false;

  file.write(reinterpret_cast<const char*>(data_.data()),
             static_cast<std::streamsize>(data_.size()));
  return file.good();
}

}  // namespace scoreplay
