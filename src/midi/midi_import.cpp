/**
 * @file midi_import.cpp
 * @brief Note pairing and advisory warnings for imported SMF data.
 */

#include "midi/midi_import.h"

#include <algorithm>
#include <map>
#include <utility>

#include "core/timing_constants.h"

namespace scoreplay {

const char* const kFormatWarning = "Only format 1 is fully supported.";
const char* const kSmpteWarning = "SMPTE time division detected; ticks-per-quarter expected.";

namespace {

constexpr uint32_t kMaxImportedBpm = 0xFFFF;

// Key = (channel << 8) | pitch, value = (start tick, velocity)
using ActiveNotes = std::map<uint16_t, std::pair<Tick, uint8_t>>;

void closeNote(ImportedTrack& track, ActiveNotes& active, uint16_t key, Tick tick) {
  auto it = active.find(key);
  if (it == active.end()) return;
  track.notes.emplace_back(it->second.first, tick - it->second.first,
                           static_cast<uint8_t>(key & 0xFF), it->second.second);
  active.erase(it);
}

ImportedTrack importTrack(const std::vector<MidiFileEvent>& events, uint16_t& bpm,
                          bool& tempo_found) {
  ImportedTrack track;
  ActiveNotes active;
  Tick last_tick = 0;

  for (const auto& event : events) {
    last_tick = event.absolute_tick;

    if (event.kind == MidiEventKind::Meta) {
      if (event.meta_type == 0x03) {
        track.name.assign(event.data.begin(), event.data.end());
      } else if (event.meta_type == 0x51 && event.data.size() == 3 && !tempo_found) {
        uint32_t microseconds = (static_cast<uint32_t>(event.data[0]) << 16) |
                                (static_cast<uint32_t>(event.data[1]) << 8) | event.data[2];
        if (microseconds > 0) {
          uint32_t quotient = kMicrosecondsPerMinute / microseconds;
          bpm = static_cast<uint16_t>(std::min<uint32_t>(quotient, kMaxImportedBpm));
          tempo_found = true;
        }
      }
      continue;
    }
    if (event.kind != MidiEventKind::Channel) continue;

    uint8_t type = event.status & 0xF0;
    uint8_t channel = event.status & 0x0F;

    switch (type) {
      case 0x80: {  // Note Off
        uint16_t key = static_cast<uint16_t>((channel << 8) | event.data[0]);
        closeNote(track, active, key, event.absolute_tick);
        track.channel = channel;
        break;
      }
      case 0x90: {  // Note On
        uint16_t key = static_cast<uint16_t>((channel << 8) | event.data[0]);
        // Velocity 0 is a note-off; a repeated note-on closes the previous one.
        closeNote(track, active, key, event.absolute_tick);
        if (event.data[1] > 0) {
          active[key] = {event.absolute_tick, event.data[1]};
        }
        track.channel = channel;
        break;
      }
      case 0xC0:  // Program Change
        track.program = event.data[0];
        track.channel = channel;
        break;
      default:
        break;
    }
  }

  // Close any remaining active notes
  for (const auto& [key, value] : active) {
    track.notes.emplace_back(value.first, last_tick - value.first,
                             static_cast<uint8_t>(key & 0xFF), value.second);
  }

  std::stable_sort(track.notes.begin(), track.notes.end(),
                   [](const NoteEvent& a, const NoteEvent& b) { return a.start_tick < b.start_tick; });
  return track;
}

}  // namespace

ImportResult importParsedMidi(const ParsedMidi& midi) {
  ImportResult result;
  result.midi = midi;

  if (midi.format != 1) {
    result.warnings.emplace_back(kFormatWarning);
  }
  if (midi.isSmpteDivision()) {
    result.warnings.emplace_back(kSmpteWarning);
  }
  if (midi.tracks.size() != midi.track_count) {
    result.warnings.push_back("Header declares " + std::to_string(midi.track_count) +
                              " tracks but " + std::to_string(midi.tracks.size()) +
                              " track chunks were found.");
  }

  bool tempo_found = false;
  for (const auto& events : midi.tracks) {
    result.tracks.push_back(importTrack(events, result.bpm, tempo_found));
  }
  return result;
}

}  // namespace scoreplay
