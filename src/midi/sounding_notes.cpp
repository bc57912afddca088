/**
 * @file sounding_notes.cpp
 * @brief Tie merging and part routing for export.
 */

#include "midi/sounding_notes.h"

#include <string>
#include <unordered_map>
#include <unordered_set>

#include "core/score_index.h"

namespace scoreplay {

namespace {

constexpr size_t kNotFound = static_cast<size_t>(-1);

// Next unconsumed occurrence of `id`, preferring one that starts at `at`.
size_t findContinuation(const std::vector<PlaybackEvent>& events,
                        const std::vector<size_t>& occurrences,
                        const std::vector<bool>& consumed, Tick at, Tick not_before) {
  size_t fallback = kNotFound;
  for (size_t idx : occurrences) {
    if (consumed[idx]) continue;
    if (events[idx].tick == at) return idx;
    if (fallback == kNotFound && events[idx].tick >= not_before) fallback = idx;
  }
  return fallback;
}

}  // namespace

std::vector<std::vector<PlaybackEvent>> splitEventsByPart(
    const std::vector<PlaybackEvent>& events, const ScoreIndex& index, size_t part_count) {
  std::vector<std::vector<PlaybackEvent>> per_part(part_count);
  if (part_count == 0) return per_part;

  for (const auto& event : events) {
    const EventLocation* loc = index.find(event.source_event_id);
    size_t part = (loc && loc->part_index < part_count) ? loc->part_index : 0;
    per_part[part].push_back(event);
  }
  return per_part;
}

std::vector<NoteEvent> mergeTieChains(const std::vector<PlaybackEvent>& events,
                                      const ScoreIndex& index) {
  std::unordered_map<std::string, std::vector<size_t>> occurrences;
  for (size_t i = 0; i < events.size(); ++i) {
    occurrences[events[i].source_event_id].push_back(i);
  }

  std::vector<bool> consumed(events.size(), false);
  std::vector<NoteEvent> notes;
  notes.reserve(events.size());

  for (size_t i = 0; i < events.size(); ++i) {
    if (consumed[i]) continue;
    consumed[i] = true;

    const PlaybackEvent& head = events[i];
    NoteEvent note(head.tick, head.duration_ticks, head.pitch, head.velocity);

    std::unordered_set<std::string> chain{head.source_event_id};
    Tick last_onset = head.tick;
    const EventLocation* loc = index.find(head.source_event_id);
    while (loc && !loc->event->tie_start_id.empty()) {
      const std::string& next_id = loc->event->tie_start_id;
      if (!chain.insert(next_id).second) break;  // cyclic tie links

      auto occ = occurrences.find(next_id);
      if (occ == occurrences.end()) break;
      size_t next = findContinuation(events, occ->second, consumed, note.endTick(), last_onset);
      if (next == kNotFound) break;

      consumed[next] = true;
      note.duration += events[next].duration_ticks;
      last_onset = events[next].tick;
      loc = index.find(next_id);
    }
    notes.push_back(note);
  }
  return notes;
}

}  // namespace scoreplay
