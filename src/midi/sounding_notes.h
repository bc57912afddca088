/**
 * @file sounding_notes.h
 * @brief PlaybackEvent -> per-part sounding notes (tie chains merged).
 */

#ifndef SCOREPLAY_MIDI_SOUNDING_NOTES_H
#define SCOREPLAY_MIDI_SOUNDING_NOTES_H

#include <cstddef>
#include <vector>

#include "core/basic_types.h"

namespace scoreplay {

class ScoreIndex;

/**
 * @brief Route events to the part that owns their source note.
 *
 * Events whose source id is unknown to the index go to the first part.
 *
 * @param events Timeline (any order; relative order is kept per part)
 * @param index Index of the score the events came from
 * @param part_count Number of parts in that score
 * @return One event list per part (empty when part_count is 0)
 */
std::vector<std::vector<PlaybackEvent>> splitEventsByPart(
    const std::vector<PlaybackEvent>& events, const ScoreIndex& index, size_t part_count);

/**
 * @brief Collapse tie chains into single sounding notes.
 *
 * A note whose source carries tie_start_id absorbs the next occurrence of
 * the linked note (preferring the one starting exactly where the chain
 * currently ends), repeatedly until the chain ends. The merged note keeps
 * the first note's onset, pitch and velocity; its duration is the sum of
 * all members' durations. Every other event becomes one note unchanged.
 *
 * @param events Timeline sorted by tick
 * @param index Index of the score the events came from
 * @return Sounding notes in onset order
 */
std::vector<NoteEvent> mergeTieChains(const std::vector<PlaybackEvent>& events,
                                      const ScoreIndex& index);

}  // namespace scoreplay

#endif  // SCOREPLAY_MIDI_SOUNDING_NOTES_H
