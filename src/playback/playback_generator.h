/**
 * @file playback_generator.h
 * @brief Converts a score into a sorted timeline of PlaybackEvents.
 */

#ifndef SCOREPLAY_PLAYBACK_PLAYBACK_GENERATOR_H
#define SCOREPLAY_PLAYBACK_PLAYBACK_GENERATOR_H

#include <cstdint>
#include <vector>

#include "core/basic_types.h"
#include "core/measure_traversal.h"
#include "core/score.h"

namespace scoreplay {

/// @brief Interpretation settings for event generation.
struct GeneratorOptions {
  bool expressive = false;  ///< Apply articulations and hairpins
  uint32_t max_visits = kDefaultMaxVisits;
};

/// @brief Generated timeline plus the traversal of the longest staff.
struct GenerationResult {
  std::vector<PlaybackEvent> events;  ///< Sorted by tick, then source id
  ResolverResult traversal;           ///< Diagnostic only
};

/**
 * @brief Effective length of a measure: its longest voice.
 * @param measure Measure
 * @return Sum of event ticks of the longest voice (0 for empty measures)
 */
Tick measureLengthTicks(const Measure& measure);

/**
 * @brief Start tick of every visit in a traversal.
 * @param measures Measures the traversal was resolved from
 * @param traversal Resolver output for @p measures
 * @return One start tick per visit, in visit order
 */
std::vector<Tick> visitStartTicks(const std::vector<Measure>& measures,
                                  const ResolverResult& traversal);

/**
 * @brief Wall-clock length of a score timeline prefix.
 *
 * Follows tempo changes along the traversal of the first staff of the first
 * part, the staff the conductor track is written from. 120 BPM applies until
 * the first tempo marking.
 *
 * @param score Score snapshot
 * @param end_tick Tick to measure up to
 * @param max_visits Traversal safety bound
 * @return Seconds from tick 0 to @p end_tick
 */
double ticksToScoreSeconds(const Score& score, Tick end_tick,
                           uint32_t max_visits = kDefaultMaxVisits);

/**
 * @brief Generate the performance timeline of a score.
 *
 * Each staff is traversed independently with its own tick cursor; rests
 * advance the cursor without producing events. Strict mode uses literal
 * durations and table velocities; expressive mode additionally applies
 * articulation shaping, hairpin offsets and clamping.
 *
 * @param score Score snapshot
 * @param options Interpretation settings
 * @return Globally sorted events and the longest staff's traversal
 */
GenerationResult generatePlaybackEvents(const Score& score,
                                        const GeneratorOptions& options = {});

}  // namespace scoreplay

#endif  // SCOREPLAY_PLAYBACK_PLAYBACK_GENERATOR_H
