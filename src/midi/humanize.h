/**
 * @file humanize.h
 * @brief Deterministic timing/velocity jitter for exported notes.
 */

#ifndef SCOREPLAY_MIDI_HUMANIZE_H
#define SCOREPLAY_MIDI_HUMANIZE_H

#include <cstdint>
#include <random>
#include <vector>

#include "core/basic_types.h"

namespace scoreplay {

/// @brief Humanization parameters. Same seed + same input = same output.
struct HumanizeConfig {
  uint32_t seed = 0;
  uint32_t max_tick_offset = 0;  ///< Onset jitter bound in ticks
  uint32_t velocity_jitter = 0;  ///< Velocity jitter bound
};

/**
 * @brief Perturb onsets and velocities of notes in place.
 *
 * Each note draws one onset offset in [-max_tick_offset, max_tick_offset]
 * and one velocity offset in [-velocity_jitter, velocity_jitter], in note
 * order. Onsets are clamped to >= 0 and velocities to [1, 127]; durations
 * are unchanged.
 *
 * @param notes Notes to perturb
 * @param config Jitter bounds
 * @param rng Engine seeded from config.seed by the caller
 */
void applyHumanization(std::vector<NoteEvent>& notes, const HumanizeConfig& config,
                       std::mt19937& rng);

}  // namespace scoreplay

#endif  // SCOREPLAY_MIDI_HUMANIZE_H
