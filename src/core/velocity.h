/**
 * @file velocity.h
 * @brief Dynamics, articulation shaping and hairpin velocity offsets.
 */

#ifndef SCOREPLAY_CORE_VELOCITY_H
#define SCOREPLAY_CORE_VELOCITY_H

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include "core/basic_types.h"
#include "core/score.h"

namespace scoreplay {

class ScoreIndex;

/// Largest velocity offset a hairpin applies at its far end.
constexpr int kHairpinMaxOffset = 16;

/// @name Articulation shaping constants
/// @{
constexpr float kStaccatoDurationScale = 0.55f;
constexpr float kTenutoDurationScale = 1.08f;
constexpr int kTenutoOnsetShift = -2;  ///< Ticks (earlier)
constexpr int kAccentVelocityBoost = 10;
/// @}

/**
 * @brief Velocity for a dynamic marking.
 *
 * Monotonically increasing from ppp (20) to fff (120).
 *
 * @param dynamic Marking
 * @return Velocity (1-127)
 */
uint8_t dynamicToVelocity(Dynamic dynamic);

/**
 * @brief Base velocity for a note.
 * @param dynamic Optional marking attached to the note
 * @return Table velocity, or kNeutralVelocity without a marking
 */
uint8_t baseVelocity(const std::optional<Dynamic>& dynamic);

/// @brief Per-note playback shaping derived from articulations.
struct ArticulationShape {
  float duration_scale = 1.0f;
  int velocity_delta = 0;
  int timing_offset_ticks = 0;
};

/**
 * @brief Compute the articulation shape of a note.
 *
 * Articulations compose: duration scales multiply, velocity deltas and
 * timing offsets add.
 *
 * @param event Note event
 * @return Shape (identity for notes without articulations)
 */
ArticulationShape articulationShape(const VoiceEvent& event);

/// @brief Velocity offset per note id.
using HairpinOffsetMap = std::unordered_map<std::string, int>;

/**
 * @brief Interpolate hairpin velocity offsets across document order.
 *
 * Each hairpin ramps linearly from 0 at its first note to +/-16 at its
 * last note, by index distance in document order. Hairpins with unknown
 * or reversed endpoints are ignored; later hairpins override earlier ones
 * on shared notes.
 *
 * @param score Score providing the hairpins
 * @param index Index of the same score
 * @return Offsets for notes covered by a hairpin
 */
HairpinOffsetMap buildHairpinVelocityOffsets(const Score& score, const ScoreIndex& index);

}  // namespace scoreplay

#endif  // SCOREPLAY_CORE_VELOCITY_H
