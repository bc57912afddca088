/**
 * @file timing_constants.h
 * @brief Tick model: note value constants and duration to tick conversion.
 */

#ifndef SCOREPLAY_CORE_TIMING_CONSTANTS_H_
#define SCOREPLAY_CORE_TIMING_CONSTANTS_H_

#include <cstdint>

#include "core/basic_types.h"

namespace scoreplay {

// Timing constants based on TICKS_PER_BEAT (480).

constexpr Tick TICK_WHOLE = TICKS_PER_BEAT * 4;      // 1920 ticks
constexpr Tick TICK_HALF = TICKS_PER_BEAT * 2;       // 960 ticks
constexpr Tick TICK_QUARTER = TICKS_PER_BEAT;        // 480 ticks
constexpr Tick TICK_EIGHTH = TICKS_PER_BEAT / 2;     // 240 ticks
constexpr Tick TICK_SIXTEENTH = TICKS_PER_BEAT / 4;  // 120 ticks
constexpr Tick TICK_32ND = TICKS_PER_BEAT / 8;       // 60 ticks
constexpr Tick TICK_64TH = TICKS_PER_BEAT / 16;      // 30 ticks

// Tempo conversion constant
// 1 minute = 60,000,000 microseconds
// microseconds_per_beat = kMicrosecondsPerMinute / BPM
constexpr uint32_t kMicrosecondsPerMinute = 60000000;

/// @brief Symbolic note values, longest to shortest.
enum class DurationType : uint8_t {
  Whole,
  Half,
  Quarter,
  Eighth,
  Sixteenth,
  ThirtySecond,
  SixtyFourth,
};

/// @brief Tuplet ratio: `actual` notes in the time of `normal`.
struct TupletRatio {
  uint8_t actual = 1;
  uint8_t normal = 1;
};

/**
 * @brief Base ticks of an undotted note value.
 * @param type Note value
 * @return Ticks (quarter = 480)
 */
constexpr Tick baseTicks(DurationType type) {
  switch (type) {
    case DurationType::Whole: return TICK_WHOLE;
    case DurationType::Half: return TICK_HALF;
    case DurationType::Quarter: return TICK_QUARTER;
    case DurationType::Eighth: return TICK_EIGHTH;
    case DurationType::Sixteenth: return TICK_SIXTEENTH;
    case DurationType::ThirtySecond: return TICK_32ND;
    case DurationType::SixtyFourth: return TICK_64TH;
  }
  return TICK_QUARTER;
}

/**
 * @brief Convert a note value and dot count to ticks.
 *
 * One dot adds half the base value (x1.5), two dots add a further
 * quarter (x1.75). Dot counts above 2 are treated as 2.
 *
 * @param type Note value
 * @param dots Dot count (0-2)
 * @return Duration in ticks
 */
constexpr Tick durationToTicks(DurationType type, uint8_t dots = 0) {
  Tick base = baseTicks(type);
  if (dots == 0) return base;
  if (dots == 1) return base + base / 2;
  return base + base / 2 + base / 4;
}

/**
 * @brief Convert a note value inside a tuplet to ticks.
 * @param type Note value
 * @param dots Dot count (0-2)
 * @param tuplet Ratio; the plain duration is scaled by normal/actual
 * @return Duration in ticks
 */
constexpr Tick durationToTicks(DurationType type, uint8_t dots, TupletRatio tuplet) {
  Tick plain = durationToTicks(type, dots);
  if (tuplet.actual == 0) return plain;
  return plain * tuplet.normal / tuplet.actual;
}

/// Largest value of the 24-bit tempo meta field.
constexpr uint32_t kMaxTempoMicroseconds = 0xFFFFFF;

/// @brief Microseconds per quarter note for a tempo in BPM (0 is treated as 120).
///
/// Clamped to the 24-bit tempo field, so tempos below 4 BPM are written as
/// the slowest encodable tempo (about 3.58 BPM).
constexpr uint32_t bpmToMicroseconds(uint16_t bpm) {
  uint32_t us = kMicrosecondsPerMinute / (bpm == 0 ? 120 : bpm);
  return us > kMaxTempoMicroseconds ? kMaxTempoMicroseconds : us;
}

/**
 * @brief Convert MIDI ticks to seconds at a given BPM.
 * @param ticks Number of MIDI ticks
 * @param bpm Beats per minute
 * @return Duration in seconds
 */
inline double ticksToSeconds(Tick ticks, double bpm) {
  return static_cast<double>(ticks) / TICKS_PER_BEAT / bpm * 60.0;
}

}  // namespace scoreplay

#endif  // SCOREPLAY_CORE_TIMING_CONSTANTS_H_
