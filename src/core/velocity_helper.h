/**
 * @file velocity_helper.h
 * @brief Velocity arithmetic kept inside the note-on range [1, 127].
 *
 * Velocity 0 would read as a note-off, so the floor is 1.
 */

#ifndef SCOREPLAY_CORE_VELOCITY_HELPER_H
#define SCOREPLAY_CORE_VELOCITY_HELPER_H

#include <algorithm>
#include <cstdint>

namespace scoreplay {
namespace vel {

constexpr int kMinNoteOnVelocity = 1;
constexpr int kMaxVelocity = 127;

/// @brief Clamp an intermediate velocity sum into [1, 127].
inline uint8_t clamp(int raw) {
  return static_cast<uint8_t>(std::clamp(raw, kMinNoteOnVelocity, kMaxVelocity));
}

/// @brief Offset a velocity (accent, hairpin or jitter) and clamp the result.
/// @param base Starting velocity
/// @param delta Signed offset
inline uint8_t withDelta(uint8_t base, int delta) { return clamp(static_cast<int>(base) + delta); }

}  // namespace vel
}  // namespace scoreplay

#endif  // SCOREPLAY_CORE_VELOCITY_HELPER_H
