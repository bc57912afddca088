/**
 * @file basic_types.h
 * @brief Fundamental types: Tick, NoteEvent, PlaybackEvent, articulation and dynamic tags.
 */

#ifndef SCOREPLAY_CORE_BASIC_TYPES_H
#define SCOREPLAY_CORE_BASIC_TYPES_H

#include <cstdint>
#include <string>
#include <vector>

namespace scoreplay {

/// Time unit in ticks.
using Tick = uint32_t;

/// Ticks per quarter note (standard MIDI resolution).
constexpr Tick TICKS_PER_BEAT = 480;

/// Neutral velocity for notes without a dynamic marking.
constexpr uint8_t kNeutralVelocity = 84;

/// @brief Articulation marks that shape playback.
enum class Articulation : uint8_t {
  Staccato,
  Accent,
  Tenuto,
};

/// @brief Dynamic markings, softest to loudest.
enum class Dynamic : uint8_t {
  PPP,
  PP,
  P,
  MP,
  MF,
  F,
  FF,
  FFF,
};

/// @brief Convert Dynamic to its marking string.
inline const char* dynamicToString(Dynamic dynamic) {
  switch (dynamic) {
    case Dynamic::PPP: return "ppp";
    case Dynamic::PP: return "pp";
    case Dynamic::P: return "p";
    case Dynamic::MP: return "mp";
    case Dynamic::MF: return "mf";
    case Dynamic::F: return "f";
    case Dynamic::FF: return "ff";
    case Dynamic::FFF: return "fff";
  }
  return "unknown";
}

/// @brief One timed, shaped note of a performance.
///
/// Shared contract between real-time playback and file export.
struct PlaybackEvent {
  std::string source_event_id;  ///< Id of the score note that produced this event
  Tick tick = 0;                ///< Onset in ticks
  Tick duration_ticks = 0;      ///< Sounding length in ticks (>= 1)
  uint8_t pitch = 0;            ///< MIDI note number (0-127)
  uint8_t velocity = 0;         ///< MIDI velocity (1-127)
  std::vector<Articulation> articulation_context;  ///< Articulations on the source note
};

/// @brief Sounding note (combines note-on/off for easy editing).
struct NoteEvent {
  Tick start_tick = 0;   ///< Start time in ticks
  Tick duration = 0;     ///< Duration in ticks
  uint8_t note = 0;      ///< MIDI note number (0-127)
  uint8_t velocity = 0;  ///< MIDI velocity (0-127)

  NoteEvent() = default;
  NoteEvent(Tick start, Tick dur, uint8_t n, uint8_t vel)
      : start_tick(start), duration(dur), note(n), velocity(vel) {}

  Tick endTick() const { return start_tick + duration; }
};

/// @brief Strict weak ordering used for every event timeline.
///
/// Ascending tick; ties broken by source event id.
inline bool playbackEventLess(const PlaybackEvent& a, const PlaybackEvent& b) {
  if (a.tick != b.tick) return a.tick < b.tick;
  return a.source_event_id < b.source_event_id;
}

}  // namespace scoreplay

#endif  // SCOREPLAY_CORE_BASIC_TYPES_H
