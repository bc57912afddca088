/**
 * @file score.h
 * @brief Structural score snapshot consumed by playback and export.
 *
 * Parts own staves, staves own measures, measures own voices and voices
 * own note/rest events. The snapshot is assumed to be structurally valid.
 */

#ifndef SCOREPLAY_CORE_SCORE_H
#define SCOREPLAY_CORE_SCORE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/timing_constants.h"

namespace scoreplay {

/// @brief Diatonic step of a spelled pitch.
enum class NoteStep : uint8_t { C, D, E, F, G, A, B };

/// @brief Spelled pitch (step + octave + accidental).
struct Pitch {
  NoteStep step = NoteStep::C;
  int8_t octave = 4;      ///< Scientific octave (C4 = middle C)
  int8_t accidental = 0;  ///< -2 (double flat) to +2 (double sharp)
};

/**
 * @brief Convert a spelled pitch to a MIDI note number.
 * @param pitch Spelled pitch
 * @return MIDI note number clamped to 0-127 (C4 = 60)
 */
uint8_t pitchToMidi(const Pitch& pitch);

/// @brief Note or rest.
enum class EventKind : uint8_t { Note, Rest };

/// @brief A single note or rest inside a voice.
struct VoiceEvent {
  std::string id;
  EventKind kind = EventKind::Note;
  DurationType duration = DurationType::Quarter;
  uint8_t dots = 0;
  Pitch pitch;                 ///< Ignored for rests
  std::string tie_start_id;    ///< Next note of the tie chain (empty = none)
  std::string tie_end_id;      ///< Previous note of the tie chain (empty = none)
  std::vector<Articulation> articulations;
  std::optional<Dynamic> dynamic;

  bool isNote() const { return kind == EventKind::Note; }
  bool hasArticulation(Articulation articulation) const;
  Tick ticks() const { return durationToTicks(duration, dots); }
};

/// @brief One voice (independent rhythmic line) of a measure.
struct Voice {
  std::string id;
  std::vector<VoiceEvent> events;
};

struct TimeSignature {
  uint8_t numerator = 4;
  uint8_t denominator = 4;  ///< 2, 4, 8 or 16

  bool operator==(const TimeSignature& other) const {
    return numerator == other.numerator && denominator == other.denominator;
  }
  bool operator!=(const TimeSignature& other) const { return !(*this == other); }
};

enum class KeyMode : uint8_t { Major, Minor };

struct KeySignature {
  int8_t fifths = 0;  ///< Negative = flats, positive = sharps
  KeyMode mode = KeyMode::Major;

  bool operator==(const KeySignature& other) const {
    return fifths == other.fifths && mode == other.mode;
  }
  bool operator!=(const KeySignature& other) const { return !(*this == other); }
};

/// @brief Navigation instruction attached to a measure.
enum class NavigationMarker : uint8_t {
  None,
  DaCapo,   ///< Return to start
  DalSegno, ///< Return to sign (also marks the sign itself)
  Fine,     ///< End here after a jump
  Coda,
};

struct Measure {
  std::string id;
  uint32_t number = 1;
  std::vector<Voice> voices;
  std::optional<TimeSignature> time_signature;
  std::optional<KeySignature> key_signature;
  std::optional<uint16_t> tempo_bpm;
  bool repeat_start = false;
  bool repeat_end = false;
  uint8_t volta = 0;  ///< 0 = none, 1 = first ending, 2 = second ending
  NavigationMarker navigation = NavigationMarker::None;
};

struct Staff {
  std::string id;
  std::vector<Measure> measures;
};

struct Part {
  std::string id;
  std::string name;
  bool percussion = false;  ///< Percussion parts default to channel 9
  std::vector<Staff> staves;
};

enum class HairpinType : uint8_t { Crescendo, Diminuendo };

/// @brief Crescendo/diminuendo spanning two notes by id.
struct Hairpin {
  std::string id;
  std::string from;
  std::string to;
  HairpinType type = HairpinType::Crescendo;
};

struct Score {
  std::string id;
  std::string title;
  std::vector<Part> parts;
  std::vector<Hairpin> hairpins;
};

}  // namespace scoreplay

#endif  // SCOREPLAY_CORE_SCORE_H
