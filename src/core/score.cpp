/**
 * @file score.cpp
 * @brief Pitch spelling and voice event helpers.
 */

#include "core/score.h"

#include <algorithm>

namespace scoreplay {

namespace {

// Semitone offset of each diatonic step above C.
constexpr int kStepSemitones[] = {0, 2, 4, 5, 7, 9, 11};

}  // namespace

uint8_t pitchToMidi(const Pitch& pitch) {
  int midi = (static_cast<int>(pitch.octave) + 1) * 12 +
             kStepSemitones[static_cast<int>(pitch.step)] + pitch.accidental;
  return static_cast<uint8_t>(std::clamp(midi, 0, 127));
}

bool VoiceEvent::hasArticulation(Articulation articulation) const {
  return std::find(articulations.begin(), articulations.end(), articulation) !=
         articulations.end();
}

}  // namespace scoreplay
