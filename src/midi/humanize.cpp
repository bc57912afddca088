/**
 * @file humanize.cpp
 * @brief Implementation of deterministic humanization.
 */

#include "midi/humanize.h"

#include <algorithm>
#include <climits>

#include "core/rng_util.h"
#include "core/velocity_helper.h"

namespace scoreplay {

namespace {

int boundToInt(uint32_t value) {
  return static_cast<int>(std::min<uint32_t>(value, INT_MAX / 2));
}

}  // namespace

void applyHumanization(std::vector<NoteEvent>& notes, const HumanizeConfig& config,
                       std::mt19937& rng) {
  int max_ticks = boundToInt(config.max_tick_offset);
  int max_velocity = boundToInt(config.velocity_jitter);

  for (auto& note : notes) {
    int tick_offset = rng_util::rollJitter(rng, max_ticks);
    int vel_offset = rng_util::rollJitter(rng, max_velocity);

    int64_t start = static_cast<int64_t>(note.start_tick) + tick_offset;
    note.start_tick = static_cast<Tick>(std::max<int64_t>(0, start));
    note.velocity = vel::withDelta(note.velocity, vel_offset);
  }
}

}  // namespace scoreplay
