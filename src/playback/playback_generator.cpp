/**
 * @file playback_generator.cpp
 * @brief Implementation of score to PlaybackEvent conversion.
 */

#include "playback/playback_generator.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <unordered_map>

#include "core/score_index.h"
#include "core/timing_constants.h"
#include "core/velocity.h"
#include "core/velocity_helper.h"

namespace scoreplay {

namespace {

std::unordered_map<std::string, size_t> indexMeasures(const std::vector<Measure>& measures) {
  std::unordered_map<std::string, size_t> by_id;
  for (size_t i = 0; i < measures.size(); ++i) {
    by_id.emplace(measures[i].id, i);
  }
  return by_id;
}

PlaybackEvent makeEvent(const VoiceEvent& note, Tick onset, bool expressive,
                        const HairpinOffsetMap& hairpins) {
  ArticulationShape shape = expressive ? articulationShape(note) : ArticulationShape{};
  int hairpin_offset = 0;
  if (expressive) {
    auto it = hairpins.find(note.id);
    if (it != hairpins.end()) hairpin_offset = it->second;
  }

  int64_t tick = static_cast<int64_t>(onset) + shape.timing_offset_ticks;
  long duration = std::lround(static_cast<double>(note.ticks()) * shape.duration_scale);

  PlaybackEvent event;
  event.source_event_id = note.id;
  event.tick = static_cast<Tick>(std::max<int64_t>(0, tick));
  event.duration_ticks = static_cast<Tick>(std::max(1L, duration));
  event.pitch = pitchToMidi(note.pitch);
  event.velocity =
      vel::clamp(static_cast<int>(baseVelocity(note.dynamic)) + shape.velocity_delta +
                 hairpin_offset);
  event.articulation_context = note.articulations;
  return event;
}

}  // namespace

Tick measureLengthTicks(const Measure& measure) {
  Tick longest = 0;
  for (const auto& voice : measure.voices) {
    Tick voice_ticks = 0;
    for (const auto& event : voice.events) {
      voice_ticks += event.ticks();
    }
    longest = std::max(longest, voice_ticks);
  }
  return longest;
}

std::vector<Tick> visitStartTicks(const std::vector<Measure>& measures,
                                  const ResolverResult& traversal) {
  auto by_id = indexMeasures(measures);
  std::vector<Tick> starts;
  starts.reserve(traversal.order.size());

  Tick cursor = 0;
  for (const auto& visit : traversal.order) {
    starts.push_back(cursor);
    auto it = by_id.find(visit.measure_id);
    if (it != by_id.end()) {
      cursor += measureLengthTicks(measures[it->second]);
    }
  }
  return starts;
}

double ticksToScoreSeconds(const Score& score, Tick end_tick, uint32_t max_visits) {
  uint16_t bpm = 120;
  if (score.parts.empty() || score.parts.front().staves.empty()) {
    return ticksToSeconds(end_tick, bpm);
  }
  const auto& measures = score.parts.front().staves.front().measures;
  ResolverResult traversal = resolveMeasureTraversal(measures, max_visits);
  std::vector<Tick> starts = visitStartTicks(measures, traversal);
  auto by_id = indexMeasures(measures);

  double seconds = 0.0;
  Tick prev = 0;
  for (size_t v = 0; v < traversal.order.size() && starts[v] < end_tick; ++v) {
    auto it = by_id.find(traversal.order[v].measure_id);
    if (it == by_id.end()) continue;
    const Measure& measure = measures[it->second];
    if (!measure.tempo_bpm || *measure.tempo_bpm == 0) continue;
    seconds += ticksToSeconds(starts[v] - prev, bpm);
    prev = starts[v];
    bpm = *measure.tempo_bpm;
  }
  return seconds + ticksToSeconds(end_tick - prev, bpm);
}

GenerationResult generatePlaybackEvents(const Score& score, const GeneratorOptions& options) {
  GenerationResult result;
  ScoreIndex index(score);
  HairpinOffsetMap hairpins;
  if (options.expressive) {
    hairpins = buildHairpinVelocityOffsets(score, index);
  }

  bool have_traversal = false;
  for (const auto& part : score.parts) {
    for (const auto& staff : part.staves) {
      ResolverResult traversal = resolveMeasureTraversal(staff.measures, options.max_visits);
      std::vector<Tick> starts = visitStartTicks(staff.measures, traversal);
      auto by_id = indexMeasures(staff.measures);

      for (size_t v = 0; v < traversal.order.size(); ++v) {
        auto it = by_id.find(traversal.order[v].measure_id);
        if (it == by_id.end()) continue;
        const Measure& measure = staff.measures[it->second];

        // Polyphonic voices share the measure's start tick.
        for (const auto& voice : measure.voices) {
          Tick local = 0;
          for (const auto& event : voice.events) {
            if (event.isNote()) {
              result.events.push_back(
                  makeEvent(event, starts[v] + local, options.expressive, hairpins));
            }
            local += event.ticks();
          }
        }
      }

      if (!have_traversal || traversal.order.size() > result.traversal.order.size()) {
        result.traversal = std::move(traversal);
        have_traversal = true;
      }
    }
  }

  std::stable_sort(result.events.begin(), result.events.end(), playbackEventLess);
  return result;
}

}  // namespace scoreplay
