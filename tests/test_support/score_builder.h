/**
 * @file score_builder.h
 * @brief Fluent builder for score snapshots used across tests.
 *
 * part() opens a part with one staff, measure() appends a measure with one
 * voice to the current staff, and note()/rest() append events to the current
 * voice. Modifiers apply to the most recent measure or event. build()
 * fills in tie_end_id from every tie_start_id.
 */

#ifndef SCOREPLAY_TEST_SCORE_BUILDER_H
#define SCOREPLAY_TEST_SCORE_BUILDER_H

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "core/score.h"

namespace scoreplay {
namespace test {

/// Measure with only an id; enough for traversal tests.
inline Measure bareMeasure(const std::string& id) {
  Measure m;
  m.id = id;
  return m;
}

/// Ids of a traversal order, for compact comparisons.
template <typename Visits>
std::vector<std::string> visitIds(const Visits& order) {
  std::vector<std::string> ids;
  for (const auto& visit : order) ids.push_back(visit.measure_id);
  return ids;
}

class ScoreBuilder {
 public:
  explicit ScoreBuilder(std::string id = "score") { score_.id = std::move(id); }

  ScoreBuilder& title(std::string title) {
    score_.title = std::move(title);
    return *this;
  }

  ScoreBuilder& part(const std::string& id, const std::string& name = "", bool percussion = false) {
    Part p;
    p.id = id;
    p.name = name.empty() ? id : name;
    p.percussion = percussion;
    p.staves.push_back(Staff{id + "-s1", {}});
    score_.parts.push_back(std::move(p));
    return *this;
  }

  ScoreBuilder& staff(const std::string& id) {
    currentPart().staves.push_back(Staff{id, {}});
    return *this;
  }

  ScoreBuilder& measure(const std::string& id) {
    auto& measures = currentStaff().measures;
    Measure m;
    m.id = id;
    m.number = static_cast<uint32_t>(measures.size() + 1);
    m.voices.push_back(Voice{id + "-v1", {}});
    measures.push_back(std::move(m));
    return *this;
  }

  ScoreBuilder& voice(const std::string& id) {
    currentMeasure().voices.push_back(Voice{id, {}});
    return *this;
  }

  ScoreBuilder& note(const std::string& id, NoteStep step, int8_t octave,
                     DurationType duration = DurationType::Quarter, uint8_t dots = 0,
                     int8_t accidental = 0) {
    VoiceEvent event;
    event.id = id;
    event.kind = EventKind::Note;
    event.duration = duration;
    event.dots = dots;
    event.pitch = Pitch{step, octave, accidental};
    currentMeasure().voices.back().events.push_back(std::move(event));
    return *this;
  }

  ScoreBuilder& rest(const std::string& id, DurationType duration = DurationType::Quarter) {
    VoiceEvent event;
    event.id = id;
    event.kind = EventKind::Rest;
    event.duration = duration;
    currentMeasure().voices.back().events.push_back(std::move(event));
    return *this;
  }

  ScoreBuilder& articulation(Articulation articulation) {
    lastEvent().articulations.push_back(articulation);
    return *this;
  }

  ScoreBuilder& dynamic(Dynamic dynamic) {
    lastEvent().dynamic = dynamic;
    return *this;
  }

  /// Ties the last event to the note with id `next_id`.
  ScoreBuilder& tieTo(const std::string& next_id) {
    lastEvent().tie_start_id = next_id;
    return *this;
  }

  ScoreBuilder& repeatStart() {
    currentMeasure().repeat_start = true;
    return *this;
  }

  ScoreBuilder& repeatEnd() {
    currentMeasure().repeat_end = true;
    return *this;
  }

  ScoreBuilder& volta(uint8_t ending) {
    currentMeasure().volta = ending;
    return *this;
  }

  ScoreBuilder& navigation(NavigationMarker marker) {
    currentMeasure().navigation = marker;
    return *this;
  }

  ScoreBuilder& tempo(uint16_t bpm) {
    currentMeasure().tempo_bpm = bpm;
    return *this;
  }

  ScoreBuilder& timeSignature(uint8_t numerator, uint8_t denominator) {
    currentMeasure().time_signature = TimeSignature{numerator, denominator};
    return *this;
  }

  ScoreBuilder& keySignature(int8_t fifths, KeyMode mode = KeyMode::Major) {
    currentMeasure().key_signature = KeySignature{fifths, mode};
    return *this;
  }

  ScoreBuilder& hairpin(const std::string& id, const std::string& from, const std::string& to,
                        HairpinType type = HairpinType::Crescendo) {
    score_.hairpins.push_back(Hairpin{id, from, to, type});
    return *this;
  }

  Score build() const {
    Score score = score_;
    std::map<std::string, std::string> previous;
    forEachEvent(score, [&previous](VoiceEvent& event) {
      if (!event.tie_start_id.empty()) previous[event.tie_start_id] = event.id;
    });
    forEachEvent(score, [&previous](VoiceEvent& event) {
      auto it = previous.find(event.id);
      if (it != previous.end()) event.tie_end_id = it->second;
    });
    return score;
  }

 private:
  template <typename Fn>
  static void forEachEvent(Score& score, Fn fn) {
    for (auto& p : score.parts)
      for (auto& s : p.staves)
        for (auto& m : s.measures)
          for (auto& v : m.voices)
            for (auto& e : v.events) fn(e);
  }

  Part& currentPart() {
    if (score_.parts.empty()) part("p1");
    return score_.parts.back();
  }

  Staff& currentStaff() { return currentPart().staves.back(); }

  Measure& currentMeasure() {
    if (currentStaff().measures.empty()) measure("m1");
    return currentStaff().measures.back();
  }

  VoiceEvent& lastEvent() { return currentMeasure().voices.back().events.back(); }

  Score score_;
};

}  // namespace test
}  // namespace scoreplay

#endif  // SCOREPLAY_TEST_SCORE_BUILDER_H
