/**
 * @file demo_score.cpp
 * @brief Built-in demo score.
 */

#include "core/demo_score.h"

#include <string>
#include <utility>

namespace scoreplay {

namespace {

VoiceEvent note(std::string id, NoteStep step, int8_t octave, DurationType duration,
                uint8_t dots = 0) {
  VoiceEvent event;
  event.id = std::move(id);
  event.kind = EventKind::Note;
  event.duration = duration;
  event.dots = dots;
  event.pitch.step = step;
  event.pitch.octave = octave;
  return event;
}

// Ties `first` to `second`; both must be adjacent in the same voice.
void tie(VoiceEvent& first, VoiceEvent& second) {
  first.tie_start_id = second.id;
  second.tie_end_id = first.id;
}

Measure measure(const std::string& id, uint32_t number, const std::string& voice_id,
                std::vector<VoiceEvent> events) {
  Measure m;
  m.id = id;
  m.number = number;
  m.voices.push_back(Voice{voice_id, std::move(events)});
  return m;
}

// Repeat structure shared by both staves: |: 1 2 3 [1. 4 :| [2. 5 6 ||
void applyForm(std::vector<Measure>& measures) {
  measures[0].repeat_start = true;
  measures[3].volta = 1;
  measures[3].repeat_end = true;
  measures[4].volta = 2;
}

Part melodyPart() {
  using D = DurationType;
  using S = NoteStep;
  std::vector<Measure> m;

  auto m1 = std::vector<VoiceEvent>{note("mel-1", S::E, 4, D::Quarter),
                                    note("mel-2", S::E, 4, D::Quarter),
                                    note("mel-3", S::F, 4, D::Quarter),
                                    note("mel-4", S::G, 4, D::Quarter)};
  m1[0].dynamic = Dynamic::MP;
  m.push_back(measure("mel-m1", 1, "mel-v1", std::move(m1)));

  m.push_back(measure("mel-m2", 2, "mel-v1",
                      {note("mel-5", S::G, 4, D::Quarter), note("mel-6", S::F, 4, D::Quarter),
                       note("mel-7", S::E, 4, D::Quarter), note("mel-8", S::D, 4, D::Quarter)}));

  auto m3 = std::vector<VoiceEvent>{note("mel-9", S::C, 4, D::Quarter),
                                    note("mel-10", S::C, 4, D::Quarter),
                                    note("mel-11", S::D, 4, D::Quarter),
                                    note("mel-12", S::E, 4, D::Quarter)};
  m3[0].articulations.push_back(Articulation::Accent);
  m.push_back(measure("mel-m3", 3, "mel-v1", std::move(m3)));

  auto m4 = std::vector<VoiceEvent>{note("mel-13", S::E, 4, D::Quarter, 1),
                                    note("mel-14", S::D, 4, D::Eighth),
                                    note("mel-15", S::D, 4, D::Half)};
  m4[1].articulations.push_back(Articulation::Staccato);
  m4[2].articulations.push_back(Articulation::Tenuto);
  m.push_back(measure("mel-m4", 4, "mel-v1", std::move(m4)));

  auto m5 = std::vector<VoiceEvent>{note("mel-16", S::D, 4, D::Quarter, 1),
                                    note("mel-17", S::C, 4, D::Eighth),
                                    note("mel-18", S::C, 4, D::Half)};
  m5[0].dynamic = Dynamic::F;
  m.push_back(measure("mel-m5", 5, "mel-v1", std::move(m5)));

  auto m6 = std::vector<VoiceEvent>{note("mel-19", S::C, 4, D::Half),
                                    note("mel-20", S::C, 4, D::Half)};
  tie(m6[0], m6[1]);
  m6[0].dynamic = Dynamic::MF;
  m.push_back(measure("mel-m6", 6, "mel-v1", std::move(m6)));

  m[0].tempo_bpm = 100;
  m[0].time_signature = TimeSignature{4, 4};
  m[0].key_signature = KeySignature{0, KeyMode::Major};
  m[4].tempo_bpm = 92;
  applyForm(m);

  Part part;
  part.id = "melody";
  part.name = "Melody";
  part.staves.push_back(Staff{"melody-staff", std::move(m)});
  return part;
}

Part bassPart() {
  using D = DurationType;
  using S = NoteStep;
  std::vector<Measure> m;

  auto with_dynamic = [](VoiceEvent event, Dynamic dynamic) {
    event.dynamic = dynamic;
    return event;
  };

  m.push_back(measure("bass-m1", 1, "bass-v1",
                      {with_dynamic(note("bass-1", S::C, 3, D::Whole), Dynamic::P)}));
  m.push_back(measure("bass-m2", 2, "bass-v1", {note("bass-2", S::G, 2, D::Whole)}));
  m.push_back(measure("bass-m3", 3, "bass-v1",
                      {note("bass-3", S::C, 3, D::Half), note("bass-4", S::A, 2, D::Half)}));
  m.push_back(measure("bass-m4", 4, "bass-v1", {note("bass-5", S::G, 2, D::Whole)}));

  auto m5 = std::vector<VoiceEvent>{note("bass-6", S::G, 2, D::Half),
                                    note("bass-7", S::G, 2, D::Quarter)};
  VoiceEvent rest;
  rest.id = "bass-r1";
  rest.kind = EventKind::Rest;
  rest.duration = D::Quarter;
  m5.push_back(rest);
  m5[1].articulations.push_back(Articulation::Staccato);
  m.push_back(measure("bass-m5", 5, "bass-v1", std::move(m5)));

  m.push_back(measure("bass-m6", 6, "bass-v1", {note("bass-8", S::C, 3, D::Whole)}));
  applyForm(m);

  Part part;
  part.id = "bass";
  part.name = "Bass";
  part.staves.push_back(Staff{"bass-staff", std::move(m)});
  return part;
}

}  // namespace

Score createDemoScore() {
  Score score;
  score.id = "demo";
  score.title = "Scoreplay Demo";
  score.parts.push_back(melodyPart());
  score.parts.push_back(bassPart());
  score.hairpins.push_back(Hairpin{"hp-1", "mel-5", "mel-12", HairpinType::Crescendo});
  return score;
}

}  // namespace scoreplay
