/**
 * @file sounding_notes_test.cpp
 * @brief Tests for part routing and tie-chain merging.
 */

#include "midi/sounding_notes.h"

#include <gtest/gtest.h>

#include "core/score_index.h"
#include "playback/playback_generator.h"
#include "test_support/score_builder.h"

namespace scoreplay {
namespace {

using test::ScoreBuilder;

PlaybackEvent makeEvent(const std::string& id, Tick tick, Tick duration, uint8_t pitch) {
  PlaybackEvent event;
  event.source_event_id = id;
  event.tick = tick;
  event.duration_ticks = duration;
  event.pitch = pitch;
  event.velocity = 84;
  return event;
}

// ============================================================================
// splitEventsByPart
// ============================================================================

TEST(SoundingNotesTest, SplitRoutesByOwningPart) {
  Score score = ScoreBuilder()
                    .part("a")
                    .measure("a1")
                    .note("a_note", NoteStep::C, 4)
                    .part("b")
                    .measure("b1")
                    .note("b_note", NoteStep::E, 3)
                    .build();
  ScoreIndex index(score);
  std::vector<PlaybackEvent> events = {makeEvent("b_note", 0, 480, 52), makeEvent("a_note", 0, 480, 60),
                                       makeEvent("unknown", 10, 10, 70)};

  auto per_part = splitEventsByPart(events, index, score.parts.size());
  ASSERT_EQ(per_part.size(), 2u);
  ASSERT_EQ(per_part[0].size(), 2u);
  EXPECT_EQ(per_part[0][0].source_event_id, "a_note");
  EXPECT_EQ(per_part[0][1].source_event_id, "unknown");
  ASSERT_EQ(per_part[1].size(), 1u);
  EXPECT_EQ(per_part[1][0].source_event_id, "b_note");
}

TEST(SoundingNotesTest, SplitWithoutPartsIsEmpty) {
  Score score;
  ScoreIndex index(score);
  auto per_part = splitEventsByPart({makeEvent("x", 0, 1, 60)}, index, 0);
  EXPECT_TRUE(per_part.empty());
}

// ============================================================================
// mergeTieChains
// ============================================================================

TEST(SoundingNotesTest, UntiedEventsPassThrough) {
  Score score = ScoreBuilder().measure("m1").note("a", NoteStep::C, 4).note("b", NoteStep::D, 4).build();
  ScoreIndex index(score);

  auto notes = mergeTieChains(generatePlaybackEvents(score).events, index);
  ASSERT_EQ(notes.size(), 2u);
  EXPECT_EQ(notes[1].start_tick, 480u);
  EXPECT_EQ(notes[1].duration, 480u);
  EXPECT_EQ(notes[1].note, 62);
}

TEST(SoundingNotesTest, ThreeNoteChainAcrossMeasures) {
  Score score = ScoreBuilder()
                    .measure("m1")
                    .note("t1", NoteStep::G, 4, DurationType::Half)
                    .note("t2", NoteStep::G, 4, DurationType::Half)
                    .tieTo("t3")
                    .measure("m2")
                    .note("t3", NoteStep::G, 4, DurationType::Half)
                    .tieTo("t4")
                    .note("t4", NoteStep::G, 4, DurationType::Quarter)
                    .build();
  ScoreIndex index(score);

  auto notes = mergeTieChains(generatePlaybackEvents(score).events, index);
  ASSERT_EQ(notes.size(), 2u);
  EXPECT_EQ(notes[0].start_tick, 0u);
  EXPECT_EQ(notes[0].duration, 960u);
  EXPECT_EQ(notes[1].start_tick, 960u);
  EXPECT_EQ(notes[1].duration, 960u + 960u + 480u);
  EXPECT_EQ(notes[1].note, 67);
}

TEST(SoundingNotesTest, MergedNoteKeepsHeadVelocity) {
  Score score = ScoreBuilder()
                    .measure("m1")
                    .note("h", NoteStep::A, 4)
                    .dynamic(Dynamic::FF)
                    .tieTo("t")
                    .note("t", NoteStep::A, 4)
                    .dynamic(Dynamic::P)
                    .build();
  ScoreIndex index(score);

  auto notes = mergeTieChains(generatePlaybackEvents(score).events, index);
  ASSERT_EQ(notes.size(), 1u);
  EXPECT_EQ(notes[0].velocity, 112);
}

TEST(SoundingNotesTest, TieInsideRepeatMergesPerPass) {
  Score score = ScoreBuilder()
                    .measure("m1")
                    .repeatStart()
                    .note("x1", NoteStep::C, 4, DurationType::Half)
                    .note("x2", NoteStep::C, 4, DurationType::Half)
                    .measure("m2")
                    .repeatEnd()
                    .note("y1", NoteStep::E, 4, DurationType::Half)
                    .tieTo("y2")
                    .note("y2", NoteStep::E, 4, DurationType::Half)
                    .build();
  ScoreIndex index(score);

  auto events = generatePlaybackEvents(score).events;
  ASSERT_EQ(events.size(), 8u);
  auto notes = mergeTieChains(events, index);

  std::vector<Tick> e_onsets;
  for (const auto& note : notes) {
    if (note.note == 64) {
      e_onsets.push_back(note.start_tick);
      EXPECT_EQ(note.duration, 1920u);
    }
  }
  EXPECT_EQ(e_onsets, (std::vector<Tick>{1920, 5760}));
}

TEST(SoundingNotesTest, CyclicTieLinksTerminate) {
  Score score = ScoreBuilder()
                    .measure("m1")
                    .note("c1", NoteStep::C, 4)
                    .tieTo("c2")
                    .note("c2", NoteStep::C, 4)
                    .tieTo("c1")
                    .build();
  ScoreIndex index(score);

  auto notes = mergeTieChains(generatePlaybackEvents(score).events, index);
  ASSERT_EQ(notes.size(), 1u);
  EXPECT_EQ(notes[0].duration, 960u);
}

TEST(SoundingNotesTest, MissingContinuationKeepsHead) {
  Score score = ScoreBuilder()
                    .measure("m1")
                    .note("head", NoteStep::D, 4)
                    .tieTo("gone")
                    .build();
  ScoreIndex index(score);

  auto notes = mergeTieChains(generatePlaybackEvents(score).events, index);
  ASSERT_EQ(notes.size(), 1u);
  EXPECT_EQ(notes[0].duration, 480u);
}

}  // namespace
}  // namespace scoreplay
