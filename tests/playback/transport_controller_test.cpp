/**
 * @file transport_controller_test.cpp
 * @brief Tests for TransportController against a virtual scheduler.
 */

#include "playback/transport_controller.h"

#include <gtest/gtest.h>

#include "test_support/virtual_scheduler.h"

namespace scoreplay {
namespace {

using test::VirtualScheduler;

PlaybackEvent makeEvent(const std::string& id, Tick tick) {
  PlaybackEvent event;
  event.source_event_id = id;
  event.tick = tick;
  event.duration_ticks = 480;
  event.pitch = 60;
  event.velocity = 84;
  return event;
}

std::vector<PlaybackEvent> fourBeats() {
  return {makeEvent("a", 0), makeEvent("b", 480), makeEvent("c", 960), makeEvent("d", 1440)};
}

class TransportControllerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    hooks_.on_event = [this](const PlaybackEvent& e) {
      fired_ids_.push_back(e.source_event_id);
      fired_ticks_.push_back(scheduler_.now());
    };
    hooks_.on_click = [this](uint32_t beat) {
      clicks_.push_back(beat);
      click_ticks_.push_back(scheduler_.now());
    };
  }

  VirtualScheduler scheduler_;
  TransportHooks hooks_;
  std::vector<std::string> fired_ids_;
  std::vector<Tick> fired_ticks_;
  std::vector<uint32_t> clicks_;
  std::vector<Tick> click_ticks_;
};

TEST_F(TransportControllerTest, PlayFiresEventsAtTheirTicks) {
  TransportController transport(scheduler_, fourBeats(), hooks_);
  transport.play();
  EXPECT_EQ(transport.getState(), TransportState::Playing);
  EXPECT_EQ(transport.pendingCount(), 4u);

  scheduler_.advanceTo(10000);
  EXPECT_EQ(fired_ids_, (std::vector<std::string>{"a", "b", "c", "d"}));
  EXPECT_EQ(fired_ticks_, (std::vector<Tick>{0, 480, 960, 1440}));
  EXPECT_TRUE(clicks_.empty());
}

TEST_F(TransportControllerTest, CountInWithMetronomeClicksThenOffsetsEvents) {
  TransportController transport(scheduler_, fourBeats(), hooks_);
  transport.setCountInBeats(2);
  transport.setMetronomeEnabled(true);
  transport.play();

  scheduler_.advanceTo(10000);
  EXPECT_EQ(clicks_, (std::vector<uint32_t>{1, 2}));
  EXPECT_EQ(click_ticks_, (std::vector<Tick>{0, 480}));
  EXPECT_EQ(fired_ticks_, (std::vector<Tick>{960, 1440, 1920, 2400}));
}

TEST_F(TransportControllerTest, SilentCountInStillOffsetsEvents) {
  TransportController transport(scheduler_, fourBeats(), hooks_);
  transport.setCountInBeats(1);
  transport.play();

  scheduler_.advanceTo(10000);
  EXPECT_TRUE(clicks_.empty());
  EXPECT_EQ(fired_ticks_.front(), 480u);
}

TEST_F(TransportControllerTest, NegativeCountInIsZero) {
  TransportController transport(scheduler_, fourBeats(), hooks_);
  transport.setCountInBeats(-3);
  transport.setMetronomeEnabled(true);
  transport.play();

  scheduler_.advanceTo(10000);
  EXPECT_TRUE(clicks_.empty());
  EXPECT_EQ(fired_ticks_.front(), 0u);
}

TEST_F(TransportControllerTest, PauseCancelsEverythingPending) {
  TransportController transport(scheduler_, fourBeats(), hooks_);
  transport.play();
  scheduler_.advanceTo(500);
  ASSERT_EQ(fired_ids_.size(), 2u);

  transport.pause();
  EXPECT_EQ(transport.getState(), TransportState::Paused);
  EXPECT_EQ(transport.pendingCount(), 0u);
  EXPECT_EQ(scheduler_.pending(), 0u);

  scheduler_.advanceTo(10000);
  EXPECT_EQ(fired_ids_.size(), 2u);
}

TEST_F(TransportControllerTest, PauseOnlyActsWhilePlaying) {
  TransportController transport(scheduler_, fourBeats(), hooks_);
  transport.pause();
  EXPECT_EQ(transport.getState(), TransportState::Stopped);
}

TEST_F(TransportControllerTest, PlayWhilePlayingIsNoOp) {
  TransportController transport(scheduler_, fourBeats(), hooks_);
  transport.play();
  size_t scheduled = scheduler_.scheduledTotal();

  transport.play();
  EXPECT_EQ(scheduler_.scheduledTotal(), scheduled);
  EXPECT_EQ(transport.pendingCount(), 4u);
}

TEST_F(TransportControllerTest, StopWorksFromAnyState) {
  TransportController transport(scheduler_, fourBeats(), hooks_);
  transport.stop();
  EXPECT_EQ(transport.getState(), TransportState::Stopped);

  transport.play();
  transport.pause();
  transport.stop();
  EXPECT_EQ(transport.getState(), TransportState::Stopped);
  EXPECT_EQ(scheduler_.pending(), 0u);
}

TEST_F(TransportControllerTest, ResumeReschedulesFromStart) {
  TransportController transport(scheduler_, fourBeats(), hooks_);
  transport.play();
  transport.pause();
  transport.play();
  EXPECT_EQ(transport.getState(), TransportState::Playing);
  EXPECT_EQ(transport.pendingCount(), 4u);
}

TEST_F(TransportControllerTest, LoopRangeIsHalfOpen) {
  TransportController transport(scheduler_, fourBeats(), hooks_);
  transport.setLoop(LoopRange{480, 1440});
  transport.play();

  scheduler_.advanceTo(10000);
  EXPECT_EQ(fired_ids_, (std::vector<std::string>{"b", "c"}));

  transport.stop();
  fired_ids_.clear();
  transport.setLoop(std::nullopt);
  transport.play();
  scheduler_.advanceTo(20000);
  EXPECT_EQ(fired_ids_.size(), 4u);
}

TEST_F(TransportControllerTest, DestructorClearsPendingCallbacks) {
  {
    TransportController transport(scheduler_, fourBeats(), hooks_);
    transport.play();
    EXPECT_EQ(scheduler_.pending(), 4u);
  }
  EXPECT_EQ(scheduler_.pending(), 0u);
  scheduler_.advanceTo(10000);
  EXPECT_TRUE(fired_ids_.empty());
}

TEST(TransportStateTest, Names) {
  EXPECT_STREQ(transportStateToString(TransportState::Stopped), "stopped");
  EXPECT_STREQ(transportStateToString(TransportState::Playing), "playing");
  EXPECT_STREQ(transportStateToString(TransportState::Paused), "paused");
}

}  // namespace
}  // namespace scoreplay
