/**
 * @file transport_controller.cpp
 * @brief Implementation of TransportController.
 */

#include "playback/transport_controller.h"

#include <utility>

#include "core/timing_constants.h"

namespace scoreplay {

const char* transportStateToString(TransportState state) {
  switch (state) {
    case TransportState::Stopped: return "stopped";
    case TransportState::Playing: return "playing";
    case TransportState::Paused: return "paused";
  }
  return "unknown";
}

TransportController::TransportController(IScheduler& scheduler,
                                         std::vector<PlaybackEvent> events,
                                         TransportHooks hooks)
    : scheduler_(scheduler), events_(std::move(events)), hooks_(std::move(hooks)) {}

TransportController::~TransportController() { clearPending(); }

void TransportController::play() {
  if (state_ == TransportState::Playing) return;
  state_ = TransportState::Playing;
  clearPending();
  scheduleAll();
}

void TransportController::pause() {
  if (state_ != TransportState::Playing) return;
  state_ = TransportState::Paused;
  clearPending();
}

void TransportController::stop() {
  state_ = TransportState::Stopped;
  clearPending();
}

void TransportController::clearPending() {
  for (ScheduleHandle handle : pending_) {
    scheduler_.clear(handle);
  }
  pending_.clear();
}

void TransportController::scheduleAll() {
  if (metronome_) {
    for (uint32_t beat = 0; beat < count_in_beats_; ++beat) {
      uint32_t click = beat + 1;
      pending_.push_back(scheduler_.schedule(beat * TICK_QUARTER, [this, click]() {
        if (hooks_.on_click) hooks_.on_click(click);
      }));
    }
  }

  // Events start after the count-in whether or not it is audible.
  Tick offset = count_in_beats_ * TICK_QUARTER;
  for (const auto& event : events_) {
    if (loop_ && (event.tick < loop_->start_tick || event.tick >= loop_->end_tick)) continue;
    const PlaybackEvent* target = &event;
    pending_.push_back(scheduler_.schedule(offset + event.tick, [this, target]() {
      if (hooks_.on_event) hooks_.on_event(*target);
    }));
  }
}

}  // namespace scoreplay
