/**
 * @file transport_controller.h
 * @brief Play/pause/stop transport over an injected IScheduler.
 */

#ifndef SCOREPLAY_PLAYBACK_TRANSPORT_CONTROLLER_H
#define SCOREPLAY_PLAYBACK_TRANSPORT_CONTROLLER_H

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "core/basic_types.h"
#include "playback/i_scheduler.h"

namespace scoreplay {

enum class TransportState : uint8_t { Stopped, Playing, Paused };

const char* transportStateToString(TransportState state);

/// @brief Half-open tick window [start_tick, end_tick).
struct LoopRange {
  Tick start_tick = 0;
  Tick end_tick = 0;
};

/// @brief Callbacks fired from scheduled ticks.
struct TransportHooks {
  std::function<void(const PlaybackEvent&)> on_event;
  std::function<void(uint32_t beat)> on_click;  ///< Metronome count-in click (1-based)
};

/**
 * @brief Transport controls for a generated event timeline.
 *
 * Owns the list of pending scheduler handles exclusively. Every state
 * change away from Playing clears all of them, so no callback fires
 * after pause() or stop(). Intended for single-threaded use from the
 * host's event loop; the scheduler must outlive the controller.
 */
class TransportController {
 public:
  TransportController(IScheduler& scheduler, std::vector<PlaybackEvent> events,
                      TransportHooks hooks = {});
  ~TransportController();

  TransportController(const TransportController&) = delete;
  TransportController& operator=(const TransportController&) = delete;

  /// @brief Schedule count-in clicks and all (loop-filtered) events.
  /// No-op while already playing.
  void play();

  /// @brief Cancel pending callbacks. Only valid while playing.
  void pause();

  /// @brief Cancel pending callbacks from any state.
  void stop();

  /// @brief Restrict playback to [start, end); std::nullopt plays everything.
  void setLoop(std::optional<LoopRange> range) { loop_ = range; }

  /// @brief Count-in length in beats (negative values become 0).
  void setCountInBeats(int beats) { count_in_beats_ = beats < 0 ? 0 : static_cast<uint32_t>(beats); }

  void setMetronomeEnabled(bool enabled) { metronome_ = enabled; }

  TransportState getState() const { return state_; }

  /// @brief Number of callbacks currently scheduled.
  size_t pendingCount() const { return pending_.size(); }

 private:
  void clearPending();
  void scheduleAll();

  IScheduler& scheduler_;
  std::vector<PlaybackEvent> events_;
  TransportHooks hooks_;
  TransportState state_ = TransportState::Stopped;
  std::vector<ScheduleHandle> pending_;
  std::optional<LoopRange> loop_;
  uint32_t count_in_beats_ = 0;
  bool metronome_ = false;
};

}  // namespace scoreplay

#endif  // SCOREPLAY_PLAYBACK_TRANSPORT_CONTROLLER_H
