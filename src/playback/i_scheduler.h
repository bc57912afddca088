/**
 * @file i_scheduler.h
 * @brief Host-provided scheduling capability required by the transport.
 *
 * The host decides what a tick means in wall-clock time (real timer,
 * audio callback, or a virtual clock in tests).
 */

#ifndef SCOREPLAY_PLAYBACK_I_SCHEDULER_H
#define SCOREPLAY_PLAYBACK_I_SCHEDULER_H

#include <cstdint>
#include <functional>

#include "core/basic_types.h"

namespace scoreplay {

/// Opaque handle returned by IScheduler::schedule().
using ScheduleHandle = uint64_t;

/**
 * @brief Interface for deferred callbacks at absolute ticks.
 */
class IScheduler {
 public:
  virtual ~IScheduler() = default;

  /**
   * @brief Schedule a callback.
   * @param at_tick Absolute tick relative to transport start
   * @param callback Invoked once when the tick is reached
   * @return Handle accepted by clear()
   */
  virtual ScheduleHandle schedule(Tick at_tick, std::function<void()> callback) = 0;

  /**
   * @brief Cancel a pending callback. Unknown or fired handles are ignored.
   * @param handle Handle from schedule()
   */
  virtual void clear(ScheduleHandle handle) = 0;
};

}  // namespace scoreplay

#endif  // SCOREPLAY_PLAYBACK_I_SCHEDULER_H
