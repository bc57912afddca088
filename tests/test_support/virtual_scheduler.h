/**
 * @file virtual_scheduler.h
 * @brief Deterministic IScheduler driven by an explicit virtual clock.
 */

#ifndef SCOREPLAY_TEST_VIRTUAL_SCHEDULER_H
#define SCOREPLAY_TEST_VIRTUAL_SCHEDULER_H

#include <functional>
#include <map>
#include <utility>

#include "playback/i_scheduler.h"

namespace scoreplay {
namespace test {

/// Callbacks fire only from advanceTo(), in (tick, handle) order.
class VirtualScheduler : public IScheduler {
 public:
  ScheduleHandle schedule(Tick at_tick, std::function<void()> callback) override {
    ScheduleHandle handle = next_handle_++;
    tasks_[handle] = {at_tick, std::move(callback)};
    ++scheduled_total_;
    return handle;
  }

  void clear(ScheduleHandle handle) override { tasks_.erase(handle); }

  /// Fire every task due at or before `tick`, then move the clock to `tick`.
  void advanceTo(Tick tick) {
    while (true) {
      auto due = tasks_.end();
      for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
        if (it->second.first > tick) continue;
        if (due == tasks_.end() || it->second.first < due->second.first) due = it;
      }
      if (due == tasks_.end()) break;

      now_ = due->second.first;
      auto callback = std::move(due->second.second);
      tasks_.erase(due);
      callback();
    }
    now_ = tick;
  }

  Tick now() const { return now_; }
  size_t pending() const { return tasks_.size(); }
  size_t scheduledTotal() const { return scheduled_total_; }

 private:
  std::map<ScheduleHandle, std::pair<Tick, std::function<void()>>> tasks_;
  ScheduleHandle next_handle_ = 1;
  size_t scheduled_total_ = 0;
  Tick now_ = 0;
};

}  // namespace test
}  // namespace scoreplay

#endif  // SCOREPLAY_TEST_VIRTUAL_SCHEDULER_H
