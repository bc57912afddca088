/**
 * @file measure_traversal.cpp
 * @brief Implementation of the measure traversal state machine.
 */

#include "core/measure_traversal.h"

#ifndef SCOREPLAY_DEBUG_TRAVERSAL
#define SCOREPLAY_DEBUG_TRAVERSAL 0
#endif

#if SCOREPLAY_DEBUG_TRAVERSAL
#include <iostream>
#endif

namespace scoreplay {

namespace {

// Nearest earlier measure carrying the D.S. sign, or 0.
size_t findSegnoTarget(const std::vector<Measure>& measures, size_t instruction_idx) {
  for (size_t i = instruction_idx; i > 0; --i) {
    if (measures[i - 1].navigation == NavigationMarker::DalSegno) {
      return i - 1;
    }
  }
  return 0;
}

bool inRange(const std::optional<RepeatRange>& range, size_t idx) {
  return range && idx >= range->first && idx <= range->second;
}

}  // namespace

const char* terminationReasonToString(TerminationReason reason) {
  switch (reason) {
    case TerminationReason::EndOfScore: return "end_of_score";
    case TerminationReason::Fine: return "fine";
    case TerminationReason::SafetyLimit: return "safety_limit";
  }
  return "unknown";
}

TraversalStep stepTraversal(const std::vector<Measure>& measures, TraversalState state,
                            uint32_t max_visits) {
  TraversalStep step;

  if (state.index >= measures.size()) {
    step.terminated = TerminationReason::EndOfScore;
    step.next = std::move(state);
    return step;
  }

  state.visits++;
  if (state.visits > max_visits) {
    step.terminated = TerminationReason::SafetyLimit;
    step.next = std::move(state);
    return step;
  }

  const Measure& measure = measures[state.index];

  // First ending is skipped on the second pass through its repeat.
  if (measure.volta == 1 && inRange(state.second_pass_range, state.index)) {
    state.index++;
    step.next = std::move(state);
    return step;
  }

  step.visit = MeasureVisit{measure.id, state.pass};

#if SCOREPLAY_DEBUG_TRAVERSAL
  std::cerr << "  [traversal] visit " << measure.id << " idx=" << state.index
            << " pass=" << state.pass << "\n";
#endif

  if (state.jumped && measure.navigation == NavigationMarker::Fine) {
    step.terminated = TerminationReason::Fine;
    step.next = std::move(state);
    return step;
  }

  if (measure.repeat_start) {
    state.repeat_start_index = state.index;
  }

  if (measure.repeat_end) {
    RepeatRange range{state.repeat_start_index, state.index};
    if (state.repeated_ranges.count(range) == 0) {
      state.repeated_ranges.insert(range);
      state.second_pass_range = range;
      state.pass++;
      state.index = state.repeat_start_index;
      step.next = std::move(state);
      return step;
    }
    // Already repeated: play on past the repeat sign.
    state.second_pass_range.reset();
  }

  if (measure.navigation == NavigationMarker::DaCapo && !state.da_capo_taken) {
    state.da_capo_taken = true;
    state.jumped = true;
    state.pass++;
    state.index = 0;
    step.next = std::move(state);
    return step;
  }

  if (measure.navigation == NavigationMarker::DalSegno && state.index > 0 &&
      !state.dal_segno_taken) {
    state.dal_segno_taken = true;
    state.jumped = true;
    state.pass++;
    state.index = findSegnoTarget(measures, state.index);
    step.next = std::move(state);
    return step;
  }

  state.index++;
  step.next = std::move(state);
  return step;
}

ResolverResult resolveMeasureTraversal(const std::vector<Measure>& measures,
                                       uint32_t max_visits) {
  ResolverResult result;
  if (measures.empty()) {
    return result;
  }

  TraversalState state;
  while (true) {
    TraversalStep step = stepTraversal(measures, std::move(state), max_visits);
    if (step.visit) {
      result.order.push_back(std::move(*step.visit));
    }
    if (step.terminated) {
      result.terminated_by = *step.terminated;
      return result;
    }
    state = std::move(step.next);
  }
}

}  // namespace scoreplay
