/**
 * @file measure_traversal.h
 * @brief Expands repeats, endings and D.C./D.S./Fine into a linear measure order.
 */

#ifndef SCOREPLAY_CORE_MEASURE_TRAVERSAL_H
#define SCOREPLAY_CORE_MEASURE_TRAVERSAL_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "core/score.h"

namespace scoreplay {

/// Default bound on resolver iterations.
constexpr uint32_t kDefaultMaxVisits = 2048;

/// @brief One occurrence of a measure in performance order.
struct MeasureVisit {
  std::string measure_id;
  uint32_t pass = 1;  ///< Incremented on every repeat or jump (diagnostic only)

  bool operator==(const MeasureVisit& other) const {
    return measure_id == other.measure_id && pass == other.pass;
  }
};

/// @brief Why a traversal stopped.
enum class TerminationReason : uint8_t {
  EndOfScore,   ///< Cursor ran past the last measure
  Fine,         ///< Fine reached after a D.C./D.S. jump
  SafetyLimit,  ///< Runaway repeat graph
};

const char* terminationReasonToString(TerminationReason reason);

/// @brief Linear visitation order plus termination reason.
struct ResolverResult {
  std::vector<MeasureVisit> order;
  TerminationReason terminated_by = TerminationReason::EndOfScore;
};

/// @brief Inclusive measure index range of a repeat.
using RepeatRange = std::pair<size_t, size_t>;

/// @brief Complete resolver state, passed by value between steps.
struct TraversalState {
  size_t index = 0;               ///< Cursor
  size_t repeat_start_index = 0;  ///< Most recent repeat-begin point
  std::set<RepeatRange> repeated_ranges;
  std::optional<RepeatRange> second_pass_range;  ///< Window where volta 1 is skipped
  bool da_capo_taken = false;
  bool dal_segno_taken = false;
  bool jumped = false;  ///< After D.C./D.S., Fine becomes terminal
  uint32_t pass = 1;
  uint32_t visits = 0;  ///< Iterations so far (skipped endings included)
};

/// @brief Result of a single transition.
struct TraversalStep {
  TraversalState next;
  std::optional<MeasureVisit> visit;            ///< Measure recorded by this step
  std::optional<TerminationReason> terminated;  ///< Set when traversal ends
};

/**
 * @brief Advance the resolver by one measure.
 *
 * Pure: the returned state is a modified copy of @p state.
 *
 * @param measures Ordered measures of one staff
 * @param state Current state
 * @param max_visits Iteration bound
 * @return Next state, the visit recorded (if any), and termination (if any)
 */
TraversalStep stepTraversal(const std::vector<Measure>& measures, TraversalState state,
                            uint32_t max_visits = kDefaultMaxVisits);

/**
 * @brief Resolve the performance order of a staff's measures.
 *
 * Repeats play exactly twice, D.C. and D.S. fire at most once, Fine ends
 * the traversal only after a jump. Never throws; anomalies surface
 * through ResolverResult::terminated_by.
 *
 * @param measures Ordered measures of one staff
 * @param max_visits Iteration bound
 * @return Visit order and termination reason
 */
ResolverResult resolveMeasureTraversal(const std::vector<Measure>& measures,
                                       uint32_t max_visits = kDefaultMaxVisits);

}  // namespace scoreplay

#endif  // SCOREPLAY_CORE_MEASURE_TRAVERSAL_H
