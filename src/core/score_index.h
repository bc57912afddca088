/**
 * @file score_index.h
 * @brief Id -> event lookup built once per generation or export call.
 */

#ifndef SCOREPLAY_CORE_SCORE_INDEX_H
#define SCOREPLAY_CORE_SCORE_INDEX_H

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/score.h"

namespace scoreplay {

/// @brief Location of one voice event inside a score.
struct EventLocation {
  const VoiceEvent* event = nullptr;
  size_t part_index = 0;
  size_t document_order = 0;  ///< Position in part/staff/measure/voice order
};

/// @brief Arena-style index over a score's voice events.
///
/// Cross references (ties, hairpins) are resolved through this index
/// instead of back-pointers. The index borrows the score; it must not
/// outlive it.
class ScoreIndex {
 public:
  explicit ScoreIndex(const Score& score);

  /// @brief Find an event by id.
  /// @return Location, or nullptr if the id is unknown
  const EventLocation* find(const std::string& id) const;

  /// @brief Event ids in document order.
  const std::vector<std::string>& documentOrder() const { return document_order_; }

  size_t size() const { return document_order_.size(); }

 private:
  std::unordered_map<std::string, EventLocation> locations_;
  std::vector<std::string> document_order_;
};

}  // namespace scoreplay

#endif  // SCOREPLAY_CORE_SCORE_INDEX_H
