/**
 * @file score_index.cpp
 * @brief Implementation of ScoreIndex.
 */

#include "core/score_index.h"

namespace scoreplay {

ScoreIndex::ScoreIndex(const Score& score) {
  for (size_t part_idx = 0; part_idx < score.parts.size(); ++part_idx) {
    for (const auto& staff : score.parts[part_idx].staves) {
      for (const auto& measure : staff.measures) {
        for (const auto& voice : measure.voices) {
          for (const auto& event : voice.events) {
            // First occurrence wins for duplicate ids.
            if (locations_.count(event.id) > 0) continue;
            locations_[event.id] = {&event, part_idx, document_order_.size()};
            document_order_.push_back(event.id);
          }
        }
      }
    }
  }
}

const EventLocation* ScoreIndex::find(const std::string& id) const {
  auto it = locations_.find(id);
  return it == locations_.end() ? nullptr : &it->second;
}

}  // namespace scoreplay
