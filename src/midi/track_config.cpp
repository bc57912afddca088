/**
 * @file track_config.cpp
 * @brief Default channel/program resolution.
 */

#include "midi/track_config.h"

namespace scoreplay {

std::vector<ChannelAssignment> resolveChannelAssignments(const Score& score,
                                                         const ChannelMapping& mapping) {
  std::vector<ChannelAssignment> result;
  result.reserve(score.parts.size());

  uint8_t next_channel = 0;
  for (const auto& part : score.parts) {
    auto it = mapping.find(part.id);
    if (it != mapping.end()) {
      result.push_back({static_cast<uint8_t>(it->second.channel & 0x0F),
                        static_cast<uint8_t>(it->second.program & 0x7F)});
      continue;
    }
    if (part.percussion) {
      result.push_back({PERCUSSION_CH, DEFAULT_PROG});
      continue;
    }
    if (next_channel == PERCUSSION_CH) next_channel++;
    result.push_back({next_channel, DEFAULT_PROG});
    next_channel = next_channel >= MAX_CH ? 0 : next_channel + 1;
  }
  return result;
}

}  // namespace scoreplay
