/**
 * @file track_config.h
 * @brief Per-part channel and program assignments for MIDI output.
 */

#ifndef SCOREPLAY_MIDI_TRACK_CONFIG_H
#define SCOREPLAY_MIDI_TRACK_CONFIG_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/score.h"

namespace scoreplay {

/// @name Channel/Program Defaults
/// @{
constexpr uint8_t PERCUSSION_CH = 9;  ///< GM percussion channel
constexpr uint8_t DEFAULT_PROG = 0;   ///< Acoustic Grand Piano
constexpr uint8_t MAX_CH = 15;
/// @}

/// @brief Channel/program pair for one part.
struct ChannelAssignment {
  uint8_t channel = 0;  ///< 0-15
  uint8_t program = DEFAULT_PROG;  ///< 0-127

  bool operator==(const ChannelAssignment& other) const {
    return channel == other.channel && program == other.program;
  }
};

/// @brief Explicit assignments keyed by part id.
using ChannelMapping = std::map<std::string, ChannelAssignment>;

/**
 * @brief Resolve the channel/program of every part.
 *
 * Explicit entries win (channel masked to 0-15, program to 0-127).
 * Otherwise percussion parts get channel 9 and the others take
 * channels 0, 1, 2, ... in part order, skipping 9 and wrapping after 15;
 * program defaults to 0.
 *
 * @param score Score whose parts are assigned
 * @param mapping Explicit assignments
 * @return One assignment per part, in part order
 */
std::vector<ChannelAssignment> resolveChannelAssignments(const Score& score,
                                                         const ChannelMapping& mapping);

}  // namespace scoreplay

#endif  // SCOREPLAY_MIDI_TRACK_CONFIG_H
