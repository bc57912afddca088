/**
 * @file midi_test_helpers.h
 * @brief Byte builders and event filters for SMF tests.
 */

#ifndef SCOREPLAY_TEST_MIDI_TEST_HELPERS_H
#define SCOREPLAY_TEST_MIDI_TEST_HELPERS_H

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "midi/midi_reader.h"

namespace scoreplay {
namespace test {

/// 14-byte MThd chunk.
inline std::vector<uint8_t> smfHeader(uint16_t format, uint16_t tracks, uint16_t division,
                                      uint32_t length = 6) {
  return {'M',
          'T',
          'h',
          'd',
          static_cast<uint8_t>(length >> 24),
          static_cast<uint8_t>(length >> 16),
          static_cast<uint8_t>(length >> 8),
          static_cast<uint8_t>(length),
          static_cast<uint8_t>(format >> 8),
          static_cast<uint8_t>(format),
          static_cast<uint8_t>(tracks >> 8),
          static_cast<uint8_t>(tracks),
          static_cast<uint8_t>(division >> 8),
          static_cast<uint8_t>(division)};
}

/// MTrk chunk; `declared` overrides the length field when non-negative.
inline std::vector<uint8_t> smfTrack(const std::vector<uint8_t>& body, int64_t declared = -1) {
  uint32_t length = declared < 0 ? static_cast<uint32_t>(body.size())
                                 : static_cast<uint32_t>(declared);
  std::vector<uint8_t> chunk = {'M',
                                'T',
                                'r',
                                'k',
                                static_cast<uint8_t>(length >> 24),
                                static_cast<uint8_t>(length >> 16),
                                static_cast<uint8_t>(length >> 8),
                                static_cast<uint8_t>(length)};
  chunk.insert(chunk.end(), body.begin(), body.end());
  return chunk;
}

inline std::vector<uint8_t> concat(std::vector<uint8_t> a, const std::vector<uint8_t>& b) {
  a.insert(a.end(), b.begin(), b.end());
  return a;
}

/// Parse bytes, recording a test failure when the reader rejects them.
inline ParsedMidi parseOrFail(const std::vector<uint8_t>& bytes) {
  MidiReader reader;
  EXPECT_TRUE(reader.read(bytes)) << reader.getError();
  return reader.getParsedMidi();
}

/// Channel events whose status high nibble equals `type` (0x80, 0x90, 0xC0...).
inline std::vector<MidiFileEvent> channelEvents(const std::vector<MidiFileEvent>& track,
                                                uint8_t type) {
  std::vector<MidiFileEvent> out;
  for (const auto& e : track) {
    if (e.kind == MidiEventKind::Channel && (e.status & 0xF0) == type) out.push_back(e);
  }
  return out;
}

inline std::vector<MidiFileEvent> metaEvents(const std::vector<MidiFileEvent>& track,
                                             uint8_t meta_type) {
  std::vector<MidiFileEvent> out;
  for (const auto& e : track) {
    if (e.kind == MidiEventKind::Meta && e.meta_type == meta_type) out.push_back(e);
  }
  return out;
}

inline std::vector<Tick> ticksOf(const std::vector<MidiFileEvent>& events) {
  std::vector<Tick> ticks;
  for (const auto& e : events) ticks.push_back(e.absolute_tick);
  return ticks;
}

}  // namespace test
}  // namespace scoreplay

#endif  // SCOREPLAY_TEST_MIDI_TEST_HELPERS_H
