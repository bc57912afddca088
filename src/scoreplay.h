/**
 * @file scoreplay.h
 * @brief High-level API: score to SMF bytes, and SMF bytes back to structure.
 */

#ifndef SCOREPLAY_H
#define SCOREPLAY_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/score.h"
#include "midi/midi_import.h"
#include "midi/midi_reader.h"
#include "midi/midi_writer.h"
#include "playback/playback_generator.h"

namespace scoreplay {

/// @brief Structural decode failure raised by decodeMidi() and importMidi().
class MidiDecodeError : public std::runtime_error {
 public:
  MidiDecodeError(DecodeError code, const std::string& message)
      : std::runtime_error(std::string(decodeErrorToString(code)) + ": " + message),
        code_(code) {}

  DecodeError code() const { return code_; }

  /// Stable upper-case name such as "HEADER_LENGTH_INVALID".
  const char* codeName() const { return decodeErrorToString(code_); }

 private:
  DecodeError code_;
};

/**
 * @brief Encode a score as an SMF Type 1 file.
 * @param score Score snapshot
 * @param options Export settings
 * @return Complete file bytes
 */
std::vector<uint8_t> encodeScore(const Score& score, const ExportOptions& options = {});

/**
 * @brief Decode the chunk/event structure of an SMF file.
 * @param bytes File bytes
 * @return Parsed structure
 * @throws MidiDecodeError on a malformed header or track chunk
 */
ParsedMidi decodeMidi(const std::vector<uint8_t>& bytes);

/**
 * @brief Decode and import an SMF file into sounding notes with warnings.
 * @param bytes File bytes
 * @return Imported tracks plus advisory warnings
 * @throws MidiDecodeError on a malformed header or track chunk
 */
ImportResult importMidi(const std::vector<uint8_t>& bytes);

}  // namespace scoreplay

#endif  // SCOREPLAY_H
