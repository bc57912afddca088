/**
 * @file midi_reader.h
 * @brief SMF reader: chunk and event structure with running status, meta and SysEx events.
 */

#ifndef SCOREPLAY_MIDI_READER_H
#define SCOREPLAY_MIDI_READER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace scoreplay {

/// Structural decode failures.
enum class DecodeError : uint8_t {
  None,
  FileUnreadable,       ///< File could not be opened or read
  HeaderMissing,        ///< Fewer than 14 bytes or no MThd magic
  HeaderLengthInvalid,  ///< MThd declared length is not 6
  TrackChunkInvalid,    ///< MTrk missing, truncated, or content/length mismatch
};

/// @brief Stable upper-case name of a decode error (e.g. "HEADER_LENGTH_INVALID").
const char* decodeErrorToString(DecodeError error);

enum class MidiEventKind : uint8_t { Channel, Meta, Sysex };

/// A single event of a track chunk.
struct MidiFileEvent {
  MidiEventKind kind = MidiEventKind::Channel;
  uint8_t status = 0;      ///< Channel status (running status resolved); 0xFF meta; 0xF0/0xF7 SysEx
  uint8_t meta_type = 0;   ///< Meta events only
  std::vector<uint8_t> data;  ///< Channel data bytes or meta/SysEx payload
  Tick absolute_tick = 0;
};

/// Complete parsed representation of a Standard MIDI File.
struct ParsedMidi {
  uint16_t format = 0;
  uint16_t track_count = 0;  ///< As declared in the header
  uint16_t division = 480;   ///< Raw division word
  std::vector<std::vector<MidiFileEvent>> tracks;

  /// @brief True when the division's top bit selects SMPTE timing.
  bool isSmpteDivision() const { return (division & 0x8000) != 0; }

  /// @brief Division as a signed value (negative for SMPTE codes).
  int16_t signedDivision() const { return static_cast<int16_t>(division); }
};

/// @brief MIDI file reader that parses SMF chunk and event structure.
class MidiReader {
 public:
  MidiReader() = default;

  /// @brief Read and parse a MIDI file from disk.
  /// @param path File path to read.
  /// @return True on success. On failure, call getError() for details.
  bool read(const std::string& path);

  /// @brief Read and parse MIDI data from a byte buffer.
  /// @param data Raw MIDI file bytes.
  /// @return True on success. On failure the parsed result is empty.
  bool read(const std::vector<uint8_t>& data);

  /// @brief Get the parsed MIDI data (valid after a successful read).
  const ParsedMidi& getParsedMidi() const { return midi_; }

  /// @brief Get the error message from the last failed read().
  const std::string& getError() const { return error_; }

  /// @brief Get the error code from the last failed read().
  DecodeError getErrorCode() const { return error_code_; }

 private:
  ParsedMidi midi_;
  std::string error_;
  DecodeError error_code_ = DecodeError::None;

  bool fail(DecodeError code, const std::string& message);

  /// Parse the MThd header chunk.
  bool parseHeader(const uint8_t* data, size_t size);

  /// Parse the body of one MTrk chunk; must consume exactly `size` bytes.
  bool parseTrack(const uint8_t* data, size_t size, std::vector<MidiFileEvent>& events);
};

}  // namespace scoreplay

#endif  // SCOREPLAY_MIDI_READER_H
