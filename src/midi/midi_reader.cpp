/**
 * @file midi_reader.cpp
 * @brief Implementation of MIDI file parser.
 */

#include "midi/midi_reader.h"

#include <cstring>
#include <fstream>

#include "midi/byte_order.h"

namespace scoreplay {

namespace {

constexpr size_t kHeaderChunkSize = 14;
constexpr uint32_t kHeaderPayloadLength = 6;
constexpr size_t kChunkPrefixSize = 8;

// Data byte count of a channel message by status high nibble.
size_t channelDataLength(uint8_t status) {
  uint8_t type = status & 0xF0;
  return (type == 0xC0 || type == 0xD0) ? 1 : 2;
}

}  // namespace

const char* decodeErrorToString(DecodeError error) {
  switch (error) {
    case DecodeError::None: return "NONE";
    case DecodeError::FileUnreadable: return "FILE_UNREADABLE";
    case DecodeError::HeaderMissing: return "HEADER_MISSING";
    case DecodeError::HeaderLengthInvalid: return "HEADER_LENGTH_INVALID";
    case DecodeError::TrackChunkInvalid: return "TRACK_CHUNK_INVALID";
  }
  return "UNKNOWN";
}

bool MidiReader::fail(DecodeError code, const std::string& message) {
  midi_ = ParsedMidi{};
  error_code_ = code;
  error_ = message;
  return false;
}

bool MidiReader::read(const std::string& path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    return fail(DecodeError::FileUnreadable, "Failed to open file: " + path);
  }

  auto size = file.tellg();
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> data(static_cast<size_t>(size));
  if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
    return fail(DecodeError::FileUnreadable, "Failed to read file: " + path);
  }

  return read(data);
}

bool MidiReader::read(const std::vector<uint8_t>& data) {
  midi_ = ParsedMidi{};
  error_.clear();
  error_code_ = DecodeError::None;

  if (!parseHeader(data.data(), data.size())) {
    return false;
  }

  // Parse tracks
  size_t offset = kHeaderChunkSize;
  while (offset < data.size()) {
    if (data.size() - offset < kChunkPrefixSize ||
        std::memcmp(data.data() + offset, "MTrk", 4) != 0) {
      return fail(DecodeError::TrackChunkInvalid,
                  "Invalid MIDI track chunk at offset " + std::to_string(offset));
    }

    uint32_t track_size = readUint32BE(data.data() + offset + 4);
    offset += kChunkPrefixSize;

    if (track_size > data.size() - offset) {
      return fail(DecodeError::TrackChunkInvalid, "Invalid MIDI track chunk: data exceeds file size");
    }

    std::vector<MidiFileEvent> events;
    if (!parseTrack(data.data() + offset, track_size, events)) {
      return false;
    }
    midi_.tracks.push_back(std::move(events));

    offset += track_size;
  }

  return true;
}

bool MidiReader::parseHeader(const uint8_t* data, size_t size) {
  if (size < kHeaderChunkSize) {
    return fail(DecodeError::HeaderMissing, "File too small for MIDI header");
  }

  // Check MThd magic
  if (std::memcmp(data, "MThd", 4) != 0) {
    return fail(DecodeError::HeaderMissing, "Invalid MIDI header (expected MThd)");
  }

  uint32_t header_size = readUint32BE(data + 4);
  if (header_size != kHeaderPayloadLength) {
    return fail(DecodeError::HeaderLengthInvalid, "Unsupported MIDI header length");
  }

  midi_.format = readUint16BE(data + 8);
  midi_.track_count = readUint16BE(data + 10);
  midi_.division = readUint16BE(data + 12);

  return true;
}

bool MidiReader::parseTrack(const uint8_t* data, size_t size,
                            std::vector<MidiFileEvent>& events) {
  size_t offset = 0;
  Tick current_tick = 0;
  uint8_t running_status = 0;
  bool ended = false;

  auto invalid = [this](const std::string& what) {
    return fail(DecodeError::TrackChunkInvalid, "Invalid MIDI track chunk: " + what);
  };

  while (offset < size) {
    if (ended) {
      return invalid("data after end-of-track");
    }

    // Read delta time
    uint32_t delta = 0;
    if (!readVariableLength(data, offset, size, delta)) {
      return invalid("truncated delta time");
    }
    current_tick += delta;

    if (offset >= size) {
      return invalid("delta time without event");
    }

    MidiFileEvent event;
    event.absolute_tick = current_tick;

    uint8_t status = data[offset];

    // Handle running status
    if (status < 0x80) {
      if (running_status == 0) {
        return invalid("running status without a previous channel event");
      }
      status = running_status;
    } else {
      offset++;
      if (status < 0xF0) {
        running_status = status;
      }
    }

    if (status < 0xF0) {
      size_t length = channelDataLength(status);
      if (length > size - offset) {
        return invalid("truncated channel event");
      }
      event.kind = MidiEventKind::Channel;
      event.status = status;
      event.data.assign(data + offset, data + offset + length);
      offset += length;
    } else if (status == 0xFF) {
      // Meta event
      if (offset >= size) {
        return invalid("truncated meta event");
      }
      event.kind = MidiEventKind::Meta;
      event.status = status;
      event.meta_type = data[offset++];
      uint32_t meta_len = 0;
      if (!readVariableLength(data, offset, size, meta_len) || meta_len > size - offset) {
        return invalid("truncated meta event");
      }
      event.data.assign(data + offset, data + offset + meta_len);
      offset += meta_len;
      if (event.meta_type == 0x2F) {
        ended = true;
      }
    } else if (status == 0xF0 || status == 0xF7) {
      // SysEx
      event.kind = MidiEventKind::Sysex;
      event.status = status;
      uint32_t sysex_len = 0;
      if (!readVariableLength(data, offset, size, sysex_len) || sysex_len > size - offset) {
        return invalid("truncated SysEx event");
      }
      event.data.assign(data + offset, data + offset + sysex_len);
      offset += sysex_len;
    } else {
      return invalid("unexpected status byte");
    }

    events.push_back(std::move(event));
  }

  return true;
}

}  // namespace scoreplay
