/**
 * @file midi_import.h
 * @brief Best-effort import of parsed SMF data into sounding notes with advisory warnings.
 */

#ifndef SCOREPLAY_MIDI_IMPORT_H
#define SCOREPLAY_MIDI_IMPORT_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "midi/midi_reader.h"

namespace scoreplay {

/// Warning text for files whose format is not 1.
extern const char* const kFormatWarning;

/// Warning text for SMPTE-based division values.
extern const char* const kSmpteWarning;

/// @brief One track reduced to its sounding notes.
struct ImportedTrack {
  std::string name;
  uint8_t channel = 0;
  uint8_t program = 0;
  std::vector<NoteEvent> notes;  ///< Sorted by start tick
};

/// @brief Result of importMidi(): structure, notes and non-fatal warnings.
struct ImportResult {
  ParsedMidi midi;
  std::vector<ImportedTrack> tracks;
  uint16_t bpm = 120;  ///< First tempo found, 120 if none
  std::vector<std::string> warnings;
};

/**
 * @brief Pair note-on/note-off events into sounding notes and collect warnings.
 *
 * Never fails: unsupported formats and SMPTE divisions only add warnings.
 * @param midi Structurally valid parse result
 * @return Imported tracks and advisory warnings
 */
ImportResult importParsedMidi(const ParsedMidi& midi);

}  // namespace scoreplay

#endif  // SCOREPLAY_MIDI_IMPORT_H
