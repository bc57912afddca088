/**
 * @file scoreplay.cpp
 * @brief Implementation of the high-level encode/decode API.
 */

#include "scoreplay.h"

namespace scoreplay {

std::vector<uint8_t> encodeScore(const Score& score, const ExportOptions& options) {
  MidiWriter writer;
  writer.build(score, options);
  return writer.toBytes();
}

ParsedMidi decodeMidi(const std::vector<uint8_t>& bytes) {
  MidiReader reader;
  if (!reader.read(bytes)) {
    throw MidiDecodeError(reader.getErrorCode(), reader.getError());
  }
  return reader.getParsedMidi();
}

ImportResult importMidi(const std::vector<uint8_t>& bytes) {
  return importParsedMidi(decodeMidi(bytes));
}

}  // namespace scoreplay
