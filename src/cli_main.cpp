/**
 * @file cli_main.cpp
 * @brief Command-line interface for score export and MIDI file inspection.
 */

#include "scoreplay.h"
#include "core/demo_score.h"
#include "core/json_helpers.h"
#include "core/timing_constants.h"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

void printUsage(const char* program) {
  std::cout << "Usage: " << program << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --demo                Export the built-in demo score\n";
  std::cout << "  --output FILE         Output path for --demo (default: demo.mid)\n";
  std::cout << "  --expressive          Apply articulations and hairpins when exporting\n";
  std::cout << "  --max-visits N        Traversal safety limit (default: 2048)\n";
  std::cout << "  --humanize-seed N     Enable humanization with seed N\n";
  std::cout << "  --humanize-ticks N    Maximum onset offset in ticks (default: 0)\n";
  std::cout << "  --humanize-velocity N Velocity jitter magnitude (default: 0)\n";
  std::cout << "  --options FILE        Read export options from a flat JSON file\n";
  std::cout << "  --decode FILE         Decode a MIDI file and print its structure\n";
  std::cout << "  --json                Output JSON to stdout (with --decode)\n";
  std::cout << "  --help                Show this help message\n";
}

/// Export settings gathered from an options file and command-line flags.
struct CliExportSettings {
  bool expressive = false;
  uint32_t max_visits = scoreplay::kDefaultMaxVisits;
  bool humanize = false;
  uint32_t humanize_seed = 0;
  uint32_t humanize_ticks = 0;
  uint32_t humanize_velocity = 0;
};

bool loadOptionsFile(const std::string& path, CliExportSettings& settings) {
  std::ifstream file(path);
  if (!file) {
    std::cerr << "Error: Failed to open options file: " << path << "\n";
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  scoreplay::json::Parser p(buffer.str());
  if (!p.isObject()) {
    std::cerr << "Error: Options file is not a JSON object: " << path << "\n";
    return false;
  }

  if (p.has("expressive")) settings.expressive = p.getBool("expressive");
  if (p.has("max_visits")) settings.max_visits = p.getUint("max_visits", settings.max_visits);
  if (p.has("humanize_seed")) {
    settings.humanize = true;
    settings.humanize_seed = p.getUint("humanize_seed");
  }
  if (p.has("humanize_ticks")) settings.humanize_ticks = p.getUint("humanize_ticks");
  if (p.has("humanize_velocity")) settings.humanize_velocity = p.getUint("humanize_velocity");
  return true;
}

bool readFileBytes(const std::string& path, std::vector<uint8_t>& bytes) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) return false;
  auto size = file.tellg();
  file.seekg(0, std::ios::beg);
  bytes.resize(static_cast<size_t>(size));
  return static_cast<bool>(file.read(reinterpret_cast<char*>(bytes.data()), size));
}

int exportDemo(const std::string& output, const CliExportSettings& settings) {
  scoreplay::Score score = scoreplay::createDemoScore();

  scoreplay::GeneratorOptions gen_options;
  gen_options.expressive = settings.expressive;
  gen_options.max_visits = settings.max_visits;
  auto generated = scoreplay::generatePlaybackEvents(score, gen_options);

  scoreplay::ExportOptions options;
  options.max_visits = settings.max_visits;
  options.use_playback_events = generated.events;
  if (settings.humanize) {
    scoreplay::HumanizeConfig humanize;
    humanize.seed = settings.humanize_seed;
    humanize.max_tick_offset = settings.humanize_ticks;
    humanize.velocity_jitter = settings.humanize_velocity;
    options.humanize = humanize;
  }

  scoreplay::MidiWriter writer;
  writer.build(score, options);
  if (!writer.writeToFile(output)) {
    std::cerr << "Error: Failed to write " << output << "\n";
    return 1;
  }

  scoreplay::Tick end_tick = 0;
  for (const auto& event : generated.events) {
    end_tick = std::max(end_tick, event.tick + event.duration_ticks);
  }

  std::cout << "Score: " << score.title << "\n";
  std::cout << "  Parts: " << score.parts.size() << "\n";
  std::cout << "  Mode: " << (settings.expressive ? "expressive" : "strict") << "\n";
  std::cout << "  Measures visited: " << generated.traversal.order.size() << " ("
            << scoreplay::terminationReasonToString(generated.traversal.terminated_by) << ")\n";
  std::cout << "  Events: " << generated.events.size() << "\n";
  std::cout << "  Length: " << std::fixed << std::setprecision(1)
            << scoreplay::ticksToScoreSeconds(score, end_tick, settings.max_visits) << " s\n";
  if (settings.humanize) {
    std::cout << "  Humanize: seed " << settings.humanize_seed << ", +/-"
              << settings.humanize_ticks << " ticks, +/-" << settings.humanize_velocity
              << " velocity\n";
  }
  std::cout << "\nSaved: " << output << " (" << writer.toBytes().size() << " bytes)\n";
  return 0;
}

const char* eventKindName(scoreplay::MidiEventKind kind) {
  switch (kind) {
    case scoreplay::MidiEventKind::Channel: return "channel";
    case scoreplay::MidiEventKind::Meta: return "meta";
    case scoreplay::MidiEventKind::Sysex: return "sysex";
  }
  return "unknown";
}

void printDecodeJson(const scoreplay::ImportResult& result) {
  const auto& midi = result.midi;
  scoreplay::json::Writer w(std::cout, true);
  {
    scoreplay::json::ObjectScope root(w);
    w.write("format", midi.format)
        .write("track_count", midi.track_count)
        .write("division", midi.signedDivision())
        .write("bpm", result.bpm);
    {
      scoreplay::json::ArrayScope tracks(w, "tracks");
      for (size_t i = 0; i < midi.tracks.size(); ++i) {
        const auto& imported = result.tracks[i];
        scoreplay::json::ObjectScope track(w);
        w.write("name", imported.name)
            .write("channel", static_cast<int>(imported.channel))
            .write("program", static_cast<int>(imported.program))
            .write("events", midi.tracks[i].size())
            .write("notes", imported.notes.size());
      }
    }
    scoreplay::json::ArrayScope warnings(w, "warnings");
    for (const auto& warning : result.warnings) {
      w.value(warning);
    }
  }
  std::cout << "\n";
}

void printDecodeText(const std::string& path, const scoreplay::ImportResult& result) {
  const auto& midi = result.midi;
  std::cout << "Decoding: " << path << "\n\n";
  std::cout << "MIDI Info:\n";
  std::cout << "  Format: " << midi.format << "\n";
  std::cout << "  Tracks: " << midi.track_count << "\n";
  if (midi.isSmpteDivision()) {
    std::cout << "  Division: " << midi.signedDivision() << " (SMPTE)\n";
  } else {
    std::cout << "  Division: " << midi.division << " ticks/quarter\n";
  }
  std::cout << "  BPM: " << result.bpm << "\n\n";

  std::cout << "Tracks:\n";
  for (size_t i = 0; i < midi.tracks.size(); ++i) {
    const auto& track = result.tracks[i];
    size_t counts[3] = {0, 0, 0};
    for (const auto& event : midi.tracks[i]) {
      counts[static_cast<size_t>(event.kind)]++;
    }
    std::cout << "  [" << i << "] " << (track.name.empty() ? "(unnamed)" : track.name) << " - "
              << track.notes.size() << " notes, ch " << static_cast<int>(track.channel)
              << ", prog " << static_cast<int>(track.program) << " (";
    for (size_t k = 0; k < 3; ++k) {
      if (k > 0) std::cout << ", ";
      std::cout << counts[k] << " " << eventKindName(static_cast<scoreplay::MidiEventKind>(k));
    }
    std::cout << ")\n";
  }

  if (!result.warnings.empty()) {
    std::cout << "\nWarnings:\n";
    for (const auto& warning : result.warnings) {
      std::cout << "  ! " << warning << "\n";
    }
  }
}

int decodeFile(const std::string& path, bool json_output) {
  std::vector<uint8_t> bytes;
  if (!readFileBytes(path, bytes)) {
    std::cerr << "Error: Failed to open file: " << path << "\n";
    return 1;
  }

  scoreplay::MidiReader reader;
  if (!reader.read(bytes)) {
    std::cerr << "Error: " << scoreplay::decodeErrorToString(reader.getErrorCode()) << ": "
              << reader.getError() << "\n";
    return 1;
  }

  auto result = scoreplay::importParsedMidi(reader.getParsedMidi());
  if (json_output) {
    printDecodeJson(result);
  } else {
    printDecodeText(path, result);
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  bool demo = false;
  bool json_output = false;
  std::string output = "demo.mid";
  std::string decode_file;
  std::string options_file;
  CliExportSettings settings;

  // Options file first so that flags override it.
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--options") == 0 && i + 1 < argc) {
      options_file = argv[i + 1];
    }
  }
  if (!options_file.empty() && !loadOptionsFile(options_file, settings)) {
    return 1;
  }

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--demo") == 0) {
      demo = true;
    } else if (std::strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
      output = argv[++i];
    } else if (std::strcmp(argv[i], "--expressive") == 0) {
      settings.expressive = true;
    } else if (std::strcmp(argv[i], "--max-visits") == 0 && i + 1 < argc) {
      settings.max_visits = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
    } else if (std::strcmp(argv[i], "--humanize-seed") == 0 && i + 1 < argc) {
      settings.humanize = true;
      settings.humanize_seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
    } else if (std::strcmp(argv[i], "--humanize-ticks") == 0 && i + 1 < argc) {
      settings.humanize_ticks = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
    } else if (std::strcmp(argv[i], "--humanize-velocity") == 0 && i + 1 < argc) {
      settings.humanize_velocity = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
    } else if (std::strcmp(argv[i], "--options") == 0 && i + 1 < argc) {
      ++i;  // Already loaded
    } else if (std::strcmp(argv[i], "--decode") == 0 && i + 1 < argc) {
      decode_file = argv[++i];
    } else if (std::strcmp(argv[i], "--json") == 0) {
      json_output = true;
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      printUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown option: " << argv[i] << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (!decode_file.empty()) {
    return decodeFile(decode_file, json_output);
  }
  if (demo) {
    return exportDemo(output, settings);
  }

  printUsage(argv[0]);
  return 1;
}
