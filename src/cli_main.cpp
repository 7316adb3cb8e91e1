/// @file
/// @brief CLI entry point for the band chord voicer.

#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <climits>
#include <cstring>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/json_parser.h"
#include "core/version_info.h"
#include "generator.h"
#include "midi/midi_writer.h"

namespace {

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::optional<std::string> root;
  std::optional<std::string> quality;
  std::optional<std::string> anchor;
  std::optional<std::string> bass;
  std::optional<std::string> progression;
  std::optional<std::string> config_path;
  std::optional<int> max_notes;
  std::optional<int> bpm;
  bool include_root = true;
  bool demo = false;
  bool json_output = false;
  bool verbose = false;
  std::string output = "iiVI.mid";
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("band_cli - closed chord voicing and MIDI export\n\n");
  std::printf("Usage: band_cli [options]\n\n");
  std::printf("Options:\n");
  std::printf("  --root PITCH        Chord root (e.g. D4, Bb3)\n");
  std::printf("  --quality Q         Chord quality (e.g. m7(9), 7(13), maj7, dim7, sus4)\n");
  std::printf("  --anchor PITCH      Register center for the voicing (default C4)\n");
  std::printf("  --max-notes N       Note budget, at least 2 (default 5)\n");
  std::printf("  --bass PITCH        Separate bass note, placed an octave below the anchor\n");
  std::printf("  --no-root           Leave the root out of the upper voicing\n");
  std::printf("  --progression STR   Chords as \"ROOT:QUALITY[/BASS] ...\"\n");
  std::printf("  --demo              ii-V-I in C (default when no chord is given)\n");
  std::printf("  --bpm N             Tempo, 20-300 (default 120)\n");
  std::printf("  --config FILE       JSON config (flags override it)\n");
  std::printf("  --json              Also write voicings and events as JSON\n");
  std::printf("  --verbose           Trace voicing decisions to stderr\n");
  std::printf("  -o FILE             Output MIDI path (default iiVI.mid)\n");
  std::printf("  --help              Show this help\n");
}

/// @brief Parse a whole decimal argument that fits in an int.
std::optional<int> parseIntArg(const char* text) {
  char* end = nullptr;
  errno = 0;
  long value = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || errno == ERANGE || value < INT_MIN || value > INT_MAX) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

/// @brief Parse command-line arguments into CliOptions.
/// @return False if --help was requested or an argument is unknown.
bool parseArgs(int argc, char* argv[], CliOptions& opts, int& exit_code) {
  exit_code = 0;
  for (int idx = 1; idx < argc; ++idx) {
    const char* arg = argv[idx];
    bool has_value = idx + 1 < argc;

    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      printUsage();
      return false;
    }
    if (std::strcmp(arg, "--root") == 0 && has_value) {
      opts.root = argv[++idx];
    } else if (std::strcmp(arg, "--quality") == 0 && has_value) {
      opts.quality = argv[++idx];
    } else if (std::strcmp(arg, "--anchor") == 0 && has_value) {
      opts.anchor = argv[++idx];
    } else if (std::strcmp(arg, "--bass") == 0 && has_value) {
      opts.bass = argv[++idx];
    } else if (std::strcmp(arg, "--progression") == 0 && has_value) {
      opts.progression = argv[++idx];
    } else if (std::strcmp(arg, "--config") == 0 && has_value) {
      opts.config_path = argv[++idx];
    } else if ((std::strcmp(arg, "--max-notes") == 0 || std::strcmp(arg, "--bpm") == 0) &&
               has_value) {
      auto value = parseIntArg(argv[++idx]);
      if (!value) {
        std::fprintf(stderr, "Error: %s expects an integer, got '%s'\n", arg, argv[idx]);
        exit_code = 2;
        return false;
      }
      if (std::strcmp(arg, "--bpm") == 0) {
        opts.bpm = *value;
      } else {
        opts.max_notes = *value;
      }
    } else if (std::strcmp(arg, "-o") == 0 && has_value) {
      opts.output = argv[++idx];
    } else if (std::strcmp(arg, "--no-root") == 0) {
      opts.include_root = false;
    } else if (std::strcmp(arg, "--demo") == 0) {
      opts.demo = true;
    } else if (std::strcmp(arg, "--json") == 0) {
      opts.json_output = true;
    } else if (std::strcmp(arg, "--verbose") == 0) {
      opts.verbose = true;
    } else {
      std::fprintf(stderr, "Error: unknown or incomplete option '%s' (see --help)\n", arg);
      exit_code = 2;
      return false;
    }
  }
  return true;
}

bool readFile(const std::string& path, std::string& out) {
  std::ifstream file(path);
  if (!file.is_open()) return false;
  std::ostringstream contents;
  contents << file.rdbuf();
  out = contents.str();
  return true;
}

/// @brief Merge the config file and the command line into a GeneratorConfig.
/// @return False (after printing the reason) on any invalid input.
bool buildGeneratorConfig(const CliOptions& opts, band::GeneratorConfig& config) {
  if (opts.config_path) {
    std::string text;
    if (!readFile(*opts.config_path, text)) {
      std::fprintf(stderr, "Error: cannot read config %s\n", opts.config_path->c_str());
      return false;
    }
    auto object = band::parseJsonObject(text);
    if (!object) {
      std::fprintf(stderr, "Error: %s is not a flat JSON object\n", opts.config_path->c_str());
      return false;
    }
    auto parsed = band::configFromJson(*object, config);
    if (!parsed.ok()) {
      std::fprintf(stderr, "Error: %s: %s\n", opts.config_path->c_str(),
                   parsed.error_message.c_str());
      return false;
    }
    config = parsed.value;
  }

  if (opts.anchor) {
    auto anchor = band::Pitch::fromString(*opts.anchor);
    if (!anchor) {
      std::fprintf(stderr, "Error: cannot parse anchor pitch '%s'\n", opts.anchor->c_str());
      return false;
    }
    config.anchor = *anchor;
  }
  if (opts.max_notes) config.max_notes = *opts.max_notes;
  if (opts.bpm) {
    if (*opts.bpm < band::kMinBpm || *opts.bpm > band::kMaxBpm) {
      std::fprintf(stderr, "Error: --bpm must be between %d and %d\n", band::kMinBpm,
                   band::kMaxBpm);
      return false;
    }
    config.bpm = static_cast<uint16_t>(*opts.bpm);
  }
  config.verbose = opts.verbose;

  if (opts.progression) {
    auto chords = band::parseProgression(*opts.progression, opts.include_root);
    if (!chords.ok()) {
      std::fprintf(stderr, "Error: %s\n", chords.error_message.c_str());
      return false;
    }
    config.chords = chords.value;
  } else if (!opts.demo && (opts.root || opts.quality)) {
    // Reuse the JSON path so flag and config validation agree.
    band::JsonObject object;
    auto put = [&object](const char* key, const std::optional<std::string>& val) {
      if (!val) return;
      band::JsonValue json_val;
      json_val.type = band::JsonValue::String;
      json_val.string_val = *val;
      object[key] = json_val;
    };
    put("root", opts.root);
    put("quality", opts.quality);
    put("bass", opts.bass);
    band::JsonValue include_root;
    include_root.type = band::JsonValue::Bool;
    include_root.bool_val = opts.include_root;
    object["include_root"] = include_root;

    auto parsed = band::configFromJson(object, config);
    if (!parsed.ok()) {
      std::fprintf(stderr, "Error: %s\n", parsed.error_message.c_str());
      return false;
    }
    config.chords = parsed.value.chords;
  }

  if (opts.demo || config.chords.empty()) {
    band::Pitch tonic = band::kMiddleC;
    if (opts.root) {
      auto parsed = band::Pitch::fromString(*opts.root);
      if (!parsed) {
        std::fprintf(stderr, "Error: cannot parse root pitch '%s'\n", opts.root->c_str());
        return false;
      }
      tonic = *parsed;
    }
    config.chords = band::twoFiveOneProgression(tonic);
  }
  return true;
}

std::string jsonPathFor(const std::string& midi_path) {
  auto dot_pos = midi_path.rfind('.');
  if (dot_pos == std::string::npos) return midi_path + ".json";
  return midi_path.substr(0, dot_pos) + ".json";
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  int exit_code = 0;
  if (!parseArgs(argc, argv, opts, exit_code)) {
    return exit_code;
  }

  band::GeneratorConfig config;
  if (!buildGeneratorConfig(opts, config)) {
    return 1;
  }

  std::printf("band_cli v%s\n", band::kBandVersion);
  std::printf("Anchor:     %s\n", config.anchor.name().c_str());
  std::printf("Max notes:  %d\n", config.max_notes);
  std::printf("BPM:        %d\n", config.bpm);
  std::printf("Chords:     %zu\n\n", config.chords.size());

  band::GeneratorResult result = band::generate(config);
  if (!result.success) {
    std::fprintf(stderr, "Error: %s\n", result.error_message.c_str());
    return 1;
  }

  for (size_t idx = 0; idx < result.voicings.size(); ++idx) {
    std::printf("%3zu  %-18s %s\n", idx + 1,
                band::progressionChordToString(config.chords[idx]).c_str(),
                result.voicings[idx].toString().c_str());
  }

  band::MidiWriter writer;
  writer.build(result.tracks, result.tempo_events);
  if (!writer.writeToFile(opts.output)) {
    std::fprintf(stderr, "Error: failed to write %s\n", opts.output.c_str());
    return 1;
  }
  std::printf("\nOutput:     %s\n", opts.output.c_str());

  if (opts.json_output) {
    std::string json_path = jsonPathFor(opts.output);
    std::ofstream json_file(json_path);
    if (json_file.is_open()) {
      json_file << band::buildEventsJson(result, config);
      std::printf("JSON:       %s\n", json_path.c_str());
    } else {
      std::fprintf(stderr, "Warning: failed to write %s\n", json_path.c_str());
    }
  }

  return 0;
}
