/// @file
/// @brief CLI entry point for the figured bass realizer.

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "counterpoint/motion_analyzer.h"
#include "counterpoint/voice_leading_evaluator.h"
#include "figured_bass/figured_bass_line.h"
#include "figured_bass/rules.h"
#include "figured_bass/voice.h"
#include "harmony/key.h"
#include "midi/midi_writer.h"
#include "realizer.h"

namespace {

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::string key = "C_major";
  std::string input_path;
  std::string line;
  std::string voices = "keyboard";
  std::string rules_path;
  figbass::QueryMode mode = figbass::QueryMode::Sample;
  size_t limit = 0;
  size_t samples = 1;
  bool proportional = false;
  uint32_t seed = 0;
  figbass::RenderStyle style = figbass::RenderStyle::Keyboard;
  uint16_t bpm = 72;
  bool json_output = false;
  std::string output;
  bool verbose = false;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("figbass_cli - Figured bass realizer\n\n");
  std::printf("Usage: figbass_cli (--input FILE | --line \"C3 F3:6 G3:7 C3\") [options]\n\n");
  std::printf("Options:\n");
  std::printf("  --key KEY        Key for --line (e.g. D_major, a_minor)\n");
  std::printf("  --input FILE     Figured bass file\n");
  std::printf("  --line TEXT      Compact bass line, quarter notes\n");
  std::printf("  --voices V       keyboard, chorale, a voice count, or LABEL=LOW-HIGH[/SEP],...\n");
  std::printf("  --rules FILE     Rules JSON\n");
  std::printf("  --count          Count progressions only\n");
  std::printf("  --all            Enumerate progressions\n");
  std::printf("  --limit N        Enumeration limit (0 = none)\n");
  std::printf("  --sample N       Draw N random progressions (default 1)\n");
  std::printf("  --proportional   Sample uniformly over progressions\n");
  std::printf("  --seed N         Random seed (0 = auto)\n");
  std::printf("  --style STYLE    MIDI style: keyboard, chorale\n");
  std::printf("  --bpm N          BPM (20-300)\n");
  std::printf("  --json           JSON output\n");
  std::printf("  -o FILE          MIDI output file\n");
  std::printf("  --verbose        Log build progress and motion statistics\n");
  std::printf("  --help           Show this help\n");
}

/// @brief Parse command-line arguments into CliOptions.
/// @return False if --help was requested (caller should exit cleanly).
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--help") == 0 ||
        std::strcmp(argv[idx], "-h") == 0) {
      printUsage();
      return false;
    }
    if (std::strcmp(argv[idx], "--key") == 0 && idx + 1 < argc) {
      opts.key = argv[++idx];
    } else if (std::strcmp(argv[idx], "--input") == 0 && idx + 1 < argc) {
      opts.input_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--line") == 0 && idx + 1 < argc) {
      opts.line = argv[++idx];
    } else if (std::strcmp(argv[idx], "--voices") == 0 && idx + 1 < argc) {
      opts.voices = argv[++idx];
    } else if (std::strcmp(argv[idx], "--rules") == 0 && idx + 1 < argc) {
      opts.rules_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--count") == 0) {
      opts.mode = figbass::QueryMode::Count;
    } else if (std::strcmp(argv[idx], "--all") == 0) {
      opts.mode = figbass::QueryMode::All;
    } else if (std::strcmp(argv[idx], "--limit") == 0 && idx + 1 < argc) {
      opts.limit = static_cast<size_t>(std::strtoull(argv[++idx], nullptr, 10));
    } else if (std::strcmp(argv[idx], "--sample") == 0 && idx + 1 < argc) {
      opts.mode = figbass::QueryMode::Sample;
      opts.samples = static_cast<size_t>(std::strtoull(argv[++idx], nullptr, 10));
    } else if (std::strcmp(argv[idx], "--proportional") == 0) {
      opts.proportional = true;
    } else if (std::strcmp(argv[idx], "--seed") == 0 && idx + 1 < argc) {
      opts.seed = static_cast<uint32_t>(std::strtoul(argv[++idx], nullptr, 10));
    } else if (std::strcmp(argv[idx], "--style") == 0 && idx + 1 < argc) {
      opts.style = figbass::renderStyleFromString(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--bpm") == 0 && idx + 1 < argc) {
      int bpm = std::atoi(argv[++idx]);
      if (bpm < 20) bpm = 20;
      if (bpm > 300) bpm = 300;
      opts.bpm = static_cast<uint16_t>(bpm);
    } else if (std::strcmp(argv[idx], "--json") == 0) {
      opts.json_output = true;
    } else if (std::strcmp(argv[idx], "-o") == 0 && idx + 1 < argc) {
      opts.output = argv[++idx];
    } else if (std::strcmp(argv[idx], "--verbose") == 0) {
      opts.verbose = true;
    } else {
      std::fprintf(stderr, "Warning: ignoring argument '%s'\n", argv[idx]);
    }
  }
  return true;
}

/// @brief Read a whole file into a string.
bool readFile(const std::string& path, std::string& out) {
  std::ifstream file(path);
  if (!file.is_open()) return false;
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

/// @brief Load the bass line from --input or --line.
bool loadLine(const CliOptions& opts, figbass::FiguredBassLine& line, std::string* error) {
  if (!opts.input_path.empty()) {
    std::string text;
    if (!readFile(opts.input_path, text)) {
      *error = "cannot read " + opts.input_path;
      return false;
    }
    return figbass::parseFiguredBassLine(text, line, error);
  }
  if (opts.line.empty()) {
    *error = "no bass line (use --input or --line)";
    return false;
  }
  figbass::KeySignature key;
  if (!figbass::keySignatureFromString(opts.key, key)) {
    *error = "unknown key '" + opts.key + "'";
    return false;
  }
  return figbass::parseCompactBassLine(opts.line, key, line, error);
}

/// @brief Build a RealizerConfig from parsed CLI options.
bool buildRealizerConfig(const CliOptions& opts, figbass::RealizerConfig& config,
                         std::string* error) {
  if (!figbass::voicesFromString(opts.voices, config.voices, error)) return false;
  if (!opts.rules_path.empty()) {
    std::string text;
    if (!readFile(opts.rules_path, text)) {
      *error = "cannot read " + opts.rules_path;
      return false;
    }
    if (!figbass::rulesFromJson(text, config.rules, error)) return false;
  }
  config.mode = opts.mode;
  config.limit = opts.limit;
  config.num_samples = opts.samples;
  config.proportional = opts.proportional;
  config.seed = opts.seed;
  config.style = opts.style;
  config.bpm = opts.bpm;
  config.verbose = opts.verbose;
  return true;
}

/// @brief Print contrary-motion statistics of each progression to stderr.
void printMotionStats(const figbass::RealizerResult& result) {
  figbass::VoiceLeadingEvaluator evaluator;
  figbass::MotionAnalyzer analyzer(evaluator);
  for (size_t idx = 0; idx < result.progressions.size(); ++idx) {
    auto stats = analyzer.analyzeProgression(result.progressions[idx]);
    std::fprintf(stderr,
                 "[Motion] #%zu parallel %d, similar %d, contrary %d, oblique %d "
                 "(contrary %.2f)\n",
                 idx, stats.parallel, stats.similar, stats.contrary, stats.oblique,
                 static_cast<double>(stats.contraryRatio()));
    std::fprintf(stderr, "[Motion] #%zu outer: %s\n", idx,
                 analyzer.describeOuterVoices(result.progressions[idx]).c_str());
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  if (!parseArgs(argc, argv, opts)) {
    return 0;
  }

  std::string error;
  figbass::FiguredBassLine line;
  if (!loadLine(opts, line, &error)) {
    std::fprintf(stderr, "Error: %s\n", error.c_str());
    return 2;
  }
  figbass::RealizerConfig config;
  if (!buildRealizerConfig(opts, config, &error)) {
    std::fprintf(stderr, "Error: %s\n", error.c_str());
    return 2;
  }

  figbass::RealizerResult result = figbass::realize(line, config);
  if (!result.success) {
    std::fprintf(stderr, "Error: %s\n", result.error_message.c_str());
    return 1;
  }

  if (opts.verbose) printMotionStats(result);

  if (opts.json_output) {
    std::printf("%s\n", result.json.c_str());
  } else {
    std::printf("Key:        %s\n", figbass::keySignatureToString(line.key).c_str());
    std::printf("Slots:      %zu\n", line.notes.size());
    std::printf("Realized:  ");
    for (size_t count : result.realization_counts) std::printf(" %zu", count);
    std::printf("\n");
    std::printf("Count:      %llu%s\n", static_cast<unsigned long long>(result.count),
                result.count_overflow ? " (overflow)" : "");
    if (opts.mode == figbass::QueryMode::Sample) {
      std::printf("Seed used:  %u\n", result.seed_used);
    }
    if (!result.text.empty()) std::printf("\n%s", result.text.c_str());
    if (result.truncated) std::printf("(stopped at limit %zu)\n", opts.limit);
  }

  if (!opts.output.empty()) {
    if (result.tracks.empty()) {
      std::fprintf(stderr, "Warning: nothing to write to %s\n", opts.output.c_str());
      return 0;
    }
    figbass::MidiWriter writer;
    writer.build(result.tracks, result.tempo_events, line.key,
                 figbass::rulesToJson(config.rules));
    if (!writer.writeToFile(opts.output)) {
      std::fprintf(stderr, "Error: failed to write %s\n", opts.output.c_str());
      return 1;
    }
    if (!opts.json_output) std::printf("\nOutput:     %s\n", opts.output.c_str());
  }

  return 0;
}
