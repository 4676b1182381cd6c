// Realizer facade implementation.

#include "realizer.h"

#include <cstdio>
#include <limits>
#include <random>
#include <utility>

#include "core/rng_util.h"
#include "figured_bass/chain.h"
#include "figured_bass/realization_cache.h"
#include "render/progression_renderer.h"

namespace figbass {

namespace {

/// Rest between consecutive progressions in the rendered tracks.
constexpr Tick kProgressionGap = kQuarterNote;

void fail(RealizerResult& result, const RealizeError& error) {
  result.success = false;
  result.error = error;
  result.error_message = error.toString();
}

/// Append the tracks of one progression at the given offset.
bool appendTracks(RealizerResult& result, const FiguredBassLine& line,
                  const std::vector<Voice>& voices, const std::vector<Possibility>& progression,
                  RenderStyle style, Tick offset) {
  RenderResult rendered = renderTracks(style, line, voices, progression);
  if (!rendered.success) {
    fail(result, makeRealizeError(RealizeErrorKind::InputError, -1, rendered.error_message));
    return false;
  }
  if (result.tracks.empty()) {
    result.tracks = rendered.tracks;
    for (auto& track : result.tracks) track.notes.clear();
  }
  for (size_t idx = 0; idx < rendered.tracks.size() && idx < result.tracks.size(); ++idx) {
    for (auto note : rendered.tracks[idx].notes) {
      note.start_tick += offset;
      result.tracks[idx].notes.push_back(note);
    }
  }
  return true;
}

}  // namespace

const char* queryModeToString(QueryMode mode) {
  switch (mode) {
    case QueryMode::Count:  return "count";
    case QueryMode::All:    return "all";
    case QueryMode::Sample: return "sample";
  }
  return "unknown";
}

RealizerResult realize(const FiguredBassLine& line, const RealizerConfig& config) {
  RealizerResult result;
  result.seed_used = config.seed == 0 ? rng::generateRandomSeed() : config.seed;

  RealizationCache cache;
  ChainBuildOptions options;
  options.verbose = config.verbose;
  ChainBuildResult built = buildChain(line, config.voices, config.rules, cache, options);
  if (!built.success) {
    fail(result, built.error);
    return result;
  }
  const Chain& chain = built.chain;
  result.realization_counts = chain.realizationCounts();

  CountResult counted = chain.count();
  if (counted.success) {
    result.count = counted.count;
  } else if (counted.error.kind == RealizeErrorKind::CountOverflow &&
             config.mode != QueryMode::Count &&
             !(config.mode == QueryMode::Sample && config.proportional)) {
    result.count = std::numeric_limits<uint64_t>::max();
    result.count_overflow = true;
    if (config.verbose) std::fprintf(stderr, "[Realizer] %s\n", counted.error.toString().c_str());
  } else {
    fail(result, counted.error);
    return result;
  }

  std::vector<IndexProgression> chosen;
  if (config.mode == QueryMode::All) {
    EnumerationResult enumerated = chain.enumerateAll(config.limit);
    if (!enumerated.success) {
      fail(result, enumerated.error);
      return result;
    }
    chosen = std::move(enumerated.progressions);
    result.truncated = enumerated.truncated;
  } else if (config.mode == QueryMode::Sample) {
    std::mt19937 rng(result.seed_used);
    for (size_t idx = 0; idx < config.num_samples; ++idx) {
      SampleResult sampled = config.proportional ? chain.sampleProportional(rng)
                                                 : chain.sampleOne(rng);
      if (!sampled.success) {
        fail(result, sampled.error);
        return result;
      }
      chosen.push_back(std::move(sampled.progression));
    }
  }

  for (const auto& indices : chosen) {
    PossibilityResult mapped = chain.progressionToPossibilities(indices);
    if (!mapped.success) {
      fail(result, mapped.error);
      return result;
    }
    result.progressions.push_back(std::move(mapped.possibilities));
  }

  Tick line_duration = line.totalDuration();
  Tick offset = 0;
  for (size_t idx = 0; idx < result.progressions.size(); ++idx) {
    const auto& progression = result.progressions[idx];
    if (idx > 0) result.text += "\n";
    result.text += formatProgressionText(chain, progression);
    if (!appendTracks(result, line, chain.voices(), progression, config.style, offset)) {
      return result;
    }
    offset += line_duration + kProgressionGap;
  }
  if (!result.progressions.empty()) {
    result.total_duration_ticks = offset - kProgressionGap;
    result.tempo_events.push_back({0, config.bpm});
  }

  result.json = progressionsToJson(chain, result.count, result.progressions);

  if (config.verbose) {
    std::fprintf(stderr, "[Realizer] %s: %llu progressions, %zu returned (seed %u)\n",
                 queryModeToString(config.mode), static_cast<unsigned long long>(result.count),
                 result.progressions.size(), result.seed_used);
  }
  result.success = true;
  return result;
}

}  // namespace figbass
