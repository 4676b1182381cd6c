// Realizer facade: builds a chain for a figured bass line, runs the
// requested query and renders the chosen progressions.

#ifndef FIGBASS_REALIZER_H
#define FIGBASS_REALIZER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "figured_bass/figured_bass_line.h"
#include "figured_bass/possibility.h"
#include "figured_bass/realize_error.h"
#include "figured_bass/rules.h"
#include "figured_bass/voice.h"

namespace figbass {

/// @brief What the realizer should produce.
enum class QueryMode : uint8_t {
  Count,   ///< Count only.
  All,     ///< Enumerate (up to a limit).
  Sample   ///< Draw random progressions.
};

/// @brief Convert QueryMode to a string such as "sample".
const char* queryModeToString(QueryMode mode);

/// @brief Configuration of one realization request.
struct RealizerConfig {
  std::vector<Voice> voices = keyboardVoices();
  Rules rules;
  QueryMode mode = QueryMode::Sample;
  size_t limit = 0;          ///< Enumeration limit for All (0 = no limit).
  size_t num_samples = 1;    ///< Progressions drawn for Sample.
  bool proportional = false; ///< Sample uniformly over progressions.
  uint32_t seed = 0;         ///< 0 = auto (random).
  RenderStyle style = RenderStyle::Keyboard;
  uint16_t bpm = 72;
  bool verbose = false;
};

/// @brief Result of realize().
struct RealizerResult {
  bool success = false;
  RealizeError error;
  std::string error_message;
  uint32_t seed_used = 0;

  uint64_t count = 0;
  bool count_overflow = false;  ///< count holds UINT64_MAX when set.
  std::vector<size_t> realization_counts;  ///< Live realizations per slot.

  std::vector<std::vector<Possibility>> progressions;
  bool truncated = false;  ///< Enumeration stopped at the limit.

  std::string text;  ///< One block per progression.
  std::string json;

  std::vector<Track> tracks;  ///< Progressions played one after another.
  std::vector<TempoEvent> tempo_events;
  Tick total_duration_ticks = 0;
};

/// @brief Realize a figured bass line.
///
/// Count mode returns no progressions and no tracks. Sample mode draws
/// config.num_samples progressions with one generator seeded from
/// config.seed.
///
/// @param line Bass line.
/// @param config Request configuration.
/// @return Result; on failure error names the kind and slot.
RealizerResult realize(const FiguredBassLine& line, const RealizerConfig& config);

}  // namespace figbass

#endif  // FIGBASS_REALIZER_H
