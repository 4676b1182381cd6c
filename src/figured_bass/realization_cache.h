// Request-scoped memo for candidate pitch lists and slot realizations.

#ifndef FIGBASS_FIGURED_BASS_REALIZATION_CACHE_H
#define FIGBASS_FIGURED_BASS_REALIZATION_CACHE_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <tuple>
#include <vector>

#include "figured_bass/possibility.h"
#include "figured_bass/realizer_scale.h"

namespace figbass {

/// @brief Inputs that fully determine one slot's realizations for a fixed
///        voice list and rule snapshot.
struct SlotCacheKey {
  uint8_t bass = 0;
  PitchClassMask chord = 0;
  PitchClassMask required = 0;
  PitchClassMask raised = 0;
  std::vector<int> fixed;  ///< Per upper voice, -1 when not fixed.

  bool operator<(const SlotCacheKey& other) const {
    return std::tie(bass, chord, required, raised, fixed) <
           std::tie(other.bass, other.chord, other.required, other.raised, other.fixed);
  }
};

/// @brief Memoizes scale lookups and slot realizations within one request.
///
/// Entries are valid only for one voice list and one rule snapshot. bind()
/// names that context and drops everything cached under another one, so a
/// cache can be reused safely across requests.
class RealizationCache {
 public:
  /// @brief Set the request context; clears the cache if it changed.
  void bind(const std::string& context);

  /// @brief Pitches in [low, high] with a pitch class in the mask, ascending.
  const std::vector<uint8_t>& candidatePitches(PitchClassMask mask, int low, int high);

  /// @brief Cached realizations for a slot, or nullptr.
  const std::vector<Possibility>* findRealizations(const SlotCacheKey& key) const;

  /// @brief Store a slot's realizations.
  void storeRealizations(const SlotCacheKey& key, const std::vector<Possibility>& realizations);

  void clear();

  size_t hits() const { return hits_; }
  size_t misses() const { return misses_; }

 private:
  using PitchKey = std::tuple<PitchClassMask, int, int>;

  std::string context_;
  std::map<PitchKey, std::vector<uint8_t>> pitches_;
  std::map<SlotCacheKey, std::vector<Possibility>> realizations_;
  mutable size_t hits_ = 0;
  mutable size_t misses_ = 0;
};

}  // namespace figbass

#endif  // FIGBASS_FIGURED_BASS_REALIZATION_CACHE_H
