// Chain of constrained slots -- builds realizations and movements for a
// figured bass line, prunes dead ends, and counts, enumerates and samples
// the resulting progressions.

#ifndef FIGBASS_FIGURED_BASS_CHAIN_H
#define FIGBASS_FIGURED_BASS_CHAIN_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "counterpoint/i_rule_evaluator.h"
#include "figured_bass/figured_bass_line.h"
#include "figured_bass/possibility.h"
#include "figured_bass/realization_cache.h"
#include "figured_bass/realize_error.h"
#include "figured_bass/resolution.h"
#include "figured_bass/rules.h"
#include "figured_bass/segment.h"
#include "figured_bass/voice.h"
#include "harmony/key.h"

namespace figbass {

class ProgressionEnumerator;

/// One realization index per slot.
using IndexProgression = std::vector<uint32_t>;

/// Construction state; each step requires the previous one.
enum class ChainState : uint8_t {
  Unbuilt,
  RealizationsBuilt,
  MovementsBuilt,
  Pruned
};

/// @brief Convert ChainState to a string such as "Pruned".
const char* chainStateToString(ChainState state);

/// @brief Result of Chain::count().
struct CountResult {
  bool success = false;
  RealizeError error;
  uint64_t count = 0;
};

/// @brief Result of Chain::enumerateAll().
struct EnumerationResult {
  bool success = false;
  RealizeError error;
  std::vector<IndexProgression> progressions;
  bool truncated = false;  ///< True if the limit stopped enumeration early.
};

/// @brief Result of a sampling call.
struct SampleResult {
  bool success = false;
  RealizeError error;
  IndexProgression progression;
};

/// @brief Result of Chain::progressionToPossibilities().
struct PossibilityResult {
  bool success = false;
  RealizeError error;
  std::vector<Possibility> possibilities;
};

/// @brief Slots of one realization request and the legal motions between them.
///
/// Build order is addSlot()*, buildRealizations(), buildMovements(), prune().
/// After pruning the chain is read-only: every query is const and the
/// progression counts are cached by prune().
class Chain {
 public:
  Chain() = default;

  /// @param key Key of the bass line.
  /// @param voices Voice list; sorted high to low here.
  /// @param rules Rule snapshot copied into the chain.
  Chain(const KeySignature& key, const std::vector<Voice>& voices, const Rules& rules);

  /// @brief Log build progress to stderr.
  void setVerbose(bool verbose) { verbose_ = verbose; }

  /// @brief Append a slot for a bass note.
  /// @return False with InputError on a malformed figure or fixed pitch.
  bool addSlot(const BassNote& note, RealizeError* error);

  /// @brief Decide slot-pair resolutions and generate every slot's realizations.
  RealizeError buildRealizations(RealizationCache& cache);

  /// @brief Compute the adjacency between every pair of adjacent slots.
  RealizeError buildMovements(const IRuleEvaluator& evaluator);

  /// @brief Backward sweep removing realizations with no way to the end.
  ///
  /// Idempotent. Fills the progression count cache.
  /// @return ChainInfeasible if the first slot loses every realization.
  RealizeError prune();

  // --- Queries (require the Pruned state) ---

  /// @brief Exact number of complete progressions.
  CountResult count() const;

  /// @brief All progressions in lexicographic index order.
  /// @param limit Stop after this many (0 = no limit).
  EnumerationResult enumerateAll(size_t limit = 0) const;

  /// @brief Lazy enumerator; the chain must outlive it and must not move.
  ProgressionEnumerator enumerator() const;

  /// @brief Uniform first realization, then a uniform successor at each step.
  ///
  /// Not uniform over progressions: a realization with few continuations
  /// is as likely as one with many.
  SampleResult sampleOne(std::mt19937& rng) const;

  /// @brief Uniform over progressions (successors weighted by their counts).
  /// @return CountOverflow when the progression count exceeds 64 bits;
  ///         use sampleOne() for such chains.
  SampleResult sampleProportional(std::mt19937& rng) const;

  /// @brief Map an index progression to its possibilities.
  /// @return InputError on a wrong length, a dead index or a missing link.
  PossibilityResult progressionToPossibilities(const IndexProgression& progression) const;

  /// @brief Live realizations per slot.
  std::vector<size_t> realizationCounts() const;

  /// @brief Live realizations of one slot (0 for an invalid slot).
  size_t numLiveRealizations(size_t slot) const;

  /// @brief Progressions starting at a realization (0 for dead ones).
  uint64_t pathCount(size_t slot, size_t realization) const;

  // --- Accessors ---

  ChainState state() const { return state_; }
  size_t numSlots() const { return slots_.size(); }
  const Segment& slot(size_t idx) const { return slots_[idx]; }
  const std::vector<Voice>& voices() const { return voices_; }
  const Rules& rules() const { return rules_; }
  const KeySignature& key() const { return key_; }

  /// @brief Resolution plan between slot idx and slot idx + 1.
  const ResolutionPlan& plan(size_t idx) const { return plans_[idx]; }

 private:
  bool requirePruned(RealizeError* error) const;
  void computePathCounts();
  std::vector<uint32_t> liveFirstRealizations() const;

  KeySignature key_;
  std::vector<Voice> voices_;
  Rules rules_;
  bool verbose_ = false;
  ChainState state_ = ChainState::Unbuilt;

  std::vector<Segment> slots_;
  std::vector<ResolutionPlan> plans_;

  // path_counts_[slot][realization]; filled by prune().
  std::vector<std::vector<uint64_t>> path_counts_;
  bool count_overflow_ = false;
};

/// @brief Options for buildChain().
struct ChainBuildOptions {
  bool verbose = false;
};

/// @brief Result of buildChain(); chain is Pruned when success is true.
struct ChainBuildResult {
  bool success = false;
  RealizeError error;
  Chain chain;
};

/// @brief Validate the inputs, then build and prune a chain.
///
/// @param line Bass line with figures and key.
/// @param voices Voice list (any order).
/// @param rules Rule snapshot.
/// @param cache Request-scoped cache.
/// @param options Build options.
/// @return On failure the error names the kind and slot (InputError,
///         SlotInfeasible, RealizationCapExceeded, ChainInfeasible).
ChainBuildResult buildChain(const FiguredBassLine& line, const std::vector<Voice>& voices,
                            const Rules& rules, RealizationCache& cache,
                            const ChainBuildOptions& options = ChainBuildOptions());

}  // namespace figbass

#endif  // FIGBASS_FIGURED_BASS_CHAIN_H
