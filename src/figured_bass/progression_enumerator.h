// Lazy, restartable enumeration of the progressions of a pruned chain.

#ifndef FIGBASS_FIGURED_BASS_PROGRESSION_ENUMERATOR_H
#define FIGBASS_FIGURED_BASS_PROGRESSION_ENUMERATOR_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "figured_bass/chain.h"
#include "figured_bass/realize_error.h"

namespace figbass {

/// @brief Depth-first walk over a pruned chain in lexicographic index order.
///
/// Holds a pointer to the chain, which must outlive the enumerator. Only
/// the current path is kept in memory.
///
/// @code
///   ProgressionEnumerator iter = chain.enumerator();
///   IndexProgression prog;
///   while (iter.next(prog)) { ... }
/// @endcode
class ProgressionEnumerator {
 public:
  explicit ProgressionEnumerator(const Chain& chain);

  /// @brief Produce the next progression.
  /// @return False when exhausted or when the chain was not pruned.
  bool next(IndexProgression& out);

  /// @brief Start again from the first progression.
  void reset();

  /// @brief Progressions produced since construction or the last reset.
  uint64_t produced() const { return produced_; }

  /// @brief QueryOnUnbuiltChain if the chain was not pruned.
  const RealizeError& error() const { return error_; }

 private:
  /// Candidate list at a depth given the current path above it.
  const std::vector<uint32_t>& choicesAt(size_t level) const;

  /// Take the first choice at every level from `level` down.
  bool descend(size_t level);

  const Chain* chain_;
  RealizeError error_;
  std::vector<uint32_t> first_;
  std::vector<size_t> positions_;
  IndexProgression current_;
  bool started_ = false;
  bool done_ = false;
  uint64_t produced_ = 0;
};

}  // namespace figbass

#endif  // FIGBASS_FIGURED_BASS_PROGRESSION_ENUMERATOR_H
