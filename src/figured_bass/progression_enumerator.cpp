// Implementation of the lazy progression enumerator.

#include "figured_bass/progression_enumerator.h"

namespace figbass {

ProgressionEnumerator::ProgressionEnumerator(const Chain& chain) : chain_(&chain) {
  if (chain.state() != ChainState::Pruned) {
    error_ = makeRealizeError(RealizeErrorKind::QueryOnUnbuiltChain, -1,
                              std::string("enumeration needs a pruned chain (state ") +
                                  chainStateToString(chain.state()) + ")");
    done_ = true;
    return;
  }
  if (chain.numSlots() == 0) {
    done_ = true;
    return;
  }
  const Segment& first = chain.slot(0);
  for (size_t idx = 0; idx < first.numRealizations(); ++idx) {
    if (first.isAlive(idx)) first_.push_back(static_cast<uint32_t>(idx));
  }
  positions_.assign(chain.numSlots(), 0);
  current_.assign(chain.numSlots(), 0);
}

const std::vector<uint32_t>& ProgressionEnumerator::choicesAt(size_t level) const {
  if (level == 0) return first_;
  return chain_->slot(level - 1).successors(current_[level - 1]);
}

bool ProgressionEnumerator::descend(size_t level) {
  for (; level < current_.size(); ++level) {
    const std::vector<uint32_t>& choices = choicesAt(level);
    if (choices.empty()) return false;
    positions_[level] = 0;
    current_[level] = choices[0];
  }
  return true;
}

bool ProgressionEnumerator::next(IndexProgression& out) {
  if (done_) return false;

  bool found = false;
  if (!started_) {
    started_ = true;
    found = descend(0);
  } else {
    // Advance the deepest level that still has an unused choice.
    for (size_t level = current_.size(); level-- > 0;) {
      const std::vector<uint32_t>& choices = choicesAt(level);
      if (positions_[level] + 1 < choices.size()) {
        ++positions_[level];
        current_[level] = choices[positions_[level]];
        found = descend(level + 1);
        break;
      }
    }
  }

  if (!found) {
    done_ = true;
    return false;
  }
  out = current_;
  ++produced_;
  return true;
}

void ProgressionEnumerator::reset() {
  if (error_.isError() || current_.empty()) return;
  started_ = false;
  done_ = false;
  produced_ = 0;
}

}  // namespace figbass
