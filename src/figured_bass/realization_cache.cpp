// Implementation of the request-scoped realization cache.

#include "figured_bass/realization_cache.h"

namespace figbass {

void RealizationCache::bind(const std::string& context) {
  if (context == context_) return;
  clear();
  context_ = context;
}

const std::vector<uint8_t>& RealizationCache::candidatePitches(PitchClassMask mask, int low,
                                                               int high) {
  PitchKey key(mask, low, high);
  auto iter = pitches_.find(key);
  if (iter != pitches_.end()) return iter->second;
  auto inserted =
      pitches_.emplace(key, FiguredBassScale::pitchesForScaleDegrees(mask, low, high));
  return inserted.first->second;
}

const std::vector<Possibility>* RealizationCache::findRealizations(const SlotCacheKey& key) const {
  auto iter = realizations_.find(key);
  if (iter == realizations_.end()) {
    ++misses_;
    return nullptr;
  }
  ++hits_;
  return &iter->second;
}

void RealizationCache::storeRealizations(const SlotCacheKey& key,
                                         const std::vector<Possibility>& realizations) {
  realizations_[key] = realizations;
}

void RealizationCache::clear() {
  pitches_.clear();
  realizations_.clear();
  hits_ = 0;
  misses_ = 0;
  context_.clear();
}

}  // namespace figbass
