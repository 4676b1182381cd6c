// Implementation of the slot chain: build, prune, count, enumerate, sample.

#include "figured_bass/chain.h"

#include <cstdio>
#include <limits>
#include <utility>

#include "core/rng_util.h"
#include "counterpoint/voice_leading_evaluator.h"
#include "figured_bass/movement_generator.h"
#include "figured_bass/notation.h"
#include "figured_bass/progression_enumerator.h"
#include "figured_bass/realizer_scale.h"

namespace figbass {

const char* chainStateToString(ChainState state) {
  switch (state) {
    case ChainState::Unbuilt:           return "Unbuilt";
    case ChainState::RealizationsBuilt: return "RealizationsBuilt";
    case ChainState::MovementsBuilt:    return "MovementsBuilt";
    case ChainState::Pruned:            return "Pruned";
  }
  return "Unbuilt";
}

namespace {

RealizeError outOfOrder(const char* step, ChainState state) {
  return makeRealizeError(RealizeErrorKind::QueryOnUnbuiltChain, -1,
                          std::string(step) + " called in state " + chainStateToString(state));
}

/// Saturating add; sets overflow when the sum does not fit.
uint64_t addCounts(uint64_t lhs, uint64_t rhs, bool& overflow) {
  if (lhs > std::numeric_limits<uint64_t>::max() - rhs) {
    overflow = true;
    return std::numeric_limits<uint64_t>::max();
  }
  return lhs + rhs;
}

/// Identifies the voice list and rules that cached realizations depend on.
std::string cacheContext(const std::vector<Voice>& voices, const Rules& rules) {
  std::string context = rulesToJson(rules);
  for (const auto& voice : voices) {
    PitchRange sounding = voice.soundingRange();
    context += "|" + voice.label + ":" + std::to_string(sounding.lowest) + "-" +
               std::to_string(sounding.highest) + "/" + std::to_string(voice.max_separation);
  }
  return context;
}

}  // namespace

Chain::Chain(const KeySignature& key, const std::vector<Voice>& voices, const Rules& rules)
    : key_(key), voices_(voices), rules_(rules) {
  sortVoices(voices_);
}

bool Chain::addSlot(const BassNote& note, RealizeError* error) {
  int slot_index = static_cast<int>(slots_.size());
  std::string where = spelledPitchToString(note.pitch) + " '" + note.figure + "'";
  auto fail = [&](const std::string& message) {
    if (error) *error = makeRealizeError(RealizeErrorKind::InputError, slot_index, where + ": " + message);
    return false;
  };
  if (state_ != ChainState::Unbuilt) {
    if (error) *error = outOfOrder("addSlot", state_);
    return false;
  }

  Figure figure;
  std::string figure_error;
  if (!parseFigure(note.figure, figure, &figure_error)) return fail(figure_error);

  FiguredBassScale scale(key_);
  Segment segment(slots_.size(), note.pitch, figure, scale, rules_);
  for (const auto& fixed : note.fixed_pitches) {
    size_t voice_index = voices_.size();
    for (size_t idx = 0; idx + 1 < voices_.size(); ++idx) {
      if (voices_[idx].label == fixed.label) voice_index = idx;
    }
    if (voice_index == voices_.size()) {
      return fail("no upper voice labelled '" + fixed.label + "'");
    }
    segment.fixVoice(voice_index, fixed.pitch.midi());
  }
  slots_.push_back(segment);
  return true;
}

RealizeError Chain::buildRealizations(RealizationCache& cache) {
  if (state_ != ChainState::Unbuilt) return outOfOrder("buildRealizations", state_);
  if (slots_.empty()) {
    return makeRealizeError(RealizeErrorKind::InputError, -1, "empty bass sequence");
  }

  // Resolutions are decided up front: a V7 -> I pair relaxes completeness
  // of the tonic slot before it is generated.
  plans_.clear();
  for (size_t idx = 0; idx + 1 < slots_.size(); ++idx) {
    plans_.push_back(planResolution(slots_[idx].requirement(), slots_[idx + 1].analysis(), rules_));
    if (plans_.back().relax_target_completeness) slots_[idx + 1].relaxCompleteness();
  }

  cache.bind(cacheContext(voices_, rules_));
  for (auto& segment : slots_) {
    RealizeError error;
    if (!segment.generateRealizations(voices_, rules_, cache, &error)) {
      if (verbose_) std::fprintf(stderr, "[Chain] %s\n", error.toString().c_str());
      return error;
    }
    if (verbose_) {
      std::fprintf(stderr, "[Chain] slot %zu %s: %s, %zu realizations%s\n", segment.index(),
                   segment.describe().c_str(), chordQualityToString(segment.analysis().quality),
                   segment.numRealizations(),
                   segment.isCompletenessRelaxed() ? " (incomplete allowed)" : "");
    }
  }
  if (verbose_) {
    std::fprintf(stderr, "[Chain] realization cache: %zu hits, %zu misses\n", cache.hits(),
                 cache.misses());
  }
  state_ = ChainState::RealizationsBuilt;
  return RealizeError();
}

RealizeError Chain::buildMovements(const IRuleEvaluator& evaluator) {
  if (state_ != ChainState::RealizationsBuilt) return outOfOrder("buildMovements", state_);
  MovementGenerator generator(evaluator, rules_, voices_);
  for (size_t idx = 0; idx + 1 < slots_.size(); ++idx) {
    size_t edges = generator.generateMovements(plans_[idx], slots_[idx], slots_[idx + 1]);
    if (verbose_) {
      std::fprintf(stderr, "[Chain] movements %zu -> %zu: %zu edges (%s)\n", idx, idx + 1, edges,
                   plans_[idx].description.empty() ? "ordinary"
                                                   : plans_[idx].description.c_str());
    }
  }
  state_ = ChainState::MovementsBuilt;
  return RealizeError();
}

RealizeError Chain::prune() {
  if (state_ != ChainState::MovementsBuilt && state_ != ChainState::Pruned) {
    return outOfOrder("prune", state_);
  }

  int emptied = -1;
  for (size_t idx = slots_.size() - 1; idx-- > 0;) {
    Segment& segment = slots_[idx];
    const Segment& next = slots_[idx + 1];
    for (size_t real = 0; real < segment.numRealizations(); ++real) {
      if (!segment.isAlive(real)) continue;
      std::vector<uint32_t>& successors = segment.mutableSuccessors(real);
      std::vector<uint32_t> live;
      live.reserve(successors.size());
      for (uint32_t target : successors) {
        if (next.isAlive(target)) live.push_back(target);
      }
      successors.swap(live);
      if (successors.empty()) segment.markDead(real);
    }
    if (segment.numAlive() == 0 && emptied < 0) emptied = static_cast<int>(idx);
  }

  computePathCounts();
  state_ = ChainState::Pruned;
  if (verbose_) {
    std::fprintf(stderr, "[Chain] pruned live realizations:");
    for (const auto& segment : slots_) std::fprintf(stderr, " %zu", segment.numAlive());
    std::fprintf(stderr, "\n");
  }

  if (slots_.front().numAlive() == 0) {
    std::string message = "no progression from " + slots_.front().describe() + " to " +
                          slots_.back().describe();
    if (emptied >= 0) {
      message += "; slot " + std::to_string(emptied) + " " + slots_[emptied].describe() +
                 " has no realization that can continue";
    }
    return makeRealizeError(RealizeErrorKind::ChainInfeasible, emptied, message);
  }
  return RealizeError();
}

void Chain::computePathCounts() {
  count_overflow_ = false;
  path_counts_.assign(slots_.size(), std::vector<uint64_t>());
  for (size_t idx = slots_.size(); idx-- > 0;) {
    const Segment& segment = slots_[idx];
    std::vector<uint64_t>& counts = path_counts_[idx];
    counts.assign(segment.numRealizations(), 0);
    bool last = idx + 1 == slots_.size();
    for (size_t real = 0; real < segment.numRealizations(); ++real) {
      if (!segment.isAlive(real)) continue;
      if (last) {
        counts[real] = 1;
        continue;
      }
      uint64_t total = 0;
      for (uint32_t target : segment.successors(real)) {
        total = addCounts(total, path_counts_[idx + 1][target], count_overflow_);
      }
      counts[real] = total;
    }
  }
}

bool Chain::requirePruned(RealizeError* error) const {
  if (state_ == ChainState::Pruned) return true;
  if (error) *error = outOfOrder("query", state_);
  return false;
}

std::vector<uint32_t> Chain::liveFirstRealizations() const {
  std::vector<uint32_t> live;
  if (slots_.empty()) return live;
  for (size_t real = 0; real < slots_[0].numRealizations(); ++real) {
    if (slots_[0].isAlive(real)) live.push_back(static_cast<uint32_t>(real));
  }
  return live;
}

CountResult Chain::count() const {
  CountResult result;
  if (!requirePruned(&result.error)) return result;
  bool overflow = count_overflow_;
  uint64_t total = 0;
  for (uint32_t real : liveFirstRealizations()) {
    total = addCounts(total, path_counts_[0][real], overflow);
  }
  if (overflow) {
    result.error = makeRealizeError(RealizeErrorKind::CountOverflow, -1,
                                    "progression count exceeds 64 bits");
    return result;
  }
  result.count = total;
  result.success = true;
  return result;
}

EnumerationResult Chain::enumerateAll(size_t limit) const {
  EnumerationResult result;
  if (!requirePruned(&result.error)) return result;
  ProgressionEnumerator iter(*this);
  IndexProgression progression;
  while (iter.next(progression)) {
    if (limit > 0 && result.progressions.size() == limit) {
      result.truncated = true;
      break;
    }
    result.progressions.push_back(progression);
  }
  result.success = true;
  return result;
}

ProgressionEnumerator Chain::enumerator() const { return ProgressionEnumerator(*this); }

SampleResult Chain::sampleOne(std::mt19937& rng) const {
  SampleResult result;
  if (!requirePruned(&result.error)) return result;
  std::vector<uint32_t> first = liveFirstRealizations();
  if (first.empty()) {
    result.error = makeRealizeError(RealizeErrorKind::ChainInfeasible, 0, "no live realization");
    return result;
  }
  uint32_t current = rng::selectRandom(rng, first);
  result.progression.push_back(current);
  for (size_t idx = 0; idx + 1 < slots_.size(); ++idx) {
    current = rng::selectRandom(rng, slots_[idx].successors(current));
    result.progression.push_back(current);
  }
  result.success = true;
  return result;
}

SampleResult Chain::sampleProportional(std::mt19937& rng) const {
  SampleResult result;
  if (!requirePruned(&result.error)) return result;
  // The weights must be exact and their sum must fit in 64 bits.
  CountResult total = count();
  if (!total.success) {
    result.error = total.error;
    if (result.error.kind == RealizeErrorKind::CountOverflow) {
      result.error.message = "proportional sampling needs exact path counts; " +
                             result.error.message;
    }
    return result;
  }
  std::vector<uint32_t> first = liveFirstRealizations();
  if (first.empty()) {
    result.error = makeRealizeError(RealizeErrorKind::ChainInfeasible, 0, "no live realization");
    return result;
  }

  std::vector<uint64_t> weights;
  for (uint32_t real : first) weights.push_back(path_counts_[0][real]);
  uint32_t current = first[rng::selectWeightedIndex(rng, weights)];
  result.progression.push_back(current);
  for (size_t idx = 0; idx + 1 < slots_.size(); ++idx) {
    const std::vector<uint32_t>& successors = slots_[idx].successors(current);
    weights.clear();
    for (uint32_t target : successors) weights.push_back(path_counts_[idx + 1][target]);
    current = successors[rng::selectWeightedIndex(rng, weights)];
    result.progression.push_back(current);
  }
  result.success = true;
  return result;
}

PossibilityResult Chain::progressionToPossibilities(const IndexProgression& progression) const {
  PossibilityResult result;
  if (!requirePruned(&result.error)) return result;
  if (progression.size() != slots_.size()) {
    result.error = makeRealizeError(
        RealizeErrorKind::InputError, -1,
        "progression has " + std::to_string(progression.size()) + " indices, chain has " +
            std::to_string(slots_.size()) + " slots");
    return result;
  }
  for (size_t idx = 0; idx < progression.size(); ++idx) {
    const Segment& segment = slots_[idx];
    uint32_t real = progression[idx];
    if (!segment.isAlive(real)) {
      result.error = makeRealizeError(RealizeErrorKind::InputError, static_cast<int>(idx),
                                      "realization " + std::to_string(real) + " of " +
                                          segment.describe() + " is not live");
      result.possibilities.clear();
      return result;
    }
    if (idx > 0) {
      const std::vector<uint32_t>& successors = slots_[idx - 1].successors(progression[idx - 1]);
      bool linked = false;
      for (uint32_t target : successors) {
        if (target == real) linked = true;
      }
      if (!linked) {
        result.error = makeRealizeError(RealizeErrorKind::InputError, static_cast<int>(idx),
                                        "realization " + std::to_string(real) + " of " +
                                            segment.describe() +
                                            " does not follow the previous one");
        result.possibilities.clear();
        return result;
      }
    }
    result.possibilities.push_back(segment.realization(real));
  }
  result.success = true;
  return result;
}

std::vector<size_t> Chain::realizationCounts() const {
  std::vector<size_t> counts;
  for (const auto& segment : slots_) counts.push_back(segment.numAlive());
  return counts;
}

size_t Chain::numLiveRealizations(size_t slot) const {
  if (slot >= slots_.size()) return 0;
  return slots_[slot].numAlive();
}

uint64_t Chain::pathCount(size_t slot, size_t realization) const {
  if (state_ != ChainState::Pruned || slot >= path_counts_.size() ||
      realization >= path_counts_[slot].size()) {
    return 0;
  }
  return path_counts_[slot][realization];
}

// ---------------------------------------------------------------------------
// buildChain
// ---------------------------------------------------------------------------

ChainBuildResult buildChain(const FiguredBassLine& line, const std::vector<Voice>& voices,
                            const Rules& rules, RealizationCache& cache,
                            const ChainBuildOptions& options) {
  ChainBuildResult result;
  std::string voice_error;
  if (!validateVoices(voices, &voice_error)) {
    result.error = makeRealizeError(RealizeErrorKind::InputError, -1, voice_error);
    return result;
  }
  if (line.notes.empty()) {
    result.error = makeRealizeError(RealizeErrorKind::InputError, -1, "empty bass sequence");
    return result;
  }

  Chain chain(line.key, voices, rules);
  chain.setVerbose(options.verbose);
  if (options.verbose) {
    std::fprintf(stderr, "[Chain] %zu slots in %s, %zu voices\n", line.notes.size(),
                 keySignatureToString(line.key).c_str(), voices.size());
  }
  for (const auto& note : line.notes) {
    if (!chain.addSlot(note, &result.error)) return result;
  }

  result.error = chain.buildRealizations(cache);
  if (result.error.isError()) return result;

  VoiceLeadingEvaluator evaluator;
  result.error = chain.buildMovements(evaluator);
  if (result.error.isError()) return result;

  result.error = chain.prune();
  if (result.error.isError()) return result;

  result.chain = std::move(chain);
  result.success = true;
  return result;
}

}  // namespace figbass
