// Implementation of chord slots and realization generation.

#include "figured_bass/segment.h"

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace figbass {

namespace {

/// @brief Depth-first search over upper-voice assignments.
///
/// Voices are assigned from index 0 (highest) down; each voice tries its
/// candidates in ascending order, so results come out lexicographically
/// sorted. The bass pitch is fixed.
class RealizationSearch {
 public:
  RealizationSearch(std::vector<const std::vector<uint8_t>*> candidates,
                    std::vector<int> separation, uint8_t bass, PitchClassMask required,
                    PitchClassMask raised, const Rules& rules, std::vector<Possibility>& out)
      : candidates_(std::move(candidates)),
        separation_(std::move(separation)),
        bass_(bass),
        required_(required),
        raised_(raised),
        rules_(rules),
        out_(out),
        num_upper_(candidates_.size()),
        current_(num_upper_ + 1, bass) {}

  /// @return False if the cap was exceeded.
  bool run() {
    PitchClassMask bass_bit = pitchClassBit(getPitchClass(bass_));
    search(0, bass_bit, raised_ & bass_bit, kMidiPitchMax, kMidiPitchMin);
    return !cap_exceeded_;
  }

 private:
  void search(size_t voice, PitchClassMask used, PitchClassMask raised_used, int upper_low,
              int upper_high) {
    if (cap_exceeded_) return;
    if (voice == num_upper_) {
      if (isIncomplete(current_, required_)) return;
      if (out_.size() >= rules_.max_realizations_per_slot) {
        cap_exceeded_ = true;
        return;
      }
      out_.push_back(current_);
      return;
    }

    bool last_upper = voice + 1 == num_upper_;
    int remaining = static_cast<int>(num_upper_ - voice - 1);
    for (uint8_t pitch : *candidates_[voice]) {
      if (voice > 0) {
        int above = current_[voice - 1];
        if (rules_.forbid_voice_crossing && pitch > above) break;
        if (std::abs(above - pitch) > separation_[voice]) {
          if (pitch > above) break;
          continue;
        }
      }
      if (last_upper && std::abs(pitch - bass_) > separation_[num_upper_]) {
        if (pitch > bass_) break;
        continue;
      }
      if (rules_.forbid_unisons &&
          std::find(current_.begin(), current_.begin() + voice, pitch) != current_.begin() + voice) {
        continue;
      }
      int low = std::min(upper_low, static_cast<int>(pitch));
      int high = std::max(upper_high, static_cast<int>(pitch));
      if (rules_.upper_parts_max_semitone_separation &&
          high - low > *rules_.upper_parts_max_semitone_separation) {
        continue;
      }
      PitchClassMask bit = pitchClassBit(getPitchClass(pitch));
      if (rules_.forbid_doubled_raised_tones && (raised_ & bit) && (raised_used & bit)) continue;
      PitchClassMask next_used = used | bit;
      if (pitchClassCount(required_ & static_cast<PitchClassMask>(~next_used)) > remaining) continue;

      current_[voice] = pitch;
      search(voice + 1, next_used, raised_used | (raised_ & bit), low, high);
      if (cap_exceeded_) return;
    }
  }

  std::vector<const std::vector<uint8_t>*> candidates_;
  std::vector<int> separation_;
  uint8_t bass_;
  PitchClassMask required_;
  PitchClassMask raised_;
  const Rules& rules_;
  std::vector<Possibility>& out_;
  size_t num_upper_;
  Possibility current_;
  bool cap_exceeded_ = false;
};

}  // namespace

Segment::Segment(size_t index, const SpelledPitch& bass, const Figure& figure,
                 const FiguredBassScale& scale, const Rules& rules)
    : index_(index), bass_(bass), figure_(figure) {
  pitch_names_ = scale.chordPitchNames(bass.name, figure);
  analysis_ = analyzeChord(pitch_names_.names(), bass.name);
  requirement_ = resolutionRequirementFor(analysis_, rules);
}

void Segment::fixVoice(size_t voice_index, int pitch) {
  if (fixed_.size() <= voice_index) fixed_.resize(voice_index + 1, kNoFixedPitch);
  fixed_[voice_index] = pitch;
}

PitchClassMask Segment::requiredPitchClasses(const Rules& rules) const {
  if (!rules.forbid_incomplete_possibilities || completeness_relaxed_) return 0;
  PitchClassMask required = 0;
  for (const auto& member : pitch_names_.members) {
    if (member.number != 1 && rules.isOmittable(member.number)) continue;
    required |= pitchClassBit(member.name.pitchClass());
  }
  return required;
}

bool Segment::generateRealizations(const std::vector<Voice>& voices, const Rules& rules,
                                   RealizationCache& cache, RealizeError* error) {
  realizations_.clear();
  alive_.clear();
  successors_.clear();
  num_alive_ = 0;

  size_t num_upper = voices.size() - 1;
  fixed_.resize(num_upper, kNoFixedPitch);

  SlotCacheKey key;
  key.bass = bassMidi();
  key.chord = pitch_names_.pitchClassMask();
  key.required = requiredPitchClasses(rules);
  key.raised = pitch_names_.raisedMask();
  key.fixed = fixed_;

  const std::vector<Possibility>* cached = cache.findRealizations(key);
  if (cached) {
    realizations_ = *cached;
  } else {
    std::vector<const std::vector<uint8_t>*> candidates;
    std::vector<std::vector<uint8_t>> fixed_lists(num_upper);
    for (size_t voice = 0; voice < num_upper; ++voice) {
      if (fixed_[voice] != kNoFixedPitch) {
        fixed_lists[voice].push_back(static_cast<uint8_t>(fixed_[voice]));
        candidates.push_back(&fixed_lists[voice]);
        continue;
      }
      PitchRange sounding = voices[voice].soundingRange();
      // With crossing permitted an upper voice may sound below the bass; the
      // spacing check against the bass still bounds how far.
      int low = sounding.lowest;
      if (rules.forbid_voice_crossing) low = std::max(low, static_cast<int>(key.bass));
      candidates.push_back(&cache.candidatePitches(key.chord, low, sounding.highest));
    }
    std::vector<int> separation;
    for (const auto& voice : voices) separation.push_back(voice.max_separation);

    RealizationSearch search(candidates, separation, key.bass, key.required, key.raised, rules,
                             realizations_);
    if (!search.run()) {
      realizations_.clear();
      if (error) {
        *error = makeRealizeError(RealizeErrorKind::RealizationCapExceeded,
                                  static_cast<int>(index_),
                                  describe() + " exceeds " +
                                      std::to_string(rules.max_realizations_per_slot) +
                                      " realizations");
      }
      return false;
    }
    cache.storeRealizations(key, realizations_);
  }

  if (realizations_.empty()) {
    if (error) {
      *error = makeRealizeError(RealizeErrorKind::SlotInfeasible, static_cast<int>(index_),
                                describe() + " has no legal realization");
    }
    return false;
  }

  alive_.assign(realizations_.size(), true);
  num_alive_ = realizations_.size();
  successors_.assign(realizations_.size(), std::vector<uint32_t>());
  return true;
}

void Segment::setSuccessors(size_t realization, std::vector<uint32_t> successors) {
  successors_[realization] = std::move(successors);
}

void Segment::markDead(size_t realization) {
  if (!alive_[realization]) return;
  alive_[realization] = false;
  successors_[realization].clear();
  --num_alive_;
}

std::string Segment::describe() const {
  return spelledPitchToString(bass_) + " '" + figure_.notation + "'";
}

}  // namespace figbass
