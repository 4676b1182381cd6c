/// @file
/// @brief Implementation of MotionAnalyzer - voice-pair motion classification and statistics.

#include "counterpoint/motion_analyzer.h"

#include "core/interval.h"
#include "core/pitch_utils.h"

namespace figbass {

// ---------------------------------------------------------------------------
// MotionStats
// ---------------------------------------------------------------------------

float MotionAnalyzer::MotionStats::contraryRatio() const {
  int total_count = total();
  if (total_count == 0) {
    return 0.0f;
  }
  return static_cast<float>(contrary) / static_cast<float>(total_count);
}

MotionAnalyzer::MotionStats& MotionAnalyzer::MotionStats::operator+=(const MotionStats& other) {
  parallel += other.parallel;
  similar += other.similar;
  contrary += other.contrary;
  oblique += other.oblique;
  return *this;
}

// ---------------------------------------------------------------------------
// MotionAnalyzer
// ---------------------------------------------------------------------------

MotionAnalyzer::MotionAnalyzer(const IRuleEvaluator& rules) : rules_(rules) {}

MotionType MotionAnalyzer::classifyMotion(uint8_t prev1, uint8_t curr1,
                                          uint8_t prev2, uint8_t curr2) const {
  return rules_.classifyMotion(prev1, curr1, prev2, curr2);
}

MotionAnalyzer::MotionStats MotionAnalyzer::analyzeVoicePair(
    const std::vector<std::vector<uint8_t>>& progression, size_t voice1, size_t voice2) const {
  MotionStats stats;

  for (size_t idx = 1; idx < progression.size(); ++idx) {
    const auto& prev = progression[idx - 1];
    const auto& curr = progression[idx];
    if (voice1 >= prev.size() || voice2 >= prev.size() ||
        voice1 >= curr.size() || voice2 >= curr.size()) {
      continue;
    }

    // Only classify when at least one voice has actually changed pitch.
    if (prev[voice1] == curr[voice1] && prev[voice2] == curr[voice2]) {
      continue;
    }

    switch (rules_.classifyMotion(prev[voice1], curr[voice1], prev[voice2], curr[voice2])) {
      case MotionType::Parallel: ++stats.parallel; break;
      case MotionType::Similar:  ++stats.similar;  break;
      case MotionType::Contrary: ++stats.contrary; break;
      case MotionType::Oblique:  ++stats.oblique;  break;
    }
  }

  return stats;
}

MotionAnalyzer::MotionStats MotionAnalyzer::analyzeProgression(
    const std::vector<std::vector<uint8_t>>& progression) const {
  MotionStats stats;
  if (progression.empty()) return stats;

  size_t num_voices = progression.front().size();
  for (size_t upper = 0; upper + 1 < num_voices; ++upper) {
    for (size_t lower = upper + 1; lower < num_voices; ++lower) {
      stats += analyzeVoicePair(progression, upper, lower);
    }
  }
  return stats;
}

std::string MotionAnalyzer::describeOuterVoices(
    const std::vector<std::vector<uint8_t>>& progression) const {
  std::string out;
  for (size_t idx = 1; idx < progression.size(); ++idx) {
    const auto& prev = progression[idx - 1];
    const auto& curr = progression[idx];
    if (prev.size() < 2 || curr.size() != prev.size()) continue;
    size_t bass = curr.size() - 1;
    if (!out.empty()) out += ' ';
    out += motionTypeToString(rules_.classifyMotion(prev[0], curr[0], prev[bass], curr[bass]));
    if (interval_util::isPerfectConsonance(absoluteInterval(curr[0], curr[bass]))) out += '*';
  }
  return out;
}

}  // namespace figbass
