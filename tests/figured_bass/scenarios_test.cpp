// End-to-end realization scenarios: single chords under rule variations,
// special resolutions, infeasible chains and the I-IV-V-I cadence.

#include "figured_bass/chain.h"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <utility>
#include <vector>

namespace figbass {
namespace {

ChainBuildResult buildCompact(const char* key_text, const char* bass, const Rules& rules,
                              const std::vector<Voice>& voices = choraleVoices()) {
  KeySignature key;
  EXPECT_TRUE(keySignatureFromString(key_text, key));
  FiguredBassLine line;
  std::string error;
  EXPECT_TRUE(parseCompactBassLine(bass, key, line, &error)) << error;
  RealizationCache cache;
  return buildChain(line, voices, rules, cache);
}

uint64_t countFor(const char* key_text, const char* bass, const Rules& rules,
                  const std::vector<Voice>& voices = choraleVoices()) {
  ChainBuildResult result = buildCompact(key_text, bass, rules, voices);
  EXPECT_TRUE(result.success) << result.error.toString();
  if (!result.success) return 0;
  return result.chain.count().count;
}

std::vector<size_t> generatedSizes(const Chain& chain) {
  std::vector<size_t> sizes;
  for (size_t idx = 0; idx < chain.numSlots(); ++idx) {
    sizes.push_back(chain.slot(idx).numRealizations());
  }
  return sizes;
}

// ---------------------------------------------------------------------------
// One chord
// ---------------------------------------------------------------------------

TEST(SingleChordScenario, ChoraleTonicTriad) {
  ChainBuildResult result = buildCompact("C_major", "C3", Rules());
  ASSERT_TRUE(result.success) << result.error.toString();
  EnumerationResult all = result.chain.enumerateAll();
  ASSERT_EQ(all.progressions.size(), 13u);

  const Segment& slot = result.chain.slot(0);
  EXPECT_EQ(slot.realization(all.progressions.front()[0]), (Possibility{60, 55, 52, 48}));
  EXPECT_EQ(slot.realization(all.progressions.back()[0]), (Possibility{76, 72, 67, 48}));
}

TEST(SingleChordScenario, RuleVariations) {
  Rules incomplete;
  incomplete.forbid_incomplete_possibilities = false;
  EXPECT_EQ(countFor("C_major", "C3", incomplete), 42u);

  Rules no_separation;
  no_separation.upper_parts_max_semitone_separation.reset();
  EXPECT_EQ(countFor("C_major", "C3", no_separation), 23u);

  Rules no_unisons;
  no_unisons.forbid_unisons = true;
  EXPECT_EQ(countFor("C_major", "C3", no_unisons), 8u);

  Rules omit_fifth;
  omit_fifth.omittable_figures = {5};
  EXPECT_EQ(countFor("C_major", "C3", omit_fifth), 24u);

  EXPECT_EQ(countFor("C_major", "C3", Rules(), keyboardVoices(3)), 21u);
}

TEST(SingleChordScenario, RaisedLeadingToneDoubling) {
  EXPECT_EQ(countFor("A_minor", "E3:#", Rules()), 5u);
  Rules allow;
  allow.forbid_doubled_raised_tones = false;
  EXPECT_EQ(countFor("A_minor", "E3:#", allow), 7u);
}

// ---------------------------------------------------------------------------
// Diminished seventh in D major, five voices
// ---------------------------------------------------------------------------

class DiminishedSeventhScenario : public ::testing::Test {
 protected:
  using SlotPair = std::pair<Possibility, Possibility>;

  static std::vector<Voice> fiveVoices() {
    std::vector<Voice> voices = {
        {"S1", PitchRange{62, 81}, 0, 12, "treble"},
        {"S2", PitchRange{57, 76}, 0, 12, "treble"},
        {"A", PitchRange{55, 74}, 0, 12, "treble"},
        {"T", PitchRange{48, 67}, 0, 12, "treble_8vb"},
        {"B", PitchRange{38, 62}, 0, 24, "bass"},
    };
    return voices;
  }

  /// Distinct (second, third) slot pairs over every progression.
  static std::set<SlotPair> resolutionPairs(const Rules& rules, uint64_t* count = nullptr) {
    ChainBuildResult result = buildCompact("D_major", "D3 E3:6,-5 F#3:6", rules, fiveVoices());
    EXPECT_TRUE(result.success) << result.error.toString();
    std::set<SlotPair> pairs;
    if (!result.success) return pairs;
    EXPECT_EQ(generatedSizes(result.chain), (std::vector<size_t>{28, 18, 27}));
    if (count) *count = result.chain.count().count;
    for (const auto& progression : result.chain.enumerateAll().progressions) {
      PossibilityResult possibs = result.chain.progressionToPossibilities(progression);
      EXPECT_TRUE(possibs.success);
      if (!possibs.success) continue;
      pairs.insert(SlotPair(possibs.possibilities[1], possibs.possibilities[2]));
    }
    return pairs;
  }
};

TEST_F(DiminishedSeventhScenario, ResolutionFollowsTargetInversion) {
  Rules contextual;
  uint64_t count = 0;
  std::set<SlotPair> third = resolutionPairs(contextual, &count);
  EXPECT_EQ(count, 38u);
  EXPECT_EQ(third.size(), 13u);

  Rules fixed_third;
  fixed_third.dim7_doubling_from_context = false;
  fixed_third.doubled_root_in_dim7 = false;
  EXPECT_EQ(resolutionPairs(fixed_third), third);

  Rules fixed_root;
  fixed_root.dim7_doubling_from_context = false;
  fixed_root.doubled_root_in_dim7 = true;
  std::set<SlotPair> root = resolutionPairs(fixed_root);
  EXPECT_EQ(root.size(), 13u);

  size_t shared = 0;
  for (const auto& pair : root) shared += third.count(pair);
  EXPECT_EQ(shared, 8u);
}

TEST_F(DiminishedSeventhScenario, PlanDescription) {
  ChainBuildResult result =
      buildCompact("D_major", "D3 E3:6,-5 F#3:6", Rules(), fiveVoices());
  ASSERT_TRUE(result.success) << result.error.toString();
  EXPECT_EQ(result.chain.plan(0).method, ResolutionMethod::Ordinary);
  EXPECT_EQ(result.chain.plan(1).method, ResolutionMethod::Prescribed);
  EXPECT_EQ(result.chain.plan(1).description,
            "diminished seventh to major tonic (doubled third)");
}

// ---------------------------------------------------------------------------
// Infeasible chain
// ---------------------------------------------------------------------------

TEST(InfeasibleScenario, FrozenSopranoOverMovingBass) {
  Rules rules;
  rules.part_movement_limits.push_back({"S", 0});
  ChainBuildResult result = buildCompact("C_major", "C3 G2 D3", rules);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.kind, RealizeErrorKind::ChainInfeasible);
  EXPECT_GE(result.error.slot_index, 0);
  EXPECT_NE(result.error.message.find("no progression"), std::string::npos);
}

// ---------------------------------------------------------------------------
// I - IV - V - I
// ---------------------------------------------------------------------------

TEST(CadenceScenario, SlotSizesAndTotal) {
  ChainBuildResult result = buildCompact("C_major", "C3 F3 G3 C3", Rules());
  ASSERT_TRUE(result.success) << result.error.toString();
  EXPECT_EQ(generatedSizes(result.chain), (std::vector<size_t>{13, 10, 10, 13}));
  EXPECT_EQ(result.chain.count().count, 75u);
  EXPECT_EQ(result.chain.numLiveRealizations(0), 10u);
}

}  // namespace
}  // namespace figbass
