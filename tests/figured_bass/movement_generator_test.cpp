// Tests for figured_bass/movement_generator.h -- consecutive rules and
// adjacency between the realizations of two slots.

#include "figured_bass/movement_generator.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "counterpoint/voice_leading_evaluator.h"

namespace figbass {
namespace {

Segment makeSegment(const char* bass_text, const char* figure_text, size_t index,
                    const Rules& rules) {
  KeySignature key;
  EXPECT_TRUE(keySignatureFromString("C_major", key));
  SpelledPitch bass;
  EXPECT_TRUE(parseSpelledPitch(bass_text, bass));
  Figure figure;
  EXPECT_TRUE(parseFigure(figure_text, figure));
  return Segment(index, bass, figure, FiguredBassScale(key), rules);
}

size_t indexOf(const Segment& segment, const Possibility& possib) {
  const auto& all = segment.realizations();
  auto iter = std::find(all.begin(), all.end(), possib);
  return static_cast<size_t>(iter - all.begin());
}

class MovementGeneratorTest : public ::testing::Test {
 protected:
  VoiceLeadingEvaluator evaluator;
  std::vector<Voice> voices = choraleVoices();
  Rules rules;
};

// ---------------------------------------------------------------------------
// Consecutive rules
// ---------------------------------------------------------------------------

TEST_F(MovementGeneratorTest, ParallelFifthsRejected) {
  // Soprano and tenor move G4/C4 -> A4/D4.
  Possibility from = {67, 64, 60, 48};
  Possibility to = {69, 65, 62, 53};
  {
    MovementGenerator generator(evaluator, rules, voices);
    EXPECT_FALSE(generator.passesConsecutiveRules(from, to));
  }
  rules.forbid_parallel_fifths = false;
  MovementGenerator relaxed(evaluator, rules, voices);
  EXPECT_TRUE(relaxed.passesConsecutiveRules(from, to));
}

TEST_F(MovementGeneratorTest, ParallelOctavesRejected) {
  MovementGenerator generator(evaluator, rules, voices);
  // Tenor and bass both C -> D an octave apart.
  EXPECT_FALSE(generator.passesConsecutiveRules({67, 64, 60, 48}, {65, 65, 62, 50}));
}

TEST_F(MovementGeneratorTest, VoiceOverlapRejected) {
  // Alto rises above the soprano's previous pitch.
  Possibility from = {67, 64, 60, 48};
  Possibility to = {72, 69, 60, 48};
  {
    MovementGenerator generator(evaluator, rules, voices);
    EXPECT_FALSE(generator.passesConsecutiveRules(from, to));
  }
  rules.forbid_voice_overlap = false;
  MovementGenerator relaxed(evaluator, rules, voices);
  EXPECT_TRUE(relaxed.passesConsecutiveRules(from, to));
}

TEST_F(MovementGeneratorTest, VoiceOverlapChecksEveryPairWhenCrossingAllowed) {
  // Soprano and alto swap C4/E4 while the tenor rises from C4 to E4 above
  // the soprano's previous pitch. Neighbouring voices never overlap.
  Possibility from = {60, 64, 60, 48};
  Possibility to = {64, 60, 64, 48};
  rules.forbid_parallel_octaves = false;
  {
    MovementGenerator ordered(evaluator, rules, voices);
    EXPECT_TRUE(ordered.passesConsecutiveRules(from, to));
  }
  rules.forbid_voice_crossing = false;
  {
    MovementGenerator crossing(evaluator, rules, voices);
    EXPECT_FALSE(crossing.passesConsecutiveRules(from, to));
  }
  rules.forbid_voice_overlap = false;
  MovementGenerator relaxed(evaluator, rules, voices);
  EXPECT_TRUE(relaxed.passesConsecutiveRules(from, to));
}

TEST_F(MovementGeneratorTest, HiddenFifthOnlyBetweenOuterVoices) {
  std::vector<Voice> two = {voices.front(), voices.back()};
  Possibility from = {64, 48};
  Possibility to = {69, 50};
  {
    MovementGenerator generator(evaluator, rules, two);
    EXPECT_FALSE(generator.passesConsecutiveRules(from, to));
  }
  rules.forbid_hidden_fifths = false;
  MovementGenerator relaxed(evaluator, rules, two);
  EXPECT_TRUE(relaxed.passesConsecutiveRules(from, to));
}

TEST_F(MovementGeneratorTest, PartMovementLimits) {
  rules.part_movement_limits.push_back({"S", 0});
  MovementGenerator generator(evaluator, rules, voices);
  EXPECT_FALSE(generator.passesConsecutiveRules({67, 64, 60, 48}, {69, 65, 60, 53}));
  EXPECT_TRUE(generator.passesConsecutiveRules({67, 64, 60, 48}, {67, 65, 62, 53}));
}

TEST_F(MovementGeneratorTest, MismatchedSizesRejected) {
  MovementGenerator generator(evaluator, rules, voices);
  EXPECT_FALSE(generator.passesConsecutiveRules({67, 64, 60, 48}, {67, 60, 48}));
  EXPECT_FALSE(generator.passesConsecutiveRules({48}, {50}));
}

// ---------------------------------------------------------------------------
// Legal movement by plan
// ---------------------------------------------------------------------------

TEST_F(MovementGeneratorTest, PrescribedIgnoresConsecutiveRulesByDefault) {
  Segment seventh = makeSegment("G2", "7", 0, rules);
  Segment tonic = makeSegment("C3", "", 1, rules);
  ResolutionPlan plan = planResolution(seventh.requirement(), tonic.analysis(), rules);
  ASSERT_EQ(plan.method, ResolutionMethod::Prescribed);

  MovementGenerator generator(evaluator, rules, voices);
  // B4 F4 D4 G2 -> C5 E4 C4 C3.
  EXPECT_TRUE(generator.isLegalMovement(plan, {71, 65, 62, 43}, {72, 64, 60, 48}));
  // Leading tone held.
  EXPECT_FALSE(generator.isLegalMovement(plan, {71, 65, 62, 43}, {71, 64, 60, 48}));
}

TEST_F(MovementGeneratorTest, OrdinaryPlanUsesConsecutiveRules) {
  ResolutionPlan plan;
  MovementGenerator generator(evaluator, rules, voices);
  EXPECT_FALSE(generator.isLegalMovement(plan, {67, 64, 60, 48}, {69, 65, 62, 53}));
  EXPECT_TRUE(generator.isLegalMovement(plan, {67, 64, 60, 48}, {69, 65, 60, 53}));
}

// ---------------------------------------------------------------------------
// Adjacency
// ---------------------------------------------------------------------------

TEST_F(MovementGeneratorTest, OrdinaryAdjacencyMatchesPairwiseCheck) {
  RealizationCache cache;
  RealizeError error;
  Segment a = makeSegment("C3", "", 0, rules);
  Segment b = makeSegment("F3", "", 1, rules);
  ASSERT_TRUE(a.generateRealizations(voices, rules, cache, &error));
  ASSERT_TRUE(b.generateRealizations(voices, rules, cache, &error));

  ResolutionPlan plan;
  MovementGenerator generator(evaluator, rules, voices);
  size_t edges = generator.generateMovements(plan, a, b);

  size_t expected = 0;
  for (size_t idx_a = 0; idx_a < a.numRealizations(); ++idx_a) {
    std::vector<uint32_t> legal;
    for (size_t idx_b = 0; idx_b < b.numRealizations(); ++idx_b) {
      if (generator.isLegalMovement(plan, a.realization(idx_a), b.realization(idx_b))) {
        legal.push_back(static_cast<uint32_t>(idx_b));
      }
    }
    EXPECT_EQ(a.successors(idx_a), legal);
    expected += legal.size();
  }
  EXPECT_EQ(edges, expected);
  EXPECT_GT(edges, 0u);
}

TEST_F(MovementGeneratorTest, PrescribedAdjacencyLooksUpResolution) {
  RealizationCache cache;
  RealizeError error;
  Segment a = makeSegment("G2", "7", 0, rules);
  Segment b = makeSegment("C3", "", 1, rules);
  ResolutionPlan plan = planResolution(a.requirement(), b.analysis(), rules);
  ASSERT_TRUE(plan.relax_target_completeness);
  b.relaxCompleteness();
  ASSERT_TRUE(a.generateRealizations(voices, rules, cache, &error));
  ASSERT_TRUE(b.generateRealizations(voices, rules, cache, &error));

  MovementGenerator generator(evaluator, rules, voices);
  generator.generateMovements(plan, a, b);

  size_t from = indexOf(a, {71, 65, 62, 43});
  ASSERT_LT(from, a.numRealizations());
  const std::vector<uint32_t>& successors = a.successors(from);
  ASSERT_EQ(successors.size(), 1u);
  EXPECT_EQ(b.realization(successors[0]), (Possibility{72, 64, 60, 48}));

  for (size_t idx_a = 0; idx_a < a.numRealizations(); ++idx_a) {
    EXPECT_LE(a.successors(idx_a).size(), 1u);
    for (uint32_t idx_b : a.successors(idx_a)) {
      EXPECT_TRUE(followsResolution(plan, a.realization(idx_a), b.realization(idx_b)));
    }
  }
}

TEST_F(MovementGeneratorTest, DeadRealizationsGetNoSuccessors) {
  RealizationCache cache;
  RealizeError error;
  Segment a = makeSegment("C3", "", 0, rules);
  Segment b = makeSegment("G2", "", 1, rules);
  ASSERT_TRUE(a.generateRealizations(voices, rules, cache, &error));
  ASSERT_TRUE(b.generateRealizations(voices, rules, cache, &error));
  a.markDead(0);
  for (size_t idx_b = 0; idx_b < b.numRealizations(); ++idx_b) b.markDead(idx_b);

  MovementGenerator generator(evaluator, rules, voices);
  EXPECT_EQ(generator.generateMovements(ResolutionPlan(), a, b), 0u);
  for (size_t idx_a = 0; idx_a < a.numRealizations(); ++idx_a) {
    EXPECT_TRUE(a.successors(idx_a).empty());
  }
}

}  // namespace
}  // namespace figbass
