// Tests for figured_bass/progression_enumerator.h -- lazy lexicographic walk.

#include "figured_bass/progression_enumerator.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace figbass {
namespace {

ChainBuildResult buildCompact(const char* bass) {
  KeySignature key;
  FiguredBassLine line;
  std::string error;
  EXPECT_TRUE(parseCompactBassLine(bass, key, line, &error)) << error;
  RealizationCache cache;
  return buildChain(line, choraleVoices(), Rules(), cache);
}

TEST(ProgressionEnumeratorTest, UnbuiltChainReportsError) {
  KeySignature key;
  Chain chain(key, choraleVoices(), Rules());
  ProgressionEnumerator iter = chain.enumerator();
  IndexProgression progression;
  EXPECT_FALSE(iter.next(progression));
  EXPECT_EQ(iter.error().kind, RealizeErrorKind::QueryOnUnbuiltChain);
  EXPECT_EQ(iter.produced(), 0u);
}

TEST(ProgressionEnumeratorTest, MatchesEnumerateAll) {
  ChainBuildResult result = buildCompact("C3 F3 G3 C3");
  ASSERT_TRUE(result.success) << result.error.toString();

  std::vector<IndexProgression> walked;
  ProgressionEnumerator iter(result.chain);
  IndexProgression progression;
  while (iter.next(progression)) walked.push_back(progression);

  EXPECT_FALSE(iter.error().isError());
  EXPECT_EQ(iter.produced(), 75u);
  EXPECT_EQ(walked, result.chain.enumerateAll().progressions);

  // Exhausted enumerators stay exhausted.
  EXPECT_FALSE(iter.next(progression));
}

TEST(ProgressionEnumeratorTest, ResetRestarts) {
  ChainBuildResult result = buildCompact("C3 G2 C3");
  ASSERT_TRUE(result.success) << result.error.toString();

  ProgressionEnumerator iter = result.chain.enumerator();
  IndexProgression first;
  IndexProgression second;
  ASSERT_TRUE(iter.next(first));
  ASSERT_TRUE(iter.next(second));
  EXPECT_LT(first, second);
  EXPECT_EQ(iter.produced(), 2u);

  iter.reset();
  EXPECT_EQ(iter.produced(), 0u);
  IndexProgression again;
  ASSERT_TRUE(iter.next(again));
  EXPECT_EQ(again, first);
}

TEST(ProgressionEnumeratorTest, SingleSlotYieldsEveryRealization) {
  ChainBuildResult result = buildCompact("C3");
  ASSERT_TRUE(result.success) << result.error.toString();

  ProgressionEnumerator iter = result.chain.enumerator();
  IndexProgression progression;
  uint32_t expected = 0;
  while (iter.next(progression)) {
    ASSERT_EQ(progression.size(), 1u);
    EXPECT_EQ(progression[0], expected++);
  }
  EXPECT_EQ(expected, 13u);
}

}  // namespace
}  // namespace figbass
