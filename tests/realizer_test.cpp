// Tests for realizer.h -- the request facade over chain, sampling and rendering.

#include "realizer.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace figbass {
namespace {

FiguredBassLine cadenceLine() {
  KeySignature key;
  FiguredBassLine line;
  EXPECT_TRUE(parseCompactBassLine("C3 F3 G3 C3", key, line));
  return line;
}

RealizerConfig choraleConfig(QueryMode mode) {
  RealizerConfig config;
  config.voices = choraleVoices();
  config.mode = mode;
  config.seed = 7;
  return config;
}

TEST(QueryModeTest, Names) {
  EXPECT_STREQ(queryModeToString(QueryMode::Count), "count");
  EXPECT_STREQ(queryModeToString(QueryMode::All), "all");
  EXPECT_STREQ(queryModeToString(QueryMode::Sample), "sample");
}

TEST(RealizerTest, CountOnly) {
  RealizerResult result = realize(cadenceLine(), choraleConfig(QueryMode::Count));
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.count, 75u);
  EXPECT_FALSE(result.count_overflow);
  EXPECT_EQ(result.realization_counts.size(), 4u);
  EXPECT_EQ(result.realization_counts[0], 10u);
  EXPECT_TRUE(result.progressions.empty());
  EXPECT_TRUE(result.tracks.empty());
  EXPECT_TRUE(result.tempo_events.empty());
  EXPECT_NE(result.json.find("\"count\":75"), std::string::npos);
}

TEST(RealizerTest, EnumerateWithLimit) {
  RealizerConfig config = choraleConfig(QueryMode::All);
  config.limit = 3;
  RealizerResult result = realize(cadenceLine(), config);
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_TRUE(result.truncated);
  ASSERT_EQ(result.progressions.size(), 3u);
  for (const auto& progression : result.progressions) {
    ASSERT_EQ(progression.size(), 4u);
    EXPECT_EQ(progression[0].back(), 48);
    EXPECT_EQ(progression[3].back(), 48);
  }
  EXPECT_LT(result.progressions[0], result.progressions[1]);
}

TEST(RealizerTest, SampleRendersTracksBackToBack) {
  RealizerConfig config = choraleConfig(QueryMode::Sample);
  config.num_samples = 2;
  config.style = RenderStyle::Chorale;
  config.bpm = 96;
  FiguredBassLine line = cadenceLine();
  RealizerResult result = realize(line, config);
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.seed_used, 7u);
  ASSERT_EQ(result.progressions.size(), 2u);

  ASSERT_EQ(result.tracks.size(), 4u);
  const Track& bass = result.tracks[3];
  ASSERT_EQ(bass.notes.size(), 8u);
  // The second progression starts after the line plus a quarter rest.
  EXPECT_EQ(bass.notes[4].start_tick, line.totalDuration() + kQuarterNote);
  EXPECT_EQ(result.total_duration_ticks, 2 * line.totalDuration() + kQuarterNote);
  ASSERT_EQ(result.tempo_events.size(), 1u);
  EXPECT_EQ(result.tempo_events[0].bpm, 96);

  // Two text blocks separated by a blank line.
  EXPECT_NE(result.text.find("\n\nS "), std::string::npos);
}

TEST(RealizerTest, SameSeedSameProgressions) {
  RealizerConfig config = choraleConfig(QueryMode::Sample);
  config.num_samples = 5;
  config.proportional = true;
  config.seed = 31337;
  RealizerResult first = realize(cadenceLine(), config);
  RealizerResult second = realize(cadenceLine(), config);
  ASSERT_TRUE(first.success);
  ASSERT_TRUE(second.success);
  EXPECT_EQ(first.progressions, second.progressions);
  EXPECT_EQ(first.json, second.json);
}

TEST(RealizerTest, AutoSeed) {
  RealizerConfig config = choraleConfig(QueryMode::Sample);
  config.seed = 0;
  RealizerResult result = realize(cadenceLine(), config);
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_NE(result.seed_used, 0u);
  EXPECT_EQ(result.progressions.size(), 1u);
}

TEST(RealizerTest, KeyboardDefaultVoices) {
  RealizerConfig config;
  config.seed = 3;
  RealizerResult result = realize(cadenceLine(), config);
  ASSERT_TRUE(result.success) << result.error_message;
  ASSERT_EQ(result.tracks.size(), 2u);
  EXPECT_EQ(result.tracks[0].notes.size(), 12u);
  EXPECT_EQ(result.tracks[1].notes.size(), 4u);
}

TEST(RealizerTest, CountOverflowBlocksOnlyProportionalSampling) {
  KeySignature key;
  FiguredBassLine line;
  std::string bass;
  for (int idx = 0; idx < 30; ++idx) bass += "C3 F3 G3 ";
  ASSERT_TRUE(parseCompactBassLine(bass, key, line));

  RealizerConfig config = choraleConfig(QueryMode::Sample);
  RealizerResult uniform = realize(line, config);
  ASSERT_TRUE(uniform.success) << uniform.error_message;
  EXPECT_TRUE(uniform.count_overflow);
  ASSERT_EQ(uniform.progressions.size(), 1u);
  EXPECT_EQ(uniform.progressions[0].size(), 90u);

  config.proportional = true;
  RealizerResult proportional = realize(line, config);
  EXPECT_FALSE(proportional.success);
  EXPECT_EQ(proportional.error.kind, RealizeErrorKind::CountOverflow);

  RealizerResult counted = realize(line, choraleConfig(QueryMode::Count));
  EXPECT_FALSE(counted.success);
  EXPECT_EQ(counted.error.kind, RealizeErrorKind::CountOverflow);
}

TEST(RealizerTest, ErrorsCarryKindAndSlot) {
  RealizerConfig config = choraleConfig(QueryMode::Count);
  config.rules.part_movement_limits.push_back({"S", 0});
  KeySignature key;
  FiguredBassLine line;
  ASSERT_TRUE(parseCompactBassLine("C3 G2 D3", key, line));
  RealizerResult result = realize(line, config);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.kind, RealizeErrorKind::ChainInfeasible);
  EXPECT_NE(result.error_message.find("ChainInfeasible"), std::string::npos);

  FiguredBassLine empty;
  RealizerResult empty_result = realize(empty, config);
  EXPECT_EQ(empty_result.error.kind, RealizeErrorKind::InputError);
}

}  // namespace
}  // namespace figbass
