// Tests for core/interval.h -- compound reduction and perfect classes.

#include "core/interval.h"

#include <gtest/gtest.h>

namespace figbass {
namespace {

TEST(CompoundToSimpleTest, ReducesByOctave) {
  EXPECT_EQ(interval_util::compoundToSimple(19), 7);
  EXPECT_EQ(interval_util::compoundToSimple(24), 0);
  EXPECT_EQ(interval_util::compoundToSimple(-3), 3);
  EXPECT_EQ(interval_util::compoundToSimple(11), 11);
}

TEST(PerfectConsonanceTest, UnisonFifthOctave) {
  EXPECT_TRUE(interval_util::isPerfectConsonance(0));
  EXPECT_TRUE(interval_util::isPerfectConsonance(7));
  EXPECT_TRUE(interval_util::isPerfectConsonance(12));
  EXPECT_TRUE(interval_util::isPerfectConsonance(31));
  // The fourth is not perfect for voice-leading purposes.
  EXPECT_FALSE(interval_util::isPerfectConsonance(5));
  EXPECT_FALSE(interval_util::isPerfectConsonance(4));
}

TEST(PerfectClassTest, FifthAndOctaveClasses) {
  EXPECT_TRUE(interval_util::isPerfectFifthClass(19));
  EXPECT_FALSE(interval_util::isPerfectFifthClass(12));
  EXPECT_TRUE(interval_util::isOctaveClass(36));
  EXPECT_TRUE(interval_util::isOctaveClass(-12));
  EXPECT_FALSE(interval_util::isOctaveClass(7));
}

}  // namespace
}  // namespace figbass
