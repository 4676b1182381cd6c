// Tests for core/scale.h -- mode tables and spelled degree lookup.

#include "core/scale.h"

#include <gtest/gtest.h>

#include <string>

namespace figbass {
namespace {

std::string degreeString(const char* tonic, ScaleMode mode, int degree) {
  SpelledPitchClass name;
  EXPECT_TRUE(parseSpelledPitchClass(tonic, name));
  return spelledPitchClassToString(scale_util::degreeName(name, mode, degree));
}

TEST(ModeIntervalsTest, Tables) {
  EXPECT_EQ(scale_util::getModeIntervals(ScaleMode::Major)[2], 4);
  EXPECT_EQ(scale_util::getModeIntervals(ScaleMode::Minor)[2], 3);
  EXPECT_EQ(scale_util::getModeIntervals(ScaleMode::Dorian)[5], 9);
  EXPECT_EQ(scale_util::getModeIntervals(ScaleMode::Phrygian)[1], 1);
}

TEST(DegreeNameTest, MajorKeys) {
  EXPECT_EQ(degreeString("D", ScaleMode::Major, 2), "F#");
  EXPECT_EQ(degreeString("D", ScaleMode::Major, 6), "C#");
  EXPECT_EQ(degreeString("Bb", ScaleMode::Major, 6), "A");
  EXPECT_EQ(degreeString("Bb", ScaleMode::Major, 3), "Eb");
}

TEST(DegreeNameTest, MinorKeys) {
  EXPECT_EQ(degreeString("F#", ScaleMode::Minor, 2), "A");
  EXPECT_EQ(degreeString("C", ScaleMode::Minor, 5), "Ab");
  EXPECT_EQ(degreeString("A", ScaleMode::Minor, 6), "G");
}

TEST(DegreeNameTest, DegreesWrap) {
  EXPECT_EQ(degreeString("C", ScaleMode::Major, 7), "C");
  EXPECT_EQ(degreeString("C", ScaleMode::Major, -1), "B");
}

TEST(DegreeOfStepTest, IgnoresAccidentals) {
  SpelledPitchClass c_tonic{0, 0};
  EXPECT_EQ(scale_util::degreeOfStep(c_tonic, 3), 3);
  SpelledPitchClass d_tonic{1, 0};
  EXPECT_EQ(scale_util::degreeOfStep(d_tonic, 0), 6);
}

}  // namespace
}  // namespace figbass
