// Tests for harmony/key.h -- key parsing, formatting and degree lookup.

#include "harmony/key.h"

#include <gtest/gtest.h>

#include <string>

namespace figbass {
namespace {

TEST(KeySignatureTest, ParsesTonicAndMode) {
  KeySignature key;
  ASSERT_TRUE(keySignatureFromString("f#_minor", key));
  EXPECT_EQ(key.tonic.step, 3);
  EXPECT_EQ(key.tonic.alter, 1);
  EXPECT_EQ(key.mode, ScaleMode::Minor);
  EXPECT_EQ(keySignatureToString(key), "F#_minor");
}

TEST(KeySignatureTest, ModeDefaultsToMajor) {
  KeySignature key;
  ASSERT_TRUE(keySignatureFromString("Bb", key));
  EXPECT_EQ(key.mode, ScaleMode::Major);
  EXPECT_EQ(keySignatureToString(key), "Bb_major");
}

TEST(KeySignatureTest, RejectsUnknown) {
  KeySignature key;
  key.mode = ScaleMode::Dorian;
  EXPECT_FALSE(keySignatureFromString("H_major", key));
  EXPECT_FALSE(keySignatureFromString("C_lydian", key));
  EXPECT_EQ(key.mode, ScaleMode::Dorian);
}

TEST(KeySignatureTest, EnharmonicKeysDiffer) {
  KeySignature g_flat;
  KeySignature f_sharp;
  ASSERT_TRUE(keySignatureFromString("Gb_major", g_flat));
  ASSERT_TRUE(keySignatureFromString("F#_major", f_sharp));
  EXPECT_NE(g_flat, f_sharp);
}

TEST(KeySignatureTest, DegreeNames) {
  KeySignature key;
  ASSERT_TRUE(keySignatureFromString("D_major", key));
  EXPECT_EQ(spelledPitchClassToString(pitchNameForDegree(key, 2)), "F#");
  EXPECT_EQ(spelledPitchClassToString(pitchNameForDegree(key, 4)), "A");

  ASSERT_TRUE(keySignatureFromString("E_phrygian", key));
  EXPECT_EQ(spelledPitchClassToString(pitchNameForDegree(key, 1)), "F");
}

TEST(KeySignatureTest, DegreeOfPitchNameUsesLetter) {
  KeySignature key;
  ASSERT_TRUE(keySignatureFromString("D_major", key));
  SpelledPitchClass g_sharp{4, 1};
  SpelledPitchClass c_natural{0, 0};
  EXPECT_EQ(degreeOfPitchName(key, g_sharp), 3);
  EXPECT_EQ(degreeOfPitchName(key, c_natural), 6);
}

}  // namespace
}  // namespace figbass
