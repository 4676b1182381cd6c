// Tests for core/pitch_utils.h -- spelled pitch parsing and formatting,
// spelled transposition, MIDI helpers and parallel-perfect checks.

#include "core/pitch_utils.h"

#include <gtest/gtest.h>

#include <string>

namespace figbass {
namespace {

// ---------------------------------------------------------------------------
// Spelled pitch classes
// ---------------------------------------------------------------------------

TEST(SpelledPitchClassTest, ParsesLettersAndAccidentals) {
  SpelledPitchClass name;
  ASSERT_TRUE(parseSpelledPitchClass("F#", name));
  EXPECT_EQ(name.step, 3);
  EXPECT_EQ(name.alter, 1);
  EXPECT_EQ(name.pitchClass(), 6);

  ASSERT_TRUE(parseSpelledPitchClass("bb", name));
  EXPECT_EQ(name.step, 6);
  EXPECT_EQ(name.alter, -1);
  EXPECT_EQ(name.pitchClass(), 10);

  ASSERT_TRUE(parseSpelledPitchClass("E-", name));
  EXPECT_EQ(name.pitchClass(), 3);
}

TEST(SpelledPitchClassTest, EnharmonicsDiffer) {
  SpelledPitchClass f_sharp;
  SpelledPitchClass g_flat;
  ASSERT_TRUE(parseSpelledPitchClass("F#", f_sharp));
  ASSERT_TRUE(parseSpelledPitchClass("Gb", g_flat));
  EXPECT_EQ(f_sharp.pitchClass(), g_flat.pitchClass());
  EXPECT_NE(f_sharp, g_flat);
}

TEST(SpelledPitchClassTest, CbWrapsToB) {
  SpelledPitchClass name;
  ASSERT_TRUE(parseSpelledPitchClass("Cb", name));
  EXPECT_EQ(name.pitchClass(), 11);
}

TEST(SpelledPitchClassTest, RejectsMalformed) {
  SpelledPitchClass name;
  EXPECT_FALSE(parseSpelledPitchClass("", name));
  EXPECT_FALSE(parseSpelledPitchClass("H", name));
  EXPECT_FALSE(parseSpelledPitchClass("C4", name));
  EXPECT_FALSE(parseSpelledPitchClass("C####", name));
}

TEST(SpelledPitchClassTest, Formats) {
  SpelledPitchClass name{0, -2};
  EXPECT_EQ(spelledPitchClassToString(name), "Cbb");
  name = {3, 1};
  EXPECT_EQ(spelledPitchClassToString(name), "F#");
}

// ---------------------------------------------------------------------------
// Spelled pitches with octave
// ---------------------------------------------------------------------------

TEST(SpelledPitchTest, MiddleC) {
  SpelledPitch pitch;
  ASSERT_TRUE(parseSpelledPitch("C4", pitch));
  EXPECT_EQ(pitch.midi(), 60);
  EXPECT_EQ(spelledPitchToString(pitch), "C4");
}

TEST(SpelledPitchTest, OctaveFollowsLetter) {
  // B#3 sounds as C4 and Cb4 as B3.
  SpelledPitch pitch;
  ASSERT_TRUE(parseSpelledPitch("B#3", pitch));
  EXPECT_EQ(pitch.midi(), 60);
  ASSERT_TRUE(parseSpelledPitch("Cb4", pitch));
  EXPECT_EQ(pitch.midi(), 59);
}

TEST(SpelledPitchTest, BassRegister) {
  SpelledPitch pitch;
  ASSERT_TRUE(parseSpelledPitch("F#3", pitch));
  EXPECT_EQ(pitch.midi(), 54);
  ASSERT_TRUE(parseSpelledPitch("E-2", pitch));
  EXPECT_EQ(pitch.midi(), 39);
}

TEST(SpelledPitchTest, RejectsOutOfMidiRange) {
  SpelledPitch pitch;
  EXPECT_FALSE(parseSpelledPitch("G#9", pitch));
  EXPECT_FALSE(parseSpelledPitch("C", pitch));
  EXPECT_FALSE(parseSpelledPitch("C4x", pitch));
  EXPECT_FALSE(parseSpelledPitch("C100", pitch));
}

TEST(SpelledPitchTest, ParseFailureLeavesOutputUntouched) {
  SpelledPitch pitch;
  pitch.octave = 2;
  EXPECT_FALSE(parseSpelledPitch("Q3", pitch));
  EXPECT_EQ(pitch.octave, 2);
}

// ---------------------------------------------------------------------------
// Spelled transposition
// ---------------------------------------------------------------------------

TEST(TransposeSpelledTest, IntervalsKeepLetterDistance) {
  SpelledPitchClass d{1, 0};
  // Major third above D is F#, not Gb.
  SpelledPitchClass third = transposeSpelled(d, 2, 4);
  EXPECT_EQ(spelledPitchClassToString(third), "F#");
  // Minor sixth above D is Bb.
  EXPECT_EQ(spelledPitchClassToString(transposeSpelled(d, 5, 8)), "Bb");
}

TEST(TransposeSpelledTest, DiminishedSeventh) {
  SpelledPitchClass c_sharp{0, 1};
  EXPECT_EQ(spelledPitchClassToString(transposeSpelled(c_sharp, 6, 9)), "Bb");
}

TEST(TransposeSpelledTest, StepDistance) {
  SpelledPitchClass b{6, 0};
  SpelledPitchClass d{1, 0};
  EXPECT_EQ(stepDistance(b, d), 2);
  EXPECT_EQ(stepDistance(d, b), 5);
}

// ---------------------------------------------------------------------------
// MIDI helpers
// ---------------------------------------------------------------------------

TEST(MidiPitchTest, PitchClassAndOctave) {
  EXPECT_EQ(getPitchClass(61), 1);
  EXPECT_EQ(getOctave(60), 4);
  EXPECT_EQ(getOctave(59), 3);
  EXPECT_EQ(pitchToNoteName(66), "F#4");
}

TEST(MidiPitchTest, Intervals) {
  EXPECT_EQ(directedInterval(60, 55), -5);
  EXPECT_EQ(absoluteInterval(55, 60), 5);
}

TEST(ParallelPerfectTest, FifthsAndOctaves) {
  EXPECT_TRUE(isParallelFifths(7, 19));
  EXPECT_FALSE(isParallelFifths(7, 8));
  EXPECT_TRUE(isParallelOctaves(12, 24));
  EXPECT_TRUE(isParallelOctaves(0, 12));
  EXPECT_FALSE(isParallelOctaves(12, 7));
}

}  // namespace
}  // namespace figbass
