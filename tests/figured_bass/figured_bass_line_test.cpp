// Tests for figured_bass/figured_bass_line.h -- text and compact input.

#include "figured_bass/figured_bass_line.h"

#include <gtest/gtest.h>

#include <string>

namespace figbass {
namespace {

// ---------------------------------------------------------------------------
// Text format
// ---------------------------------------------------------------------------

TEST(FiguredBassLineTest, ParsesKeyNotesAndFigures) {
  const char* text =
      "# cadence in D\n"
      "key D_major\n"
      "\n"
      "D3  1    _\n"
      "E3  0.5  6,-5\n"
      "F#3 2    6\n";
  FiguredBassLine line;
  std::string error;
  ASSERT_TRUE(parseFiguredBassLine(text, line, &error)) << error;
  EXPECT_EQ(keySignatureToString(line.key), "D_major");
  ASSERT_EQ(line.notes.size(), 3u);

  EXPECT_EQ(line.notes[0].pitch.midi(), 50);
  EXPECT_EQ(line.notes[0].figure, "");
  EXPECT_EQ(line.notes[0].duration, kQuarterNote);

  EXPECT_EQ(line.notes[1].figure, "6,-5");
  EXPECT_EQ(line.notes[1].duration, kEighthNote);

  EXPECT_EQ(line.notes[2].pitch.midi(), 54);
  EXPECT_EQ(line.notes[2].duration, kHalfNote);
  EXPECT_EQ(line.totalDuration(), kQuarterNote + kEighthNote + kHalfNote);
}

TEST(FiguredBassLineTest, MissingFigureIsEmpty) {
  FiguredBassLine line;
  ASSERT_TRUE(parseFiguredBassLine("C3 1\n", line));
  ASSERT_EQ(line.notes.size(), 1u);
  EXPECT_EQ(line.notes[0].figure, "");
  // No key directive: C major.
  EXPECT_EQ(keySignatureToString(line.key), "C_major");
}

TEST(FiguredBassLineTest, AccidentalFigureIsNotAComment) {
  FiguredBassLine line;
  ASSERT_TRUE(parseFiguredBassLine("key A_minor\nE3 1 #\nA2 1 #6\n", line));
  ASSERT_EQ(line.notes.size(), 2u);
  EXPECT_EQ(line.notes[0].figure, "#");
  EXPECT_EQ(line.notes[1].figure, "#6");
}

TEST(FiguredBassLineTest, FixedPitches) {
  FiguredBassLine line;
  std::string error;
  ASSERT_TRUE(parseFiguredBassLine("C3 1 _ S=C5 A=G4\nG2 1 A=B3\n", line, &error)) << error;
  ASSERT_EQ(line.notes.size(), 2u);
  ASSERT_EQ(line.notes[0].fixed_pitches.size(), 2u);
  EXPECT_EQ(line.notes[0].fixed_pitches[0].label, "S");
  EXPECT_EQ(line.notes[0].fixed_pitches[0].pitch.midi(), 72);
  EXPECT_EQ(line.notes[0].fixed_pitches[1].label, "A");
  EXPECT_EQ(line.notes[0].fixed_pitches[1].pitch.midi(), 67);
  // Fixed pitch directly after the duration: figure stays empty.
  EXPECT_EQ(line.notes[1].figure, "");
  ASSERT_EQ(line.notes[1].fixed_pitches.size(), 1u);
  EXPECT_EQ(line.notes[1].fixed_pitches[0].pitch.midi(), 59);
}

// ---------------------------------------------------------------------------
// Text format errors
// ---------------------------------------------------------------------------

TEST(FiguredBassLineTest, ErrorsNameTheLine) {
  FiguredBassLine line;
  std::string error;
  EXPECT_FALSE(parseFiguredBassLine("C3 1\nX3 1\n", line, &error));
  EXPECT_EQ(error.rfind("line 2:", 0), 0u) << error;

  EXPECT_FALSE(parseFiguredBassLine("C3\n", line, &error));
  EXPECT_NE(error.find("quarter length"), std::string::npos);

  EXPECT_FALSE(parseFiguredBassLine("C3 0\n", line, &error));
  EXPECT_FALSE(parseFiguredBassLine("C3 -1\n", line, &error));
  EXPECT_FALSE(parseFiguredBassLine("C3 1 6 S=\n", line, &error));
  EXPECT_NE(error.find("fixed pitch"), std::string::npos);
}

TEST(FiguredBassLineTest, KeyDirectiveRules) {
  FiguredBassLine line;
  std::string error;
  EXPECT_FALSE(parseFiguredBassLine("key H_major\nC3 1\n", line, &error));
  EXPECT_NE(error.find("invalid key"), std::string::npos);

  EXPECT_FALSE(parseFiguredBassLine("C3 1\nkey G_major\n", line, &error));
  EXPECT_EQ(error, "line 2: key must come once, before notes");

  EXPECT_FALSE(parseFiguredBassLine("key G_major\nkey D_major\nG2 1\n", line, &error));
  EXPECT_FALSE(parseFiguredBassLine("key\nG2 1\n", line, &error));
}

TEST(FiguredBassLineTest, EmptyInputRejected) {
  FiguredBassLine line;
  line.notes.resize(1);
  std::string error;
  EXPECT_FALSE(parseFiguredBassLine("# nothing\nkey C_major\n", line, &error));
  EXPECT_NE(error.find("no bass notes"), std::string::npos);
  EXPECT_EQ(line.notes.size(), 1u);
}

// ---------------------------------------------------------------------------
// Compact format
// ---------------------------------------------------------------------------

TEST(CompactBassLineTest, PitchesAndFigures) {
  KeySignature key;
  ASSERT_TRUE(keySignatureFromString("C_major", key));
  FiguredBassLine line;
  ASSERT_TRUE(parseCompactBassLine("C3 F3:6 G3:7  C3", key, line));
  ASSERT_EQ(line.notes.size(), 4u);
  EXPECT_EQ(line.notes[1].figure, "6");
  EXPECT_EQ(line.notes[2].figure, "7");
  EXPECT_EQ(line.notes[3].figure, "");
  for (const auto& note : line.notes) EXPECT_EQ(note.duration, kQuarterNote);
  EXPECT_EQ(line.key, key);
}

TEST(CompactBassLineTest, Errors) {
  KeySignature key;
  FiguredBassLine line;
  std::string error;
  EXPECT_FALSE(parseCompactBassLine("C3 Q3:6", key, line, &error));
  EXPECT_EQ(error, "invalid bass pitch 'Q3'");
  EXPECT_FALSE(parseCompactBassLine("   ", key, line, &error));
  EXPECT_EQ(error, "no bass notes");
}

}  // namespace
}  // namespace figbass
