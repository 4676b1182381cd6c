// Tests for harmony/chord_types.h -- spelled chord analysis.

#include "harmony/chord_types.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace figbass {
namespace {

SpelledPitchClass name(const char* text) {
  SpelledPitchClass result;
  EXPECT_TRUE(parseSpelledPitchClass(text, result)) << text;
  return result;
}

ChordAnalysis analyze(std::vector<const char*> names, const char* bass) {
  std::vector<SpelledPitchClass> spelled;
  for (const char* text : names) spelled.push_back(name(text));
  return analyzeChord(spelled, name(bass));
}

TEST(AnalyzeChordTest, MajorTriadRootPosition) {
  ChordAnalysis analysis = analyze({"C", "E", "G"}, "C");
  EXPECT_EQ(analysis.quality, ChordQuality::Major);
  EXPECT_TRUE(analysis.isConsonantTriad());
  EXPECT_EQ(analysis.root, name("C"));
  EXPECT_EQ(analysis.inversion, 0);
}

TEST(AnalyzeChordTest, MinorTriadFirstInversion) {
  ChordAnalysis analysis = analyze({"F#", "A", "D"}, "F#");
  EXPECT_EQ(analysis.quality, ChordQuality::Major);
  EXPECT_EQ(analysis.root, name("D"));
  EXPECT_EQ(analysis.inversion, 1);

  analysis = analyze({"C", "E", "A"}, "C");
  EXPECT_EQ(analysis.quality, ChordQuality::Minor);
  EXPECT_EQ(analysis.root, name("A"));
}

TEST(AnalyzeChordTest, DiminishedAndAugmented) {
  EXPECT_EQ(analyze({"B", "D", "F"}, "B").quality, ChordQuality::Diminished);
  EXPECT_EQ(analyze({"C", "E", "G#"}, "C").quality, ChordQuality::Augmented);
}

TEST(AnalyzeChordTest, DominantSeventhThirdInversion) {
  ChordAnalysis analysis = analyze({"F", "G", "B", "D"}, "F");
  EXPECT_EQ(analysis.quality, ChordQuality::Dominant7);
  EXPECT_EQ(analysis.root, name("G"));
  EXPECT_EQ(analysis.seventh, name("F"));
  EXPECT_EQ(analysis.inversion, 3);
}

TEST(AnalyzeChordTest, DiminishedSeventhDependsOnSpelling) {
  ChordAnalysis analysis = analyze({"C#", "E", "G", "Bb"}, "C#");
  EXPECT_EQ(analysis.quality, ChordQuality::Diminished7);
  EXPECT_EQ(analysis.root, name("C#"));

  // Respelling Db for C# makes E the root, in third inversion.
  analysis = analyze({"Db", "E", "G", "Bb"}, "Db");
  EXPECT_EQ(analysis.quality, ChordQuality::Diminished7);
  EXPECT_EQ(analysis.root, name("E"));
  EXPECT_EQ(analysis.inversion, 3);
}

TEST(AnalyzeChordTest, DuplicatesIgnored) {
  ChordAnalysis analysis = analyze({"G", "B", "D", "G", "D"}, "G");
  EXPECT_EQ(analysis.quality, ChordQuality::Major);
}

TEST(AnalyzeChordTest, AugmentedSixths) {
  ChordAnalysis italian = analyze({"Ab", "C", "F#"}, "Ab");
  EXPECT_EQ(italian.quality, ChordQuality::ItalianSixth);
  EXPECT_TRUE(italian.isAugmentedSixth());
  EXPECT_FALSE(italian.isConsonantTriad());

  EXPECT_EQ(analyze({"Ab", "C", "D", "F#"}, "Ab").quality, ChordQuality::FrenchSixth);
  EXPECT_EQ(analyze({"Ab", "C", "Eb", "F#"}, "Ab").quality, ChordQuality::GermanSixth);
  EXPECT_EQ(analyze({"Ab", "C", "D#", "F#"}, "Ab").quality, ChordQuality::SwissSixth);
}

TEST(AnalyzeChordTest, ClusterIsOther) {
  ChordAnalysis analysis = analyze({"C", "D", "E"}, "C");
  EXPECT_EQ(analysis.quality, ChordQuality::Other);
  EXPECT_FALSE(analysis.has_root);
}

TEST(ChordQualityTest, Names) {
  EXPECT_STREQ(chordQualityToString(ChordQuality::Dominant7), "Dominant7");
  EXPECT_STREQ(chordQualityToString(ChordQuality::Other), "Other");
}

}  // namespace
}  // namespace figbass
