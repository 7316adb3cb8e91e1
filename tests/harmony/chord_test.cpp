// Tests for harmony/chord.h -- ordered pitch collections.

#include "harmony/chord.h"

#include <gtest/gtest.h>

#include <vector>

namespace band {
namespace {

Pitch pitchOf(const char* text) {
  auto pitch = Pitch::fromString(text);
  return pitch ? *pitch : Pitch();
}

Chord chordOf(std::initializer_list<const char*> names) {
  std::vector<Pitch> pitches;
  for (const char* name : names) {
    pitches.push_back(pitchOf(name));
  }
  return Chord(std::move(pitches));
}

TEST(ChordTest, EmptyByDefault) {
  Chord chord;
  EXPECT_TRUE(chord.empty());
  EXPECT_EQ(chord.size(), 0u);
  EXPECT_EQ(chord.toString(), "<>");
}

TEST(ChordTest, KeepsInsertionOrder) {
  Chord chord = chordOf({"G4", "C4", "E4"});
  EXPECT_EQ(chord.midiValues(), (std::vector<int>{67, 60, 64}));
  EXPECT_EQ(chord[0].name(), "G4");
  EXPECT_EQ(chord.toString(), "<G4 C4 E4>");
}

TEST(ChordTest, LowestAndHighest) {
  Chord chord = chordOf({"G4", "C4", "E5"});
  EXPECT_EQ(chord.lowest().name(), "C4");
  EXPECT_EQ(chord.highest().name(), "E5");
}

TEST(ChordTest, SortedAscendingIsStable) {
  // B#3 and C4 share MIDI 60; their relative order must survive.
  Chord chord = chordOf({"E4", "B#3", "C4"});
  Chord sorted = chord.sortedAscending();
  EXPECT_EQ(sorted.toString(), "<B#3 C4 E4>");

  Chord reversed = chordOf({"E4", "C4", "B#3"}).sortedAscending();
  EXPECT_EQ(reversed.toString(), "<C4 B#3 E4>");
}

TEST(ChordTest, WithPitchInsertsAndSorts) {
  Chord chord = chordOf({"C4", "E4", "G4"});
  Chord with_bass = chord.withPitch(pitchOf("D3"));
  EXPECT_EQ(with_bass.toString(), "<D3 C4 E4 G4>");
  EXPECT_EQ(chord.size(), 3u);
}

TEST(ChordTest, TransposeMovesEveryPitch) {
  Chord chord = chordOf({"C4", "Eb4", "G4"});
  EXPECT_EQ(chord.transpose(12).toString(), "<C5 Eb5 G5>");
  EXPECT_EQ(chord.transpose(2).midiValues(), (std::vector<int>{62, 65, 69}));
}

TEST(ChordTest, DuplicatesKept) {
  Chord chord = chordOf({"C4", "C4"});
  EXPECT_EQ(chord.size(), 2u);
}

TEST(ChordTest, Equality) {
  EXPECT_EQ(chordOf({"C4", "E4"}), chordOf({"C4", "E4"}));
  EXPECT_NE(chordOf({"C4", "E4"}), chordOf({"E4", "C4"}));
}

}  // namespace
}  // namespace band
