// Tests for core/pitch.h -- spelled pitch parsing, naming and transposition.

#include "core/pitch.h"

#include <gtest/gtest.h>

#include <string>

namespace band {
namespace {

// ---------------------------------------------------------------------------
// Construction and MIDI value
// ---------------------------------------------------------------------------

TEST(PitchTest, DefaultIsMiddleC) {
  Pitch pitch;
  EXPECT_EQ(pitch.midi(), 60);
  EXPECT_EQ(pitch, kMiddleC);
  EXPECT_EQ(pitch.name(), "C4");
}

TEST(PitchTest, MidiValueFollowsSpelling) {
  EXPECT_EQ(Pitch(Step::A, 0, 4).midi(), 69);
  EXPECT_EQ(Pitch(Step::B, 1, 3).midi(), 60);   // B#3
  EXPECT_EQ(Pitch(Step::C, -1, 4).midi(), 59);  // Cb4
  EXPECT_EQ(Pitch(Step::D, 0, 3).midi(), 50);
}

// ---------------------------------------------------------------------------
// fromString
// ---------------------------------------------------------------------------

TEST(PitchFromStringTest, PlainAndAccidentals) {
  auto c4 = Pitch::fromString("C4");
  ASSERT_TRUE(c4.has_value());
  EXPECT_EQ(c4->midi(), 60);

  auto fs3 = Pitch::fromString("F#3");
  ASSERT_TRUE(fs3.has_value());
  EXPECT_EQ(fs3->midi(), 54);
  EXPECT_EQ(fs3->alter(), 1);

  auto bb5 = Pitch::fromString("Bb5");
  ASSERT_TRUE(bb5.has_value());
  EXPECT_EQ(bb5->midi(), 82);
  EXPECT_EQ(bb5->name(), "Bb5");

  auto ebb2 = Pitch::fromString("Ebb2");
  ASSERT_TRUE(ebb2.has_value());
  EXPECT_EQ(ebb2->alter(), -2);
  EXPECT_EQ(ebb2->midi(), 38);
}

TEST(PitchFromStringTest, DefaultOctaveAndLowercase) {
  auto pitch = Pitch::fromString("d");
  ASSERT_TRUE(pitch.has_value());
  EXPECT_EQ(pitch->octave(), 4);
  EXPECT_EQ(pitch->midi(), 62);
}

TEST(PitchFromStringTest, NegativeOctave) {
  auto pitch = Pitch::fromString("C-1");
  ASSERT_TRUE(pitch.has_value());
  EXPECT_EQ(pitch->midi(), 0);
}

TEST(PitchFromStringTest, MalformedRejected) {
  EXPECT_FALSE(Pitch::fromString("").has_value());
  EXPECT_FALSE(Pitch::fromString("H4").has_value());
  EXPECT_FALSE(Pitch::fromString("C#b4").has_value());
  EXPECT_FALSE(Pitch::fromString("C4x").has_value());
  EXPECT_FALSE(Pitch::fromString("C-").has_value());
  EXPECT_FALSE(Pitch::fromString("C123").has_value());
  EXPECT_FALSE(Pitch::fromString("4C").has_value());
}

TEST(PitchFromStringTest, AtMostTwoAccidentals) {
  auto cx = Pitch::fromString("C##4");
  ASSERT_TRUE(cx.has_value());
  EXPECT_EQ(cx->midi(), 62);
  EXPECT_FALSE(Pitch::fromString("C###4").has_value());
  EXPECT_FALSE(Pitch::fromString("Dbbb4").has_value());
  EXPECT_FALSE(Pitch::fromString("C" + std::string(200, '#') + "4").has_value());
}

TEST(PitchFromStringTest, NameRoundTrip) {
  for (const char* text : {"C4", "C#4", "Db3", "B#3", "Fbb2", "G##5", "A0"}) {
    auto pitch = Pitch::fromString(text);
    ASSERT_TRUE(pitch.has_value()) << text;
    EXPECT_EQ(pitch->name(), text);
  }
}

// ---------------------------------------------------------------------------
// fromMidi
// ---------------------------------------------------------------------------

TEST(PitchFromMidiTest, SharpSpelling) {
  EXPECT_EQ(Pitch::fromMidi(60).name(), "C4");
  EXPECT_EQ(Pitch::fromMidi(61).name(), "C#4");
  EXPECT_EQ(Pitch::fromMidi(70).name(), "A#4");
  EXPECT_EQ(Pitch::fromMidi(11).name(), "B-1");
}

// ---------------------------------------------------------------------------
// Transposition
// ---------------------------------------------------------------------------

TEST(PitchTransposeTest, OctavesKeepSpelling) {
  Pitch bb3(Step::B, -1, 3);
  Pitch up = bb3.transpose(12);
  EXPECT_EQ(up.name(), "Bb4");
  Pitch down = bb3.transpose(-24);
  EXPECT_EQ(down.name(), "Bb1");
  EXPECT_EQ(down.midi(), bb3.midi() - 24);
}

TEST(PitchTransposeTest, SemitonesRespellWithSharps) {
  Pitch eb4(Step::E, -1, 4);
  Pitch up = eb4.transpose(1);
  EXPECT_EQ(up.midi(), 64);
  EXPECT_EQ(up.name(), "E4");
  EXPECT_EQ(kMiddleC.transpose(-1).name(), "B3");
}

TEST(PitchTransposeTest, NamedIntervalSpelling) {
  Pitch d4(Step::D, 0, 4);
  EXPECT_EQ(d4.transpose(named_interval::km3).name(), "F4");
  EXPECT_EQ(d4.transpose(named_interval::kM9).name(), "E5");
  EXPECT_EQ(d4.transpose(named_interval::km7).name(), "C5");
  EXPECT_EQ(kMiddleC.transpose(named_interval::kA5).name(), "G#4");
  EXPECT_EQ(kMiddleC.transpose(named_interval::km13).name(), "Ab5");
  EXPECT_EQ(kMiddleC.transpose(named_interval::kd7).name(), "Bbb4");
  EXPECT_EQ(Pitch(Step::E, 0, 4).transpose(named_interval::kM3).name(), "G#4");
  EXPECT_EQ(Pitch(Step::B, 0, 3).transpose(named_interval::kd5).name(), "F4");
}

TEST(PitchTransposeTest, NamedIntervalMidiMatchesSemitones) {
  Pitch g3(Step::G, 0, 3);
  EXPECT_EQ(g3.transpose(named_interval::kM13).midi(), g3.midi() + 21);
  EXPECT_EQ(g3.transpose(named_interval::kA11).midi(), g3.midi() + 18);
}

TEST(PitchTest, EqualityComparesSpelling) {
  Pitch cs4(Step::C, 1, 4);
  Pitch db4(Step::D, -1, 4);
  EXPECT_TRUE(cs4.sameMidi(db4));
  EXPECT_NE(cs4, db4);
}

}  // namespace
}  // namespace band
