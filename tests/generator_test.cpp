// Tests for generator.h -- progression voicing, track layout, text and JSON input.

#include "generator.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/json_parser.h"

namespace band {
namespace {

Pitch pitchOf(const char* text) {
  auto pitch = Pitch::fromString(text);
  return pitch ? *pitch : Pitch();
}

GeneratorConfig demoConfig() {
  GeneratorConfig config;
  config.chords = twoFiveOneProgression(kMiddleC);
  return config;
}

// ---------------------------------------------------------------------------
// twoFiveOneProgression
// ---------------------------------------------------------------------------

TEST(TwoFiveOneTest, ChordsInC) {
  auto chords = twoFiveOneProgression(kMiddleC);
  ASSERT_EQ(chords.size(), 3u);

  EXPECT_EQ(chords[0].root.name(), "D4");
  EXPECT_EQ(chords[0].type, kMinorSeventh.addMaj9());
  EXPECT_EQ(chords[1].root.name(), "G4");
  EXPECT_EQ(chords[1].type, kDominantSeventh.addMaj13());
  EXPECT_EQ(chords[2].root.name(), "C4");
  EXPECT_EQ(chords[2].type, kMajorSeventh.addMaj9());

  for (const auto& chord : chords) {
    EXPECT_FALSE(chord.include_root);
    ASSERT_TRUE(chord.bass.has_value());
    EXPECT_EQ(*chord.bass, chord.root);
  }
}

TEST(TwoFiveOneTest, SpellingFollowsTonic) {
  auto chords = twoFiveOneProgression(pitchOf("Bb3"));
  EXPECT_EQ(chords[0].root.name(), "C4");
  EXPECT_EQ(chords[1].root.name(), "F4");
  EXPECT_EQ(chords[2].root.name(), "Bb3");
}

// ---------------------------------------------------------------------------
// generate
// ---------------------------------------------------------------------------

TEST(GenerateTest, TwoFiveOneVoicings) {
  GeneratorResult result = generate(demoConfig());
  ASSERT_TRUE(result.success) << result.error_message;
  ASSERT_EQ(result.voicings.size(), 3u);
  EXPECT_EQ(result.voicings[0].toString(), "<D3 A3 C4 E4 F4>");
  EXPECT_EQ(result.voicings[1].toString(), "<G2 B3 D4 E4 F4>");
  EXPECT_EQ(result.voicings[2].toString(), "<C3 B3 D4 E4 G4>");
}

TEST(GenerateTest, ChordsLaidOutBackToBack) {
  GeneratorConfig config = demoConfig();
  config.chord_duration = duration::kHalfNote;
  config.velocity = 90;
  config.program = 4;
  GeneratorResult result = generate(config);
  ASSERT_TRUE(result.success);

  ASSERT_EQ(result.tracks.size(), 1u);
  const Track& track = result.tracks[0];
  EXPECT_EQ(track.program, 4);
  ASSERT_EQ(track.notes.size(), 15u);
  for (const auto& note : track.notes) {
    EXPECT_EQ(note.start_tick, note.chord_index * duration::kHalfNote);
    EXPECT_EQ(note.duration, duration::kHalfNote);
    EXPECT_EQ(note.velocity, 90);
  }
  EXPECT_EQ(track.notes.front().pitch, 50);  // D3
  EXPECT_EQ(result.total_duration_ticks, 3 * duration::kHalfNote);

  ASSERT_EQ(result.tempo_events.size(), 1u);
  EXPECT_EQ(result.tempo_events[0].tick, 0u);
  EXPECT_EQ(result.tempo_events[0].bpm, 120);
}

TEST(GenerateTest, EmptyProgressionFails) {
  GeneratorResult result = generate(GeneratorConfig{});
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, GeneratorError::EmptyProgression);
}

TEST(GenerateTest, FailingChordAbortsWithItsError) {
  GeneratorConfig config = demoConfig();
  config.max_notes = 1;
  GeneratorResult result = generate(config);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, GeneratorError::InsufficientChordSize);
  EXPECT_NE(result.error_message.find("chord 1"), std::string::npos);
  EXPECT_TRUE(result.voicings.empty());
  EXPECT_TRUE(result.tracks.empty());
}

TEST(GenerateTest, Deterministic) {
  GeneratorResult first = generate(demoConfig());
  GeneratorResult second = generate(demoConfig());
  ASSERT_TRUE(first.success);
  EXPECT_EQ(first.voicings, second.voicings);
}

// ---------------------------------------------------------------------------
// Text input
// ---------------------------------------------------------------------------

TEST(ProgressionParseTest, FullSymbol) {
  auto parsed = progressionChordFromString("D4:m7(9)/D4");
  ASSERT_TRUE(parsed.ok()) << parsed.error_message;
  EXPECT_EQ(parsed.value.root.name(), "D4");
  EXPECT_EQ(parsed.value.type, kMinorSeventh.addMaj9());
  ASSERT_TRUE(parsed.value.bass.has_value());
  EXPECT_EQ(parsed.value.bass->name(), "D4");
  EXPECT_TRUE(parsed.value.include_root);
}

TEST(ProgressionParseTest, BareRootAndEmptyQualityAreMajor) {
  auto bare = progressionChordFromString("Eb3", false);
  ASSERT_TRUE(bare.ok());
  EXPECT_EQ(bare.value.type, kMajor);
  EXPECT_FALSE(bare.value.bass.has_value());
  EXPECT_FALSE(bare.value.include_root);

  auto empty_quality = progressionChordFromString("G3:");
  ASSERT_TRUE(empty_quality.ok());
  EXPECT_EQ(empty_quality.value.type, kMajor);
}

TEST(ProgressionParseTest, Errors) {
  EXPECT_EQ(progressionChordFromString("H4:m").error, GeneratorError::InvalidPitch);
  EXPECT_EQ(progressionChordFromString("C4:xyz").error, GeneratorError::InvalidQuality);
  EXPECT_EQ(progressionChordFromString("C4:m/Q").error, GeneratorError::InvalidPitch);
  EXPECT_EQ(progressionChordFromString("").error, GeneratorError::InvalidPitch);
}

TEST(ProgressionParseTest, SymbolRoundTrip) {
  for (const auto& chord : twoFiveOneProgression(pitchOf("F#3"))) {
    std::string text = progressionChordToString(chord);
    auto parsed = progressionChordFromString(text, false);
    ASSERT_TRUE(parsed.ok()) << text;
    EXPECT_EQ(parsed.value.root, chord.root);
    EXPECT_EQ(parsed.value.type, chord.type);
    EXPECT_EQ(parsed.value.bass, chord.bass);
  }
}

TEST(ProgressionParseTest, WhitespaceSeparatedList) {
  auto parsed = parseProgression("  D4:m7(9)/D4\tG4:7(13)/G4\n C4:maj7(9)/C4 ", false);
  ASSERT_TRUE(parsed.ok()) << parsed.error_message;
  ASSERT_EQ(parsed.value.size(), 3u);
  EXPECT_EQ(parsed.value[1].type, kDominantSeventh.addMaj13());

  GeneratorConfig config;
  config.chords = parsed.value;
  GeneratorResult result = generate(config);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.voicings, generate(demoConfig()).voicings);
}

TEST(ProgressionParseTest, ListStopsAtFirstBadSymbol) {
  auto parsed = parseProgression("C4:maj7 F4:bogus G4:7");
  EXPECT_FALSE(parsed.ok());
  EXPECT_EQ(parsed.error, GeneratorError::InvalidQuality);
  EXPECT_NE(parsed.error_message.find("bogus"), std::string::npos);

  auto empty = parseProgression("   ");
  EXPECT_TRUE(empty.ok());
  EXPECT_TRUE(empty.value.empty());
}

// ---------------------------------------------------------------------------
// configFromJson
// ---------------------------------------------------------------------------

TEST(ConfigFromJsonTest, SingleChordKeys) {
  auto object = parseJsonObject(
      R"json({"quality": "m7(9)", "root": "D4", "anchor": "D4", "bass": "D4",
          "include_root": false, "max_notes": 4, "bpm": 96})json");
  ASSERT_TRUE(object.has_value());
  auto parsed = configFromJson(*object);
  ASSERT_TRUE(parsed.ok()) << parsed.error_message;

  const GeneratorConfig& config = parsed.value;
  EXPECT_EQ(config.anchor.name(), "D4");
  EXPECT_EQ(config.max_notes, 4);
  EXPECT_EQ(config.bpm, 96);
  ASSERT_EQ(config.chords.size(), 1u);
  EXPECT_EQ(config.chords[0].type, kMinorSeventh.addMaj9());
  EXPECT_FALSE(config.chords[0].include_root);
  ASSERT_TRUE(config.chords[0].bass.has_value());
}

TEST(ConfigFromJsonTest, ProgressionOverridesSingleChord) {
  auto object = parseJsonObject(R"({"quality": "m", "progression": "C4:maj7 A3:m7"})");
  ASSERT_TRUE(object.has_value());
  auto parsed = configFromJson(*object);
  ASSERT_TRUE(parsed.ok());
  ASSERT_EQ(parsed.value.chords.size(), 2u);
  EXPECT_EQ(parsed.value.chords[1].root.name(), "A3");
}

TEST(ConfigFromJsonTest, MissingKeysKeepDefaults) {
  GeneratorConfig defaults = demoConfig();
  defaults.bpm = 80;
  auto parsed = configFromJson(JsonObject{}, defaults);
  ASSERT_TRUE(parsed.ok());
  EXPECT_EQ(parsed.value.bpm, 80);
  EXPECT_EQ(parsed.value.chords.size(), 3u);
  EXPECT_EQ(parsed.value.max_notes, kDefaultMaxNotes);
}

TEST(ConfigFromJsonTest, OutOfRangeNumbersKeepDefaults) {
  auto object = parseJsonObject(R"({"bpm": 70000, "max_notes": 1e12})");
  ASSERT_TRUE(object.has_value());
  auto parsed = configFromJson(*object);
  ASSERT_TRUE(parsed.ok());
  EXPECT_EQ(parsed.value.bpm, 120);
  EXPECT_EQ(parsed.value.max_notes, kDefaultMaxNotes);

  auto slow = parseJsonObject(R"({"bpm": 5})");
  ASSERT_TRUE(slow.has_value());
  EXPECT_EQ(configFromJson(*slow).value.bpm, 120);
}

TEST(ConfigFromJsonTest, TempoLimitsAreInclusive) {
  auto low = parseJsonObject(R"({"bpm": 20})");
  auto high = parseJsonObject(R"({"bpm": 300})");
  ASSERT_TRUE(low.has_value());
  ASSERT_TRUE(high.has_value());
  EXPECT_EQ(configFromJson(*low).value.bpm, kMinBpm);
  EXPECT_EQ(configFromJson(*high).value.bpm, kMaxBpm);
}

TEST(ConfigFromJsonTest, Errors) {
  auto bad_quality = parseJsonObject(R"json({"quality": "m7(10)"})json");
  ASSERT_TRUE(bad_quality.has_value());
  EXPECT_EQ(configFromJson(*bad_quality).error, GeneratorError::InvalidQuality);

  auto bad_anchor = parseJsonObject(R"({"anchor": "Z9"})");
  ASSERT_TRUE(bad_anchor.has_value());
  EXPECT_EQ(configFromJson(*bad_anchor).error, GeneratorError::InvalidPitch);

  auto bad_bass = parseJsonObject(R"({"root": "C4", "bass": 12})");
  ASSERT_TRUE(bad_bass.has_value());
  EXPECT_TRUE(configFromJson(*bad_bass).ok());  // non-string bass reads as none
}

// ---------------------------------------------------------------------------
// buildEventsJson
// ---------------------------------------------------------------------------

TEST(BuildEventsJsonTest, DescribesVoicingsAndNotes) {
  GeneratorConfig config = demoConfig();
  GeneratorResult result = generate(config);
  ASSERT_TRUE(result.success);
  std::string json = buildEventsJson(result, config);

  auto top = parseJsonObject(json);
  ASSERT_TRUE(top.has_value());
  EXPECT_EQ(top->at("anchor").asString(), "C4");
  EXPECT_EQ(top->at("total_ticks").asInt(), 5760);
  EXPECT_EQ(top->at("bpm").asInt(), 120);

  EXPECT_NE(json.find(R"json("symbol":"D4:m7(9)/D4")json"), std::string::npos);
  EXPECT_NE(json.find(R"("pitches":["D3","A3","C4","E4","F4"])"), std::string::npos);
  EXPECT_NE(json.find(R"("midi":[50,57,60,64,65])"), std::string::npos);
  EXPECT_NE(json.find(R"("start_tick":3840)"), std::string::npos);
}

TEST(GeneratorErrorTest, Strings) {
  EXPECT_STREQ(generatorErrorToString(GeneratorError::InvalidQuality), "invalid quality");
  EXPECT_EQ(generatorErrorFromVoicing(VoicingError::InvalidPitch), GeneratorError::InvalidPitch);
}

}  // namespace
}  // namespace band
