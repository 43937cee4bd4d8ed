// Tests for engine/projector.h -- sprites, audio commands and HUD text.

#include "engine/projector.h"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace lanefall {
namespace {

using test_helpers::makeLiveNote;

Note sustainNote(NoteId id, int column, int position, bool visual, bool dead) {
  Note note = makeLiveNote(id, column, position, visual);
  note.end_ms = 1500.0;
  note.tail = Tail{position - 200.0, visual ? static_cast<double>(position) : kBottomRow, dead};
  return note;
}

TEST(ProjectorTest, LaneColors) {
  EXPECT_STREQ(laneColorName(0), "green");
  EXPECT_STREQ(laneColorName(1), "red");
  EXPECT_STREQ(laneColorName(2), "blue");
  EXPECT_STREQ(laneColorName(3), "yellow");
}

TEST(ProjectorTest, VisualNotesProjectHeads) {
  GameState state = makeInitialState();
  Note special = makeLiveNote(2, 1, 40);
  special.special = true;
  state.current_notes = {makeLiveNote(1, 0, 10), special};

  std::vector<NoteSprite> sprites = projectSprites(state);
  ASSERT_EQ(sprites.size(), 2u);
  EXPECT_EQ(sprites[0].kind, SpriteKind::Head);
  EXPECT_DOUBLE_EQ(sprites[0].y, 10.0);
  EXPECT_EQ(sprites[1].kind, SpriteKind::SpecialHead);
  EXPECT_EQ(sprites[1].column, 1);
}

TEST(ProjectorTest, ConsumedPlainNoteIsHidden) {
  GameState state = makeInitialState();
  state.current_notes = {makeLiveNote(1, 0, 330, false)};
  EXPECT_TRUE(projectSprites(state).empty());
}

TEST(ProjectorTest, SustainProjectsTailAndHead) {
  GameState state = makeInitialState();
  state.current_notes = {sustainNote(1, 2, 300, true, false)};

  std::vector<NoteSprite> sprites = projectSprites(state);
  ASSERT_EQ(sprites.size(), 2u);
  EXPECT_EQ(sprites[0].kind, SpriteKind::Tail);
  EXPECT_DOUBLE_EQ(sprites[0].y, 100.0);
  EXPECT_DOUBLE_EQ(sprites[0].height, 200.0);
  EXPECT_FALSE(sprites[0].greyed);
  EXPECT_EQ(sprites[1].kind, SpriteKind::Head);
}

TEST(ProjectorTest, HeldSustainHeadStaysOnRow) {
  GameState state = makeInitialState();
  state.current_notes = {sustainNote(1, 2, 360, false, true)};

  std::vector<NoteSprite> sprites = projectSprites(state);
  ASSERT_EQ(sprites.size(), 2u);
  EXPECT_TRUE(sprites[0].greyed);
  EXPECT_DOUBLE_EQ(sprites[1].y, kBottomRow);
  EXPECT_TRUE(sprites[1].greyed);
}

TEST(ProjectorTest, PlayableNotesBecomeAudio) {
  GameState state = makeInitialState();
  Note plain = makeLiveNote(1, 0, kBottomRow, false);
  plain.velocity = 127;
  Note held = sustainNote(2, 1, kBottomRow, false, false);
  state.playable_notes = {plain, held};

  std::vector<AudioCommand> audio = projectAudio(state);
  ASSERT_EQ(audio.size(), 2u);
  EXPECT_EQ(audio[0].type, AudioCommandType::AttackRelease);
  EXPECT_DOUBLE_EQ(audio[0].velocity, 1.0);
  EXPECT_DOUBLE_EQ(audio[0].duration_ms, 100.0);
  EXPECT_EQ(audio[0].instrument, "piano");
  EXPECT_EQ(audio[1].type, AudioCommandType::Attack);
  EXPECT_DOUBLE_EQ(audio[1].duration_ms, 1500.0);
}

TEST(ProjectorTest, DeadHeldTailIsReleased) {
  GameState state = makeInitialState();
  state.current_notes = {sustainNote(5, 3, 360, false, true), sustainNote(6, 0, 360, false, false)};

  std::vector<AudioCommand> audio = projectAudio(state);
  ASSERT_EQ(audio.size(), 1u);
  EXPECT_EQ(audio[0].type, AudioCommandType::Release);
  EXPECT_EQ(audio[0].id, 5);
  EXPECT_STREQ(audioCommandTypeToString(audio[0].type), "release");
}

TEST(ProjectorTest, HudFormatting) {
  GameState state = makeInitialState();
  state.score_gained = 42;
  state.note_count = 25;
  state.bonus_active = 100;
  state.tick_interval = 0;

  HudText hud = projectHud(state);
  EXPECT_EQ(hud.score, "42");
  EXPECT_EQ(hud.multiplier, "1.4x");
  EXPECT_EQ(hud.bonus_multiplier, "3.0x");
  EXPECT_EQ(hud.decay_time, "2.0s");

  state.tick_interval = 185;
  EXPECT_EQ(projectHud(state).decay_time, "0.7s");

  state.bonus_active = 0;
  EXPECT_EQ(projectHud(state).decay_time, "0s");
  EXPECT_EQ(projectHud(state).bonus_multiplier, "1.0x");
}

TEST(ProjectorTest, FrameReportsRemovalsAndGameOver) {
  GameState state = makeInitialState();
  state.rip_notes = {makeLiveNote(3, 0, 10), makeLiveNote(4, 1, 20)};
  state.game_end = true;

  Frame frame = project(state);
  ASSERT_EQ(frame.removed_ids.size(), 2u);
  EXPECT_EQ(frame.removed_ids[0], 3);
  EXPECT_EQ(frame.removed_ids[1], 4);
  EXPECT_TRUE(frame.game_over);
  EXPECT_TRUE(frame.sprites.empty());
}

}  // namespace
}  // namespace lanefall
