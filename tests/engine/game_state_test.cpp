// Tests for engine/game_state.h -- initial state and note lookup.

#include "engine/game_state.h"

#include <gtest/gtest.h>

#include "core/rng_util.h"
#include "test_helpers.h"

namespace lanefall {
namespace {

TEST(GameStateTest, InitialStateIsRunningAndEmpty) {
  GameState state = makeInitialState();
  EXPECT_FALSE(state.game_end);
  EXPECT_FALSE(state.all_notes_processed);
  EXPECT_EQ(state.bonus_active, 0);
  EXPECT_EQ(state.tick_interval, 0);
  EXPECT_EQ(state.note_count, 0);
  EXPECT_EQ(state.score_gained, 0);
  EXPECT_TRUE(state.current_notes.empty());
  EXPECT_TRUE(state.rip_notes.empty());
  EXPECT_TRUE(state.playable_notes.empty());
  EXPECT_EQ(state.hash, rng::hash(kDefaultSeed));
  EXPECT_EQ(state.hash, 1593167226u);
}

TEST(GameStateTest, FindNoteById) {
  GameState state = makeInitialState(1);
  state.current_notes.push_back(test_helpers::makeLiveNote(3, 0, 10));
  state.current_notes.push_back(test_helpers::makeLiveNote(-1, 2, kBottomRow, false));

  const Note* found = findNote(state, -1);
  ASSERT_NE(found, nullptr);
  EXPECT_EQ(found->column, 2);
  EXPECT_EQ(findNote(state, 3)->position, 10);
  EXPECT_EQ(findNote(state, 4), nullptr);
}

}  // namespace
}  // namespace lanefall
