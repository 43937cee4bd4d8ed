// Tests for session/trace_writer.h -- trace recording and JSON output.

#include "session/trace_writer.h"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace lanefall {
namespace {

using test_helpers::makeLiveNote;

TEST(TraceWriterTest, QuietTicksAreCountedNotRecorded) {
  TraceRecorder recorder;
  GameState state = makeInitialState(1);
  recorder.onState(SessionStep{7.0, "tick"}, state);
  recorder.onState(SessionStep{14.0, "tick"}, state);

  EXPECT_EQ(recorder.tickCount(), 2u);
  EXPECT_TRUE(recorder.entries().empty());
}

TEST(TraceWriterTest, SoundingTickIsRecorded) {
  TraceRecorder recorder;
  GameState state = makeInitialState(1);
  state.playable_notes.push_back(makeLiveNote(4, 0, kBottomRow, false));
  recorder.onState(SessionStep{2443.0, "tick"}, state);

  ASSERT_EQ(recorder.entries().size(), 1u);
  ASSERT_EQ(recorder.entries()[0].playable_ids.size(), 1u);
  EXPECT_EQ(recorder.entries()[0].playable_ids[0], 4);
}

TEST(TraceWriterTest, NonTickActionsAlwaysRecorded) {
  TraceRecorder recorder;
  GameState state = makeInitialState(1);
  state.score_gained = 3;
  state.note_count = 2;
  state.current_notes.push_back(makeLiveNote(1, 0, 40));
  recorder.onState(SessionStep{100.0, "press"}, state);
  recorder.onState(SessionStep{0.0, "reset"}, state);

  ASSERT_EQ(recorder.entries().size(), 2u);
  const TraceEntry& entry = recorder.entries()[0];
  EXPECT_EQ(entry.action, "press");
  EXPECT_EQ(entry.score, 3);
  EXPECT_EQ(entry.combo, 2);
  EXPECT_EQ(entry.live_notes, 1u);
  EXPECT_EQ(recorder.tickCount(), 0u);
}

TEST(TraceWriterTest, JsonContainsRunAndFinalState) {
  TraceRecorder recorder;
  GameState state = makeInitialState(1);
  state.score_gained = 9;
  recorder.onState(SessionStep{0.0, "spawn"}, state);

  GameState final_state = state;
  final_state.game_end = true;
  Note held = makeLiveNote(2, 1, 360, false);
  held.tail = Tail{340.0, static_cast<double>(kBottomRow), true};
  final_state.current_notes = {held};

  GameConfig config;
  config.hard_mode = true;
  std::string json = buildTraceJson(recorder.entries(), final_state, config, 1234);

  EXPECT_NE(json.find("\"seed\": 1234"), std::string::npos);
  EXPECT_NE(json.find("\"hard_mode\": true"), std::string::npos);
  EXPECT_NE(json.find("\"chart\": \"(default)\""), std::string::npos);
  EXPECT_NE(json.find("\"action\": \"spawn\""), std::string::npos);
  EXPECT_NE(json.find("\"score\": 9"), std::string::npos);
  EXPECT_NE(json.find("\"multiplier\": \"1.0x\""), std::string::npos);
  EXPECT_NE(json.find("\"dead\": true"), std::string::npos);
  EXPECT_NE(json.find("\"game_end\": true"), std::string::npos);
}

}  // namespace
}  // namespace lanefall
