// Tests for session/event_queue.h -- (time, priority, sequence) ordering.

#include "session/event_queue.h"

#include <gtest/gtest.h>

namespace lanefall {
namespace {

const char* nameOf(const SessionEvent& event) {
  if (std::holds_alternative<PauseToggle>(event.payload)) return "pause";
  return actionName(std::get<Action>(event.payload));
}

TEST(EventQueueTest, OrdersByTime) {
  EventQueue queue;
  queue.push(14.0, EventPriority::Tick, Action{TickAction{}});
  queue.push(7.0, EventPriority::Input, Action{PressAction{0}});
  queue.push(0.0, EventPriority::Spawn, Action{SpawnNotesAction{}});

  EXPECT_EQ(queue.size(), 3u);
  EXPECT_DOUBLE_EQ(queue.pop().time_ms, 0.0);
  EXPECT_DOUBLE_EQ(queue.pop().time_ms, 7.0);
  EXPECT_DOUBLE_EQ(queue.pop().time_ms, 14.0);
  EXPECT_TRUE(queue.empty());
}

TEST(EventQueueTest, PriorityBreaksTimeTies) {
  EventQueue queue;
  queue.push(2000.0, EventPriority::Input, Action{ReleaseAction{2}});
  queue.push(2000.0, EventPriority::Randomize, Action{RandomizeAction{}});
  queue.push(2000.0, EventPriority::Tick, Action{TickAction{}});
  queue.push(2000.0, EventPriority::EndOfChart, Action{EndOfChartAction{}});
  queue.push(2000.0, EventPriority::Spawn, Action{SpawnNotesAction{}});

  EXPECT_STREQ(nameOf(queue.pop()), "spawn");
  EXPECT_STREQ(nameOf(queue.pop()), "end_of_chart");
  EXPECT_STREQ(nameOf(queue.pop()), "tick");
  EXPECT_STREQ(nameOf(queue.pop()), "randomize");
  EXPECT_STREQ(nameOf(queue.pop()), "release");
}

TEST(EventQueueTest, InsertionOrderBreaksFullTies) {
  EventQueue queue;
  queue.push(50.0, EventPriority::Input, Action{PressAction{1}});
  queue.push(50.0, EventPriority::Input, PauseToggle{});
  queue.push(50.0, EventPriority::Input, Action{PressAction{3}});

  SessionEvent first = queue.pop();
  EXPECT_EQ(std::get<PressAction>(std::get<Action>(first.payload)).column, 1);
  EXPECT_STREQ(nameOf(queue.pop()), "pause");
  SessionEvent third = queue.pop();
  EXPECT_EQ(std::get<PressAction>(std::get<Action>(third.payload)).column, 3);
  EXPECT_LT(first.sequence, third.sequence);
}

TEST(EventQueueTest, ClearDropsEverything) {
  EventQueue queue;
  queue.push(1.0, EventPriority::Tick, Action{TickAction{}});
  queue.push(2.0, EventPriority::Tick, Action{TickAction{}});
  queue.clear();
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
}

}  // namespace
}  // namespace lanefall
