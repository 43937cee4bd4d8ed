/// @file
/// @brief GameSession event loop.

#include "session/game_session.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

#include "core/rng_util.h"
#include "engine/reducer.h"

namespace lanefall {

GameSession::GameSession(std::vector<Note> chart, const SessionOptions& options)
    : chart_(std::move(chart)),
      options_(options),
      scheduler_(chart_, options.reference_start_ms) {
  start(options.seed);
}

void GameSession::addObserver(StateObserver observer) {
  observers_.push_back(std::move(observer));
}

void GameSession::queueInput(const InputEvent& input) {
  if (ended_) return;
  if (!std::isfinite(input.time_ms)) {
    if (options_.verbose) {
      std::fprintf(stderr, "[session] ignoring input with non-finite time\n");
    }
    return;
  }
  TimeMs when = std::max(input.time_ms, now_);
  if (input.kind == InputKind::PauseToggle) {
    queue_.push(when, EventPriority::Input, PauseToggle{});
  } else if (input.kind == InputKind::Press) {
    queue_.push(when, EventPriority::Input, Action{PressAction{input.column}});
  } else {
    queue_.push(when, EventPriority::Input, Action{ReleaseAction{input.column}});
  }
}

void GameSession::queueInputs(const std::vector<InputEvent>& inputs) {
  for (const auto& input : inputs) {
    queueInput(input);
  }
}

TimeMs GameSession::runUntil(TimeMs limit_ms) {
  while (!ended_ && !queue_.empty() && queue_.top().time_ms <= limit_ms) {
    SessionEvent event = queue_.pop();
    now_ = event.time_ms;
    dispatch(event);
  }
  if (!ended_) {
    now_ = std::max(now_, limit_ms);
  }
  return now_;
}

bool GameSession::runToEnd(TimeMs limit_ms) {
  runUntil(limit_ms);
  return ended_;
}

void GameSession::reset(uint32_t seed) {
  GameState cleanup = state_;
  cleanup.rip_notes = state_.current_notes;
  cleanup.current_notes.clear();
  cleanup.playable_notes.clear();
  notify(SessionStep{now_, "reset"}, cleanup);

  queue_.clear();
  scheduler_.rewind();
  now_ = 0.0;
  paused_ = false;
  ended_ = false;
  applied_count_ = 0;
  dropped_count_ = 0;
  start(seed);
}

// ---------------------------------------------------------------------------
// Private
// ---------------------------------------------------------------------------

void GameSession::start(uint32_t seed) {
  seed_used_ = seed != 0 ? seed : rng::generateRandomSeed();
  state_ = makeInitialState(seed_used_);

  scheduleNextChartEvent(0.0);
  queue_.push(kTickRateMs, EventPriority::Tick, Action{TickAction{}});
  if (options_.hard_mode) {
    queue_.push(kRandomizeIntervalMs, EventPriority::Randomize, Action{RandomizeAction{}});
  }

  if (options_.verbose) {
    std::fprintf(stderr, "[session] start: seed=%u batches=%zu hard=%d\n", seed_used_,
                 scheduler_.batchCount(), options_.hard_mode ? 1 : 0);
  }
}

void GameSession::scheduleNextChartEvent(TimeMs after_ms) {
  if (scheduler_.hasNext()) {
    ScheduledBatch batch = scheduler_.next();
    queue_.push(after_ms + batch.delay_ms, EventPriority::Spawn,
                Action{SpawnNotesAction{std::move(batch.notes)}});
  } else {
    queue_.push(after_ms, EventPriority::EndOfChart, Action{EndOfChartAction{}});
  }
}

void GameSession::dispatch(const SessionEvent& event) {
  if (std::holds_alternative<PauseToggle>(event.payload)) {
    paused_ = !paused_;
    if (options_.verbose) {
      std::fprintf(stderr, "[session] %.0fms: %s\n", now_, paused_ ? "paused" : "resumed");
    }
    return;
  }

  const Action& action = std::get<Action>(event.payload);

  // Recurring sources reschedule themselves whether or not this firing is dropped.
  bool droppable = true;
  switch (event.priority) {
    case EventPriority::Spawn:
      scheduleNextChartEvent(now_);
      break;
    case EventPriority::EndOfChart:
      droppable = false;
      break;
    case EventPriority::Tick:
      queue_.push(now_ + kTickRateMs, EventPriority::Tick, Action{TickAction{}});
      break;
    case EventPriority::Randomize:
      queue_.push(now_ + kRandomizeIntervalMs, EventPriority::Randomize,
                  Action{RandomizeAction{}});
      break;
    case EventPriority::Input:
      break;
  }

  if (paused_ && droppable) {
    ++dropped_count_;
    return;
  }
  apply(action);
}

void GameSession::apply(const Action& action) {
  state_ = reduce(state_, action);
  ++applied_count_;
  notify(SessionStep{now_, actionName(action)}, state_);

  if (state_.game_end) {
    ended_ = true;
    queue_.clear();
    if (options_.verbose) {
      std::fprintf(stderr, "[session] %.0fms: game end, score=%d\n", now_, state_.score_gained);
    }
  }
}

void GameSession::notify(const SessionStep& step, const GameState& state) {
  for (const auto& observer : observers_) {
    observer(step, state);
  }
}

}  // namespace lanefall
