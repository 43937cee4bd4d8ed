// Single-threaded driver merging chart, clock and player input.

#ifndef LANEFALL_SESSION_GAME_SESSION_H
#define LANEFALL_SESSION_GAME_SESSION_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "chart/chart_scheduler.h"
#include "core/basic_types.h"
#include "engine/game_state.h"
#include "session/event_queue.h"
#include "session/input_script.h"

namespace lanefall {

/// @brief Options fixed for the lifetime of a session.
struct SessionOptions {
  uint32_t seed = 0;  ///< 0 = auto (random).
  bool hard_mode = false;
  std::optional<TimeMs> reference_start_ms;
  bool verbose = false;
};

/// @brief What produced a state, passed to observers along with it.
struct SessionStep {
  TimeMs time_ms = 0.0;
  std::string action;  ///< actionName(), or "reset" for the cleanup state.
};

using StateObserver = std::function<void(const SessionStep&, const GameState&)>;

/// @brief Drives one chart through the reducer on a simulated clock.
///
/// Events are drained from an EventQueue in (time, priority, sequence) order:
/// chart spawns come from a ChartScheduler one batch at a time, ticks repeat
/// every kTickRateMs from kTickRateMs, hard mode adds a randomize every
/// kRandomizeIntervalMs, and player input is queued by the caller.
///
/// While paused, every event except the pause toggle and end-of-chart is
/// dropped; the clock keeps running, so nothing piles up for resume. Once a
/// state reports game_end the queue is discarded and the session is inert
/// until reset().
class GameSession {
 public:
  GameSession(std::vector<Note> chart, const SessionOptions& options);

  /// @brief Register a callback invoked with every produced state.
  void addObserver(StateObserver observer);

  /// @brief Queue one player input. Inputs in the past run at the current time.
  void queueInput(const InputEvent& input);

  /// @brief Queue several inputs.
  void queueInputs(const std::vector<InputEvent>& inputs);

  /// @brief Process every event due at or before limit_ms.
  /// @return Session clock after processing.
  TimeMs runUntil(TimeMs limit_ms);

  /// @brief Run until the game ends or the clock passes limit_ms.
  /// @return True if the game ended.
  bool runToEnd(TimeMs limit_ms);

  /// @brief Start over with a fresh state and a fresh chart schedule.
  ///
  /// Observers first receive a cleanup state whose rip_notes are the notes
  /// still live in the abandoned run. Pending events, including queued
  /// inputs, are discarded.
  ///
  /// @param seed New seed; 0 draws a random one.
  void reset(uint32_t seed = 0);

  const GameState& state() const { return state_; }
  TimeMs now() const { return now_; }
  bool isEnded() const { return ended_; }
  bool isPaused() const { return paused_; }
  uint32_t seedUsed() const { return seed_used_; }
  size_t appliedCount() const { return applied_count_; }
  size_t droppedCount() const { return dropped_count_; }

 private:
  void start(uint32_t seed);
  void scheduleNextChartEvent(TimeMs after_ms);
  void dispatch(const SessionEvent& event);
  void apply(const Action& action);
  void notify(const SessionStep& step, const GameState& state);

  std::vector<Note> chart_;
  SessionOptions options_;
  ChartScheduler scheduler_;
  EventQueue queue_;
  GameState state_;
  std::vector<StateObserver> observers_;
  TimeMs now_ = 0.0;
  bool paused_ = false;
  bool ended_ = false;
  uint32_t seed_used_ = 0;
  size_t applied_count_ = 0;
  size_t dropped_count_ = 0;
};

}  // namespace lanefall

#endif  // LANEFALL_SESSION_GAME_SESSION_H
