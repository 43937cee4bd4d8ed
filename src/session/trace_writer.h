// Session trace recording and JSON serialization.

#ifndef LANEFALL_SESSION_TRACE_WRITER_H
#define LANEFALL_SESSION_TRACE_WRITER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "engine/game_state.h"
#include "session/game_config.h"
#include "session/game_session.h"

namespace lanefall {

/// @brief Summary of one produced state.
struct TraceEntry {
  TimeMs time_ms = 0.0;
  std::string action;
  int score = 0;
  int combo = 0;
  int bonus = 0;
  size_t live_notes = 0;
  std::vector<NoteId> playable_ids;
  bool game_end = false;
};

/// @brief Observer that keeps a compact trace of a session.
///
/// Ticks are only recorded when they sound a note or end the game; every
/// other action is always recorded.
class TraceRecorder {
 public:
  /// @brief Observer entry point (bind with GameSession::addObserver).
  void onState(const SessionStep& step, const GameState& state);

  const std::vector<TraceEntry>& entries() const { return entries_; }
  size_t tickCount() const { return tick_count_; }

 private:
  std::vector<TraceEntry> entries_;
  size_t tick_count_ = 0;
};

/// @brief Serialize a finished session as JSON.
/// @param entries Recorded trace.
/// @param final_state Last state of the session.
/// @param config Configuration used for the run.
/// @param seed_used Seed actually used (after auto selection).
std::string buildTraceJson(const std::vector<TraceEntry>& entries, const GameState& final_state,
                           const GameConfig& config, uint32_t seed_used);

}  // namespace lanefall

#endif  // LANEFALL_SESSION_TRACE_WRITER_H
