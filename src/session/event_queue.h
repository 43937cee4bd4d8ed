// Discrete-event queue ordering every session event on one timeline.

#ifndef LANEFALL_SESSION_EVENT_QUEUE_H
#define LANEFALL_SESSION_EVENT_QUEUE_H

#include <cstddef>
#include <cstdint>
#include <queue>
#include <variant>
#include <vector>

#include "core/basic_types.h"
#include "engine/actions.h"

namespace lanefall {

/// Tiebreak for events sharing a timestamp; lower runs first.
enum class EventPriority : uint8_t {
  Spawn = 0,
  EndOfChart = 1,
  Tick = 2,
  Randomize = 3,
  Input = 4
};

/// Pause key: flips the session between running and paused.
struct PauseToggle {};

using EventPayload = std::variant<Action, PauseToggle>;

/// @brief A payload due at a point on the session clock.
struct SessionEvent {
  TimeMs time_ms = 0.0;
  EventPriority priority = EventPriority::Input;
  uint64_t sequence = 0;  ///< Insertion order, last tiebreak.
  EventPayload payload;
};

/// @brief Min-queue on (time, priority, sequence).
///
/// Simultaneous events always come out in the same order, so a replay of the
/// same inputs reproduces the same state sequence.
class EventQueue {
 public:
  /// @brief Schedule a payload.
  void push(TimeMs time_ms, EventPriority priority, EventPayload payload);

  /// @brief Earliest event. Requires !empty().
  const SessionEvent& top() const { return queue_.top(); }

  /// @brief Remove and return the earliest event. Requires !empty().
  SessionEvent pop();

  bool empty() const { return queue_.empty(); }
  size_t size() const { return queue_.size(); }

  /// @brief Discard every pending event.
  void clear();

 private:
  struct Later {
    bool operator()(const SessionEvent& lhs, const SessionEvent& rhs) const {
      if (lhs.time_ms != rhs.time_ms) return lhs.time_ms > rhs.time_ms;
      if (lhs.priority != rhs.priority) return lhs.priority > rhs.priority;
      return lhs.sequence > rhs.sequence;
    }
  };

  std::priority_queue<SessionEvent, std::vector<SessionEvent>, Later> queue_;
  uint64_t next_sequence_ = 0;
};

}  // namespace lanefall

#endif  // LANEFALL_SESSION_EVENT_QUEUE_H
