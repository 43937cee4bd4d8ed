// EventQueue implementation.

#include "session/event_queue.h"

#include <utility>

namespace lanefall {

void EventQueue::push(TimeMs time_ms, EventPriority priority, EventPayload payload) {
  SessionEvent event;
  event.time_ms = time_ms;
  event.priority = priority;
  event.sequence = next_sequence_++;
  event.payload = std::move(payload);
  queue_.push(std::move(event));
}

SessionEvent EventQueue::pop() {
  SessionEvent event = queue_.top();
  queue_.pop();
  return event;
}

void EventQueue::clear() {
  queue_ = decltype(queue_)();
}

}  // namespace lanefall
