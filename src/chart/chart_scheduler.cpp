/// @file
/// @brief Chart batch grouping and relative pacing.

#include "chart/chart_scheduler.h"

#include <algorithm>
#include <map>
#include <utility>

namespace lanefall {

std::vector<NoteBatch> groupByStart(const std::vector<Note>& notes) {
  std::map<double, NoteBatch> by_start;
  for (const auto& note : notes) {
    by_start[note.start_ms].push_back(note);
  }
  std::vector<NoteBatch> groups;
  groups.reserve(by_start.size());
  for (auto& entry : by_start) {
    groups.push_back(std::move(entry.second));
  }
  return groups;
}

ChartScheduler::ChartScheduler(const std::vector<Note>& notes,
                               std::optional<TimeMs> reference_start_ms)
    : groups_(groupByStart(notes)), reference_start_ms_(reference_start_ms) {}

ScheduledBatch ChartScheduler::next() {
  ScheduledBatch batch;
  const NoteBatch& group = groups_[cursor_];
  batch.chart_start_ms = group.front().start_ms;

  if (cursor_ == 0) {
    batch.delay_ms = reference_start_ms_ ? batch.chart_start_ms - *reference_start_ms_ : 0.0;
  } else {
    batch.delay_ms = batch.chart_start_ms - groups_[cursor_ - 1].front().start_ms;
  }
  // A reference later than the first note cannot move emission into the past.
  batch.delay_ms = std::max(0.0, batch.delay_ms);
  batch.notes = group;
  ++cursor_;
  return batch;
}

std::vector<TimeMs> emissionTimes(const std::vector<Note>& notes,
                                  std::optional<TimeMs> reference_start_ms) {
  ChartScheduler scheduler(notes, reference_start_ms);
  std::vector<TimeMs> times;
  TimeMs clock = 0.0;
  while (scheduler.hasNext()) {
    clock += scheduler.next().delay_ms;
    times.push_back(clock);
  }
  times.push_back(clock);
  return times;
}

}  // namespace lanefall
