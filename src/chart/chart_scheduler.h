// Paces chart batches in real time using the gaps between start times.

#ifndef LANEFALL_CHART_CHART_SCHEDULER_H
#define LANEFALL_CHART_CHART_SCHEDULER_H

#include <cstddef>
#include <optional>
#include <vector>

#include "core/basic_types.h"

namespace lanefall {

/// @brief One batch of notes and when to emit it.
struct ScheduledBatch {
  TimeMs delay_ms = 0.0;        ///< Wait after the previous emission (or schedule start).
  TimeMs chart_start_ms = 0.0;  ///< Shared start time of the batch in the chart.
  NoteBatch notes;
};

/// @brief Group notes by identical start time, groups in ascending start order.
///
/// Order within a group follows the input order.
std::vector<NoteBatch> groupByStart(const std::vector<Note>& notes);

/// @brief Lazy source of spawn batches for one chart.
///
/// Only relative gaps are used, so the chart can be started at any offset
/// without reparsing. Batch 0 is due immediately, or `start[0] - reference`
/// after the schedule starts when a reference start is given. Batch i+1 is
/// due `start[i+1] - start[i]` after batch i. When hasNext() turns false the
/// chart is exhausted and end-of-chart is due at once.
class ChartScheduler {
 public:
  /// @param notes Chart notes (any order).
  /// @param reference_start_ms Chart time that corresponds to schedule start.
  explicit ChartScheduler(const std::vector<Note>& notes,
                          std::optional<TimeMs> reference_start_ms = std::nullopt);

  /// @brief True while batches remain.
  bool hasNext() const { return cursor_ < groups_.size(); }

  /// @brief Emit the next batch. Requires hasNext().
  ScheduledBatch next();

  /// @brief Restart from the first batch.
  void rewind() { cursor_ = 0; }

  /// @brief Total number of batches in the chart.
  size_t batchCount() const { return groups_.size(); }

 private:
  std::vector<NoteBatch> groups_;
  std::optional<TimeMs> reference_start_ms_;
  size_t cursor_ = 0;
};

/// @brief Absolute emission times of every batch, schedule start at 0.
/// The last element is the end-of-chart time (equal to the last batch time,
/// or the start time when the chart is empty).
std::vector<TimeMs> emissionTimes(const std::vector<Note>& notes,
                                  std::optional<TimeMs> reference_start_ms = std::nullopt);

}  // namespace lanefall

#endif  // LANEFALL_CHART_CHART_SCHEDULER_H
