// Built-in chart used when no chart file can be read.

#ifndef LANEFALL_CHART_DEFAULT_CHART_H
#define LANEFALL_CHART_DEFAULT_CHART_H

#include <vector>

#include "core/basic_types.h"

namespace lanefall {

/// @brief CSV text of the built-in chart (same format ChartReader accepts).
const char* defaultChartCsv();

/// @brief Parsed notes of the built-in chart.
std::vector<Note> loadDefaultChart();

}  // namespace lanefall

#endif  // LANEFALL_CHART_DEFAULT_CHART_H
