// Implementation of lane names and multiplier arithmetic.

#include "core/basic_types.h"

#include <cmath>

namespace lanefall {

const char* columnToString(Column column) {
  switch (column) {
    case Column::Green:  return "Green";
    case Column::Red:    return "Red";
    case Column::Blue:   return "Blue";
    case Column::Yellow: return "Yellow";
  }
  return "Unknown";
}

double comboMultiplier(int count) {
  return 1.0 + 0.2 * std::floor(static_cast<double>(count) / 10.0);
}

}  // namespace lanefall
