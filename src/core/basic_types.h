// Basic types for the lanefall simulation engine

#ifndef LANEFALL_CORE_BASIC_TYPES_H
#define LANEFALL_CORE_BASIC_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanefall {

/// Note identifier. Chart notes are numbered from 1; synthetic notes are negative.
using NoteId = int64_t;

/// Wall-clock time on the session timeline, in milliseconds.
using TimeMs = double;

// ---------------------------------------------------------------------------
// Engine constants
// ---------------------------------------------------------------------------

/// Fixed tick period of the simulation clock.
constexpr int kTickRateMs = 7;

/// Vertical distance a note travels per tick.
constexpr int kTickUnitIncrement = 1;

/// Row at which notes are judged or expire.
constexpr int kBottomRow = 350;

/// Hit window extends this far above the bottom row.
constexpr int kPositionThreshold = 40;

/// Number of lanes.
constexpr int kNumColumns = 4;

/// Visual notes longer than this become sustain notes.
constexpr double kSustainThresholdMs = 1000.0;

/// Roll threshold (out of 100) at or above which a note is special (10%).
constexpr int kBonusNotesPercentage = 90;

/// Bonus pool and combo credit granted by a special note.
constexpr int kSpecialReward = 100;

/// Amount drained from bonus pool and combo at each decay step.
constexpr int kBonusDecayAmount = 50;

/// Length of one bonus decay cycle.
constexpr int kBonusDecayMs = 2000;

/// Number of ticks in one bonus decay cycle (285 at 7ms).
constexpr int kBonusDecayTicks = kBonusDecayMs / kTickRateMs;

/// Period of lane randomization in hard mode.
constexpr int kRandomizeIntervalMs = 2000;

// ---------------------------------------------------------------------------
// Lanes
// ---------------------------------------------------------------------------

/// Lane identifiers, left to right.
enum class Column : uint8_t {
  Green = 0,
  Red = 1,
  Blue = 2,
  Yellow = 3
};

/// @brief Convert Column to human-readable string.
const char* columnToString(Column column);

/// @brief Map a MIDI pitch onto a lane (pitch mod 4).
inline int columnForPitch(int pitch) {
  int col = pitch % kNumColumns;
  return col < 0 ? col + kNumColumns : col;
}

/// @brief Score multiplier for a combo (or bonus pool) value: 1 + 0.2 * floor(count / 10).
double comboMultiplier(int count);

// ---------------------------------------------------------------------------
// Notes
// ---------------------------------------------------------------------------

/// Extent of a sustain note's body. Both edges move with the head while the
/// note is unplayed; once played, tail_end is pinned to the bottom row.
struct Tail {
  double tail_start = 0.0;
  double tail_end = 0.0;
  bool dead = false;  ///< Released early or expired. Never clears.

  bool operator==(const Tail& other) const {
    return tail_start == other.tail_start && tail_end == other.tail_end &&
           dead == other.dead;
  }
  bool operator!=(const Tail& other) const { return !(*this == other); }
};

/// A single chart event travelling down a lane.
struct Note {
  NoteId id = 0;
  int column = 0;
  bool visual = true;    ///< Oncoming and unplayed. Only goes true -> false.
  bool special = false;  ///< Bonus note.
  int position = 0;
  std::string instrument_name;
  int velocity = 0;
  int pitch = 0;
  double start_ms = 0.0;
  double end_ms = 0.0;
  std::optional<Tail> tail;

  /// @brief Chart duration in milliseconds.
  double durationMs() const { return end_ms - start_ms; }

  /// @brief True when the note has a sustain body.
  bool hasTail() const { return tail.has_value(); }
};

/// A group of notes sharing one chart start time.
using NoteBatch = std::vector<Note>;

}  // namespace lanefall

#endif  // LANEFALL_CORE_BASIC_TYPES_H
