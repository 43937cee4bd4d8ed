// Closed set of pure engine transitions.

#ifndef LANEFALL_ENGINE_ACTIONS_H
#define LANEFALL_ENGINE_ACTIONS_H

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "core/basic_types.h"
#include "engine/game_state.h"

namespace lanefall {

// ---------------------------------------------------------------------------
// Action payloads
// ---------------------------------------------------------------------------

/// Key down on a lane.
struct PressAction {
  int column = 0;
};

/// Key up on a lane.
struct ReleaseAction {
  int column = 0;
};

/// Fixed-rate clock step.
struct TickAction {};

/// A chart batch entering the playfield.
struct SpawnNotesAction {
  NoteBatch notes;
};

/// The chart has no more batches.
struct EndOfChartAction {};

/// Hard mode lane shuffle.
struct RandomizeAction {};

/// Every transition the reducer accepts.
using Action = std::variant<PressAction, ReleaseAction, TickAction, SpawnNotesAction,
                            EndOfChartAction, RandomizeAction>;

/// @brief Short name of the action held in the variant (for logs and traces).
const char* actionName(const Action& action);

// ---------------------------------------------------------------------------
// Transitions
// ---------------------------------------------------------------------------

/// Instruments a wrong press may sound with.
extern const std::vector<std::string> kWrongPressInstruments;

/// @brief True if the note can be hit by a press on the given column.
///
/// The note must be visual, in the column, and within
/// [kBottomRow - kPositionThreshold, kBottomRow).
bool isInHitWindow(const Note& note, int column);

/// @brief Build the synthetic note played for a press that hit nothing.
/// @param seed Seed to derive instrument, velocity, pitch and duration from.
/// @param column Lane that was pressed.
/// @param id Identifier for the synthetic note (negative).
Note makeWrongPressNote(uint32_t seed, int column, NoteId id);

/// @brief Consume every hittable note in the column and score it.
///
/// Special notes add kSpecialReward to both bonus pool and combo. Normal notes
/// add comboMultiplier(combo) to the score and one to the combo. A press that
/// matches nothing, on a lane without a held tail, emits a wrong-press note
/// and resets the combo to the bonus pool. The seed always advances.
GameState applyPress(const GameState& state, int column);

/// @brief Cut every held tail in the column, charging a penalty for each.
GameState applyRelease(const GameState& state, int column);

/// @brief One physics step plus the bonus decay cycle.
GameState applyTick(const GameState& state);

/// @brief Add a chart batch at position 0, then run one physics step.
GameState applySpawnNotes(const GameState& state, const NoteBatch& batch);

/// @brief Mark the chart exhausted, then run one physics step.
GameState applyEndOfChart(const GameState& state);

/// @brief Reassign the lane of every visual note from the seed.
GameState applyRandomize(const GameState& state);

}  // namespace lanefall

#endif  // LANEFALL_ENGINE_ACTIONS_H
