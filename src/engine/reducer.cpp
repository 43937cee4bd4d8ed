// Reducer over the Action variant.

#include "engine/reducer.h"

namespace lanefall {

namespace {

/// Visitor binding one state to the per-action transitions.
struct ActionApplier {
  const GameState& state;

  GameState operator()(const PressAction& action) const {
    return applyPress(state, action.column);
  }
  GameState operator()(const ReleaseAction& action) const {
    return applyRelease(state, action.column);
  }
  GameState operator()(const TickAction&) const { return applyTick(state); }
  GameState operator()(const SpawnNotesAction& action) const {
    return applySpawnNotes(state, action.notes);
  }
  GameState operator()(const EndOfChartAction&) const { return applyEndOfChart(state); }
  GameState operator()(const RandomizeAction&) const { return applyRandomize(state); }
};

}  // namespace

GameState reduce(const GameState& state, const Action& action) {
  if (state.game_end) {
    return state;
  }
  return std::visit(ActionApplier{state}, action);
}

std::vector<GameState> reduceAll(const GameState& initial, const std::vector<Action>& actions) {
  std::vector<GameState> states;
  states.reserve(actions.size());
  GameState current = initial;
  for (const auto& action : actions) {
    current = reduce(current, action);
    states.push_back(current);
  }
  return states;
}

}  // namespace lanefall
