// Exhaustive dispatch of actions onto the engine state.

#ifndef LANEFALL_ENGINE_REDUCER_H
#define LANEFALL_ENGINE_REDUCER_H

#include <vector>

#include "engine/actions.h"
#include "engine/game_state.h"

namespace lanefall {

/// @brief Apply one action to a state.
///
/// Once game_end is set the state is terminal and every action returns it
/// unchanged.
///
/// @param state Current state.
/// @param action Action to apply.
/// @return Successor state.
GameState reduce(const GameState& state, const Action& action);

/// @brief Fold a sequence of actions over an initial state.
/// @return Every intermediate state, in order (excluding the initial one).
std::vector<GameState> reduceAll(const GameState& initial, const std::vector<Action>& actions);

}  // namespace lanefall

#endif  // LANEFALL_ENGINE_REDUCER_H
