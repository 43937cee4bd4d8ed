// GameState construction and lookup.

#include "engine/game_state.h"

#include "core/rng_util.h"

namespace lanefall {

GameState makeInitialState(uint32_t seed) {
  GameState state;
  state.hash = rng::hash(seed);
  return state;
}

const Note* findNote(const GameState& state, NoteId id) {
  for (const auto& note : state.current_notes) {
    if (note.id == id) {
      return &note;
    }
  }
  return nullptr;
}

}  // namespace lanefall
