// Immutable simulation snapshot passed between engine transitions.

#ifndef LANEFALL_ENGINE_GAME_STATE_H
#define LANEFALL_ENGINE_GAME_STATE_H

#include <cstdint>
#include <vector>

#include "core/basic_types.h"

namespace lanefall {

/// Seed used by the original game when no seed is configured.
constexpr uint32_t kDefaultSeed = 3847589;

/// @brief Complete engine state. Every action returns a new value.
struct GameState {
  bool game_end = false;
  bool all_notes_processed = false;  ///< Chart exhausted.
  int bonus_active = 0;              ///< Remaining bonus pool.
  int tick_interval = 0;             ///< Bonus decay cycle counter.
  uint32_t hash = 0;                 ///< PRNG seed.
  int note_count = 0;                ///< Combo counter.
  int score_gained = 0;
  int64_t synthetic_count = 0;       ///< Wrong-press notes issued so far.
  std::vector<Note> current_notes;   ///< Live notes.
  std::vector<Note> rip_notes;       ///< Live set before the last transition.
  std::vector<Note> playable_notes;  ///< Notes to sound for this step.
};

/// @brief Build a fresh Running state.
/// @param seed Raw seed; it is passed through rng::hash() once.
GameState makeInitialState(uint32_t seed = kDefaultSeed);

/// @brief Find a live note by id.
/// @return Pointer into state.current_notes, or nullptr.
const Note* findNote(const GameState& state, NoteId id);

}  // namespace lanefall

#endif  // LANEFALL_ENGINE_GAME_STATE_H
