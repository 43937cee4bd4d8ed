// Per-tick note motion and boundary classification.

#ifndef LANEFALL_ENGINE_PHYSICS_H
#define LANEFALL_ENGINE_PHYSICS_H

#include <optional>

#include "core/basic_types.h"
#include "engine/game_state.h"

namespace lanefall {

/// @brief Outcome of advancing a single note by one step.
///
/// `live` holds the note if it stays in the live set; `playable` holds it if
/// its audio should be triggered on this step. Both empty means the note
/// leaves the simulation.
struct NoteStep {
  std::optional<Note> live;
  std::optional<Note> playable;
};

/// @brief Advance one note and classify it against the bottom row.
///
/// Decision table (B = bottom_row, evaluated after the move):
///
///   visual  tail  condition                    result
///   yes     no    position < B                 keep
///   yes     no    position >= B                drop (miss)
///   no      no    position < B                 keep
///   no      no    position == B                playable, leaves live set
///   no      no    position > B                 drop
///   yes     yes   head < B                     keep, tail_end follows head
///   yes     yes   head >= B, tail_start < B    keep as non-visual dead remnant
///   yes     yes   head >= B, tail_start >= B   drop
///   no      yes   position == B                keep and playable
///   no      yes   tail_start < B               keep, tail_end pinned at B
///   no      yes   tail_start >= B, alive       keep once more with dead = true
///   no      yes   tail_start >= B, dead        drop
///
/// @param note Note to advance.
/// @param increment Position delta per step.
/// @param bottom_row Judgment row.
/// @return Classification for this step.
NoteStep advanceNote(const Note& note, int increment = kTickUnitIncrement,
                     int bottom_row = kBottomRow);

/// @brief Run one physics step over every live note.
///
/// Rebuilds current_notes and playable_notes, moves the previous live set
/// into rip_notes, resets the combo to the bonus pool when a visual note is
/// one step away from being missed, and recomputes game_end.
GameState stepPhysics(const GameState& state);

}  // namespace lanefall

#endif  // LANEFALL_ENGINE_PHYSICS_H
