/// @file
/// @brief Note motion and boundary classification.

#include "engine/physics.h"

#include <algorithm>

namespace lanefall {

namespace {

NoteStep keep(const Note& note) {
  NoteStep step;
  step.live = note;
  return step;
}

NoteStep playableOnly(const Note& note) {
  NoteStep step;
  step.playable = note;
  return step;
}

NoteStep keepAndPlay(const Note& note) {
  NoteStep step;
  step.live = note;
  step.playable = note;
  return step;
}

/// Head-only notes: a visual note at the row is a miss, a consumed one sounds.
NoteStep advancePlainNote(Note moved, int bottom_row) {
  if (moved.position < bottom_row) return keep(moved);
  if (moved.visual) return NoteStep{};
  if (moved.position == bottom_row) return playableOnly(moved);
  return NoteStep{};
}

NoteStep advanceSustainNote(Note moved, int increment, int bottom_row) {
  Tail tail = *moved.tail;
  tail.tail_start += increment;

  if (moved.visual) {
    tail.tail_end += increment;
    moved.tail = tail;
    if (moved.position >= bottom_row) {
      // Missed sustain: leave a falling remnant unless the body already collapsed.
      if (tail.tail_start < bottom_row) {
        moved.visual = false;
        moved.tail->dead = true;
        return keep(moved);
      }
      return NoteStep{};
    }
    if (tail.tail_start < bottom_row) return keep(moved);
    return NoteStep{};
  }

  tail.tail_end = static_cast<double>(bottom_row);
  moved.tail = tail;
  if (moved.position == bottom_row) return keepAndPlay(moved);
  if (tail.tail_start < bottom_row) return keep(moved);
  if (!tail.dead) {
    moved.tail->dead = true;
    return keep(moved);
  }
  return NoteStep{};
}

}  // namespace

NoteStep advanceNote(const Note& note, int increment, int bottom_row) {
  Note moved = note;
  moved.position += increment;
  if (!moved.hasTail()) {
    return advancePlainNote(moved, bottom_row);
  }
  return advanceSustainNote(moved, increment, bottom_row);
}

GameState stepPhysics(const GameState& state) {
  GameState next = state;
  next.current_notes.clear();
  next.playable_notes.clear();
  next.current_notes.reserve(state.current_notes.size());

  for (const auto& note : state.current_notes) {
    NoteStep step = advanceNote(note);
    if (step.live) next.current_notes.push_back(*step.live);
    if (step.playable) next.playable_notes.push_back(*step.playable);
  }

  bool about_to_miss = std::any_of(
      next.current_notes.begin(), next.current_notes.end(), [](const Note& note) {
        return note.visual && note.position + kTickUnitIncrement == kBottomRow;
      });
  if (about_to_miss) {
    next.note_count = state.bonus_active;
  }

  next.game_end = state.all_notes_processed && next.current_notes.empty() &&
                  next.playable_notes.empty() && state.current_notes.empty();
  next.rip_notes = state.current_notes;
  return next;
}

}  // namespace lanefall
