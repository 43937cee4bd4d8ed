/// @file
/// @brief Press, release, tick, spawn, end-of-chart and randomize transitions.

#include "engine/actions.h"

#include <algorithm>

#include "core/rng_util.h"
#include "engine/physics.h"

namespace lanefall {

const std::vector<std::string> kWrongPressInstruments = {
    "piano", "violin", "flute", "saxophone", "trumpet", "bass-electric"};

namespace {

/// Upper bounds for the random parameters of a wrong-press note.
constexpr int kWrongPressMaxVelocity = 90;
constexpr int kWrongPressMaxPitch = 70;
constexpr int kWrongPressMaxDurationMs = 500;

/// Start a transition: the previous live set becomes the removal report and
/// no audio is pending.
GameState beginTransition(const GameState& state) {
  GameState next = state;
  next.rip_notes = state.current_notes;
  next.playable_notes.clear();
  return next;
}

}  // namespace

namespace {

/// Visitor naming each action alternative.
struct ActionNamer {
  const char* operator()(const PressAction&) const { return "press"; }
  const char* operator()(const ReleaseAction&) const { return "release"; }
  const char* operator()(const TickAction&) const { return "tick"; }
  const char* operator()(const SpawnNotesAction&) const { return "spawn"; }
  const char* operator()(const EndOfChartAction&) const { return "end_of_chart"; }
  const char* operator()(const RandomizeAction&) const { return "randomize"; }
};

}  // namespace

const char* actionName(const Action& action) { return std::visit(ActionNamer{}, action); }

bool isInHitWindow(const Note& note, int column) {
  return note.visual && note.column == column &&
         note.position >= kBottomRow - kPositionThreshold && note.position < kBottomRow;
}

Note makeWrongPressNote(uint32_t seed, int column, NoteId id) {
  Note note;
  note.id = id;
  note.column = column;
  note.visual = false;
  note.position = kBottomRow;
  note.instrument_name = kWrongPressInstruments[static_cast<size_t>(rng::scaleToInt(
      rng::seedFor(seed, 0), static_cast<int>(kWrongPressInstruments.size())))];
  note.velocity = rng::scaleToInt(rng::seedFor(seed, 1), kWrongPressMaxVelocity);
  note.pitch = rng::scaleToInt(rng::seedFor(seed, 2), kWrongPressMaxPitch);
  note.start_ms = 0.0;
  note.end_ms = rng::scaleToInt(rng::seedFor(seed, 3), kWrongPressMaxDurationMs);
  return note;
}

// ---------------------------------------------------------------------------
// Player input
// ---------------------------------------------------------------------------

GameState applyPress(const GameState& state, int column) {
  GameState next = beginTransition(state);

  bool triggered = false;
  double score = state.score_gained;
  int combo = state.note_count;
  int bonus = state.bonus_active;

  for (auto& note : next.current_notes) {
    if (!isInHitWindow(note, column)) continue;
    triggered = true;
    if (note.special) {
      bonus += kSpecialReward;
      combo += kSpecialReward;
    } else {
      score += comboMultiplier(combo);
      combo += 1;
    }
    note.visual = false;
  }

  // Holding a lane for rapid play must not count as a wrong press while a
  // sustain is sounding there.
  bool lane_holds_tail = std::any_of(
      next.current_notes.begin(), next.current_notes.end(), [column](const Note& note) {
        return note.column == column && !note.visual && note.hasTail();
      });
  bool wrong_press = !triggered && !lane_holds_tail;

  next.bonus_active = bonus;
  next.note_count = wrong_press ? state.bonus_active : combo;
  next.score_gained = static_cast<int>(score);
  if (wrong_press) {
    ++next.synthetic_count;
    next.playable_notes.push_back(makeWrongPressNote(state.hash, column, -next.synthetic_count));
  }
  next.hash = rng::hash(state.hash);
  return next;
}

GameState applyRelease(const GameState& state, int column) {
  GameState next = beginTransition(state);

  double score = state.score_gained;
  bool cut = false;
  for (auto& note : next.current_notes) {
    if (!note.hasTail() || note.column != column || note.visual || note.tail->dead) {
      continue;
    }
    score -= comboMultiplier(state.note_count);
    note.tail->dead = true;
    cut = true;
  }

  next.score_gained = static_cast<int>(score);
  if (cut) {
    next.note_count = state.bonus_active;
  }
  return next;
}

// ---------------------------------------------------------------------------
// Clock and chart
// ---------------------------------------------------------------------------

GameState applyTick(const GameState& state) {
  bool on_cycle_boundary =
      state.tick_interval != 0 && state.tick_interval % kBonusDecayTicks == 0;
  bool decay = state.bonus_active > 0 && on_cycle_boundary;

  GameState next = stepPhysics(state);
  next.tick_interval =
      (state.bonus_active > 0 && !on_cycle_boundary) ? state.tick_interval + 1 : 0;
  if (decay) {
    next.bonus_active = state.bonus_active - kBonusDecayAmount;
    next.note_count -= kBonusDecayAmount;
  }
  return next;
}

GameState applySpawnNotes(const GameState& state, const NoteBatch& batch) {
  GameState staged = state;
  staged.current_notes.reserve(state.current_notes.size() + batch.size());

  for (size_t idx = 0; idx < batch.size(); ++idx) {
    Note note = batch[idx];
    note.position = 0;
    double duration = note.durationMs();
    if (note.visual && duration > kSustainThresholdMs) {
      double tail_length = duration / kTickRateMs;
      note.tail = Tail{note.position - tail_length, static_cast<double>(note.position), false};
      note.special = false;
    } else {
      int roll = rng::scaleToInt(rng::seedFor(state.hash, idx), 100);
      note.special = roll >= kBonusNotesPercentage;
      note.tail.reset();
    }
    staged.current_notes.push_back(note);
  }

  staged.hash = rng::hash(state.hash);
  return stepPhysics(staged);
}

GameState applyEndOfChart(const GameState& state) {
  GameState staged = state;
  staged.all_notes_processed = true;
  return stepPhysics(staged);
}

GameState applyRandomize(const GameState& state) {
  GameState next = beginTransition(state);
  for (size_t idx = 0; idx < next.current_notes.size(); ++idx) {
    Note& note = next.current_notes[idx];
    if (note.visual) {
      note.column = rng::scaleToInt(rng::seedFor(state.hash, idx), kNumColumns);
    }
  }
  next.hash = rng::hash(state.hash);
  return next;
}

}  // namespace lanefall
