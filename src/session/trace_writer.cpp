/// @file
/// @brief TraceRecorder and trace JSON output.

#include "session/trace_writer.h"

#include "core/json_helpers.h"
#include "engine/projector.h"

namespace lanefall {

void TraceRecorder::onState(const SessionStep& step, const GameState& state) {
  bool is_tick = step.action == "tick";
  if (is_tick) ++tick_count_;
  if (is_tick && state.playable_notes.empty() && !state.game_end) return;

  TraceEntry entry;
  entry.time_ms = step.time_ms;
  entry.action = step.action;
  entry.score = state.score_gained;
  entry.combo = state.note_count;
  entry.bonus = state.bonus_active;
  entry.live_notes = state.current_notes.size();
  for (const auto& note : state.playable_notes) {
    entry.playable_ids.push_back(note.id);
  }
  entry.game_end = state.game_end;
  entries_.push_back(entry);
}

namespace {

void writeNote(JsonWriter& writer, const Note& note) {
  writer.beginObject();
  writer.key("id");
  writer.value(static_cast<int64_t>(note.id));
  writer.key("column");
  writer.value(note.column);
  writer.key("visual");
  writer.value(note.visual);
  writer.key("special");
  writer.value(note.special);
  writer.key("position");
  writer.value(note.position);
  writer.key("instrument");
  writer.value(note.instrument_name);
  writer.key("pitch");
  writer.value(note.pitch);
  if (note.hasTail()) {
    writer.key("tail");
    writer.beginObject();
    writer.key("start");
    writer.value(note.tail->tail_start);
    writer.key("end");
    writer.value(note.tail->tail_end);
    writer.key("dead");
    writer.value(note.tail->dead);
    writer.endObject();
  }
  writer.endObject();
}

}  // namespace

std::string buildTraceJson(const std::vector<TraceEntry>& entries, const GameState& final_state,
                           const GameConfig& config, uint32_t seed_used) {
  JsonWriter writer;
  writer.beginObject();

  writer.key("seed");
  writer.value(seed_used);
  writer.key("hard_mode");
  writer.value(config.hard_mode);
  writer.key("chart");
  writer.value(config.chart_path.empty() ? std::string("(default)") : config.chart_path);

  writer.key("steps");
  writer.beginArray();
  for (const auto& entry : entries) {
    writer.beginObject();
    writer.key("t");
    writer.value(entry.time_ms);
    writer.key("action");
    writer.value(entry.action);
    writer.key("score");
    writer.value(entry.score);
    writer.key("combo");
    writer.value(entry.combo);
    writer.key("bonus");
    writer.value(entry.bonus);
    writer.key("live");
    writer.value(static_cast<int64_t>(entry.live_notes));
    if (!entry.playable_ids.empty()) {
      writer.key("playable");
      writer.beginArray();
      for (NoteId id : entry.playable_ids) writer.value(static_cast<int64_t>(id));
      writer.endArray();
    }
    if (entry.game_end) {
      writer.key("game_end");
      writer.value(true);
    }
    writer.endObject();
  }
  writer.endArray();

  HudText hud = projectHud(final_state);
  writer.key("final");
  writer.beginObject();
  writer.key("game_end");
  writer.value(final_state.game_end);
  writer.key("score");
  writer.value(final_state.score_gained);
  writer.key("multiplier");
  writer.value(hud.multiplier);
  writer.key("bonus_multiplier");
  writer.value(hud.bonus_multiplier);
  writer.key("live_notes");
  writer.beginArray();
  for (const auto& note : final_state.current_notes) {
    writeNote(writer, note);
  }
  writer.endArray();
  writer.endObject();

  writer.endObject();
  return writer.toPrettyString();
}

}  // namespace lanefall
