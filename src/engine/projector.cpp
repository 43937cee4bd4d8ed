/// @file
/// @brief Render and audio projection of GameState.

#include "engine/projector.h"

#include <cstdio>

namespace lanefall {

namespace {

constexpr double kMaxMidiVelocity = 127.0;

std::string formatFixed1(double value, const char* suffix) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%s", value, suffix);
  return buf;
}

NoteSprite tailSprite(const Note& note) {
  NoteSprite sprite;
  sprite.id = note.id;
  sprite.kind = SpriteKind::Tail;
  sprite.column = note.column;
  sprite.y = note.tail->tail_start;
  sprite.height = note.tail->tail_end - note.tail->tail_start;
  sprite.greyed = !note.visual && note.tail->dead;
  return sprite;
}

}  // namespace

const char* laneColorName(int column) {
  switch (column) {
    case 0: return "green";
    case 1: return "red";
    case 2: return "blue";
    case 3: return "yellow";
  }
  return "grey";
}

const char* audioCommandTypeToString(AudioCommandType type) {
  switch (type) {
    case AudioCommandType::Attack:        return "attack";
    case AudioCommandType::AttackRelease: return "attack_release";
    case AudioCommandType::Release:       return "release";
  }
  return "unknown";
}

std::vector<NoteSprite> projectSprites(const GameState& state) {
  std::vector<NoteSprite> sprites;
  for (const auto& note : state.current_notes) {
    if (note.visual) {
      if (note.hasTail()) sprites.push_back(tailSprite(note));
      NoteSprite head;
      head.id = note.id;
      head.kind = note.special ? SpriteKind::SpecialHead : SpriteKind::Head;
      head.column = note.column;
      head.y = note.position;
      sprites.push_back(head);
    } else if (note.hasTail()) {
      // A played sustain keeps its head on the judgment row.
      sprites.push_back(tailSprite(note));
      NoteSprite head;
      head.id = note.id;
      head.column = note.column;
      head.y = kBottomRow;
      head.greyed = note.tail->dead;
      sprites.push_back(head);
    }
  }
  return sprites;
}

std::vector<AudioCommand> projectAudio(const GameState& state) {
  std::vector<AudioCommand> commands;
  for (const auto& note : state.playable_notes) {
    AudioCommand cmd;
    cmd.type = note.hasTail() ? AudioCommandType::Attack : AudioCommandType::AttackRelease;
    cmd.id = note.id;
    cmd.instrument = note.instrument_name;
    cmd.pitch = note.pitch;
    cmd.velocity = note.velocity / kMaxMidiVelocity;
    cmd.duration_ms = note.durationMs();
    commands.push_back(cmd);
  }
  for (const auto& note : state.current_notes) {
    if (note.visual || !note.hasTail() || !note.tail->dead) continue;
    AudioCommand cmd;
    cmd.type = AudioCommandType::Release;
    cmd.id = note.id;
    cmd.instrument = note.instrument_name;
    cmd.pitch = note.pitch;
    commands.push_back(cmd);
  }
  return commands;
}

HudText projectHud(const GameState& state) {
  HudText hud;
  hud.score = std::to_string(state.score_gained);
  hud.multiplier = formatFixed1(comboMultiplier(state.note_count), "x");
  hud.bonus_multiplier = formatFixed1(comboMultiplier(state.bonus_active), "x");
  if (state.bonus_active > 0) {
    double remaining_ms =
        static_cast<double>(kBonusDecayTicks - state.tick_interval) * kTickRateMs;
    hud.decay_time = formatFixed1(remaining_ms / 1000.0, "s");
  } else {
    hud.decay_time = "0s";
  }
  return hud;
}

Frame project(const GameState& state) {
  Frame frame;
  frame.removed_ids.reserve(state.rip_notes.size());
  for (const auto& note : state.rip_notes) {
    frame.removed_ids.push_back(note.id);
  }
  frame.sprites = projectSprites(state);
  frame.audio = projectAudio(state);
  frame.hud = projectHud(state);
  frame.game_over = state.game_end;
  return frame;
}

}  // namespace lanefall
