// Pure projection of engine state onto render and audio commands.

#ifndef LANEFALL_ENGINE_PROJECTOR_H
#define LANEFALL_ENGINE_PROJECTOR_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "engine/game_state.h"

namespace lanefall {

/// Shape a renderer should draw for a note.
enum class SpriteKind : uint8_t {
  Head,         ///< Round note head.
  SpecialHead,  ///< Star-shaped bonus note.
  Tail          ///< Sustain body rectangle.
};

/// @brief One drawable element. Tails span [y, y + height).
struct NoteSprite {
  NoteId id = 0;
  SpriteKind kind = SpriteKind::Head;
  int column = 0;
  double y = 0.0;
  double height = 0.0;
  bool greyed = false;  ///< Dead sustain.
};

/// Audio operations for the sample player.
enum class AudioCommandType : uint8_t {
  Attack,         ///< Start a held note; release after duration_ms.
  AttackRelease,  ///< One-shot of duration_ms.
  Release         ///< Stop a held note now.
};

struct AudioCommand {
  AudioCommandType type = AudioCommandType::AttackRelease;
  NoteId id = 0;
  std::string instrument;
  int pitch = 0;
  double velocity = 0.0;  ///< Normalized to [0, 1].
  double duration_ms = 0.0;
};

/// Text fields of the heads-up display.
struct HudText {
  std::string score;
  std::string multiplier;
  std::string bonus_multiplier;
  std::string decay_time;
};

/// @brief Everything external collaborators need for one state update.
struct Frame {
  std::vector<NoteId> removed_ids;  ///< Clear these before drawing sprites.
  std::vector<NoteSprite> sprites;
  std::vector<AudioCommand> audio;
  HudText hud;
  bool game_over = false;
};

/// @brief Lane colour name used for sprite fills ("green", "red", "blue", "yellow").
const char* laneColorName(int column);

/// @brief Convert AudioCommandType to string.
const char* audioCommandTypeToString(AudioCommandType type);

/// @brief Sprites for all live notes.
std::vector<NoteSprite> projectSprites(const GameState& state);

/// @brief Audio for playable notes plus releases for dead held tails.
std::vector<AudioCommand> projectAudio(const GameState& state);

/// @brief HUD strings (score, multipliers, bonus countdown).
HudText projectHud(const GameState& state);

/// @brief Full projection of one state.
Frame project(const GameState& state);

}  // namespace lanefall

#endif  // LANEFALL_ENGINE_PROJECTOR_H
