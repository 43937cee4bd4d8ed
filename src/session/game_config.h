// Run configuration for the session driver and CLI.

#ifndef LANEFALL_SESSION_GAME_CONFIG_H
#define LANEFALL_SESSION_GAME_CONFIG_H

#include <cstdint>
#include <optional>
#include <string>

#include "core/basic_types.h"

namespace lanefall {

/// @brief Unified configuration for one game run.
struct GameConfig {
  uint32_t seed = 0;        ///< 0 = auto (random).
  bool hard_mode = false;   ///< Periodic lane randomization.
  std::optional<TimeMs> reference_start_ms;  ///< Chart time mapped to session start.
  std::string chart_path;   ///< Empty = built-in chart.
  std::string input_path;   ///< Empty = no player input.
  std::string output_path = "trace.json";
  bool json_output = false;
  bool verbose = false;
  TimeMs max_time_ms = 600000.0;  ///< Hard stop for the session clock.
};

/// @brief Apply keys from a flat JSON object onto a config.
///
/// Recognized keys: seed, hard_mode, reference_start_ms, chart, inputs,
/// output, json, verbose, max_time_ms. Unknown keys are ignored; missing keys
/// keep their current value.
///
/// @param json JSON text.
/// @param config Config to update in place.
/// @param error Receives the parse error on failure.
/// @return False if the JSON is malformed.
bool applyConfigJson(const std::string& json, GameConfig& config, std::string& error);

/// @brief Load a JSON config file onto a config.
/// @return False if the file cannot be read or is malformed.
bool loadGameConfig(const std::string& path, GameConfig& config, std::string& error);

}  // namespace lanefall

#endif  // LANEFALL_SESSION_GAME_CONFIG_H
