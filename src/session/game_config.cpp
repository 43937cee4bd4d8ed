// GameConfig JSON loading.

#include "session/game_config.h"

#include <fstream>
#include <sstream>

#include "core/json_parser.h"

namespace lanefall {

bool applyConfigJson(const std::string& json, GameConfig& config, std::string& error) {
  JsonObject obj;
  if (!parseJsonObject(json, obj, error)) {
    return false;
  }

  auto find = [&obj](const char* name) -> const JsonValue* {
    auto iter = obj.find(name);
    return iter == obj.end() ? nullptr : &iter->second;
  };

  if (const JsonValue* val = find("seed")) config.seed = val->asUint(config.seed);
  if (const JsonValue* val = find("hard_mode")) config.hard_mode = val->asBool(config.hard_mode);
  if (const JsonValue* val = find("reference_start_ms")) {
    if (val->type == JsonValue::Number) {
      config.reference_start_ms = val->number_val;
    } else if (val->type == JsonValue::Null) {
      config.reference_start_ms.reset();
    }
  }
  if (const JsonValue* val = find("chart")) config.chart_path = val->asString(config.chart_path);
  if (const JsonValue* val = find("inputs")) config.input_path = val->asString(config.input_path);
  if (const JsonValue* val = find("output")) config.output_path = val->asString(config.output_path);
  if (const JsonValue* val = find("json")) config.json_output = val->asBool(config.json_output);
  if (const JsonValue* val = find("verbose")) config.verbose = val->asBool(config.verbose);
  if (const JsonValue* val = find("max_time_ms")) {
    config.max_time_ms = val->asDouble(config.max_time_ms);
  }
  return true;
}

bool loadGameConfig(const std::string& path, GameConfig& config, std::string& error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "Failed to open config: " + path;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (!applyConfigJson(buffer.str(), config, error)) {
    error = path + ": " + error;
    return false;
  }
  return true;
}

}  // namespace lanefall
