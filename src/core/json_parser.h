// Minimal flat-object JSON parser for config input (no external dependencies).
//
// Handles only the subset needed for GameConfig: a flat object with string,
// number, boolean and null values. Nested objects and arrays are skipped.

#ifndef LANEFALL_CORE_JSON_PARSER_H
#define LANEFALL_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace lanefall {

/// @brief A single JSON value (string, number, or boolean).
struct JsonValue {
  enum Type { String, Number, Bool, Null };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;

  int asInt(int default_val = 0) const;
  uint32_t asUint(uint32_t default_val = 0) const;
  double asDouble(double default_val = 0.0) const;
  bool asBool(bool default_val = false) const;
  std::string asString(const std::string& default_val = "") const;
};

using JsonObject = std::map<std::string, JsonValue>;

/// @brief Parse a flat JSON object into a key-value map.
///
/// @param json JSON text.
/// @param out Receives the top-level keys. Cleared first.
/// @param error Receives a description of the first syntax error.
/// @return False on malformed input.
bool parseJsonObject(const std::string& json, JsonObject& out, std::string& error);

}  // namespace lanefall

#endif  // LANEFALL_CORE_JSON_PARSER_H
