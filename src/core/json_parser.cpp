// Implementation of minimal flat-object JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cstdlib>
#include <limits>

namespace lanefall {

int JsonValue::asInt(int default_val) const {
  if (type == Number && number_val >= std::numeric_limits<int>::min() &&
      number_val <= std::numeric_limits<int>::max()) {
    return static_cast<int>(number_val);
  }
  return default_val;
}

uint32_t JsonValue::asUint(uint32_t default_val) const {
  if (type == Number && number_val >= 0.0 &&
      number_val <= static_cast<double>(std::numeric_limits<uint32_t>::max())) {
    return static_cast<uint32_t>(number_val);
  }
  return default_val;
}

double JsonValue::asDouble(double default_val) const {
  if (type == Number) return number_val;
  return default_val;
}

bool JsonValue::asBool(bool default_val) const {
  if (type == Bool) return bool_val;
  return default_val;
}

std::string JsonValue::asString(const std::string& default_val) const {
  if (type == String) return string_val;
  return default_val;
}

namespace {

/// Read position over the JSON text.
struct Cursor {
  const std::string& text;
  size_t pos = 0;

  bool atEnd() const { return pos >= text.size(); }
  char peek() const { return atEnd() ? '\0' : text[pos]; }

  void skipWhitespace() {
    while (!atEnd() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
  }

  bool consumeLiteral(const char* literal) {
    size_t start = pos;
    for (const char* chr = literal; *chr != '\0'; ++chr, ++pos) {
      if (atEnd() || text[pos] != *chr) {
        pos = start;
        return false;
      }
    }
    return true;
  }
};

/// @brief Parse a string literal (cursor at opening quote).
bool parseString(Cursor& cur, std::string& out) {
  if (cur.peek() != '"') return false;
  ++cur.pos;
  out.clear();
  while (!cur.atEnd() && cur.peek() != '"') {
    char chr = cur.text[cur.pos];
    if (chr == '\\' && cur.pos + 1 < cur.text.size()) {
      ++cur.pos;
      switch (cur.text[cur.pos]) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        default:  out += cur.text[cur.pos]; break;
      }
    } else {
      out += chr;
    }
    ++cur.pos;
  }
  if (cur.atEnd()) return false;
  ++cur.pos;  // closing quote
  return true;
}

bool parseNumber(Cursor& cur, double& out) {
  const char* begin = cur.text.c_str() + cur.pos;
  char* end = nullptr;
  out = std::strtod(begin, &end);
  if (end == begin) return false;
  cur.pos += static_cast<size_t>(end - begin);
  return true;
}

/// @brief Skip a nested object or array, honouring strings.
bool skipContainer(Cursor& cur) {
  int depth = 0;
  std::string ignored;
  while (!cur.atEnd()) {
    char chr = cur.peek();
    if (chr == '"') {
      if (!parseString(cur, ignored)) return false;
      continue;
    }
    if (chr == '{' || chr == '[') ++depth;
    if (chr == '}' || chr == ']') --depth;
    ++cur.pos;
    if (depth == 0) return true;
  }
  return false;
}

bool parseValue(Cursor& cur, JsonValue& val, bool& skipped) {
  skipped = false;
  char chr = cur.peek();
  if (chr == '"') {
    val.type = JsonValue::String;
    return parseString(cur, val.string_val);
  }
  if (chr == '{' || chr == '[') {
    skipped = true;
    return skipContainer(cur);
  }
  if (cur.consumeLiteral("true")) {
    val.type = JsonValue::Bool;
    val.bool_val = true;
    return true;
  }
  if (cur.consumeLiteral("false")) {
    val.type = JsonValue::Bool;
    val.bool_val = false;
    return true;
  }
  if (cur.consumeLiteral("null")) {
    val.type = JsonValue::Null;
    return true;
  }
  val.type = JsonValue::Number;
  return parseNumber(cur, val.number_val);
}

}  // namespace

bool parseJsonObject(const std::string& json, JsonObject& out, std::string& error) {
  out.clear();
  error.clear();
  Cursor cur{json};

  cur.skipWhitespace();
  if (cur.peek() != '{') {
    error = "expected '{' at offset " + std::to_string(cur.pos);
    return false;
  }
  ++cur.pos;

  bool first = true;
  while (true) {
    cur.skipWhitespace();
    if (cur.atEnd()) {
      error = "unterminated object";
      return false;
    }
    if (cur.peek() == '}') {
      ++cur.pos;
      return true;
    }
    if (!first) {
      if (cur.peek() != ',') {
        error = "expected ',' at offset " + std::to_string(cur.pos);
        return false;
      }
      ++cur.pos;
      cur.skipWhitespace();
    }
    first = false;

    std::string key;
    if (!parseString(cur, key)) {
      error = "expected key string at offset " + std::to_string(cur.pos);
      return false;
    }
    cur.skipWhitespace();
    if (cur.peek() != ':') {
      error = "expected ':' after key \"" + key + "\"";
      return false;
    }
    ++cur.pos;
    cur.skipWhitespace();

    JsonValue val;
    bool skipped = false;
    if (!parseValue(cur, val, skipped)) {
      error = "invalid value for key \"" + key + "\"";
      return false;
    }
    if (!skipped) out[key] = val;
  }
}

}  // namespace lanefall
