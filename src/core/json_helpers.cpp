/// @file
/// @brief Token-stream JSON writer used for session traces.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>
#include <sstream>
#include <utility>

namespace lanefall {

void JsonWriter::beginObject() { push(Token::Open, "{"); }
void JsonWriter::endObject() { push(Token::Close, "}"); }
void JsonWriter::beginArray() { push(Token::Open, "["); }
void JsonWriter::endArray() { push(Token::Close, "]"); }

void JsonWriter::key(std::string_view name) { push(Token::Key, "\"" + escape(name) + "\""); }

void JsonWriter::value(std::string_view val) { push(Token::Scalar, "\"" + escape(val) + "\""); }
void JsonWriter::value(int val) { push(Token::Scalar, std::to_string(val)); }
void JsonWriter::value(int64_t val) { push(Token::Scalar, std::to_string(val)); }
void JsonWriter::value(uint32_t val) { push(Token::Scalar, std::to_string(val)); }
void JsonWriter::value(bool val) { push(Token::Scalar, val ? "true" : "false"); }
void JsonWriter::valueNull() { push(Token::Scalar, "null"); }

void JsonWriter::value(double val) {
  if (!std::isfinite(val)) {
    valueNull();
    return;
  }
  std::ostringstream oss;
  oss << val;
  push(Token::Scalar, oss.str());
}

std::string JsonWriter::toPrettyString(int indent_size) const {
  return render(indent_size < 0 ? 0 : indent_size);
}

void JsonWriter::push(Token::Kind kind, std::string text) {
  tokens_.push_back(Token{kind, std::move(text)});
}

std::string JsonWriter::render(int indent_size) const {
  const bool pretty = indent_size >= 0;
  std::string out;
  int depth = 0;
  bool after_key = false;
  // Per open container: whether an element has been written.
  std::vector<bool> has_element;

  auto breakLine = [&](int level) {
    if (!pretty) return;
    out += '\n';
    out.append(static_cast<size_t>(level * indent_size), ' ');
  };

  for (size_t idx = 0; idx < tokens_.size(); ++idx) {
    const Token& token = tokens_[idx];

    if (token.kind == Token::Close) {
      --depth;
      bool had_element = !has_element.empty() && has_element.back();
      if (!has_element.empty()) has_element.pop_back();
      if (had_element) breakLine(depth);
      out += token.text;
      continue;
    }

    // A value directly after its key shares the key's line.
    if (!after_key && !has_element.empty()) {
      if (has_element.back()) out += ',';
      has_element.back() = true;
      breakLine(depth);
    }
    after_key = false;
    out += token.text;

    if (token.kind == Token::Key) {
      out += pretty ? ": " : ":";
      after_key = true;
    } else if (token.kind == Token::Open) {
      ++depth;
      has_element.push_back(false);
    }
  }
  return out;
}

std::string JsonWriter::escape(std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (char chr : input) {
    if (chr == '"' || chr == '\\') {
      result += '\\';
      result += chr;
    } else if (chr == '\n') {
      result += "\\n";
    } else if (chr == '\r') {
      result += "\\r";
    } else if (chr == '\t') {
      result += "\\t";
    } else if (static_cast<unsigned char>(chr) < 0x20) {
      char hex_buf[8];
      std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x", static_cast<unsigned>(chr));
      result += hex_buf;
    } else {
      result += chr;
    }
  }
  return result;
}

}  // namespace lanefall
