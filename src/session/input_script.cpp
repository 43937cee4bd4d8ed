/// @file
/// @brief Input script parsing.

#include "session/input_script.h"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "chart/chart_reader.h"

namespace lanefall {

namespace {

std::string trim(const std::string& text) {
  const char* whitespace = " \t\r";
  size_t first = text.find_first_not_of(whitespace);
  if (first == std::string::npos) return "";
  size_t last = text.find_last_not_of(whitespace);
  return text.substr(first, last - first + 1);
}

bool parseKind(const std::string& text, InputKind& kind) {
  if (text == "press") {
    kind = InputKind::Press;
  } else if (text == "release") {
    kind = InputKind::Release;
  } else if (text == "pause") {
    kind = InputKind::PauseToggle;
  } else {
    return false;
  }
  return true;
}

bool parseLine(const std::string& line, InputEvent& event) {
  std::vector<std::string> fields = splitCsvLine(line);
  for (auto& field : fields) field = trim(field);
  if (fields.size() < 2) return false;

  if (!parseDoubleField(fields[0], event.time_ms) || event.time_ms < 0.0) return false;
  if (!parseKind(fields[1], event.kind)) return false;
  if (event.kind == InputKind::PauseToggle) return true;

  if (fields.size() < 3 || !parseIntField(fields[2], event.column)) return false;
  return event.column >= 0 && event.column < kNumColumns;
}

}  // namespace

const char* inputKindToString(InputKind kind) {
  switch (kind) {
    case InputKind::Press:       return "press";
    case InputKind::Release:     return "release";
    case InputKind::PauseToggle: return "pause";
  }
  return "unknown";
}

bool InputScriptReader::read(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    events_.clear();
    skipped_lines_ = 0;
    error_ = "Failed to open input script: " + path;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool InputScriptReader::parse(const std::string& contents) {
  events_.clear();
  error_.clear();
  skipped_lines_ = 0;

  std::istringstream stream(contents);
  std::string line;
  while (std::getline(stream, line)) {
    std::string text = trim(line);
    if (text.empty() || text[0] == '#') continue;
    InputEvent event;
    if (!parseLine(text, event)) {
      ++skipped_lines_;
      continue;
    }
    events_.push_back(event);
  }

  std::stable_sort(events_.begin(), events_.end(),
                   [](const InputEvent& lhs, const InputEvent& rhs) {
                     return lhs.time_ms < rhs.time_ms;
                   });
  return true;
}

}  // namespace lanefall
