/// @file
/// @brief CSV chart reader implementation.

#include "chart/chart_reader.h"

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace lanefall {

namespace {

constexpr size_t kChartFieldCount = 6;
constexpr double kMsPerSecond = 1000.0;

std::string stripCarriageReturn(std::string line) {
  if (!line.empty() && line.back() == '\r') line.pop_back();
  return line;
}

}  // namespace

// ---------------------------------------------------------------------------
// Field helpers
// ---------------------------------------------------------------------------

std::vector<std::string> splitCsvLine(const std::string& line) {
  std::vector<std::string> fields;
  std::string field;
  std::istringstream stream(line);
  while (std::getline(stream, field, ',')) {
    fields.push_back(field);
  }
  if (!line.empty() && line.back() == ',') {
    fields.emplace_back();
  }
  return fields;
}

bool parseIntField(const std::string& text, int& out) {
  if (text.empty()) return false;
  char* end = nullptr;
  errno = 0;
  long val = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') return false;
  if (val < INT_MIN || val > INT_MAX) return false;
  out = static_cast<int>(val);
  return true;
}

bool parseDoubleField(const std::string& text, double& out) {
  if (text.empty()) return false;
  char* end = nullptr;
  errno = 0;
  double val = std::strtod(text.c_str(), &end);
  if (errno != 0 || end == text.c_str() || *end != '\0') return false;
  if (!std::isfinite(val)) return false;
  out = val;
  return true;
}

// ---------------------------------------------------------------------------
// ChartReader
// ---------------------------------------------------------------------------

bool ChartReader::read(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    notes_.clear();
    skipped_rows_ = 0;
    error_ = "Failed to open chart: " + path;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool ChartReader::parse(const std::string& contents) {
  notes_.clear();
  error_.clear();
  skipped_rows_ = 0;

  std::istringstream stream(contents);
  std::string line;
  while (std::getline(stream, line)) {
    std::vector<std::string> fields = splitCsvLine(stripCarriageReturn(line));
    if (fields.empty() || (fields[0] != "True" && fields[0] != "False")) {
      continue;
    }
    Note note;
    if (!parseRow(fields, note)) {
      ++skipped_rows_;
      continue;
    }
    note.id = static_cast<NoteId>(notes_.size() + 1);
    notes_.push_back(note);
  }
  return true;
}

bool ChartReader::parseRow(const std::vector<std::string>& fields, Note& note) const {
  if (fields.size() < kChartFieldCount) return false;

  int velocity = 0;
  int pitch = 0;
  double start_s = 0.0;
  double end_s = 0.0;
  if (!parseIntField(fields[2], velocity) || !parseIntField(fields[3], pitch) ||
      !parseDoubleField(fields[4], start_s) || !parseDoubleField(fields[5], end_s)) {
    return false;
  }

  note.visual = fields[0] == "True";
  note.instrument_name = fields[1];
  note.velocity = velocity;
  note.pitch = pitch;
  note.column = columnForPitch(pitch);
  note.position = 0;
  note.start_ms = start_s * kMsPerSecond;
  note.end_ms = end_s * kMsPerSecond;
  return true;
}

}  // namespace lanefall
