// CSV chart reader. Turns chart rows into Note records for the scheduler.

#ifndef LANEFALL_CHART_CHART_READER_H
#define LANEFALL_CHART_CHART_READER_H

#include <cstddef>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace lanefall {

/// @brief Reads charts of the form `visual,instrument,velocity,pitch,start_s,end_s`.
///
/// Only rows whose first field is `True` or `False` are chart rows; anything
/// else (headers, blank lines) is ignored. Chart rows with unparseable numeric
/// fields are skipped and counted, so the scheduler only sees complete notes.
/// Accepted notes get ids 1, 2, ... in row order, column = pitch mod 4, and
/// times converted to milliseconds.
class ChartReader {
 public:
  ChartReader() = default;

  /// @brief Read and parse a chart file from disk.
  /// @param path File path to read.
  /// @return True on success. On failure, call getError() for details.
  bool read(const std::string& path);

  /// @brief Parse chart text already in memory.
  /// @param contents CSV text.
  /// @return True (malformed rows are skipped, not fatal).
  bool parse(const std::string& contents);

  /// @brief Notes from the last successful read or parse.
  const std::vector<Note>& getNotes() const { return notes_; }

  /// @brief Number of chart rows rejected by the last parse.
  size_t skippedRows() const { return skipped_rows_; }

  /// @brief Get the error message from the last failed read().
  const std::string& getError() const { return error_; }

 private:
  std::vector<Note> notes_;
  std::string error_;
  size_t skipped_rows_ = 0;

  /// Parse one split row. Returns false if a numeric field is malformed.
  bool parseRow(const std::vector<std::string>& fields, Note& note) const;
};

/// @brief Split a line on commas without trimming.
std::vector<std::string> splitCsvLine(const std::string& line);

/// @brief Parse a whole string as an integer.
/// @return False if the string is empty, has trailing garbage, or overflows int.
bool parseIntField(const std::string& text, int& out);

/// @brief Parse a whole string as a finite double.
/// @return False if the string is empty, has trailing garbage, or is nan/inf.
bool parseDoubleField(const std::string& text, double& out);

}  // namespace lanefall

#endif  // LANEFALL_CHART_CHART_READER_H
