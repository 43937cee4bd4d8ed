// Recorded player input: timestamped press, release and pause events.

#ifndef LANEFALL_SESSION_INPUT_SCRIPT_H
#define LANEFALL_SESSION_INPUT_SCRIPT_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace lanefall {

enum class InputKind : uint8_t {
  Press,
  Release,
  PauseToggle
};

/// @brief Convert InputKind to its script keyword.
const char* inputKindToString(InputKind kind);

/// One external input on the session clock.
struct InputEvent {
  TimeMs time_ms = 0.0;
  InputKind kind = InputKind::Press;
  int column = 0;  ///< Unused for PauseToggle.
};

/// @brief Reads input scripts: one `time_ms,kind[,column]` per line.
///
/// kind is `press`, `release` or `pause`. Blank lines and lines starting with
/// '#' are ignored. Lines with a bad time, unknown kind or a column outside
/// 0-3 are skipped and counted. Events come back sorted by time, file order
/// breaking ties.
class InputScriptReader {
 public:
  InputScriptReader() = default;

  /// @brief Read and parse a script file.
  /// @return True on success. On failure, call getError() for details.
  bool read(const std::string& path);

  /// @brief Parse script text already in memory.
  /// @return True (bad lines are skipped, not fatal).
  bool parse(const std::string& contents);

  const std::vector<InputEvent>& getEvents() const { return events_; }
  size_t skippedLines() const { return skipped_lines_; }
  const std::string& getError() const { return error_; }

 private:
  std::vector<InputEvent> events_;
  std::string error_;
  size_t skipped_lines_ = 0;
};

}  // namespace lanefall

#endif  // LANEFALL_SESSION_INPUT_SCRIPT_H
