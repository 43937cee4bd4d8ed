/// @file
/// @brief CLI entry point: replays a chart against recorded input headlessly.

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

#include "chart/chart_reader.h"
#include "chart/default_chart.h"
#include "core/basic_types.h"
#include "engine/projector.h"
#include "session/game_config.h"
#include "session/game_session.h"
#include "session/input_script.h"
#include "session/trace_writer.h"

namespace {

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("lanefall_cli - four-lane rhythm game simulator\n\n");
  std::printf("Usage: lanefall_cli [options]\n\n");
  std::printf("Options:\n");
  std::printf("  --config FILE    Load settings from a JSON file (flags override it)\n");
  std::printf("  --chart FILE     Chart CSV (default: built-in chart)\n");
  std::printf("  --inputs FILE    Input script: time_ms,press|release|pause[,column]\n");
  std::printf("  --seed N         Random seed (0 = auto)\n");
  std::printf("  --hard           Randomize lanes every 2 seconds\n");
  std::printf("  --offset MS      Chart time that maps to session start\n");
  std::printf("  --until MS       Stop the clock at MS (default 600000)\n");
  std::printf("  --json           Write a JSON trace\n");
  std::printf("  -o FILE          Trace output path (default trace.json)\n");
  std::printf("  --verbose        Log session events to stderr\n");
  std::printf("  --help           Show this help\n");
}

/// @brief Parse command-line arguments into a GameConfig.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param config Output structure populated with parsed values.
/// @param exit_code Set when the caller should exit immediately.
/// @return False if the program should exit (help or config error).
bool parseArgs(int argc, char* argv[], lanefall::GameConfig& config, int& exit_code) {
  // The config file is applied first so that flags override it regardless of order.
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--config") == 0 && idx + 1 < argc) {
      std::string error;
      if (!lanefall::loadGameConfig(argv[idx + 1], config, error)) {
        std::fprintf(stderr, "Error: %s\n", error.c_str());
        exit_code = 1;
        return false;
      }
    }
  }

  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--help") == 0 || std::strcmp(argv[idx], "-h") == 0) {
      printUsage();
      exit_code = 0;
      return false;
    }
    if (std::strcmp(argv[idx], "--config") == 0 && idx + 1 < argc) {
      ++idx;
    } else if (std::strcmp(argv[idx], "--chart") == 0 && idx + 1 < argc) {
      config.chart_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--inputs") == 0 && idx + 1 < argc) {
      config.input_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--seed") == 0 && idx + 1 < argc) {
      config.seed = static_cast<uint32_t>(std::strtoul(argv[++idx], nullptr, 10));
    } else if (std::strcmp(argv[idx], "--hard") == 0) {
      config.hard_mode = true;
    } else if (std::strcmp(argv[idx], "--offset") == 0 && idx + 1 < argc) {
      config.reference_start_ms = std::atof(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--until") == 0 && idx + 1 < argc) {
      config.max_time_ms = std::atof(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--json") == 0) {
      config.json_output = true;
    } else if (std::strcmp(argv[idx], "-o") == 0 && idx + 1 < argc) {
      config.output_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--verbose") == 0) {
      config.verbose = true;
    } else {
      std::fprintf(stderr, "Warning: ignoring argument %s\n", argv[idx]);
    }
  }
  return true;
}

/// @brief Load the configured chart, falling back to the built-in one.
std::vector<lanefall::Note> loadChart(const lanefall::GameConfig& config) {
  if (config.chart_path.empty()) {
    return lanefall::loadDefaultChart();
  }
  lanefall::ChartReader reader;
  if (!reader.read(config.chart_path)) {
    std::fprintf(stderr, "Warning: %s; using built-in chart\n", reader.getError().c_str());
    return lanefall::loadDefaultChart();
  }
  if (reader.skippedRows() > 0) {
    std::fprintf(stderr, "Warning: skipped %zu malformed chart rows\n", reader.skippedRows());
  }
  return reader.getNotes();
}

}  // namespace

int main(int argc, char* argv[]) {
  lanefall::GameConfig config;
  int exit_code = 0;
  if (!parseArgs(argc, argv, config, exit_code)) {
    return exit_code;
  }

  std::vector<lanefall::Note> chart = loadChart(config);

  std::vector<lanefall::InputEvent> inputs;
  if (!config.input_path.empty()) {
    lanefall::InputScriptReader script;
    if (!script.read(config.input_path)) {
      std::fprintf(stderr, "Error: %s\n", script.getError().c_str());
      return 1;
    }
    if (script.skippedLines() > 0) {
      std::fprintf(stderr, "Warning: skipped %zu malformed input lines\n",
                   script.skippedLines());
    }
    inputs = script.getEvents();
  }

  lanefall::SessionOptions options;
  options.seed = config.seed;
  options.hard_mode = config.hard_mode;
  options.reference_start_ms = config.reference_start_ms;
  options.verbose = config.verbose;

  lanefall::GameSession session(chart, options);
  lanefall::TraceRecorder recorder;
  session.addObserver([&recorder](const lanefall::SessionStep& step,
                                  const lanefall::GameState& state) {
    recorder.onState(step, state);
  });
  session.queueInputs(inputs);

  std::printf("lanefall_cli v0.1.0\n");
  std::printf("Chart:      %s (%zu notes)\n",
              config.chart_path.empty() ? "(built-in)" : config.chart_path.c_str(),
              chart.size());
  std::printf("Inputs:     %zu\n", inputs.size());
  std::printf("Mode:       %s\n", config.hard_mode ? "hard" : "normal");
  std::printf("Seed:       %u%s\n", session.seedUsed(), config.seed == 0 ? " (auto)" : "");
  std::printf("\n");

  bool ended = session.runToEnd(config.max_time_ms);
  const lanefall::GameState& final_state = session.state();
  lanefall::HudText hud = lanefall::projectHud(final_state);

  std::printf("Result:     %s at %.0f ms\n", ended ? "game over" : "stopped", session.now());
  std::printf("Score:      %s\n", hud.score.c_str());
  std::printf("Multiplier: %s (bonus %s)\n", hud.multiplier.c_str(),
              hud.bonus_multiplier.c_str());
  std::printf("Ticks:      %zu\n", recorder.tickCount());
  std::printf("Dropped:    %zu (paused)\n", session.droppedCount());

  if (config.json_output) {
    std::ofstream json_file(config.output_path);
    if (!json_file.is_open()) {
      std::fprintf(stderr, "Error: failed to write %s\n", config.output_path.c_str());
      return 1;
    }
    json_file << lanefall::buildTraceJson(recorder.entries(), final_state, config,
                                          session.seedUsed());
    std::printf("Trace:      %s\n", config.output_path.c_str());
  }

  return 0;
}
