#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "spiketune/common.hpp"

namespace spiketune::cli {

enum class Command { Extract, ExtractMoves, Run, Metrics, Avoidance, Regress, Spsa };

struct Options {
  Command command = Command::Extract;
  std::vector<std::string> inputs;  // transcripts / move logs

  // Extraction
  std::string outDir;
  int threshold = 250;
  int topK = 10;
  int backMin = 2;
  int backMax = 5;
  std::string side = "cand";

  // Files
  std::string targetsFile;
  std::string resultsFile;
  std::optional<std::string> outFile;
  std::optional<std::string> profilesFile;
  std::vector<std::string> profileNames;
  std::string configFile = "regression_scenarios.json";
  std::vector<std::string> scenarioNames;
  std::string paramsFile;
  std::optional<std::string> historyFile;

  // Engine / sessions
  std::string enginePath;
  int threads = 1;
  int hashMb = 256;
  int multipv = 1;
  std::optional<int> minThinkMs;
  int byoyomiMs = 2000;
  int graceMs = 5000;
  int handshakeMs = 10000;
  int jobs = 1;
  std::optional<std::string> logDir;
  bool progress = true;

  // Metrics
  int badThreshold = -600;
  int goodThreshold = -200;
  bool firstBad = false;
  std::optional<std::string> firstBadProfile;

  // SPSA
  int iterations = 10;
  double a0 = 1.0;
  std::optional<double> bigA;
  double alpha = 0.602;
  double c0 = 1.0;
  double gamma = 0.101;
  uint64_t seed = 0;
  bool monitor = false;
  bool parallelPair = false;
};

Options parse_args(int argc, char** argv, const DefaultPaths& defaults);

}  // namespace spiketune::cli
