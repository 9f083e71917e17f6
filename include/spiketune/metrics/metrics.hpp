#pragma once
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "spiketune/types.hpp"

namespace spiketune::metrics {

inline constexpr int kDefaultBadThresholdCp = -600;
inline constexpr int kDefaultGoodThresholdCp = -200;

struct MetricsReport {
  int total = 0;
  int valid = 0;     // results with a score
  int badCount = 0;  // valid results with score <= threshold
  std::optional<double> spikeRatePercent;  // null iff valid == 0
  std::optional<double> avgCp;
  std::optional<double> avgDepth;
};

MetricsReport aggregate(const std::vector<EvalResult>& results, int badThreshold);

// Results of one profile only.
std::vector<EvalResult> filter_profile(const std::vector<EvalResult>& results, const std::string& profile);

// Identifies the game decision a target was rewound from.
struct OriginKey {
  std::string log;
  std::optional<int> gameIndex;
  int ply = 0;

  friend bool operator<(const OriginKey& a, const OriginKey& b) {
    if (a.log != b.log) return a.log < b.log;
    if (a.gameIndex != b.gameIndex) return a.gameIndex < b.gameIndex;
    return a.ply < b.ply;
  }
};

OriginKey origin_of(const Target& t);

struct FirstBad {
  Target target;
  EvalResult result;
};

// Per origin: targets by increasing rewind depth, first whose score under `profile`
// is <= badThreshold. Origins without such a target contribute nothing.
std::vector<FirstBad> select_first_bad(const std::vector<Target>& targets,
                                       const std::vector<EvalResult>& results, const std::string& profile,
                                       int badThreshold);

std::vector<EvalResult> results_of(const std::vector<FirstBad>& rows);

struct AvoidanceReport {
  int firstBadTotal = 0;
  int avoidCount = 0;  // evaluated bestmove differs from the move originally played
  int avoidAndGoodCount = 0;
  std::optional<double> avoidRatePercent;
  std::optional<double> avoidAndGoodRatePercent;
};

// `evaluated` supplies the bestmove/score to judge; usually results of a second profile.
AvoidanceReport compute_avoidance(const std::vector<FirstBad>& firstBad,
                                  const std::vector<EvalResult>& evaluated, const std::string& profile,
                                  int goodThreshold);

nlohmann::json to_json(const MetricsReport& r);
nlohmann::json to_json(const AvoidanceReport& r);

}  // namespace spiketune::metrics
