#pragma once
#include <iosfwd>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "spiketune/runner/profile.hpp"
#include "spiketune/runner/target_runner.hpp"

namespace spiketune::regression {

struct PrefixGuard {
  int number = 0;
  std::vector<std::string> allowedMoves;  // empty: any move
  std::optional<int> minCp;
  std::optional<int> maxCp;
};

struct Scenario {
  std::string name;
  std::string log;           // transcript whose last position line is replayed
  std::vector<int> prefixes;  // move counts to keep from that position
  int threads = 8;
  int multipv = 1;
  int byoyomiMs = 10000;
  std::optional<std::string> engine;
  std::optional<std::string> outDir;
  std::optional<int> scoreCpMin;
  std::optional<int> scoreCpMax;
  std::optional<int> seldepthMax;
  std::vector<PrefixGuard> guards;

  std::string resolved_out_dir() const { return outDir ? *outDir : "runs/regressions/" + name; }
};

// Throws ConfigError when the file is missing or holds no usable scenario.
std::vector<Scenario> load_scenarios(const std::string& path);

// Keeps declaration order; throws ConfigError listing any unknown name.
std::vector<Scenario> select_scenarios(const std::vector<Scenario>& all, const std::vector<std::string>& names);

// Search depth and score stay empty when the summary has no usable last_info line.
struct PrefixResult {
  std::string bestmove;
  int depth = 0;
  std::optional<int> seldepth;
  std::optional<int> scoreCp;
};

// A scenario-level failure with its reason; never aborts the suite.
class RegressionFailure : public std::runtime_error {
 public:
  explicit RegressionFailure(const std::string& what) : std::runtime_error(what) {}
};

// Reads "pre-N: bestmove=<mv>" and "pre-N: last_info=<info line>" lines. Throws
// RegressionFailure when a prefix has info but no bestmove.
std::map<int, PrefixResult> parse_summary(const std::vector<std::string>& lines);

// First violated bound, if any. Global bounds are checked per declared prefix, then guards.
// A declared bound on a prefix that reported no score (or seldepth) is a violation.
std::optional<std::string> check_bounds(const Scenario& s, const std::map<int, PrefixResult>& results);

// Produces the summary lines for one scenario.
class PrefixReplayer {
 public:
  virtual ~PrefixReplayer() = default;
  virtual std::vector<std::string> replay(const Scenario& s) = 0;
};

// Replays each prefix in a fresh engine session and writes <out_dir>/summary.txt.
class EngineReplayer : public PrefixReplayer {
 public:
  EngineReplayer(runner::RunnerSettings base, runner::ProfileConfig profile);

  std::vector<std::string> replay(const Scenario& s) override;

 private:
  runner::RunnerSettings base_;
  runner::ProfileConfig profile_;
};

enum class ScenarioState { Pending, Replayed, Parsed, Checked, Pass, Fail };

const char* to_string(ScenarioState s) noexcept;

struct ScenarioOutcome {
  std::string name;
  ScenarioState state = ScenarioState::Pending;
  std::string reason;
  int prefixCount = 0;
};

class RegressionSuite {
 public:
  RegressionSuite(std::vector<Scenario> scenarios, PrefixReplayer& replayer);

  // ConfigError propagates; every other failure is confined to the scenario.
  ScenarioOutcome run_one(const Scenario& s);

  // Runs all scenarios, prints progress and the failure list. Returns 1 if any failed.
  int run(std::ostream& out);

  const std::vector<ScenarioOutcome>& outcomes() const noexcept { return outcomes_; }

 private:
  std::vector<Scenario> scenarios_;
  PrefixReplayer& replayer_;
  std::vector<ScenarioOutcome> outcomes_;
};

}  // namespace spiketune::regression
