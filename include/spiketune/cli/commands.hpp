#pragma once
#include <vector>

#include "spiketune/cli/options.hpp"
#include "spiketune/runner/profile.hpp"
#include "spiketune/runner/target_runner.hpp"

namespace spiketune::cli {

// Runner settings derived from the session options.
runner::RunnerSettings runner_settings(const Options& opts);

// Profiles named by --profile from --profiles, or the single "base" profile.
std::vector<runner::ProfileConfig> resolve_profiles(const Options& opts);

// Each returns the process exit code.
int cmd_extract(const Options& opts);
int cmd_extract_moves(const Options& opts);
int cmd_run(const Options& opts);
int cmd_metrics(const Options& opts);
int cmd_avoidance(const Options& opts);
int cmd_regress(const Options& opts);
int cmd_spsa(const Options& opts);

int dispatch(const Options& opts);

}  // namespace spiketune::cli
