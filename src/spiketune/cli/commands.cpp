#include "spiketune/cli/commands.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "spiketune/analysis/move_log.hpp"
#include "spiketune/analysis/target_generator.hpp"
#include "spiketune/errors.hpp"
#include "spiketune/io/batch_io.hpp"
#include "spiketune/metrics/metrics.hpp"
#include "spiketune/regression/regression_suite.hpp"
#include "spiketune/tuning/param_vector.hpp"
#include "spiketune/tuning/spsa.hpp"

namespace spiketune::cli {

namespace fs = std::filesystem;
using nlohmann::json;

runner::RunnerSettings runner_settings(const Options& opts) {
  runner::RunnerSettings s;
  s.enginePath = opts.enginePath;
  s.threads = opts.threads;
  s.hashMb = opts.hashMb;
  s.multipv = opts.multipv;
  s.minThinkMs = opts.minThinkMs;
  s.byoyomiMs = opts.byoyomiMs;
  s.handshakeTimeout = std::chrono::milliseconds(opts.handshakeMs);
  s.readyTimeout = std::chrono::milliseconds(opts.handshakeMs);
  s.decisionGrace = std::chrono::milliseconds(opts.graceMs);
  s.logDir = opts.logDir;
  return s;
}

std::vector<runner::ProfileConfig> resolve_profiles(const Options& opts) {
  if (opts.profilesFile) {
    auto all = runner::load_profiles(*opts.profilesFile);
    if (opts.profileNames.empty()) return all;
    return runner::select_profiles(all, opts.profileNames);
  }
  if (opts.profileNames.empty()) return {runner::base_profile()};
  if (opts.profileNames.size() == 1 && opts.profileNames.front() == "base") return {runner::base_profile()};
  throw ConfigError("--profile other than 'base' needs --profiles <file>");
}

static analysis::ExtractSettings extract_settings(const Options& opts) {
  analysis::ExtractSettings s;
  s.threshold = opts.threshold;
  s.topK = opts.topK;
  s.back = {opts.backMin, opts.backMax};
  return s;
}

static void write_extract_outputs(const Options& opts, const std::vector<Target>& targets,
                                  std::vector<std::string>& summary) {
  summary.push_back("unique_targets=" + std::to_string(targets.size()));
  const fs::path dir(opts.outDir);
  io::write_targets((dir / "targets.json").string(), targets);
  io::write_lines((dir / "summary.txt").string(), summary);
  for (const auto& line : summary) std::cout << line << "\n";
  std::cout << "Targets written to " << (dir / "targets.json").string() << "\n";
}

int cmd_extract(const Options& opts) {
  const auto settings = extract_settings(opts);
  analysis::DedupContext ctx;
  std::vector<Target> targets;
  std::vector<std::string> summary;

  for (const auto& path : opts.inputs) {
    std::vector<std::string> lines;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || !io::read_lines(path, lines)) {
      summary.push_back("SKIP(not found): " + path);
      continue;
    }
    analysis::SpikeOrigin origin;
    origin.originLog = path;
    origin.tagStem = fs::path(path).stem().string();

    analysis::ExtractSummary s;
    auto produced = analysis::extract_from_transcript(ctx, origin, lines, settings, &s);
    if (!s.hasDecisions) {
      summary.push_back("SKIP(no bestmove): " + path);
      continue;
    }
    summary.push_back(fs::path(path).filename().string() + ": plies=" + std::to_string(s.plies) +
                      " spikes=" + std::to_string(s.spikes) + " (threshold=" + std::to_string(opts.threshold) +
                      ")");
    targets.insert(targets.end(), std::make_move_iterator(produced.begin()),
                   std::make_move_iterator(produced.end()));
  }

  write_extract_outputs(opts, targets, summary);
  return 0;
}

int cmd_extract_moves(const Options& opts) {
  const auto settings = extract_settings(opts);
  const auto filter = analysis::parse_side_filter(opts.side);
  if (!filter) throw ConfigError("invalid --side: " + opts.side);

  analysis::MoveGames games;
  std::vector<std::string> summary;
  for (const auto& path : opts.inputs) {
    if (!analysis::read_move_log(path, *filter, games)) summary.push_back("SKIP(not found): " + path);
  }

  analysis::DedupContext ctx;
  std::vector<Target> targets;
  for (auto& [key, records] : games) {
    analysis::GameSummary gs;
    auto produced = analysis::extract_from_game(ctx, key.first, key.second, records, settings, &gs);
    summary.push_back(key.first + ": game=" + std::to_string(key.second) + " moves=" + std::to_string(gs.moves) +
                      " spikes=" + std::to_string(gs.spikes) + " (threshold=" + std::to_string(opts.threshold) +
                      ")");
    targets.insert(targets.end(), std::make_move_iterator(produced.begin()),
                   std::make_move_iterator(produced.end()));
  }

  write_extract_outputs(opts, targets, summary);
  return 0;
}

static std::string format_rate(const std::optional<double>& v) {
  if (!v) return "null";
  std::ostringstream os;
  os << std::fixed << std::setprecision(2) << *v << "%";
  return os.str();
}

int cmd_run(const Options& opts) {
  const auto profiles = resolve_profiles(opts);
  const auto targets = io::read_targets(opts.targetsFile);
  if (targets.empty()) {
    std::cerr << "[runner] no targets in " << opts.targetsFile << "\n";
    return 0;
  }

  std::cout << "[runner] engine=" << opts.enginePath << " targets=" << targets.size()
            << " profiles=" << profiles.size() << " byoyomi=" << opts.byoyomiMs << "ms jobs=" << opts.jobs << "\n";

  runner::TargetRunner batchRunner(runner_settings(opts));
  const auto fresh = batchRunner.run_batch(targets, profiles, opts.jobs, opts.progress);

  const auto merged = io::merge_results(io::read_results_if_exists(opts.resultsFile), fresh);
  io::write_results(opts.resultsFile, merged);

  for (const auto& p : profiles) {
    const auto r = metrics::aggregate(metrics::filter_profile(fresh, p.name), opts.badThreshold);
    std::cout << "[runner] profile=" << p.name << " valid=" << r.valid << "/" << r.total << " bad=" << r.badCount
              << " spike_rate=" << format_rate(r.spikeRatePercent) << "\n";
  }
  std::cout << "Results written to " << opts.resultsFile << "\n";
  return 0;
}

// Profiles in first-appearance order.
static std::vector<std::string> profiles_in(const std::vector<EvalResult>& results) {
  std::vector<std::string> names;
  for (const auto& r : results)
    if (std::find(names.begin(), names.end(), r.profile) == names.end()) names.push_back(r.profile);
  return names;
}

static void emit_report(const Options& opts, const json& report) {
  std::cout << report.dump(2) << "\n";
  if (opts.outFile) {
    io::write_json_file(*opts.outFile, report);
    std::cout << "Report written to " << *opts.outFile << "\n";
  }
}

static const json kNoFirstBad = {{"error", "no_first_bad"}};

int cmd_metrics(const Options& opts) {
  const auto results = io::read_results(opts.resultsFile);
  std::vector<Target> targets;
  if (opts.firstBad) targets = io::read_targets(opts.targetsFile);

  auto report_for = [&](const std::optional<std::string>& profile) -> json {
    if (opts.firstBad) {
      const auto rows =
          metrics::select_first_bad(targets, results, profile.value_or(""), opts.badThreshold);
      if (rows.empty()) return kNoFirstBad;
      json j = metrics::to_json(metrics::aggregate(metrics::results_of(rows), opts.badThreshold));
      j["first_bad"] = true;
      return j;
    }
    const auto subset = profile ? metrics::filter_profile(results, *profile) : results;
    return metrics::to_json(metrics::aggregate(subset, opts.badThreshold));
  };

  std::vector<std::string> profiles = opts.profileNames;
  if (profiles.empty()) profiles = profiles_in(results);

  if (profiles.size() == 1) {
    emit_report(opts, report_for(profiles.front()));
  } else if (profiles.empty()) {
    emit_report(opts, report_for(std::nullopt));
  } else {
    json all = json::object();
    for (const auto& p : profiles) all[p] = report_for(p);
    emit_report(opts, all);
  }
  return 0;
}

int cmd_avoidance(const Options& opts) {
  const std::string& profile = opts.profileNames.front();
  const std::string firstBadProfile = opts.firstBadProfile.value_or(profile);

  const auto targets = io::read_targets(opts.targetsFile);
  const auto results = io::read_results(opts.resultsFile);
  const auto rows = metrics::select_first_bad(targets, results, firstBadProfile, opts.badThreshold);
  if (rows.empty()) {
    emit_report(opts, kNoFirstBad);
    return 0;
  }
  json j = metrics::to_json(metrics::compute_avoidance(rows, results, profile, opts.goodThreshold));
  j["profile"] = profile;
  j["first_bad_profile"] = firstBadProfile;
  emit_report(opts, j);
  return 0;
}

int cmd_regress(const Options& opts) {
  const auto scenarios =
      regression::select_scenarios(regression::load_scenarios(opts.configFile), opts.scenarioNames);

  runner::ProfileConfig profile = runner::base_profile("regression");
  if (opts.profilesFile || !opts.profileNames.empty()) {
    const auto profiles = resolve_profiles(opts);
    if (profiles.size() != 1) throw ConfigError("regress takes exactly one --profile");
    profile = profiles.front();
  }

  regression::EngineReplayer replayer(runner_settings(opts), profile);
  regression::RegressionSuite suite(scenarios, replayer);
  return suite.run(std::cout);
}

// Profile options first; a tunable replaces any option of the same name.
static runner::ProfileConfig with_params(const runner::ProfileConfig& base, const tuning::ParamVector& theta) {
  runner::ProfileConfig p = base;
  for (auto& setting : tuning::to_option_settings(theta)) {
    const std::string name = runner::wire_name(setting.name);
    p.options.erase(std::remove_if(p.options.begin(), p.options.end(),
                                   [&](const runner::OptionSetting& o) { return runner::wire_name(o.name) == name; }),
                    p.options.end());
    p.options.push_back(std::move(setting));
  }
  return p;
}

int cmd_spsa(const Options& opts) {
  const auto format = tuning::format_for_path(opts.paramsFile);
  tuning::ParamVector params = tuning::load_params(opts.paramsFile);
  const auto targets = io::read_targets(opts.targetsFile);
  if (targets.empty()) throw ConfigError("no targets in " + opts.targetsFile);

  const auto profiles = resolve_profiles(opts);
  if (profiles.size() != 1) throw ConfigError("spsa takes exactly one --profile");
  const runner::ProfileConfig base = profiles.front();

  const runner::TargetRunner batchRunner(runner_settings(opts));
  const bool progress = opts.progress && !opts.parallelPair;
  auto objective = [&](const tuning::ParamVector& theta) {
    const auto results = batchRunner.run_batch(targets, {with_params(base, theta)}, opts.jobs, progress);
    return metrics::aggregate(results, opts.badThreshold).spikeRatePercent.value_or(0.0);
  };

  tuning::SpsaSettings settings;
  settings.iterations = opts.iterations;
  settings.a0 = opts.a0;
  settings.bigA = opts.bigA;
  settings.alpha = opts.alpha;
  settings.c0 = opts.c0;
  settings.gamma = opts.gamma;
  settings.seed = opts.seed;
  settings.monitor = opts.monitor;
  settings.parallelPair = opts.parallelPair;

  std::ofstream history;
  if (opts.historyFile) {
    std::error_code ec;
    const bool fresh = !fs::exists(*opts.historyFile, ec) || fs::file_size(*opts.historyFile, ec) == 0;
    const fs::path parent = fs::path(*opts.historyFile).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);
    history.open(*opts.historyFile, std::ios::app);
    if (!history) throw std::runtime_error("Failed to open history file: " + *opts.historyFile);
    if (fresh) history << "k,a_k,c_k,j_plus,j_minus,j_monitor,params\n";
  }

  std::cout << "[spsa] params=" << params.size() << " targets=" << targets.size()
            << " iterations=" << opts.iterations << " profile=" << base.name << "\n";

  tuning::SpsaOptimizer spsa(std::move(params), settings, objective);
  const double j0 = spsa.baseline();
  std::cout << "[spsa] baseline J=" << j0 << " " << tuning::describe(spsa.current()) << "\n";

  const auto tuned = spsa.run([&](const tuning::SpsaIteration& it) {
    std::cout << "[spsa] iter=" << it.k << " a_k=" << it.ak << " c_k=" << it.ck << " J+=" << it.jPlus
              << " J-=" << it.jMinus;
    if (it.jMonitor) std::cout << " J=" << *it.jMonitor;
    std::cout << "\n";
    tuning::save_params(opts.paramsFile, it.theta, format);
    if (history.is_open()) {
      history << it.k << "," << it.ak << "," << it.ck << "," << it.jPlus << "," << it.jMinus << ","
              << (it.jMonitor ? std::to_string(*it.jMonitor) : std::string()) << "," << tuning::describe(it.theta)
              << "\n";
      history.flush();
    }
  });

  tuning::save_params(opts.paramsFile, tuned, format);
  std::cout << "[spsa] final " << tuning::describe(tuned) << "\n";
  std::cout << "Parameters written to " << opts.paramsFile << "\n";
  return 0;
}

int dispatch(const Options& opts) {
  switch (opts.command) {
    case Command::Extract:
      return cmd_extract(opts);
    case Command::ExtractMoves:
      return cmd_extract_moves(opts);
    case Command::Run:
      return cmd_run(opts);
    case Command::Metrics:
      return cmd_metrics(opts);
    case Command::Avoidance:
      return cmd_avoidance(opts);
    case Command::Regress:
      return cmd_regress(opts);
    case Command::Spsa:
      return cmd_spsa(opts);
  }
  return 1;
}

}  // namespace spiketune::cli
