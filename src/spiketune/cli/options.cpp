#include "spiketune/cli/options.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "spiketune/errors.hpp"

namespace spiketune::cli {

[[noreturn]] static void usage_and_exit(const DefaultPaths& d) {
  std::cerr
      << "Usage: spiketune <command> [options]\n"
         "Commands:\n"
         "  extract <log>...          Mine engine transcripts for spikes -> <out>/targets.json\n"
         "  extract-moves <jsonl>...  Same, from structured move logs\n"
         "  run                       Evaluate a target batch under one or more profiles\n"
         "  metrics                   Aggregate a result batch\n"
         "  avoidance                 Bad-move avoidance on first-bad targets\n"
         "  regress                   Replay regression scenarios (exit 1 on any failure)\n"
         "  spsa                      Tune parameters to minimise the spike rate\n"
         "\nExtraction:\n"
         "  --out <dir>               Output directory (targets.json, summary.txt)\n"
         "  --threshold <cp>          Spike threshold on |delta| (default 250)\n"
         "  --topk <K>                Keep the K largest spikes per transcript/game (0 => all, default 10)\n"
         "  --back-min <N>            Smallest rewind depth (default 2)\n"
         "  --back-max <N>            Largest rewind depth (default 5)\n"
         "  --side cand|base|both     Move-log side filter (default cand)\n"
         "\nSessions:\n"
         "  --engine <path>           USI engine binary (default "
      << (d.engine ? d.engine->string() : std::string("autodetect")) << ")\n"
      << "  --targets <file>          Target batch\n"
         "  --results <file>          Result batch (run merges into it)\n"
         "  --profiles <file>         Profiles JSON (default: single \"base\" profile)\n"
         "  --profile <name>          Profile to use (repeatable)\n"
         "  --byoyomi <ms>            Think time per position (default 2000)\n"
         "  --grace <ms>              Extra wait for bestmove (default 5000)\n"
         "  --handshake-timeout <ms>  usiok/readyok wait (default 10000)\n"
         "  --threads <N>             Engine Threads (default 1)\n"
         "  --hash <MB>               USI_Hash/Hash (default 256)\n"
         "  --multipv <N>             MultiPV (default 1)\n"
         "  --min-think <ms>          MinimumThinkingTime (optional)\n"
         "  --jobs <N>                Concurrent sessions (default 1)\n"
         "  --log-dir <dir>           Write per-session transcripts\n"
         "  --no-progress             Disable the progress meter\n"
         "\nMetrics:\n"
         "  --bad-th <cp>             Badness threshold (default -600)\n"
         "  --good-th <cp>            Good threshold for avoidance (default -200)\n"
         "  --first-bad               Restrict to the first bad target per origin (needs --targets)\n"
         "  --first-bad-profile <p>   Profile that defines first-bad (default --profile)\n"
         "  --output <file>           Write the report JSON\n"
         "\nRegressions:\n"
         "  --config <file>           Scenario config (default regression_scenarios.json)\n"
         "  --scenario <name>         Scenario to run (repeatable, default all)\n"
         "\nSPSA:\n"
         "  --params <file>           Parameter file (.json or CSV), checkpointed every iteration\n"
         "  --iterations <N>          Iterations (default 10)\n"
         "  --a0 <v> --A <v> --alpha <v>   Gain schedule (defaults 1.0, 10% of iterations, 0.602)\n"
         "  --c0 <v> --gamma <v>      Perturbation schedule (defaults 1.0, 0.101)\n"
         "  --seed <u64>              RNG seed (0 => nondeterministic)\n"
         "  --monitor                 Re-evaluate the updated vector each iteration\n"
         "  --parallel-pair           Evaluate theta+ and theta- concurrently\n"
         "  --history <file>          Append per-iteration CSV history\n";
  std::exit(1);
}

static int to_int(const std::string& v, const char* name) {
  try {
    std::size_t pos = 0;
    const int r = std::stoi(v, &pos);
    if (pos == v.size()) return r;
  } catch (const std::logic_error&) {
  }
  throw ConfigError(std::string("invalid value for ") + name + ": " + v);
}

static double to_double(const std::string& v, const char* name) {
  try {
    std::size_t pos = 0;
    const double r = std::stod(v, &pos);
    if (pos == v.size()) return r;
  } catch (const std::logic_error&) {
  }
  throw ConfigError(std::string("invalid value for ") + name + ": " + v);
}

static std::optional<Command> command_from(const std::string& s) {
  if (s == "extract") return Command::Extract;
  if (s == "extract-moves") return Command::ExtractMoves;
  if (s == "run") return Command::Run;
  if (s == "metrics") return Command::Metrics;
  if (s == "avoidance") return Command::Avoidance;
  if (s == "regress") return Command::Regress;
  if (s == "spsa") return Command::Spsa;
  return std::nullopt;
}

Options parse_args(int argc, char** argv, const DefaultPaths& defaults) {
  Options o;
  if (defaults.engine) o.enginePath = defaults.engine->string();

  if (argc < 2) usage_and_exit(defaults);
  const std::string cmd = argv[1];
  if (cmd == "--help" || cmd == "-h") usage_and_exit(defaults);
  const auto command = command_from(cmd);
  if (!command) {
    std::cerr << "Unknown command: " << cmd << "\n";
    usage_and_exit(defaults);
  }
  o.command = *command;

  auto require_value = [&](int& i, const char* name) -> std::string {
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << name << "\n";
      usage_and_exit(defaults);
    }
    return argv[++i];
  };

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--out") {
      o.outDir = require_value(i, "--out");
    } else if (arg == "--threshold") {
      o.threshold = to_int(require_value(i, "--threshold"), "--threshold");
    } else if (arg == "--topk") {
      o.topK = to_int(require_value(i, "--topk"), "--topk");
    } else if (arg == "--back-min") {
      o.backMin = to_int(require_value(i, "--back-min"), "--back-min");
    } else if (arg == "--back-max") {
      o.backMax = to_int(require_value(i, "--back-max"), "--back-max");
    } else if (arg == "--side") {
      o.side = require_value(i, "--side");
    } else if (arg == "--engine") {
      o.enginePath = require_value(i, "--engine");
    } else if (arg == "--targets") {
      o.targetsFile = require_value(i, "--targets");
    } else if (arg == "--results") {
      o.resultsFile = require_value(i, "--results");
    } else if (arg == "--output") {
      o.outFile = require_value(i, "--output");
    } else if (arg == "--profiles") {
      o.profilesFile = require_value(i, "--profiles");
    } else if (arg == "--profile") {
      o.profileNames.push_back(require_value(i, "--profile"));
    } else if (arg == "--byoyomi") {
      o.byoyomiMs = to_int(require_value(i, "--byoyomi"), "--byoyomi");
    } else if (arg == "--grace") {
      o.graceMs = to_int(require_value(i, "--grace"), "--grace");
    } else if (arg == "--handshake-timeout") {
      o.handshakeMs = to_int(require_value(i, "--handshake-timeout"), "--handshake-timeout");
    } else if (arg == "--threads") {
      o.threads = to_int(require_value(i, "--threads"), "--threads");
    } else if (arg == "--hash") {
      o.hashMb = to_int(require_value(i, "--hash"), "--hash");
    } else if (arg == "--multipv") {
      o.multipv = to_int(require_value(i, "--multipv"), "--multipv");
    } else if (arg == "--min-think") {
      o.minThinkMs = to_int(require_value(i, "--min-think"), "--min-think");
    } else if (arg == "--jobs") {
      o.jobs = to_int(require_value(i, "--jobs"), "--jobs");
    } else if (arg == "--log-dir") {
      o.logDir = require_value(i, "--log-dir");
    } else if (arg == "--no-progress") {
      o.progress = false;
    } else if (arg == "--bad-th") {
      o.badThreshold = to_int(require_value(i, "--bad-th"), "--bad-th");
    } else if (arg == "--good-th") {
      o.goodThreshold = to_int(require_value(i, "--good-th"), "--good-th");
    } else if (arg == "--first-bad") {
      o.firstBad = true;
    } else if (arg == "--first-bad-profile") {
      o.firstBadProfile = require_value(i, "--first-bad-profile");
    } else if (arg == "--config") {
      o.configFile = require_value(i, "--config");
    } else if (arg == "--scenario") {
      o.scenarioNames.push_back(require_value(i, "--scenario"));
    } else if (arg == "--params") {
      o.paramsFile = require_value(i, "--params");
    } else if (arg == "--iterations") {
      o.iterations = to_int(require_value(i, "--iterations"), "--iterations");
    } else if (arg == "--a0") {
      o.a0 = to_double(require_value(i, "--a0"), "--a0");
    } else if (arg == "--A") {
      o.bigA = to_double(require_value(i, "--A"), "--A");
    } else if (arg == "--alpha") {
      o.alpha = to_double(require_value(i, "--alpha"), "--alpha");
    } else if (arg == "--c0") {
      o.c0 = to_double(require_value(i, "--c0"), "--c0");
    } else if (arg == "--gamma") {
      o.gamma = to_double(require_value(i, "--gamma"), "--gamma");
    } else if (arg == "--seed") {
      const std::string v = require_value(i, "--seed");
      try {
        o.seed = static_cast<uint64_t>(std::stoull(v));
      } catch (const std::logic_error&) {
        throw ConfigError("invalid value for --seed: " + v);
      }
    } else if (arg == "--monitor") {
      o.monitor = true;
    } else if (arg == "--parallel-pair") {
      o.parallelPair = true;
    } else if (arg == "--history") {
      o.historyFile = require_value(i, "--history");
    } else if (arg == "--help" || arg == "-h") {
      usage_and_exit(defaults);
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      usage_and_exit(defaults);
    } else {
      o.inputs.push_back(arg);
    }
  }

  auto require = [&](bool ok, const char* what) {
    if (ok) return;
    std::cerr << what << "\n";
    usage_and_exit(defaults);
  };
  switch (o.command) {
    case Command::Extract:
    case Command::ExtractMoves:
      require(!o.inputs.empty(), "No input files given.");
      require(!o.outDir.empty(), "Missing --out <dir>.");
      require(o.side == "cand" || o.side == "base" || o.side == "both", "--side must be cand, base or both.");
      break;
    case Command::Run:
      require(!o.targetsFile.empty(), "Missing --targets <file>.");
      require(!o.resultsFile.empty(), "Missing --results <file>.");
      break;
    case Command::Metrics:
      require(!o.resultsFile.empty(), "Missing --results <file>.");
      require(!o.firstBad || !o.targetsFile.empty(), "--first-bad needs --targets <file>.");
      break;
    case Command::Avoidance:
      require(!o.resultsFile.empty() && !o.targetsFile.empty(), "avoidance needs --targets and --results.");
      require(o.profileNames.size() == 1, "avoidance needs exactly one --profile.");
      break;
    case Command::Regress:
      break;
    case Command::Spsa:
      require(!o.paramsFile.empty(), "Missing --params <file>.");
      require(!o.targetsFile.empty(), "Missing --targets <file>.");
      break;
  }
  for (const auto& in : o.inputs) {
    if (o.command != Command::Extract && o.command != Command::ExtractMoves) {
      std::cerr << "Unexpected argument: " << in << "\n";
      usage_and_exit(defaults);
    }
  }

  // Normalize/clip for safety.
  o.threshold = std::max(1, o.threshold);
  o.topK = std::max(0, o.topK);
  o.backMin = std::max(0, o.backMin);
  o.backMax = std::max(o.backMin, o.backMax);
  o.threads = std::max(1, o.threads);
  o.hashMb = std::max(1, o.hashMb);
  o.multipv = std::max(1, o.multipv);
  o.byoyomiMs = std::max(0, o.byoyomiMs);
  o.graceMs = std::max(0, o.graceMs);
  o.handshakeMs = std::max(100, o.handshakeMs);
  o.jobs = std::max(1, o.jobs);
  o.iterations = std::max(0, o.iterations);
  return o;
}

}  // namespace spiketune::cli
