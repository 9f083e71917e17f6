#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "spiketune/runner/profile.hpp"
#include "spiketune/types.hpp"
#include "spiketune/usi/usi_utils.hpp"

namespace spiketune::runner {

struct RunnerSettings {
  std::string enginePath;

  // Common options, sent before profile options when the engine advertises them.
  int threads = 1;
  int hashMb = 256;
  int multipv = 1;
  std::optional<int> minThinkMs;

  int byoyomiMs = 2000;
  std::chrono::milliseconds handshakeTimeout{10000};
  std::chrono::milliseconds readyTimeout{10000};
  std::chrono::milliseconds decisionGrace{5000};  // added to the byoyomi for the bestmove wait

  std::optional<std::string> logDir;  // raw transcripts "<dir>/<name>.log" when set
  bool quiet = false;                 // suppress per-session diagnostics on stderr
};

// Retains the deepest score among multipv-1 info lines; the later line wins a tie.
class InfoTracker {
 public:
  void observe(const std::string& line);

  std::optional<int> scoreCp() const noexcept { return scoreCp_; }
  int depth() const noexcept { return depth_ < 0 ? 0 : depth_; }
  int seldepth() const noexcept { return seldepth_; }
  std::uint64_t nodes() const noexcept { return nodes_; }
  std::uint64_t nps() const noexcept { return nps_; }
  // Raw line the retained score came from ("" when no score was seen).
  const std::string& scoreLine() const noexcept { return scoreLine_; }

 private:
  int depth_ = -1;
  int seldepth_ = 0;
  std::optional<int> scoreCp_;
  std::uint64_t nodes_ = 0;
  std::uint64_t nps_ = 0;
  std::string scoreLine_;
};

// Everything one search session produced.
struct SearchOutcome {
  std::optional<std::string> bestmove;
  std::optional<int> evalCp;
  int depth = 0;
  int seldepth = 0;
  std::uint64_t nodes = 0;
  std::uint64_t nps = 0;
  long long elapsedMs = 0;
  bool timedOut = false;
  std::string scoreLine;
};

class TargetRunner {
 public:
  explicit TargetRunner(RunnerSettings settings);

  const RunnerSettings& settings() const noexcept { return settings_; }

  // Fresh engine process per call. Throws ConfigError when the engine binary is
  // missing; protocol timeouts yield a null score and bestmove instead.
  EvalResult run(const Target& target, const ProfileConfig& profile, int byoyomiMs) const;
  EvalResult run(const Target& target, const ProfileConfig& profile) const {
    return run(target, profile, settings_.byoyomiMs);
  }

  // One session on an arbitrary position body. `sessionName` names the transcript file.
  SearchOutcome search(const std::string& positionBody, const ProfileConfig& profile, int byoyomiMs,
                       const std::string& sessionName) const;

  // Every (target, profile) pair, target-major. jobs > 1 runs sessions on a worker pool.
  std::vector<EvalResult> run_batch(const std::vector<Target>& targets,
                                    const std::vector<ProfileConfig>& profiles, int jobs,
                                    bool showProgress = true) const;

 private:
  RunnerSettings settings_;
};

}  // namespace spiketune::runner
