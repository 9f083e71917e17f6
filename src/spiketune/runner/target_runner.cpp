#include "spiketune/runner/target_runner.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <utility>

#include "spiketune/errors.hpp"
#include "spiketune/progress.hpp"
#include "spiketune/usi/engine_session.hpp"
#include "spiketune/worker_pool.hpp"

namespace spiketune::runner {

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

void InfoTracker::observe(const std::string& line) {
  const auto info = usi::parseInfoLine(line);
  if (!info || info->multipv != 1) return;

  if (info->nodes) nodes_ = *info->nodes;
  if (info->nps) nps_ = *info->nps;
  if (!info->scoreCp) return;

  const int d = info->depth.value_or(0);
  if (d < depth_) return;
  depth_ = d;
  scoreCp_ = info->scoreCp;
  seldepth_ = info->seldepth.value_or(0);
  scoreLine_ = line;
}

TargetRunner::TargetRunner(RunnerSettings settings) : settings_(std::move(settings)) {}

static void apply_common_options(usi::EngineSession& session, const std::set<std::string>& advertised,
                                 const RunnerSettings& s) {
  // Engines that list no options get everything; otherwise only what they advertise.
  auto offered = [&](const char* name) { return advertised.empty() || advertised.count(name) > 0; };

  if (offered("Threads")) session.setOption("Threads", s.threads);
  if (offered("USI_Hash")) session.setOption("USI_Hash", s.hashMb);
  else if (advertised.count("Hash")) session.setOption("Hash", s.hashMb);
  if (offered("MultiPV")) session.setOption("MultiPV", s.multipv);
  if (s.minThinkMs && offered("MinimumThinkingTime"))
    session.setOption("MinimumThinkingTime", *s.minThinkMs);
}

SearchOutcome TargetRunner::search(const std::string& positionBody, const ProfileConfig& profile,
                                   int byoyomiMs, const std::string& sessionName) const {
  SearchOutcome out;

  // Declared before the session so it outlives the final "quit".
  std::ofstream transcript;
  usi::EngineSession session;
  session.open(settings_.enginePath, profile.env);

  if (settings_.logDir) {
    std::error_code ec;
    fs::create_directories(*settings_.logDir, ec);
    transcript.open(fs::path(*settings_.logDir) / (sessionName + ".log"), std::ios::trunc);
    if (transcript) session.setTranscript(&transcript);
    else if (!settings_.quiet) std::cerr << "[session] cannot write transcript for " << sessionName << "\n";
  }

  auto timed_out = [&](const char* waitingFor, std::chrono::milliseconds waited) {
    out.timedOut = true;
    if (!settings_.quiet) {
      std::cerr << "[session] " << sessionName << ": "
                << (session.reachedEof() ? "engine exited" : "timeout") << " waiting for " << waitingFor
                << " (" << waited.count() << "ms)\n";
    }
    return out;
  };

  std::set<std::string> advertised;
  if (!session.handshake(settings_.handshakeTimeout, &advertised))
    return timed_out("usiok", settings_.handshakeTimeout);

  apply_common_options(session, advertised, settings_);
  for (const auto& opt : profile.options) session.setOption(wire_name(opt.name), opt.value);

  if (!session.syncReady(settings_.readyTimeout)) return timed_out("readyok", settings_.readyTimeout);

  session.newGame();
  session.position(positionBody);

  const auto budget = std::chrono::milliseconds(std::max(0, byoyomiMs)) + settings_.decisionGrace;
  const auto t0 = Clock::now();
  session.goByoyomi(byoyomiMs);
  auto res = session.awaitPattern({"bestmove"}, budget);
  out.elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0).count();

  InfoTracker tracker;
  for (const auto& l : res.lines) tracker.observe(l);
  out.depth = tracker.depth();
  out.seldepth = tracker.seldepth();
  out.nodes = tracker.nodes();
  out.nps = tracker.nps();
  out.scoreLine = tracker.scoreLine();

  if (!res.matched) return timed_out("bestmove", budget);

  out.bestmove = usi::parseBestmove(res.lines.back());
  out.evalCp = tracker.scoreCp();
  return out;
}

EvalResult TargetRunner::run(const Target& target, const ProfileConfig& profile, int byoyomiMs) const {
  const SearchOutcome o = search(target.prePosition, profile, byoyomiMs, target.tag + "__" + profile.name);

  EvalResult r;
  r.tag = target.tag;
  r.profile = profile.name;
  r.evalCp = o.evalCp;
  r.depth = o.depth;
  r.seldepth = o.seldepth;
  r.bestmove = o.bestmove;
  r.nodes = o.nodes;
  r.nps = o.nps;
  r.elapsedMs = o.elapsedMs;
  r.timedOut = o.timedOut;
  return r;
}

std::vector<EvalResult> TargetRunner::run_batch(const std::vector<Target>& targets,
                                                const std::vector<ProfileConfig>& profiles, int jobs,
                                                bool showProgress) const {
  if (!usi::isExecutableFile(settings_.enginePath))
    throw ConfigError("engine binary not found or not executable: " + settings_.enginePath);

  const std::size_t total = targets.size() * profiles.size();
  std::vector<EvalResult> slots(total);
  if (total == 0) return slots;

  ProgressMeter pm("[runner]", total, showProgress);
  std::atomic<int> timeouts{0};

  auto one = [&](std::size_t i) {
    const Target& t = targets[i / profiles.size()];
    const ProfileConfig& p = profiles[i % profiles.size()];
    slots[i] = run(t, p);
    if (slots[i].timedOut) {
      const int n = timeouts.fetch_add(1, std::memory_order_relaxed) + 1;
      pm.set_status("timeouts=" + std::to_string(n));
    }
    pm.add();
  };

  jobs = std::clamp(jobs, 1, static_cast<int>(std::min<std::size_t>(total, 256)));
  if (jobs == 1) {
    for (std::size_t i = 0; i < total; ++i) one(i);
  } else {
    WorkerPool pool(jobs);
    pool.for_each_index(total, [&](std::size_t i, int) { one(i); });
  }
  pm.finish();
  return slots;
}

}  // namespace spiketune::runner
