#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "spiketune/errors.hpp"
#include "spiketune/runner/profile.hpp"
#include "spiketune/runner/target_runner.hpp"
#include "spiketune/usi/usi_utils.hpp"
#include "test_support.hpp"

#ifndef SPIKETUNE_FAKE_ENGINE
#error "SPIKETUNE_FAKE_ENGINE must name the fake engine binary"
#endif

using namespace spiketune;
using namespace spiketune::runner;
using namespace std::chrono_literals;

static RunnerSettings fastSettings()
{
  RunnerSettings s;
  s.enginePath = SPIKETUNE_FAKE_ENGINE;
  s.byoyomiMs = 50;
  s.threads = 2;
  s.hashMb = 64;
  s.handshakeTimeout = 3000ms;
  s.readyTimeout = 3000ms;
  s.decisionGrace = 3000ms;
  s.quiet = true;
  return s;
}

static Target target(const std::string &tag, const std::string &pos)
{
  Target t;
  t.tag = tag;
  t.prePosition = pos;
  return t;
}

static ProfileConfig profileWithEnv(const std::string &name, usi::EnvOverrides env)
{
  ProfileConfig p = base_profile(name);
  p.env = std::move(env);
  return p;
}

int main()
{
  // Deepest multipv-1 score wins; a later line wins at equal depth
  {
    InfoTracker tr;
    tr.observe("info depth 5 seldepth 7 score cp 40 nodes 100 nps 10");
    tr.observe("info depth 8 seldepth 11 score cp -20 nodes 200 nps 20");
    tr.observe("info depth 9 seldepth 12 multipv 2 score cp 900 nodes 300 nps 30");
    tr.observe("info depth 8 seldepth 10 score cp -35 nodes 400 nps 40");
    tr.observe("info depth 6 score cp 500 nodes 500 nps 50");
    tr.observe("info string depth 20 score cp 1");
    tr.observe("bestmove 7g7f");
    assert(tr.scoreCp() == -35);
    assert(tr.depth() == 8);
    assert(tr.seldepth() == 10);
    assert(tr.nodes() == 500u);
    assert(tr.nps() == 50u);
    assert(tr.scoreLine() == "info depth 8 seldepth 10 score cp -35 nodes 400 nps 40");

    InfoTracker empty;
    assert(!empty.scoreCp());
    assert(empty.depth() == 0);
  }

  const auto dir = test::scratchDir("target_runner");

  // One session: score, depth and decision of the search
  {
    TargetRunner runner(fastSettings());
    const auto r = runner.run(target("t_ply5_back2", "startpos moves 7g7f 3c3d"), base_profile());
    assert(r.tag == "t_ply5_back2");
    assert(r.profile == "base");
    assert(!r.timedOut);
    assert(r.evalCp && *r.evalCp == 50 - 200);
    assert(r.depth == 3);
    assert(r.seldepth == 5);
    assert(r.nodes == 450u);
    assert(r.nps == 4500u);
    assert(r.bestmove && *r.bestmove == "7g7f");
    assert(r.elapsedMs >= 0);
  }

  // Common options first, then profile options; environment reaches the engine
  {
    RunnerSettings s = fastSettings();
    s.logDir = (dir / "logs").string();
    s.minThinkMs = 0;
    TargetRunner runner(s);

    ProfileConfig cand = profileWithEnv("cand", {{"FAKE_USI_TAG", "cand"}});
    cand.options.push_back({GroupName{"Eval", "Bias"}, 25});
    cand.options.push_back({ScalarName{"USI_Ponder"}, false});
    const auto r = runner.run(target("opt", "startpos"), cand);
    assert(r.evalCp && *r.evalCp == 50);

    const std::string log = test::readFile(dir / "logs" / "opt__cand.log");
    const auto threads = log.find("> setoption name Threads value 2");
    const auto hash = log.find("> setoption name USI_Hash value 64");
    const auto multipv = log.find("> setoption name MultiPV value 1");
    const auto minThink = log.find("> setoption name MinimumThinkingTime value 0");
    const auto bias = log.find("> setoption name Eval.Bias value 25");
    const auto ponder = log.find("> setoption name USI_Ponder value false");
    const auto ready = log.find("> isready");
    assert(threads != std::string::npos && hash != std::string::npos);
    assert(multipv != std::string::npos && minThink != std::string::npos);
    assert(bias != std::string::npos && ponder != std::string::npos);
    assert(threads < bias && hash < bias && bias < ponder && ponder < ready);
    assert(test::contains(log, "< info string option Eval.Bias=25"));
    assert(test::contains(log, "< info string env FAKE_USI_TAG=cand"));
    assert(test::contains(log, "> position startpos\n"));
    assert(test::contains(log, "< bestmove 7g7f"));
    assert(!test::contains(log, "setoption name Hash "));
  }

  // An engine that lists no options still gets the common ones
  {
    RunnerSettings s = fastSettings();
    s.logDir = (dir / "bare").string();
    TargetRunner runner(s);
    const auto r = runner.run(target("bare", "startpos"), profileWithEnv("p", {{"FAKE_USI_NO_OPTIONS", "1"}}));
    assert(r.evalCp);
    const std::string log = test::readFile(dir / "bare" / "bare__p.log");
    assert(test::contains(log, "setoption name Threads value 2"));
    assert(test::contains(log, "setoption name USI_Hash value 64"));
    assert(!test::contains(log, "MinimumThinkingTime"));
  }

  // Mate scores fold to the centipawn scale; resignation is a decision
  {
    TargetRunner runner(fastSettings());
    const auto mate = runner.run(target("m", "startpos"), profileWithEnv("p", {{"FAKE_USI_MATE", "3"}}));
    assert(mate.evalCp && *mate.evalCp == usi::kMateScoreCp);

    const auto resign = runner.run(target("r", "startpos moves 7g7f"), profileWithEnv("p", {{"FAKE_USI_MODE", "resign"}}));
    assert(resign.bestmove && *resign.bestmove == "resign");
    assert(resign.evalCp && *resign.evalCp == -50);
  }

  // Timeouts and dead engines degrade to a null result
  {
    RunnerSettings s = fastSettings();
    s.byoyomiMs = 0;
    s.decisionGrace = 300ms;
    TargetRunner runner(s);

    const auto hung = runner.run(target("h", "startpos"), profileWithEnv("p", {{"FAKE_USI_MODE", "hang"}}));
    assert(hung.timedOut);
    assert(!hung.evalCp);
    assert(!hung.bestmove);
    assert(hung.depth == 3);
    assert(hung.elapsedMs >= 290);

    const auto crashed = runner.run(target("c", "startpos"), profileWithEnv("p", {{"FAKE_USI_MODE", "crash"}}));
    assert(crashed.timedOut);
    assert(!crashed.evalCp);

    s.handshakeTimeout = 200ms;
    TargetRunner quick(s);
    const auto silent = quick.run(target("s", "startpos"), profileWithEnv("p", {{"FAKE_USI_MODE", "silent"}}));
    assert(silent.timedOut);
    assert(!silent.evalCp);
    assert(silent.depth == 0);
  }

  // Batches are target-major regardless of the worker count
  {
    TargetRunner runner(fastSettings());
    const std::vector<Target> targets = {target("t1", "startpos moves 7g7f"),
                                         target("t2", "startpos moves 7g7f 3c3d 2g2f")};
    const std::vector<ProfileConfig> profiles = {base_profile(),
                                                 profileWithEnv("cand", {{"FAKE_USI_SCORE_BASE", "0"}})};
    for (int jobs : {1, 3})
    {
      const auto rs = runner.run_batch(targets, profiles, jobs, false);
      assert(rs.size() == 4);
      assert(rs[0].tag == "t1" && rs[0].profile == "base" && *rs[0].evalCp == -50);
      assert(rs[1].tag == "t1" && rs[1].profile == "cand" && *rs[1].evalCp == -100);
      assert(rs[2].tag == "t2" && rs[2].profile == "base" && *rs[2].evalCp == -250);
      assert(rs[3].tag == "t2" && rs[3].profile == "cand" && *rs[3].evalCp == -300);
    }
    assert(runner.run_batch({}, profiles, 2, false).empty());
  }

  // A missing engine is fatal
  {
    RunnerSettings s = fastSettings();
    s.enginePath = (dir / "missing-usi").string();
    TargetRunner runner(s);
    bool threw = false;
    try
    {
      runner.run_batch({target("x", "startpos")}, {base_profile()}, 1, false);
    }
    catch (const ConfigError &)
    {
      threw = true;
    }
    assert(threw);
  }

  std::cout << "target_runner_test OK\n";
  return 0;
}
