#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "spiketune/errors.hpp"
#include "spiketune/regression/regression_suite.hpp"
#include "spiketune/usi/usi_utils.hpp"
#include "test_support.hpp"

#ifndef SPIKETUNE_FAKE_ENGINE
#error "SPIKETUNE_FAKE_ENGINE must name the fake engine binary"
#endif

using namespace spiketune;
using namespace spiketune::regression;
using namespace std::chrono_literals;

// Serves canned summaries by scenario name.
class ScriptedReplayer : public PrefixReplayer
{
public:
  std::map<std::string, std::vector<std::string>> summaries;

  std::vector<std::string> replay(const Scenario &s) override
  {
    if (s.name == "broken-config")
      throw ConfigError("engine binary not found or not executable: /nowhere");
    if (s.name == "no-position")
      throw RegressionFailure("no position line in " + s.log);
    return summaries.at(s.name);
  }
};

static Scenario scenario(const std::string &name, std::vector<int> prefixes)
{
  Scenario s;
  s.name = name;
  s.log = name + ".log";
  s.prefixes = std::move(prefixes);
  return s;
}

template <typename Fn>
static std::string configErrorOf(Fn &&fn)
{
  try
  {
    fn();
  }
  catch (const ConfigError &e)
  {
    return e.what();
  }
  return {};
}

int main()
{
  // Summary parsing
  {
    const std::vector<std::string> lines = {
        "# scenario=opening",
        "pre-10: bestmove=7g7f",
        "pre-10: last_info=info depth 20 seldepth 31 multipv 1 score cp -85 nodes 100 pv 7g7f",
        "pre-12: bestmove=8h2b+ ponder 3a2b",
        "pre-12: last_info=info depth 18 seldepth 25 score mate 5 pv 8h2b+",
        "pre-14: bestmove=resign",
        "garbage line",
        "pre-x: bestmove=1a1b",
    };
    const auto r = parse_summary(lines);
    assert(r.size() == 3);
    assert(r.at(10).bestmove == "7g7f");
    assert(r.at(10).depth == 20 && r.at(10).seldepth == 31 && r.at(10).scoreCp == -85);
    assert(r.at(12).bestmove == "8h2b+");
    assert(r.at(12).scoreCp == usi::kMateScoreCp);
    assert(r.at(14).bestmove == "resign" && !r.at(14).scoreCp && !r.at(14).seldepth);

    bool threw = false;
    try
    {
      parse_summary({"pre-2: bestmove=7g7f", "pre-4: last_info=info depth 3 seldepth 4 score cp 1"});
    }
    catch (const RegressionFailure &e)
    {
      threw = true;
      assert(std::string(e.what()) == "summary missing data for prefixes: [4]");
    }
    assert(threw);

    // Overflowing numbers and text after "string" are not scores.
    const auto junk = parse_summary({"pre-3: bestmove=7g7f",
                                     "pre-3: last_info=info depth 9 seldepth 12 score cp 3000000000 pv 7g7f",
                                     "pre-5: bestmove=7g7f",
                                     "pre-5: last_info=info depth 9 seldepth 12 string score cp 40",
                                     "pre-99999999999: bestmove=7g7f"});
    assert(junk.size() == 2);
    assert(!junk.at(3).scoreCp && !junk.at(5).scoreCp);

    const auto bareMate = parse_summary({"pre-7: bestmove=7g7f", "pre-7: last_info=info depth 9 seldepth 9 score mate -"});
    assert(bareMate.at(7).scoreCp == -usi::kMateScoreCp);

    // Info without the depth/seldepth pair carries no fields.
    const auto loose = parse_summary({"pre-1: bestmove=a", "pre-1: last_info=info score cp 5"});
    assert(!loose.at(1).scoreCp);
  }

  // Bounds and guards
  {
    std::map<int, PrefixResult> results;
    results[6] = {"7g7f", 20, 30, -250};
    results[8] = {"2g2f", 21, 44, 120};

    Scenario s = scenario("bounds", {6, 8});
    assert(!check_bounds(s, results));

    s.scoreCpMin = -100;
    assert(check_bounds(s, results) == std::string("pre-6: score -250 < min -100"));

    s.scoreCpMin.reset();
    s.scoreCpMax = 100;
    assert(check_bounds(s, results) == std::string("pre-8: score 120 > max 100"));

    s.scoreCpMax.reset();
    s.seldepthMax = 40;
    assert(check_bounds(s, results) == std::string("pre-8: seldepth 44 > max 40"));

    s.seldepthMax.reset();
    PrefixGuard g;
    g.number = 8;
    g.allowedMoves = {"7g7f", "6i7h"};
    s.guards.push_back(g);
    assert(check_bounds(s, results) == std::string("pre-8: bestmove 2g2f not in [7g7f, 6i7h]"));

    s.guards[0].allowedMoves.push_back("2g2f");
    s.guards[0].maxCp = 100;
    assert(check_bounds(s, results) == std::string("pre-8: score 120 > guard max 100"));

    s.guards[0].maxCp.reset();
    s.guards[0].minCp = 200;
    assert(check_bounds(s, results) == std::string("pre-8: score 120 < guard min 200"));

    // A bound on a prefix that never reported a score fails instead of reading 0.
    std::map<int, PrefixResult> unscored;
    unscored[4].bestmove = "7g7f";
    Scenario bounded = scenario("unscored", {4});
    assert(!check_bounds(bounded, unscored));
    bounded.scoreCpMin = -100;
    assert(check_bounds(bounded, unscored) == std::string("pre-4: no score reported"));
    bounded.scoreCpMin.reset();
    bounded.seldepthMax = 40;
    assert(check_bounds(bounded, unscored) == std::string("pre-4: no seldepth reported"));
    bounded.seldepthMax.reset();
    PrefixGuard floor;
    floor.number = 4;
    floor.minCp = -50;
    bounded.guards.push_back(floor);
    assert(check_bounds(bounded, unscored) == std::string("pre-4: no score reported"));

    Scenario missing = scenario("missing", {6, 7, 8});
    assert(check_bounds(missing, results) == std::string("prefix pre-7 missing in summary"));

    Scenario guardOnly = scenario("guard", {6});
    PrefixGuard far;
    far.number = 30;
    guardOnly.guards.push_back(far);
    assert(check_bounds(guardOnly, results) == std::string("prefix guard pre-30 missing"));
  }

  // Suite: every scenario runs, failures are listed together
  {
    ScriptedReplayer replayer;
    replayer.summaries["ok"] = {"pre-2: bestmove=7g7f", "pre-2: last_info=info depth 9 seldepth 12 score cp 30"};
    replayer.summaries["drops-prefix"] = {"pre-2: bestmove=7g7f"};
    replayer.summaries["no-info"] = {"pre-2: bestmove=7g7f"};
    replayer.summaries["too-low"] = {"pre-2: bestmove=7g7f", "pre-2: last_info=info depth 9 seldepth 12 score cp -250"};

    Scenario low = scenario("too-low", {2});
    low.scoreCpMin = -100;
    std::vector<Scenario> all = {scenario("ok", {2}), scenario("drops-prefix", {2, 4}), low,
                                 scenario("no-position", {2})};

    RegressionSuite suite(all, replayer);
    std::ostringstream out;
    assert(suite.run(out) == 1);

    const auto &o = suite.outcomes();
    assert(o.size() == 4);
    assert(o[0].state == ScenarioState::Pass && o[0].prefixCount == 1);
    assert(o[1].state == ScenarioState::Fail && o[1].reason == "prefix pre-4 missing in summary");
    assert(o[2].state == ScenarioState::Fail && test::contains(o[2].reason, "-250"));
    assert(o[3].state == ScenarioState::Fail && test::contains(o[3].reason, "no position line"));
    assert(std::string(to_string(o[0].state)) == "pass");

    const std::string text = out.str();
    assert(test::contains(text, "[regressions] scenario=ok\n  -> PASS (1 prefixes)"));
    assert(test::contains(text, "\nFailures:\n"));
    assert(test::contains(text, "  - drops-prefix: prefix pre-4 missing in summary"));
    assert(test::contains(text, "  - too-low: pre-2: score -250 < min -100"));
    assert(!test::contains(text, "  - ok:"));

    RegressionSuite passing({scenario("ok", {2})}, replayer);
    std::ostringstream quiet;
    assert(passing.run(quiet) == 0);
    assert(!test::contains(quiet.str(), "Failures"));

    Scenario unscored = scenario("no-info", {2});
    unscored.scoreCpMin = -100;
    RegressionSuite blind({unscored}, replayer);
    std::ostringstream blindOut;
    assert(blind.run(blindOut) == 1);
    assert(blind.outcomes()[0].reason == "pre-2: no score reported");

    RegressionSuite fatal({scenario("broken-config", {2})}, replayer);
    std::ostringstream sink;
    assert(!configErrorOf([&] { fatal.run(sink); }).empty());
  }

  const auto dir = test::scratchDir("regression");

  // Scenario configuration
  {
    const auto cfg = dir / "scenarios.json";
    test::writeFile(cfg, R"({"scenarios":[
      {"name":"opening","log":"a.log","prefixes":[4,6],"score_cp_min":-300,"seldepth_max":60,
       "prefix_guard":[{"number":6,"allowed_moves":["7g7f"],"min_cp":-100}]},
      {"name":"endgame","log":"b.log","prefixes":[80],"threads":2,"byoyomi_ms":500,"engine":"/opt/e","out_dir":"x"},
      {"name":"broken","prefixes":[1]}
    ]})");
    const auto all = load_scenarios(cfg.string());
    assert(all.size() == 2);
    assert(all[0].threads == 8 && all[0].multipv == 1 && all[0].byoyomiMs == 10000);
    assert(all[0].scoreCpMin == -300 && !all[0].scoreCpMax && all[0].seldepthMax == 60);
    assert(all[0].guards.size() == 1 && all[0].guards[0].allowedMoves[0] == "7g7f");
    assert(all[0].guards[0].minCp == -100);
    assert(all[0].resolved_out_dir() == "runs/regressions/opening");
    assert(all[1].threads == 2 && all[1].byoyomiMs == 500);
    assert(all[1].engine == std::string("/opt/e") && all[1].resolved_out_dir() == "x");

    const auto picked = select_scenarios(all, {"endgame"});
    assert(picked.size() == 1 && picked[0].name == "endgame");
    assert(select_scenarios(all, {}).size() == 2);
    assert(configErrorOf([&] { select_scenarios(all, {"endgame", "nope", "gone"}); }) ==
           "Unknown scenarios requested: [nope, gone]");

    test::writeFile(dir / "empty.json", R"({"scenarios":[]})");
    assert(test::contains(configErrorOf([&] { load_scenarios((dir / "empty.json").string()); }),
                          "Config file has no scenarios"));
    assert(!configErrorOf([&] { load_scenarios((dir / "absent.json").string()); }).empty());
  }

  // Replay against a live engine
  {
    const auto log = dir / "game.log";
    test::writeLines(log, {
        "> usi",
        "< usiok",
        "> position startpos moves 7g7f",
        "< bestmove 3c3d",
        "> position startpos moves 7g7f 3c3d 2g2f 8c8d",
        "< bestmove 2g2f",
    });

    runner::RunnerSettings base;
    base.enginePath = SPIKETUNE_FAKE_ENGINE;
    base.handshakeTimeout = 3000ms;
    base.readyTimeout = 3000ms;
    base.decisionGrace = 3000ms;
    base.quiet = true;
    runner::ProfileConfig profile = runner::base_profile("regression");
    profile.env["FAKE_USI_BESTMOVES"] = "7g7f,8c8d,2g2f,3c3d,6i7h";

    Scenario pass = scenario("live-pass", {0, 2, 4});
    pass.log = log.string();
    pass.byoyomiMs = 50;
    pass.threads = 1;
    pass.outDir = (dir / "live-pass").string();
    pass.scoreCpMin = -400;
    PrefixGuard g;
    g.number = 2;
    g.allowedMoves = {"2g2f"};
    g.minCp = -200;
    pass.guards.push_back(g);

    Scenario fail = pass;
    fail.name = "live-fail";
    fail.outDir = (dir / "live-fail").string();
    fail.scoreCpMin = -300;

    Scenario noLog = pass;
    noLog.name = "no-log";
    noLog.log = (dir / "absent.log").string();

    EngineReplayer replayer(base, profile);
    const auto summary = replayer.replay(pass);
    assert(summary[0] == "# scenario=live-pass");
    const auto parsed = parse_summary(summary);
    assert(parsed.size() == 3);
    assert(parsed.at(0).bestmove == "7g7f" && parsed.at(0).scoreCp == 50);
    assert(parsed.at(2).bestmove == "2g2f" && parsed.at(2).scoreCp == -150);
    assert(parsed.at(4).bestmove == "6i7h" && parsed.at(4).scoreCp == -350);
    assert(parsed.at(4).depth == 3 && parsed.at(4).seldepth == 5);

    const std::string written = test::readFile(dir / "live-pass" / "summary.txt");
    assert(test::contains(written, "pre-4: bestmove=6i7h"));
    assert(test::fs::exists(dir / "live-pass" / "pre-2.log"));
    assert(test::contains(test::readFile(dir / "live-pass" / "pre-2.log"),
                          "> position startpos moves 7g7f 3c3d\n"));

    RegressionSuite suite({pass, fail}, replayer);
    std::ostringstream out;
    assert(suite.run(out) == 1);
    assert(suite.outcomes()[0].state == ScenarioState::Pass);
    assert(suite.outcomes()[1].reason == "pre-4: score -350 < min -300");

    RegressionSuite missingLog({noLog}, replayer);
    std::ostringstream sink;
    assert(test::contains(configErrorOf([&] { missingLog.run(sink); }), "log not found"));
  }

  std::cout << "regression_suite_test OK\n";
  return 0;
}
