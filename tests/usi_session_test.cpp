#include <cassert>
#include <cerrno>
#include <chrono>
#include <iostream>
#include <limits>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <sys/wait.h>

#include "spiketune/errors.hpp"
#include "spiketune/usi/engine_session.hpp"
#include "spiketune/usi/line_buffer.hpp"
#include "spiketune/usi/platform_spawn.hpp"
#include "spiketune/usi/usi_utils.hpp"
#include "test_support.hpp"

#ifndef SPIKETUNE_FAKE_ENGINE
#error "SPIKETUNE_FAKE_ENGINE must name the fake engine binary"
#endif

using namespace spiketune;
using namespace spiketune::usi;
using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

static const std::string kEngine = SPIKETUNE_FAKE_ENGINE;

static bool anyLine(const AwaitResult &r, const std::string &needle)
{
  for (const auto &l : r.lines)
    if (l.find(needle) != std::string::npos)
      return true;
  return false;
}

static long long msSince(Clock::time_point t0)
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0).count();
}

int main()
{
  // Line buffering across partial writes
  {
    LineBuffer buf;
    std::string line;
    buf.append("usiok\r\nreadyo", 13);
    assert(buf.popLine(line) && line == "usiok");
    assert(!buf.popLine(line));
    assert(buf.pendingBytes() == 6);
    buf.append("k\n", 2);
    assert(buf.popLine(line) && line == "readyok");
    assert(buf.pendingBytes() == 0);
    buf.append("bestmove 7g", 11);
    assert(!buf.popLine(line));
    assert(buf.takeRemainder(line) && line == "bestmove 7g");
    assert(!buf.takeRemainder(line));
  }

  // Protocol line parsing
  {
    auto info = parseInfoLine("info depth 12 seldepth 17 multipv 2 score mate -5 nodes 12345 nps 99000 pv 7g7f");
    assert(info);
    assert(info->depth == 12);
    assert(info->seldepth == 17);
    assert(info->multipv == 2);
    assert(info->mate);
    assert(info->scoreCp == -kMateScoreCp);
    assert(info->nodes == 12345u);
    assert(info->nps == 99000u);

    auto plain = parseInfoLine("info string depth 3 score cp 10");
    assert(plain && !plain->scoreCp && !plain->depth);
    assert(!parseInfoLine("bestmove 7g7f"));

    assert(parseBestmove("bestmove 7g7f ponder 3c3d") == std::string("7g7f"));
    assert(parseBestmove("bestmove resign") == std::string("resign"));
    assert(!parseBestmove("bestmove"));
    assert(parseOptionName("option name USI Hash type spin default 1") == std::string("USI Hash"));
    assert(!parseOptionName("id name Fake"));
    assert(formatOptionValue(OptionValue{true}) == "true");
    assert(formatOptionValue(OptionValue{42}) == "42");
    assert(parseInt("-17") == -17);
    assert(!parseInt("12x"));
    assert(parseInt("9223372036854775807") == std::numeric_limits<long long>::max());
    assert(parseInt("-9223372036854775808") == std::numeric_limits<long long>::min());
    assert(!parseInt("9223372036854775808"));
    assert(!parseInt("9999999999999999999"));
    assert(parseInt32("-2147483648") == std::numeric_limits<int>::min());
    assert(!parseInt32("3000000000"));
    assert(!parseInt32("-2147483649"));

    auto wide = parseInfoLine("info depth 5 score cp 3000000000 pv 7g7f");
    assert(wide && wide->depth == 5 && !wide->scoreCp);
    assert(!parseInfoLine("info depth 99999999999 score cp 1")->depth);

    auto winning = parseInfoLine("info depth 3 score mate + pv 8h2b+");
    assert(winning && winning->mate && winning->scoreCp == kMateScoreCp);
    auto losing = parseInfoLine("info depth 3 score mate -");
    assert(losing && losing->mate && losing->scoreCp == -kMateScoreCp);
    assert(trim("  a b \r\n") == "a b");
  }

  // Full exchange with option echo and environment overrides
  {
    EngineSession s;
    std::ostringstream transcript;
    s.setTranscript(&transcript);
    s.open(kEngine, {{"FAKE_USI_TAG", "tagged"}});
    assert(s.isOpen());

    std::set<std::string> options;
    assert(s.handshake(2s, &options));
    assert(options.count("Threads") == 1);
    assert(options.count("USI_Hash") == 1);
    assert(options.count("Eval.Bias") == 1);

    s.setOption("Threads", 3);
    s.setOption("Eval.Bias", -20);
    assert(s.send("isready"));
    auto ready = s.awaitPattern({"readyok"}, 2s);
    assert(ready.matched);
    assert(anyLine(ready, "env FAKE_USI_TAG=tagged"));
    assert(anyLine(ready, "option Threads=3"));
    assert(anyLine(ready, "option Eval.Bias=-20"));

    s.newGame();
    s.position("startpos moves 7g7f");
    s.goByoyomi(100);
    auto res = s.awaitPattern({"bestmove"}, 5s);
    assert(res.matched);
    assert(res.lines.back() == "bestmove 7g7f");
    assert(anyLine(res, "multipv 2"));

    s.close();
    assert(!s.isOpen());
    const std::string t = transcript.str();
    assert(test::contains(t, "> usi\n"));
    assert(test::contains(t, "< usiok\n"));
    assert(test::contains(t, "> go btime 0 wtime 0 byoyomi 100\n"));
    assert(test::contains(t, "> quit\n"));
  }

  // Lines split across writes arrive whole
  {
    EngineSession s;
    s.open(kEngine, {{"FAKE_USI_MODE", "split"}});
    assert(s.handshake(3s));
    assert(s.syncReady(3s));
    s.position("startpos");
    s.goByoyomi(0);
    auto res = s.awaitPattern({"bestmove"}, 5s);
    assert(res.matched);
    assert(res.lines.back() == "bestmove 7g7f");
    for (const auto &l : res.lines)
      assert(l.rfind("info ", 0) == 0 || l.rfind("bestmove ", 0) == 0);
  }

  // A silent engine times out the handshake
  {
    EngineSession s;
    s.open(kEngine, {{"FAKE_USI_MODE", "silent"}});
    const auto t0 = Clock::now();
    assert(!s.handshake(200ms));
    assert(msSince(t0) >= 190);
    assert(!s.reachedEof());
  }

  // No decision within the deadline: bounded wait, buffered info kept
  {
    EngineSession s;
    s.open(kEngine, {{"FAKE_USI_MODE", "hang"}});
    assert(s.handshake(2s));
    s.position("startpos");
    s.goByoyomi(0);
    const auto t0 = Clock::now();
    auto res = s.awaitPattern({"bestmove"}, 300ms);
    const long long waited = msSince(t0);
    assert(!res.matched);
    assert(waited >= 290 && waited < 3000);
    assert(anyLine(res, "score cp"));
  }

  // An engine that dies mid-search ends the wait early
  {
    EngineSession s;
    s.open(kEngine, {{"FAKE_USI_MODE", "crash"}});
    assert(s.handshake(2s));
    s.position("startpos");
    s.goByoyomi(0);
    const auto t0 = Clock::now();
    auto res = s.awaitPattern({"bestmove"}, 5s);
    assert(!res.matched);
    assert(msSince(t0) < 4000);
    assert(s.reachedEof());
    s.close();
  }

  // Sessions opened from several threads do not keep each other's pipes open
  {
    constexpr int kPairs = 4;
    std::vector<std::unique_ptr<EngineSession>> hanging(kPairs);
    std::vector<std::unique_ptr<EngineSession>> crashing(kPairs);
    std::vector<std::thread> openers;
    for (int i = 0; i < kPairs; ++i)
    {
      hanging[i] = std::make_unique<EngineSession>();
      crashing[i] = std::make_unique<EngineSession>();
    }
    for (int i = 0; i < kPairs; ++i)
    {
      openers.emplace_back([&, i]
                           {
                             crashing[i]->open(kEngine, {{"FAKE_USI_MODE", "crash"}});
                             hanging[i]->open(kEngine, {{"FAKE_USI_MODE", "hang"}}); });
    }
    for (auto &t : openers)
      t.join();

    for (auto &s : crashing)
    {
      assert(s->handshake(2s));
      s->position("startpos");
      s->goByoyomi(0);
      const auto t0 = Clock::now();
      auto res = s->awaitPattern({"bestmove"}, 5s);
      assert(!res.matched);
      assert(s->reachedEof());
      assert(msSince(t0) < 1500);
      s->close();
    }
    for (auto &s : hanging)
    {
      assert(s->isOpen() && !s->reachedEof());
      s->close(100ms);
    }
  }

  // An engine ignoring quit is killed after the grace period
  {
    SpawnedProcess p;
    std::string err;
    assert(spawnWithPipes(kEngine, {{"FAKE_USI_MODE", "noquit"}}, p, &err));
    const pid_t pid = p.pid;
    assert(pid > 0);
    const auto t0 = Clock::now();
    terminateProcess(p, 100ms);
    assert(msSince(t0) < 3000);
    assert(p.pid == -1);
    assert(p.stdinFd == -1 && p.stdoutFd == -1);
    int status = 0;
    assert(::waitpid(pid, &status, WNOHANG) == -1 && errno == ECHILD);

    EngineSession s;
    s.open(kEngine, {{"FAKE_USI_MODE", "noquit"}});
    assert(s.handshake(2s));
    const auto t1 = Clock::now();
    s.close(100ms);
    assert(!s.isOpen());
    assert(msSince(t1) < 3000);
  }

  // Missing binaries are configuration errors
  {
    const auto dir = test::scratchDir("usi_session");
    test::writeFile(dir / "not_executable", "#!/bin/sh\n");
    assert(!isExecutableFile((dir / "not_executable").string()));
    assert(!isExecutableFile(dir.string()));
    assert(isExecutableFile(kEngine));

    EngineSession s;
    bool threw = false;
    try
    {
      s.open((dir / "missing-usi").string());
    }
    catch (const ConfigError &)
    {
      threw = true;
    }
    assert(threw);
    assert(!s.isOpen());
  }

  std::cout << "usi_session_test OK\n";
  return 0;
}
