// Scripted USI engine used by the session, runner and regression tests.
//
// Environment:
//   FAKE_USI_MODE       normal | split | hang | noquit | resign | silent | crash
//   FAKE_USI_SCORE_BASE score at the root position (default 50)
//   FAKE_USI_SCORE_STEP added per move of the searched position (default -100)
//   FAKE_USI_MATE       when set, the final multipv-1 line reports "score mate <n>"
//   FAKE_USI_BESTMOVES  comma list indexed by move count (default "7g7f")
//   FAKE_USI_DELAY_MS   pause before bestmove
//   FAKE_USI_NO_OPTIONS advertise no options when set
//   FAKE_USI_TAG        echoed as "info string env FAKE_USI_TAG=<v>" after usiok
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

static std::string env_or(const char *name, const std::string &fallback)
{
  const char *v = std::getenv(name);
  return v ? std::string(v) : fallback;
}

static int env_int(const char *name, int fallback)
{
  const char *v = std::getenv(name);
  return v ? std::atoi(v) : fallback;
}

static std::vector<std::string> split(const std::string &s, char sep)
{
  std::vector<std::string> out;
  std::string cur;
  std::istringstream is(s);
  while (std::getline(is, cur, sep))
    if (!cur.empty())
      out.push_back(cur);
  return out;
}

static void sleep_ms(int ms)
{
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

static bool g_split = false;

static void emit(const std::string &line)
{
  if (!g_split)
  {
    std::cout << line << "\n" << std::flush;
    return;
  }
  // Several writes per line, each flushed, so the reader sees partial lines.
  const std::size_t half = line.size() / 2;
  std::cout << line.substr(0, half) << std::flush;
  sleep_ms(15);
  std::cout << line.substr(half) << std::flush;
  sleep_ms(15);
  std::cout << "\n" << std::flush;
}

static int count_moves(const std::string &positionCmd)
{
  std::istringstream is(positionCmd);
  std::string tok;
  bool inMoves = false;
  int n = 0;
  while (is >> tok)
  {
    if (inMoves)
      ++n;
    else if (tok == "moves")
      inMoves = true;
  }
  return n;
}

int main()
{
  const std::string mode = env_or("FAKE_USI_MODE", "normal");
  g_split = mode == "split";
  const int base = env_int("FAKE_USI_SCORE_BASE", 50);
  const int step = env_int("FAKE_USI_SCORE_STEP", -100);
  const std::string mate = env_or("FAKE_USI_MATE", "");
  std::vector<std::string> bestmoves = split(env_or("FAKE_USI_BESTMOVES", "7g7f"), ',');
  if (bestmoves.empty())
    bestmoves.push_back("7g7f");
  const int delayMs = env_int("FAKE_USI_DELAY_MS", 0);

  int moves = 0;
  std::string line;
  while (std::getline(std::cin, line))
  {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();

    if (line == "usi")
    {
      if (mode == "silent")
        continue;
      emit("id name FakeUsi");
      emit("id author spiketune");
      if (!std::getenv("FAKE_USI_NO_OPTIONS"))
      {
        emit("option name Threads type spin default 1 min 1 max 256");
        emit("option name USI_Hash type spin default 256 min 1 max 65536");
        emit("option name MultiPV type spin default 1 min 1 max 10");
        emit("option name MinimumThinkingTime type spin default 0 min 0 max 10000");
        emit("option name Eval.Bias type spin default 0 min -1000 max 1000");
      }
      emit("usiok");
      if (const char *tag = std::getenv("FAKE_USI_TAG"))
        emit(std::string("info string env FAKE_USI_TAG=") + tag);
    }
    else if (line.rfind("setoption name ", 0) == 0)
    {
      const std::string rest = line.substr(15);
      const auto v = rest.find(" value ");
      const std::string name = v == std::string::npos ? rest : rest.substr(0, v);
      const std::string value = v == std::string::npos ? "" : rest.substr(v + 7);
      emit("info string option " + name + "=" + value);
    }
    else if (line == "isready")
    {
      emit("readyok");
    }
    else if (line.rfind("position ", 0) == 0)
    {
      moves = count_moves(line);
    }
    else if (line.rfind("go", 0) == 0)
    {
      if (mode == "crash")
        return 3;

      const int s = base + step * moves;
      const std::string mv = bestmoves[static_cast<std::size_t>(moves) % bestmoves.size()];
      const std::string finalScore = mate.empty() ? "cp " + std::to_string(s) : "mate " + mate;

      emit("info depth 1 seldepth 1 multipv 1 score cp " + std::to_string(s - 40) + " nodes 10 nps 1000 pv " + mv);
      emit("info depth 3 seldepth 4 multipv 1 score cp " + std::to_string(s - 7) + " nodes 300 nps 3000 pv " + mv);
      emit("info depth 3 seldepth 9 multipv 2 score cp -999 nodes 310 nps 3100 pv 1g1f");
      emit("info depth 3 seldepth 5 multipv 1 score " + finalScore + " nodes 400 nps 4000 pv " + mv);
      emit("info depth 2 seldepth 3 multipv 1 score cp " + std::to_string(s + 500) + " nodes 450 nps 4500 pv " + mv);
      emit("info string search done");

      if (mode == "hang")
        continue;
      if (delayMs > 0)
        sleep_ms(delayMs);
      emit(mode == "resign" ? "bestmove resign" : "bestmove " + mv);
    }
    else if (line == "quit")
    {
      if (mode != "noquit")
        return 0;
    }
  }

  if (mode == "noquit")
  {
    for (;;)
      sleep_ms(1000);
  }
  return 0;
}
