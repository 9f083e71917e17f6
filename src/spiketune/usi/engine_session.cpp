#include "spiketune/usi/engine_session.hpp"

#include <algorithm>
#include <ostream>
#include <sstream>

#include "spiketune/errors.hpp"

namespace spiketune::usi
{
  using Clock = std::chrono::steady_clock;

  EngineSession::~EngineSession()
  {
    close();
  }

  void EngineSession::open(const std::string &exePath, const EnvOverrides &env)
  {
    close();
    if (!isExecutableFile(exePath))
      throw ConfigError("engine binary not found or not executable: " + exePath);

    std::string err;
    if (!platformStart(exePath, env, err))
      throw std::runtime_error("failed to start engine " + exePath + ": " + err);
  }

  void EngineSession::close(std::chrono::milliseconds grace)
  {
    if (!isOpen())
      return;
    // best-effort graceful shutdown
    send("quit");
    platformStop(grace);
  }

  bool EngineSession::send(const std::string &line)
  {
    if (m_transcript)
      *m_transcript << "> " << line << '\n';
    // USI requires \n; many engines tolerate \r\n.
    return platformWrite(line + "\n");
  }

  AwaitResult EngineSession::awaitPattern(const std::set<std::string> &patterns,
                                          std::chrono::milliseconds timeout)
  {
    AwaitResult res;
    const auto deadline = Clock::now() + timeout;

    auto take = [&](std::string &&line)
    {
      if (m_transcript)
        *m_transcript << "< " << line << '\n';
      const bool hit = std::any_of(patterns.begin(), patterns.end(), [&](const std::string &p)
                                   { return line.find(p) != std::string::npos; });
      res.lines.push_back(std::move(line));
      return hit;
    };

    for (;;)
    {
      std::string line;
      while (platformNextLine(line))
      {
        if (take(std::move(line)))
        {
          res.matched = true;
          return res;
        }
      }

      if (reachedEof())
        return res;

      const auto now = Clock::now();
      if (now >= deadline)
        return res;

      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
      platformPoll(std::min(kPollSlice, std::max(remaining, std::chrono::milliseconds(1))));
    }
  }

  bool EngineSession::handshake(std::chrono::milliseconds timeout, std::set<std::string> *outOptions)
  {
    if (!send("usi"))
      return false;
    auto res = awaitPattern({"usiok"}, timeout);
    if (outOptions)
    {
      for (const auto &l : res.lines)
        if (auto name = parseOptionName(l))
          outOptions->insert(*name);
    }
    return res.matched;
  }

  bool EngineSession::syncReady(std::chrono::milliseconds timeout)
  {
    if (!send("isready"))
      return false;
    return awaitPattern({"readyok"}, timeout).matched;
  }

  void EngineSession::setOption(const std::string &name, const OptionValue &v)
  {
    std::ostringstream os;
    os << "setoption name " << name << " value " << formatOptionValue(v);
    send(os.str());
  }

  void EngineSession::newGame()
  {
    send("usinewgame");
  }

  void EngineSession::position(const std::string &positionBody)
  {
    send("position " + positionBody);
  }

  void EngineSession::goByoyomi(int byoyomiMs)
  {
    std::ostringstream os;
    os << "go btime 0 wtime 0 byoyomi " << std::max(0, byoyomiMs);
    send(os.str());
  }

} // namespace spiketune::usi
