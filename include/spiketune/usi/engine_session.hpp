#pragma once

#include <chrono>
#include <iosfwd>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "spiketune/usi/platform_spawn.hpp"
#include "spiketune/usi/usi_utils.hpp"

namespace spiketune::usi
{
  struct AwaitResult
  {
    bool matched{false};
    std::vector<std::string> lines; // every complete line read during the wait, match included
  };

  // One USI engine subprocess driven by ordered line exchange. Replies are correlated
  // by pattern (e.g. "readyok", "bestmove"), never by request id, and every wait is bounded.
  class EngineSession
  {
  public:
    static constexpr std::chrono::milliseconds kPollSlice{20};
    static constexpr std::chrono::milliseconds kQuitGrace{300};

    EngineSession() = default;
    ~EngineSession(); // out-of-line semantics via custom deleter (safe with incomplete Impl)

    EngineSession(const EngineSession &) = delete;
    EngineSession &operator=(const EngineSession &) = delete;
    EngineSession(EngineSession &&) = delete;
    EngineSession &operator=(EngineSession &&) = delete;

    // Throws ConfigError when the binary is missing or not executable,
    // std::runtime_error when the process cannot be spawned.
    void open(const std::string &exePath, const EnvOverrides &env = {});

    // Sends "quit", waits `grace`, then kills. The process never outlives this call.
    void close(std::chrono::milliseconds grace = kQuitGrace);

    bool isOpen() const noexcept;
    bool reachedEof() const noexcept;

    // Raw lines in both directions ("> cmd", "< reply") when set.
    void setTranscript(std::ostream *out) noexcept { m_transcript = out; }

    bool send(const std::string &line);

    // Polls in kPollSlice steps until a completed line contains any of `patterns`
    // or `timeout` elapses. Lines after the matching one stay buffered for the next call.
    AwaitResult awaitPattern(const std::set<std::string> &patterns, std::chrono::milliseconds timeout);

    // ---- protocol helpers ----
    // usi -> usiok; collects advertised option names into `outOptions`.
    bool handshake(std::chrono::milliseconds timeout, std::set<std::string> *outOptions = nullptr);
    bool syncReady(std::chrono::milliseconds timeout);
    void setOption(const std::string &name, const OptionValue &v);
    void newGame();
    void position(const std::string &positionBody);
    void goByoyomi(int byoyomiMs);

  private:
    bool platformStart(const std::string &exePath, const EnvOverrides &env, std::string &outError);
    void platformStop(std::chrono::milliseconds grace);
    bool platformWrite(const std::string &s);
    // Waits up to `slice` for output and appends what arrived. False once EOF/error is seen.
    bool platformPoll(std::chrono::milliseconds slice);
    bool platformNextLine(std::string &outLine);

  private:
    std::ostream *m_transcript{nullptr};

    struct Impl;

    struct ImplDeleter
    {
      void operator()(Impl *p) noexcept; // defined in platform .cpp where Impl is complete
    };

    std::unique_ptr<Impl, ImplDeleter> m_impl;
  };
} // namespace spiketune::usi
