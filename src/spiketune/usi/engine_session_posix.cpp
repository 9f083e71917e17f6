#if !defined(_WIN32)

#include "spiketune/usi/engine_session.hpp"

#include <cerrno>
#include <csignal>
#include <string>

#include <poll.h>
#include <unistd.h>

#include "spiketune/usi/line_buffer.hpp"

namespace spiketune::usi
{
  struct EngineSession::Impl
  {
    SpawnedProcess proc;
    LineBuffer buffer;
    bool eof{false};
  };

  void EngineSession::ImplDeleter::operator()(Impl *p) noexcept
  {
    delete p;
  }

  static void ignoreSigpipeOnce()
  {
    // A dead engine must surface as a failed write, not kill the harness.
    static const bool installed = []
    {
      std::signal(SIGPIPE, SIG_IGN);
      return true;
    }();
    (void)installed;
  }

  bool EngineSession::isOpen() const noexcept
  {
    return m_impl && m_impl->proc.pid > 0;
  }

  bool EngineSession::reachedEof() const noexcept
  {
    return !m_impl || (m_impl->eof && m_impl->buffer.pendingBytes() == 0);
  }

  bool EngineSession::platformStart(const std::string &exePath, const EnvOverrides &env,
                                    std::string &outError)
  {
    platformStop(kQuitGrace);
    ignoreSigpipeOnce();
    m_impl.reset(new Impl()); // IMPORTANT: not make_unique (would create wrong deleter type)

    if (!spawnWithPipes(exePath, env, m_impl->proc, &outError))
    {
      m_impl.reset();
      return false;
    }
    return true;
  }

  void EngineSession::platformStop(std::chrono::milliseconds grace)
  {
    if (!m_impl)
      return;
    terminateProcess(m_impl->proc, grace);
    m_impl.reset();
  }

  bool EngineSession::platformWrite(const std::string &s)
  {
    if (!m_impl || m_impl->proc.stdinFd < 0)
      return false;

    const char *p = s.data();
    size_t remaining = s.size();

    while (remaining > 0)
    {
      ssize_t n = ::write(m_impl->proc.stdinFd, p, remaining);
      if (n < 0)
      {
        if (errno == EINTR)
          continue;
        return false;
      }
      p += n;
      remaining -= (size_t)n;
    }
    return true;
  }

  bool EngineSession::platformPoll(std::chrono::milliseconds slice)
  {
    if (!m_impl || m_impl->eof || m_impl->proc.stdoutFd < 0)
      return false;

    pollfd pfd{};
    pfd.fd = m_impl->proc.stdoutFd;
    pfd.events = POLLIN;

    const int r = ::poll(&pfd, 1, static_cast<int>(slice.count()));
    if (r < 0)
      return errno == EINTR;
    if (r == 0)
      return true;

    char tmp[4096];
    for (;;)
    {
      ssize_t n = ::read(m_impl->proc.stdoutFd, tmp, sizeof(tmp));
      if (n > 0)
      {
        m_impl->buffer.append(tmp, static_cast<size_t>(n));
        continue;
      }
      if (n == 0)
      {
        m_impl->eof = true;
        return false;
      }
      if (errno == EINTR)
        continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK)
        return true;
      m_impl->eof = true;
      return false;
    }
  }

  bool EngineSession::platformNextLine(std::string &outLine)
  {
    if (!m_impl)
      return false;
    if (m_impl->buffer.popLine(outLine))
      return true;
    return m_impl->eof && m_impl->buffer.takeRemainder(outLine);
  }

} // namespace spiketune::usi

#endif // !_WIN32
