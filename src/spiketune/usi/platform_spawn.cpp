#include "spiketune/usi/platform_spawn.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace spiketune::usi
{
  namespace
  {
    std::vector<std::string> buildEnvironment(const EnvOverrides &env)
    {
      std::map<std::string, std::string> merged;
      for (char **e = environ; e && *e; ++e)
      {
        const std::string kv(*e);
        const auto eq = kv.find('=');
        if (eq == std::string::npos)
          continue;
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
      }
      for (const auto &[k, v] : env)
        merged[k] = v;

      std::vector<std::string> out;
      out.reserve(merged.size());
      for (const auto &[k, v] : merged)
        out.push_back(k + "=" + v);
      return out;
    }

    void closeFd(int &fd)
    {
      if (fd >= 0)
      {
        ::close(fd);
        fd = -1;
      }
    }
  } // namespace

  bool isExecutableFile(const std::string &path)
  {
    struct stat st{};
    if (path.empty() || ::stat(path.c_str(), &st) != 0)
      return false;
    return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
  }

  bool spawnWithPipes(const std::string &exePath, const EnvOverrides &env, SpawnedProcess &out,
                      std::string *outError)
  {
    int inPipe[2]{-1, -1};
    int outPipe[2]{-1, -1};

    // Close-on-exec from creation, so engines forked by other sessions never hold these ends.
    if (::pipe2(inPipe, O_CLOEXEC) != 0)
    {
      if (outError)
        *outError = "pipe(stdin) failed.";
      return false;
    }
    if (::pipe2(outPipe, O_CLOEXEC) != 0)
    {
      if (outError)
        *outError = "pipe(stdout) failed.";
      ::close(inPipe[0]);
      ::close(inPipe[1]);
      return false;
    }

    // Everything the child needs is prepared before fork(): only async-signal-safe calls after it.
    const std::vector<std::string> envStrings = buildEnvironment(env);
    std::vector<char *> envp;
    envp.reserve(envStrings.size() + 1);
    for (const auto &s : envStrings)
      envp.push_back(const_cast<char *>(s.c_str()));
    envp.push_back(nullptr);
    char *const argv[] = {const_cast<char *>(exePath.c_str()), nullptr};

    pid_t pid = ::fork();
    if (pid < 0)
    {
      if (outError)
        *outError = "fork failed.";
      ::close(inPipe[0]);
      ::close(inPipe[1]);
      ::close(outPipe[0]);
      ::close(outPipe[1]);
      return false;
    }

    if (pid == 0)
    {
      // Child. dup2 clears close-on-exec on the standard descriptors.
      (void)::dup2(inPipe[0], STDIN_FILENO);
      (void)::dup2(outPipe[1], STDOUT_FILENO);
      (void)::dup2(outPipe[1], STDERR_FILENO);

      ::close(inPipe[0]);
      ::close(inPipe[1]);
      ::close(outPipe[0]);
      ::close(outPipe[1]);

      ::execve(exePath.c_str(), argv, envp.data());
      _exit(127);
    }

    // Parent
    ::close(inPipe[0]);
    ::close(outPipe[1]);

    const int flags = ::fcntl(outPipe[0], F_GETFL, 0);
    (void)::fcntl(outPipe[0], F_SETFL, flags | O_NONBLOCK);

    out.pid = pid;
    out.stdinFd = inPipe[1];
    out.stdoutFd = outPipe[0];
    return true;
  }

  bool reapIfExited(SpawnedProcess &p)
  {
    if (p.pid <= 0)
      return true;
    int status = 0;
    const pid_t r = ::waitpid(p.pid, &status, WNOHANG);
    if (r == p.pid || (r < 0 && errno == ECHILD))
    {
      p.pid = -1;
      return true;
    }
    return false;
  }

  void terminateProcess(SpawnedProcess &p, std::chrono::milliseconds grace)
  {
    closeFd(p.stdinFd);

    if (p.pid > 0)
    {
      const auto deadline = std::chrono::steady_clock::now() + grace;
      while (!reapIfExited(p) && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

      if (p.pid > 0)
      {
        // Still running -> hard kill and wait.
        (void)::kill(p.pid, SIGKILL);
        int status = 0;
        (void)::waitpid(p.pid, &status, 0);
        p.pid = -1;
      }
    }

    closeFd(p.stdoutFd);
  }

} // namespace spiketune::usi
