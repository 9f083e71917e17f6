#pragma once
#include <chrono>
#include <map>
#include <string>

#include <sys/types.h>

namespace spiketune::usi
{
  // Variables set (or replaced) in the child's environment on top of the parent's.
  using EnvOverrides = std::map<std::string, std::string>;

  struct SpawnedProcess
  {
    pid_t pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1}; // non-blocking; carries the child's stdout and stderr
  };

  bool isExecutableFile(const std::string &path);

  bool spawnWithPipes(const std::string &exePath, const EnvOverrides &env, SpawnedProcess &out,
                      std::string *outError = nullptr);

  // Reaps the child if it has exited. Returns true once the process is gone.
  bool reapIfExited(SpawnedProcess &p);

  // Closes the pipes, waits up to `grace` for a voluntary exit, then SIGKILLs and reaps.
  void terminateProcess(SpawnedProcess &p, std::chrono::milliseconds grace);

} // namespace spiketune::usi
