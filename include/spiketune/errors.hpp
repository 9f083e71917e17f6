#pragma once
#include <stdexcept>
#include <string>

namespace spiketune {

// Fatal configuration problem: missing engine binary, missing required file,
// unknown scenario, invalid parameter domain. Reported to the user and aborts the run.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace spiketune
