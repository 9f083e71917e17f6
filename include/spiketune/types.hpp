#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace spiketune {

// One reproducible test position derived from a spike.
struct Target {
  std::string tag;          // deterministic key, unique within a batch
  std::string prePosition;  // position body without the "position" keyword
  std::string originLog;
  int originPly = 0;
  int originDelta = 0;
  int backPlies = 0;
  std::string nextMove;  // move played from prePosition in the origin game ("" if none)

  // Present only for targets mined from structured move logs.
  std::optional<int> originGameIndex;
  std::optional<std::string> originSide;
  std::optional<bool> originCandBlack;
};

// Outcome of one (target, profile) session.
struct EvalResult {
  std::string tag;
  std::string profile;
  std::optional<int> evalCp;  // null on timeout or when no score was reported
  int depth = 0;
  int seldepth = 0;
  std::optional<std::string> bestmove;
  std::uint64_t nodes = 0;
  std::uint64_t nps = 0;
  long long elapsedMs = 0;
  bool timedOut = false;
};

}  // namespace spiketune
