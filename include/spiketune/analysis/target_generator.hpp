#pragma once
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "spiketune/analysis/log_spikes.hpp"
#include "spiketune/analysis/position.hpp"
#include "spiketune/types.hpp"

namespace spiketune::analysis {

// Positions already emitted in the current batch. Threaded explicitly through
// every expand() call of one generation pass.
struct DedupContext {
  std::unordered_set<std::string> seen;

  // True when `positionKey` is new (and records it).
  bool claim(const std::string& positionKey) { return seen.insert(positionKey).second; }
};

struct BackRange {
  int min = 2;
  int max = 5;
};

// Where spikes came from; shared by every site of one transcript or game.
struct SpikeOrigin {
  std::string originLog;  // identifier written into target provenance
  std::string tagStem;    // usually the transcript's file stem
  std::optional<int> gameIndex;
  std::optional<std::string> side;
  std::optional<bool> candBlack;
};

// A spike plus the position right after its decision.
struct SpikeSite {
  SpikeRecord spike;
  int originPly = 0;
  std::optional<Position> posAfter;
};

std::string make_tag(const SpikeOrigin& origin, int ply, int back);

// One target per (site, k) for k in [range.min, range.max], skipping positions
// already claimed in `ctx`. Sites without a position yield nothing.
std::vector<Target> expand(DedupContext& ctx, const SpikeOrigin& origin,
                           const std::vector<SpikeSite>& sites, BackRange range);

// Ply numbers within [p - back, p + forward] of any p, clipped to [1, totalPlies],
// sorted and unique.
std::vector<int> expand_window(const std::vector<int>& plies, int back, int forward, int totalPlies);

// Transcript pipeline: parse, fill, detect, top-k, expand.
struct ExtractSettings {
  int threshold = 250;
  int topK = 10;
  BackRange back;
};

struct ExtractSummary {
  int plies = 0;
  int spikes = 0;
  bool hasDecisions = false;
};

std::vector<Target> extract_from_transcript(DedupContext& ctx, const SpikeOrigin& origin,
                                            const std::vector<std::string>& lines,
                                            const ExtractSettings& settings,
                                            ExtractSummary* summary = nullptr);

}  // namespace spiketune::analysis
