#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "spiketune/analysis/target_generator.hpp"

namespace spiketune::analysis {

enum class SideFilter { Cand, Base, Both };

std::optional<SideFilter> parse_side_filter(const std::string& s);

// One line of a structured move log (JSON lines, one record per move).
struct MoveRecord {
  int gameIndex = 0;
  int ply = 0;
  std::string side;
  std::optional<int> evalCp;  // mate already folded in
  std::string position;       // position body before the move
  std::string bestmove;
  bool candBlack = false;
};

// Returns nullopt for blank lines, invalid JSON and records without a game index.
std::optional<MoveRecord> parse_move_record(const std::string& line);

// Keyed by (file base name, game index); records kept in file order.
using MoveGames = std::map<std::pair<std::string, int>, std::vector<MoveRecord>>;

// Appends the matching records of `path` to `games`. False when the file cannot be opened.
bool read_move_log(const std::string& path, SideFilter filter, MoveGames& games);

struct GameSummary {
  int moves = 0;
  int spikes = 0;
};

// Spike targets for one game. Records are ordered by ply before evaluation.
std::vector<Target> extract_from_game(DedupContext& ctx, const std::string& fileBase, int gameIndex,
                                      std::vector<MoveRecord> records, const ExtractSettings& settings,
                                      GameSummary* summary = nullptr);

}  // namespace spiketune::analysis
