#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "spiketune/analysis/position.hpp"

namespace spiketune::analysis {

// How many lines after a bestmove the GUI's next "position" line may appear.
inline constexpr int kPositionLookahead = 80;

// One engine decision in a transcript, closed out by its bestmove line.
struct DecisionRecord {
  int ply = 0;  // 1-based decision index within the transcript
  std::string bestmove;
  std::optional<Position> posAfter;
  std::optional<int> lastCp;  // most recent score seen anywhere before this decision
  int lastDepth = -1;
  int eval = 0;  // filled evaluation used for spike detection
};

struct SpikeRecord {
  int ply = 0;  // 1-based index into the evaluation series
  int delta = 0;
};

// Accumulator threaded through parse_step. Holds everything the fold needs;
// there is no state outside it.
struct ParseState {
  std::vector<DecisionRecord> records;
  std::optional<int> curEval;  // evaluation reported since the previous decision
  std::optional<int> lastCp;
  int lastDepth = -1;
  // (record index, lines left) for decisions still waiting for their position line
  std::vector<std::pair<std::size_t, int>> awaitingPosition;
};

ParseState parse_step(ParseState state, const std::string& line);

// Folds parse_step over a whole transcript.
std::vector<DecisionRecord> parse_transcript(const std::vector<std::string>& lines);

std::vector<int> eval_series(const std::vector<DecisionRecord>& records);

// Flags i in [2, L] with |E[i] - E[i-1]| >= threshold.
std::vector<SpikeRecord> detect_spikes(const std::vector<int>& evals, int threshold);

// Keeps the k largest |delta| (stable: earlier ply wins ties). k <= 0 keeps everything.
std::vector<SpikeRecord> top_k_spikes(std::vector<SpikeRecord> spikes, int k);

// "position startpos|sfen ..." anywhere in the line, parsed from the keyword on.
std::optional<Position> find_position(std::string_view line);

// Whole-word search helper shared with the move-log reader.
std::size_t find_word(std::string_view line, std::string_view word, std::size_t from = 0);

}  // namespace spiketune::analysis
