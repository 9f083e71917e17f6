#include "spiketune/analysis/log_spikes.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

#include "spiketune/usi/usi_utils.hpp"

namespace spiketune::analysis {

namespace {

inline bool is_word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Whitespace tokens starting at `pos`.
std::vector<std::string> tokens_from(std::string_view line, std::size_t pos) {
  std::vector<std::string> out;
  std::istringstream is{std::string(line.substr(pos))};
  std::string t;
  while (is >> t) out.push_back(std::move(t));
  return out;
}

struct InfoScore {
  int cp = 0;
  std::optional<int> depth;
};

// "<...> info [depth D] ... score (cp|mate) N ..." anywhere in a transcript line.
std::optional<InfoScore> match_info_score(std::string_view line) {
  const std::size_t infoPos = find_word(line, "info");
  if (infoPos == std::string_view::npos) return std::nullopt;

  const auto tok = tokens_from(line, infoPos);
  for (std::size_t i = 1; i + 2 < tok.size(); ++i) {
    if (tok[i] == "string" || tok[i] == "pv") break;
    if (tok[i] != "score") continue;
    std::optional<int> cp;
    if (tok[i + 1] == "cp") cp = usi::parseInt32(tok[i + 2]);
    else if (tok[i + 1] == "mate") cp = usi::parseMate(tok[i + 2]);
    if (!cp) continue;
    InfoScore s;
    s.cp = *cp;
    if (tok.size() > 2 && tok[1] == "depth") s.depth = usi::parseInt32(tok[2]);
    return s;
  }
  return std::nullopt;
}

std::optional<std::string> match_bestmove(std::string_view line) {
  const std::size_t pos = find_word(line, "bestmove");
  if (pos == std::string_view::npos) return std::nullopt;
  const auto tok = tokens_from(line, pos);
  if (tok.size() < 2 || tok[0] != "bestmove") return std::nullopt;
  return tok[1];
}

}  // namespace

std::optional<Position> find_position(std::string_view line) {
  std::size_t from = 0;
  for (;;) {
    const std::size_t pos = find_word(line, "position", from);
    if (pos == std::string_view::npos) return std::nullopt;
    const auto tok = tokens_from(line, pos);
    if (tok.size() >= 2 && tok[0] == "position" && (tok[1] == "startpos" || tok[1] == "sfen"))
      return Position::parse(line.substr(pos));
    from = pos + 1;
  }
}

std::size_t find_word(std::string_view line, std::string_view word, std::size_t from) {
  while (from <= line.size()) {
    const std::size_t pos = line.find(word, from);
    if (pos == std::string_view::npos) return pos;
    const bool leftOk = pos == 0 || !is_word_char(line[pos - 1]);
    const std::size_t end = pos + word.size();
    const bool rightOk = end == line.size() || !is_word_char(line[end]);
    if (leftOk && rightOk) return pos;
    from = pos + 1;
  }
  return std::string_view::npos;
}

ParseState parse_step(ParseState state, const std::string& line) {
  // Resolve decisions waiting for the GUI's next position line.
  if (!state.awaitingPosition.empty()) {
    if (auto pos = find_position(line)) {
      for (const auto& [idx, left] : state.awaitingPosition) state.records[idx].posAfter = *pos;
      state.awaitingPosition.clear();
    } else {
      for (auto& entry : state.awaitingPosition) --entry.second;
      state.awaitingPosition.erase(
          std::remove_if(state.awaitingPosition.begin(), state.awaitingPosition.end(),
                         [](const auto& e) { return e.second <= 0; }),
          state.awaitingPosition.end());
    }
  }

  if (auto info = match_info_score(line)) {
    state.curEval = info->cp;
    state.lastCp = info->cp;
    if (info->depth) state.lastDepth = *info->depth;
    return state;
  }

  if (auto bm = match_bestmove(line)) {
    DecisionRecord rec;
    rec.ply = static_cast<int>(state.records.size()) + 1;
    rec.bestmove = std::move(*bm);
    rec.lastCp = state.lastCp;
    rec.lastDepth = state.lastDepth;
    // Missing reading: carry the previous filled value forward (0 before the first one).
    if (state.curEval) rec.eval = *state.curEval;
    else rec.eval = state.records.empty() ? 0 : state.records.back().eval;
    state.curEval.reset();

    state.awaitingPosition.emplace_back(state.records.size(), kPositionLookahead - 1);
    state.records.push_back(std::move(rec));
  }
  return state;
}

std::vector<DecisionRecord> parse_transcript(const std::vector<std::string>& lines) {
  ParseState state;
  for (const auto& l : lines) state = parse_step(std::move(state), l);
  return std::move(state.records);
}

std::vector<int> eval_series(const std::vector<DecisionRecord>& records) {
  std::vector<int> out;
  out.reserve(records.size());
  for (const auto& r : records) out.push_back(r.eval);
  return out;
}

std::vector<SpikeRecord> detect_spikes(const std::vector<int>& evals, int threshold) {
  std::vector<SpikeRecord> spikes;
  for (std::size_t i = 1; i < evals.size(); ++i) {
    const int delta = evals[i] - evals[i - 1];
    if (std::abs(delta) >= threshold) spikes.push_back({static_cast<int>(i) + 1, delta});
  }
  return spikes;
}

std::vector<SpikeRecord> top_k_spikes(std::vector<SpikeRecord> spikes, int k) {
  if (k <= 0 || spikes.size() <= static_cast<std::size_t>(k)) return spikes;
  std::stable_sort(spikes.begin(), spikes.end(), [](const SpikeRecord& a, const SpikeRecord& b) {
    return std::abs(a.delta) > std::abs(b.delta);
  });
  spikes.resize(static_cast<std::size_t>(k));
  return spikes;
}

}  // namespace spiketune::analysis
