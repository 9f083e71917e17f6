#include "spiketune/analysis/move_log.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "spiketune/usi/usi_utils.hpp"

namespace spiketune::analysis {

namespace fs = std::filesystem;
using nlohmann::json;

std::optional<SideFilter> parse_side_filter(const std::string& s) {
  if (s == "cand") return SideFilter::Cand;
  if (s == "base") return SideFilter::Base;
  if (s == "both") return SideFilter::Both;
  return std::nullopt;
}

static std::string string_or_empty(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

std::optional<MoveRecord> parse_move_record(const std::string& line) {
  const std::string body = usi::trim(line);
  if (body.empty()) return std::nullopt;

  const json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (!j.is_object()) return std::nullopt;

  auto gi = j.find("game_index");
  if (gi == j.end() || !gi->is_number_integer()) return std::nullopt;

  MoveRecord r;
  r.gameIndex = gi->get<int>();
  if (auto p = j.find("ply"); p != j.end() && p->is_number_integer()) r.ply = p->get<int>();
  r.side = string_or_empty(j, "side");
  r.position = string_or_empty(j, "position");
  r.bestmove = string_or_empty(j, "bestmove");
  if (auto cb = j.find("cand_black"); cb != j.end() && cb->is_boolean()) r.candBlack = cb->get<bool>();

  if (auto cp = j.find("eval_cp"); cp != j.end() && cp->is_number_integer()) {
    r.evalCp = cp->get<int>();
  } else if (auto mate = j.find("eval_mate"); mate != j.end() && mate->is_number_integer()) {
    r.evalCp = usi::normalizeMate(mate->get<long long>());
  }
  return r;
}

bool read_move_log(const std::string& path, SideFilter filter, MoveGames& games) {
  std::ifstream in(path);
  if (!in) return false;
  const std::string base = fs::path(path).filename().string();

  std::string line;
  while (std::getline(in, line)) {
    auto rec = parse_move_record(line);
    if (!rec) continue;
    if (filter == SideFilter::Cand && rec->side != "cand") continue;
    if (filter == SideFilter::Base && rec->side != "base") continue;
    games[{base, rec->gameIndex}].push_back(std::move(*rec));
  }
  return true;
}

std::vector<Target> extract_from_game(DedupContext& ctx, const std::string& fileBase, int gameIndex,
                                      std::vector<MoveRecord> records, const ExtractSettings& settings,
                                      GameSummary* summary) {
  std::stable_sort(records.begin(), records.end(),
                   [](const MoveRecord& a, const MoveRecord& b) { return a.ply < b.ply; });

  std::vector<int> evals;
  evals.reserve(records.size());
  std::optional<int> cur;
  for (const auto& r : records) {
    if (r.evalCp) cur = r.evalCp;
    evals.push_back(cur.value_or(0));
  }

  const auto spikes = top_k_spikes(detect_spikes(evals, settings.threshold), settings.topK);
  if (summary) {
    summary->moves = static_cast<int>(records.size());
    summary->spikes = static_cast<int>(spikes.size());
  }

  SpikeOrigin origin;
  origin.originLog = fileBase;
  origin.tagStem = fs::path(fileBase).stem().string();
  origin.gameIndex = gameIndex;

  // Provenance of side/cand_black differs per move, so expand one site at a time.
  std::vector<Target> out;
  for (const auto& s : spikes) {
    const MoveRecord& m = records[static_cast<std::size_t>(s.ply - 1)];
    auto before = Position::parse(m.position);
    if (!before) continue;

    SpikeSite site;
    site.spike = s;
    site.originPly = m.ply;
    site.posAfter = before->with_move(m.bestmove);

    origin.side = m.side.empty() ? std::nullopt : std::optional<std::string>(m.side);
    origin.candBlack = m.candBlack;
    auto produced = expand(ctx, origin, {site}, settings.back);
    out.insert(out.end(), std::make_move_iterator(produced.begin()),
               std::make_move_iterator(produced.end()));
  }
  return out;
}

}  // namespace spiketune::analysis
