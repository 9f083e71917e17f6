#include "spiketune/analysis/target_generator.hpp"

#include <algorithm>
#include <set>

namespace spiketune::analysis {

std::string make_tag(const SpikeOrigin& origin, int ply, int back) {
  std::string tag = origin.tagStem;
  if (origin.gameIndex) tag += "_g" + std::to_string(*origin.gameIndex);
  tag += "_ply" + std::to_string(ply) + "_back" + std::to_string(back);
  return tag;
}

std::vector<Target> expand(DedupContext& ctx, const SpikeOrigin& origin,
                           const std::vector<SpikeSite>& sites, BackRange range) {
  std::vector<Target> out;
  for (const auto& site : sites) {
    if (!site.posAfter) continue;
    for (int k = range.min; k <= range.max; ++k) {
      const Position pre = site.posAfter->rewound(k);
      std::string key = pre.to_string();
      if (!ctx.claim(key)) continue;

      Target t;
      t.tag = make_tag(origin, site.originPly, k);
      t.prePosition = std::move(key);
      t.originLog = origin.originLog;
      t.originPly = site.originPly;
      t.originDelta = site.spike.delta;
      t.backPlies = k;
      t.nextMove = site.posAfter->move_after_rewind(k);
      t.originGameIndex = origin.gameIndex;
      t.originSide = origin.side;
      t.originCandBlack = origin.candBlack;
      out.push_back(std::move(t));
    }
  }
  return out;
}

std::vector<int> expand_window(const std::vector<int>& plies, int back, int forward, int totalPlies) {
  back = std::max(0, back);
  forward = std::max(0, forward);
  std::set<int> keep;
  for (int p : plies) {
    const int lo = std::max(1, p - back);
    const int hi = std::min(totalPlies, p + forward);
    for (int q = lo; q <= hi; ++q) keep.insert(q);
  }
  return {keep.begin(), keep.end()};
}

std::vector<Target> extract_from_transcript(DedupContext& ctx, const SpikeOrigin& origin,
                                            const std::vector<std::string>& lines,
                                            const ExtractSettings& settings,
                                            ExtractSummary* summary) {
  const auto records = parse_transcript(lines);
  if (summary) {
    summary->plies = static_cast<int>(records.size());
    summary->hasDecisions = !records.empty();
  }
  if (records.empty()) return {};

  const auto spikes = detect_spikes(eval_series(records), settings.threshold);
  if (summary) summary->spikes = static_cast<int>(spikes.size());

  std::vector<SpikeSite> sites;
  for (const auto& s : top_k_spikes(spikes, settings.topK)) {
    SpikeSite site;
    site.spike = s;
    site.originPly = s.ply;
    site.posAfter = records[static_cast<std::size_t>(s.ply - 1)].posAfter;
    sites.push_back(std::move(site));
  }
  return expand(ctx, origin, sites, settings.back);
}

}  // namespace spiketune::analysis
