#include "spiketune/metrics/metrics.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <utility>

namespace spiketune::metrics {

using nlohmann::json;

MetricsReport aggregate(const std::vector<EvalResult>& results, int badThreshold) {
  MetricsReport r;
  r.total = static_cast<int>(results.size());

  double sumCp = 0.0;
  double sumDepth = 0.0;
  for (const auto& e : results) {
    if (!e.evalCp) continue;
    ++r.valid;
    sumCp += *e.evalCp;
    sumDepth += e.depth;
    if (*e.evalCp <= badThreshold) ++r.badCount;
  }
  if (r.valid > 0) {
    r.spikeRatePercent = 100.0 * r.badCount / r.valid;
    r.avgCp = sumCp / r.valid;
    r.avgDepth = sumDepth / r.valid;
  }
  return r;
}

std::vector<EvalResult> filter_profile(const std::vector<EvalResult>& results, const std::string& profile) {
  std::vector<EvalResult> out;
  std::copy_if(results.begin(), results.end(), std::back_inserter(out),
               [&](const EvalResult& e) { return e.profile == profile; });
  return out;
}

OriginKey origin_of(const Target& t) { return {t.originLog, t.originGameIndex, t.originPly}; }

static std::map<std::string, const EvalResult*> index_by_tag(const std::vector<EvalResult>& results,
                                                             const std::string& profile) {
  std::map<std::string, const EvalResult*> idx;
  for (const auto& e : results) {
    if (e.profile == profile) idx[e.tag] = &e;  // later entries win
  }
  return idx;
}

std::vector<FirstBad> select_first_bad(const std::vector<Target>& targets,
                                       const std::vector<EvalResult>& results, const std::string& profile,
                                       int badThreshold) {
  std::map<OriginKey, std::vector<const Target*>> byOrigin;
  for (const auto& t : targets) {
    if (t.originLog.empty()) continue;
    byOrigin[origin_of(t)].push_back(&t);
  }
  const auto scores = index_by_tag(results, profile);

  std::vector<FirstBad> out;
  for (auto& [origin, items] : byOrigin) {
    std::stable_sort(items.begin(), items.end(),
                     [](const Target* a, const Target* b) { return a->backPlies < b->backPlies; });
    for (const Target* t : items) {
      auto it = scores.find(t->tag);
      if (it == scores.end() || !it->second->evalCp) continue;
      if (*it->second->evalCp <= badThreshold) {
        out.push_back({*t, *it->second});
        break;
      }
    }
  }
  return out;
}

std::vector<EvalResult> results_of(const std::vector<FirstBad>& rows) {
  std::vector<EvalResult> out;
  out.reserve(rows.size());
  for (const auto& r : rows) out.push_back(r.result);
  return out;
}

AvoidanceReport compute_avoidance(const std::vector<FirstBad>& firstBad,
                                  const std::vector<EvalResult>& evaluated, const std::string& profile,
                                  int goodThreshold) {
  AvoidanceReport r;
  const auto idx = index_by_tag(evaluated, profile);

  for (const auto& row : firstBad) {
    ++r.firstBadTotal;
    auto it = idx.find(row.target.tag);
    if (it == idx.end()) continue;
    const EvalResult& e = *it->second;

    const bool avoided = !row.target.nextMove.empty() && e.bestmove && *e.bestmove != row.target.nextMove;
    if (!avoided) continue;
    ++r.avoidCount;
    if (e.evalCp && *e.evalCp >= goodThreshold) ++r.avoidAndGoodCount;
  }
  if (r.firstBadTotal > 0) {
    r.avoidRatePercent = 100.0 * r.avoidCount / r.firstBadTotal;
    r.avoidAndGoodRatePercent = 100.0 * r.avoidAndGoodCount / r.firstBadTotal;
  }
  return r;
}

template <typename T>
static json nullable(const std::optional<T>& v) {
  return v ? json(*v) : json(nullptr);
}

json to_json(const MetricsReport& r) {
  return {
      {"total", r.total},
      {"valid", r.valid},
      {"bad_count", r.badCount},
      {"spike_rate_percent", nullable(r.spikeRatePercent)},
      {"avg_cp", nullable(r.avgCp)},
      {"avg_depth", nullable(r.avgDepth)},
  };
}

json to_json(const AvoidanceReport& r) {
  return {
      {"first_bad_total", r.firstBadTotal},
      {"avoid_count", r.avoidCount},
      {"avoid_rate_percent", nullable(r.avoidRatePercent)},
      {"avoid_and_good_count", r.avoidAndGoodCount},
      {"avoid_and_good_rate_percent", nullable(r.avoidAndGoodRatePercent)},
  };
}

}  // namespace spiketune::metrics
