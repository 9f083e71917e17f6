#include "spiketune/regression/regression_suite.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

#include "spiketune/analysis/log_spikes.hpp"
#include "spiketune/errors.hpp"
#include "spiketune/io/batch_io.hpp"
#include "spiketune/usi/usi_utils.hpp"

namespace spiketune::regression {

using nlohmann::json;

namespace {

std::optional<int> opt_int(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return std::nullopt;
  return it->get<int>();
}

Scenario scenario_from_json(const json& j) {
  Scenario s;
  s.name = j.at("name").get<std::string>();
  s.log = j.at("log").get<std::string>();
  s.prefixes = j.at("prefixes").get<std::vector<int>>();
  s.threads = j.value("threads", 8);
  s.multipv = j.value("multipv", 1);
  s.byoyomiMs = j.value("byoyomi_ms", 10000);
  if (auto it = j.find("engine"); it != j.end() && it->is_string()) s.engine = it->get<std::string>();
  if (auto it = j.find("out_dir"); it != j.end() && it->is_string()) s.outDir = it->get<std::string>();
  s.scoreCpMin = opt_int(j, "score_cp_min");
  s.scoreCpMax = opt_int(j, "score_cp_max");
  s.seldepthMax = opt_int(j, "seldepth_max");

  if (auto it = j.find("prefix_guard"); it != j.end() && it->is_array()) {
    for (const auto& g : *it) {
      PrefixGuard pg;
      pg.number = g.at("number").get<int>();
      if (auto am = g.find("allowed_moves"); am != g.end() && !am->is_null())
        pg.allowedMoves = am->get<std::vector<std::string>>();
      pg.minCp = opt_int(g, "min_cp");
      pg.maxCp = opt_int(g, "max_cp");
      s.guards.push_back(std::move(pg));
    }
  }
  if (s.name.empty()) throw std::invalid_argument("empty scenario name");
  return s;
}

template <typename T>
std::string bracket_list(const std::vector<T>& v) {
  std::ostringstream os;
  os << "[";
  for (std::size_t i = 0; i < v.size(); ++i) os << (i ? ", " : "") << v[i];
  os << "]";
  return os.str();
}

// "pre-<N>: <rest>" -> N, with `rest` set to what follows ": ".
std::optional<int> split_prefix_key(const std::string& line, std::string& rest) {
  if (!usi::startsWith(line, "pre-")) return std::nullopt;
  const auto colon = line.find(": ", 4);
  if (colon == std::string::npos) return std::nullopt;
  const auto n = usi::parseInt32(std::string_view(line).substr(4, colon - 4));
  if (!n || *n < 0) return std::nullopt;
  rest = line.substr(colon + 2);
  return n;
}

struct InfoFields {
  int depth = 0;
  int seldepth = 0;
  int scoreCp = 0;
  std::size_t at = 0;  // first token after the depth/seldepth pair
};

// Needs "depth D seldepth S" followed later by "score cp|mate X".
std::optional<InfoFields> parse_last_info(const std::string& body) {
  const auto tok = usi::splitWs(body);
  std::optional<InfoFields> found;
  for (std::size_t i = 0; i + 3 < tok.size(); ++i) {
    if (tok[i] != "depth" || tok[i + 2] != "seldepth") continue;
    const auto d = usi::parseInt32(tok[i + 1]);
    const auto sd = usi::parseInt32(tok[i + 3]);
    if (!d || !sd) continue;
    found = InfoFields{*d, *sd, 0};
    found->at = i + 4;
  }
  if (!found) return std::nullopt;

  for (std::size_t i = found->at; i + 2 < tok.size(); ++i) {
    if (tok[i] == "string") break;
    if (tok[i] != "score") continue;
    std::optional<int> cp;
    if (tok[i + 1] == "cp") cp = usi::parseInt32(tok[i + 2]);
    else if (tok[i + 1] == "mate") cp = usi::parseMate(tok[i + 2]);
    if (!cp) continue;
    found->scoreCp = *cp;
    return found;
  }
  return std::nullopt;
}

}  // namespace

std::vector<Scenario> load_scenarios(const std::string& path) {
  const json doc = io::read_json_file(path);
  const json* arr = &doc;
  if (doc.is_object()) {
    auto it = doc.find("scenarios");
    arr = it == doc.end() ? nullptr : &*it;
  }
  if (!arr || !arr->is_array() || arr->empty()) throw ConfigError("Config file has no scenarios: " + path);

  std::vector<Scenario> out;
  for (const auto& rec : *arr) {
    try {
      out.push_back(scenario_from_json(rec));
    } catch (const json::exception& e) {
      std::cerr << "[regressions] skipping malformed scenario: " << e.what() << "\n";
    } catch (const std::invalid_argument& e) {
      std::cerr << "[regressions] skipping malformed scenario: " << e.what() << "\n";
    }
  }
  if (out.empty()) throw ConfigError("Config file has no usable scenarios: " + path);
  return out;
}

std::vector<Scenario> select_scenarios(const std::vector<Scenario>& all, const std::vector<std::string>& names) {
  if (names.empty()) return all;
  const std::set<std::string> wanted(names.begin(), names.end());

  std::vector<Scenario> out;
  std::set<std::string> seen;
  for (const auto& s : all) {
    if (!wanted.count(s.name)) continue;
    out.push_back(s);
    seen.insert(s.name);
  }
  std::vector<std::string> missing;
  for (const auto& n : names) {
    if (!seen.count(n)) missing.push_back(n);
  }
  if (!missing.empty()) throw ConfigError("Unknown scenarios requested: " + bracket_list(missing));
  return out;
}

std::map<int, PrefixResult> parse_summary(const std::vector<std::string>& lines) {
  std::map<int, PrefixResult> results;
  std::set<int> withBestmove;

  for (const auto& raw : lines) {
    const std::string line = usi::trim(raw);
    if (line.empty() || line[0] == '#') continue;

    std::string rest;
    const auto num = split_prefix_key(line, rest);
    if (!num) continue;

    if (usi::startsWith(rest, "bestmove=")) {
      const auto tok = usi::splitWs(rest.substr(9));
      if (tok.empty()) continue;
      results[*num].bestmove = tok[0];
      withBestmove.insert(*num);
    } else if (usi::startsWith(rest, "last_info=")) {
      const auto f = parse_last_info(rest.substr(10));
      if (!f) continue;
      PrefixResult& r = results[*num];
      r.depth = f->depth;
      r.seldepth = f->seldepth;
      r.scoreCp = f->scoreCp;
    }
  }

  std::vector<int> missing;
  for (const auto& [num, r] : results) {
    if (!withBestmove.count(num)) missing.push_back(num);
  }
  if (!missing.empty()) throw RegressionFailure("summary missing data for prefixes: " + bracket_list(missing));
  return results;
}

std::optional<std::string> check_bounds(const Scenario& s, const std::map<int, PrefixResult>& results) {
  auto pre = [](int n) { return "pre-" + std::to_string(n); };

  for (int n : s.prefixes) {
    auto it = results.find(n);
    if (it == results.end()) return "prefix " + pre(n) + " missing in summary";
    const PrefixResult& r = it->second;
    if ((s.scoreCpMin || s.scoreCpMax) && !r.scoreCp) return pre(n) + ": no score reported";
    if (s.scoreCpMin && *r.scoreCp < *s.scoreCpMin)
      return pre(n) + ": score " + std::to_string(*r.scoreCp) + " < min " + std::to_string(*s.scoreCpMin);
    if (s.scoreCpMax && *r.scoreCp > *s.scoreCpMax)
      return pre(n) + ": score " + std::to_string(*r.scoreCp) + " > max " + std::to_string(*s.scoreCpMax);
    if (s.seldepthMax && !r.seldepth) return pre(n) + ": no seldepth reported";
    if (s.seldepthMax && *r.seldepth > *s.seldepthMax)
      return pre(n) + ": seldepth " + std::to_string(*r.seldepth) + " > max " + std::to_string(*s.seldepthMax);
  }

  for (const auto& g : s.guards) {
    auto it = results.find(g.number);
    if (it == results.end()) return "prefix guard " + pre(g.number) + " missing";
    const PrefixResult& r = it->second;
    if (!g.allowedMoves.empty() &&
        std::find(g.allowedMoves.begin(), g.allowedMoves.end(), r.bestmove) == g.allowedMoves.end())
      return pre(g.number) + ": bestmove " + r.bestmove + " not in " + bracket_list(g.allowedMoves);
    if ((g.minCp || g.maxCp) && !r.scoreCp) return pre(g.number) + ": no score reported";
    if (g.minCp && *r.scoreCp < *g.minCp)
      return pre(g.number) + ": score " + std::to_string(*r.scoreCp) + " < guard min " + std::to_string(*g.minCp);
    if (g.maxCp && *r.scoreCp > *g.maxCp)
      return pre(g.number) + ": score " + std::to_string(*r.scoreCp) + " > guard max " + std::to_string(*g.maxCp);
  }
  return std::nullopt;
}

EngineReplayer::EngineReplayer(runner::RunnerSettings base, runner::ProfileConfig profile)
    : base_(std::move(base)), profile_(std::move(profile)) {}

std::vector<std::string> EngineReplayer::replay(const Scenario& s) {
  std::vector<std::string> logLines;
  if (!io::read_lines(s.log, logLines)) throw ConfigError("scenario " + s.name + ": log not found: " + s.log);

  std::optional<analysis::Position> game;
  for (const auto& l : logLines) {
    if (auto p = analysis::find_position(l)) game = std::move(p);
  }
  if (!game) throw RegressionFailure("no position line in " + s.log);

  runner::RunnerSettings rs = base_;
  rs.threads = s.threads;
  rs.multipv = s.multipv;
  rs.byoyomiMs = s.byoyomiMs;
  if (s.engine) rs.enginePath = *s.engine;
  const std::string outDir = s.resolved_out_dir();
  rs.logDir = outDir;
  const runner::TargetRunner tr(rs);

  std::vector<std::string> summary{"# scenario=" + s.name, "# log=" + s.log};
  for (int n : s.prefixes) {
    const std::string key = "pre-" + std::to_string(n);
    const auto o = tr.search(game->prefix(n).to_string(), profile_, s.byoyomiMs, key);
    if (o.bestmove) summary.push_back(key + ": bestmove=" + *o.bestmove);
    if (!o.scoreLine.empty()) summary.push_back(key + ": last_info=" + o.scoreLine);
  }
  io::write_lines(outDir + "/summary.txt", summary);
  return summary;
}

const char* to_string(ScenarioState s) noexcept {
  switch (s) {
    case ScenarioState::Pending: return "pending";
    case ScenarioState::Replayed: return "replayed";
    case ScenarioState::Parsed: return "parsed";
    case ScenarioState::Checked: return "checked";
    case ScenarioState::Pass: return "pass";
    case ScenarioState::Fail: return "fail";
  }
  return "unknown";
}

RegressionSuite::RegressionSuite(std::vector<Scenario> scenarios, PrefixReplayer& replayer)
    : scenarios_(std::move(scenarios)), replayer_(replayer) {}

ScenarioOutcome RegressionSuite::run_one(const Scenario& s) {
  ScenarioOutcome o;
  o.name = s.name;
  try {
    const auto summary = replayer_.replay(s);
    o.state = ScenarioState::Replayed;

    const auto results = parse_summary(summary);
    o.state = ScenarioState::Parsed;

    const auto violation = check_bounds(s, results);
    o.state = ScenarioState::Checked;

    if (violation) {
      o.state = ScenarioState::Fail;
      o.reason = *violation;
    } else {
      o.state = ScenarioState::Pass;
      o.prefixCount = static_cast<int>(results.size());
    }
  } catch (const ConfigError&) {
    throw;
  } catch (const std::runtime_error& e) {
    o.state = ScenarioState::Fail;
    o.reason = e.what();
  }
  return o;
}

int RegressionSuite::run(std::ostream& out) {
  outcomes_.clear();
  for (const auto& s : scenarios_) {
    out << "[regressions] scenario=" << s.name << "\n";
    ScenarioOutcome o = run_one(s);
    if (o.state == ScenarioState::Pass) out << "  -> PASS (" << o.prefixCount << " prefixes)\n";
    else out << "  -> FAIL: " << o.reason << "\n";
    out.flush();
    outcomes_.push_back(std::move(o));
  }

  bool anyFailed = false;
  for (const auto& o : outcomes_) anyFailed = anyFailed || o.state == ScenarioState::Fail;
  if (!anyFailed) return 0;

  out << "\nFailures:\n";
  for (const auto& o : outcomes_) {
    if (o.state == ScenarioState::Fail) out << "  - " << o.name << ": " << o.reason << "\n";
  }
  return 1;
}

}  // namespace spiketune::regression
