#include "spiketune/io/batch_io.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>
#include <utility>

#include "spiketune/errors.hpp"

namespace spiketune::io {

namespace fs = std::filesystem;
using nlohmann::json;

static void ensure_parent_dir(const std::string& path) {
  const fs::path parent = fs::path(path).parent_path();
  if (parent.empty()) return;
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) throw std::runtime_error("Unable to create directory " + parent.string() + ": " + ec.message());
}

json target_to_json(const Target& t) {
  json j = {
      {"tag", t.tag},
      {"pre_position", t.prePosition},
      {"origin_log", t.originLog},
      {"origin_ply", t.originPly},
      {"origin_delta", t.originDelta},
      {"back_plies", t.backPlies},
      {"next_move", t.nextMove},
  };
  if (t.originGameIndex) j["origin_game_index"] = *t.originGameIndex;
  if (t.originSide) j["origin_side"] = *t.originSide;
  if (t.originCandBlack) j["origin_cand_black"] = *t.originCandBlack;
  return j;
}

std::optional<Target> target_from_json(const json& j) {
  if (!j.is_object()) return std::nullopt;
  Target t;
  try {
    t.tag = j.at("tag").get<std::string>();
    t.prePosition = j.at("pre_position").get<std::string>();
    t.originLog = j.value("origin_log", std::string{});
    t.originPly = j.value("origin_ply", 0);
    t.originDelta = j.value("origin_delta", 0);
    t.backPlies = j.value("back_plies", 0);
    t.nextMove = j.value("next_move", std::string{});
    if (auto it = j.find("origin_game_index"); it != j.end() && it->is_number_integer())
      t.originGameIndex = it->get<int>();
    if (auto it = j.find("origin_side"); it != j.end() && it->is_string())
      t.originSide = it->get<std::string>();
    if (auto it = j.find("origin_cand_black"); it != j.end() && it->is_boolean())
      t.originCandBlack = it->get<bool>();
  } catch (const json::exception&) {
    return std::nullopt;
  }
  if (t.tag.empty() || t.prePosition.empty()) return std::nullopt;
  return t;
}

json result_to_json(const EvalResult& r) {
  json j = {
      {"tag", r.tag},
      {"profile", r.profile},
      {"eval_cp", nullptr},
      {"depth", r.depth},
      {"seldepth", r.seldepth},
      {"bestmove", nullptr},
      {"nodes", r.nodes},
      {"nps", r.nps},
      {"elapsed_ms", r.elapsedMs},
      {"timed_out", r.timedOut},
  };
  if (r.evalCp) j["eval_cp"] = *r.evalCp;
  if (r.bestmove) j["bestmove"] = *r.bestmove;
  return j;
}

std::optional<EvalResult> result_from_json(const json& j) {
  if (!j.is_object()) return std::nullopt;
  EvalResult r;
  try {
    r.tag = j.at("tag").get<std::string>();
    r.profile = j.at("profile").get<std::string>();
    if (auto it = j.find("eval_cp"); it != j.end() && !it->is_null()) r.evalCp = it->get<int>();
    r.depth = j.value("depth", 0);
    r.seldepth = j.value("seldepth", 0);
    if (auto it = j.find("bestmove"); it != j.end() && it->is_string()) r.bestmove = it->get<std::string>();
    r.nodes = j.value("nodes", std::uint64_t{0});
    r.nps = j.value("nps", std::uint64_t{0});
    r.elapsedMs = j.value("elapsed_ms", 0LL);
    r.timedOut = j.value("timed_out", false);
  } catch (const json::exception&) {
    return std::nullopt;
  }
  return r;
}

json read_json_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ConfigError("Unable to open " + path);
  json j = json::parse(in, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) throw ConfigError("Not valid JSON: " + path);
  return j;
}

void write_json_file(const std::string& path, const json& j) {
  ensure_parent_dir(path);
  std::ofstream out(path, std::ios::trunc);
  if (!out) throw std::runtime_error("Unable to write " + path);
  out << j.dump(2) << "\n";
}

std::vector<Target> read_targets(const std::string& path) {
  const json doc = read_json_file(path);
  const json* arr = &doc;
  if (doc.is_object()) {
    auto it = doc.find("targets");
    if (it == doc.end()) throw ConfigError("No \"targets\" array in " + path);
    arr = &*it;
  }
  if (!arr->is_array()) throw ConfigError("\"targets\" is not an array in " + path);

  std::vector<Target> out;
  out.reserve(arr->size());
  for (const auto& rec : *arr) {
    if (auto t = target_from_json(rec)) out.push_back(std::move(*t));
  }
  return out;
}

void write_targets(const std::string& path, const std::vector<Target>& targets) {
  json arr = json::array();
  for (const auto& t : targets) arr.push_back(target_to_json(t));
  write_json_file(path, json{{"targets", std::move(arr)}});
}

std::vector<EvalResult> read_results(const std::string& path) {
  const json doc = read_json_file(path);
  const json* arr = &doc;
  if (doc.is_object()) {
    auto it = doc.find("results");
    if (it == doc.end()) throw ConfigError("No result array in " + path);
    arr = &*it;
  }
  if (!arr->is_array()) throw ConfigError("Result batch is not an array: " + path);

  std::vector<EvalResult> out;
  out.reserve(arr->size());
  for (const auto& rec : *arr) {
    if (auto r = result_from_json(rec)) out.push_back(std::move(*r));
  }
  return out;
}

std::vector<EvalResult> read_results_if_exists(const std::string& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) return {};
  return read_results(path);
}

void write_results(const std::string& path, const std::vector<EvalResult>& results) {
  json arr = json::array();
  for (const auto& r : results) arr.push_back(result_to_json(r));
  write_json_file(path, arr);
}

std::vector<EvalResult> merge_results(std::vector<EvalResult> existing, const std::vector<EvalResult>& fresh) {
  std::map<std::pair<std::string, std::string>, std::size_t> index;
  for (std::size_t i = 0; i < existing.size(); ++i) index[{existing[i].tag, existing[i].profile}] = i;

  for (const auto& r : fresh) {
    auto [it, inserted] = index.try_emplace({r.tag, r.profile}, existing.size());
    if (inserted) existing.push_back(r);
    else existing[it->second] = r;
  }
  return existing;
}

bool read_lines(const std::string& path, std::vector<std::string>& out) {
  std::ifstream in(path);
  if (!in) return false;
  std::string line;
  while (std::getline(in, line)) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
    out.push_back(std::move(line));
  }
  return true;
}

void write_lines(const std::string& path, const std::vector<std::string>& lines) {
  ensure_parent_dir(path);
  std::ofstream out(path, std::ios::trunc);
  if (!out) throw std::runtime_error("Unable to write " + path);
  for (const auto& l : lines) out << l << "\n";
}

}  // namespace spiketune::io
