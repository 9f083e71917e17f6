#pragma once
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "spiketune/types.hpp"

namespace spiketune::io {

// Target batch: {"targets":[{tag, pre_position, origin_log, origin_ply, origin_delta,
// back_plies, next_move, [origin_game_index, origin_side, origin_cand_black]}]}
nlohmann::json target_to_json(const Target& t);
std::optional<Target> target_from_json(const nlohmann::json& j);

// Result batch: a JSON array of {tag, profile, eval_cp|null, depth, seldepth,
// bestmove|null, nodes, nps, elapsed_ms, timed_out}.
nlohmann::json result_to_json(const EvalResult& r);
std::optional<EvalResult> result_from_json(const nlohmann::json& j);

// Missing or unparseable files throw ConfigError; malformed records are skipped.
std::vector<Target> read_targets(const std::string& path);
void write_targets(const std::string& path, const std::vector<Target>& targets);

std::vector<EvalResult> read_results(const std::string& path);
// Empty when the file does not exist yet.
std::vector<EvalResult> read_results_if_exists(const std::string& path);
void write_results(const std::string& path, const std::vector<EvalResult>& results);

// Replaces entries of `existing` that share (tag, profile) with `fresh`, appends the rest.
std::vector<EvalResult> merge_results(std::vector<EvalResult> existing, const std::vector<EvalResult>& fresh);

// Reads a whole JSON document; ConfigError when the file is missing or not JSON.
nlohmann::json read_json_file(const std::string& path);
void write_json_file(const std::string& path, const nlohmann::json& j);

// False when the file cannot be opened. CR/LF stripped.
bool read_lines(const std::string& path, std::vector<std::string>& out);
void write_lines(const std::string& path, const std::vector<std::string>& lines);

}  // namespace spiketune::io
