#include "spiketune/tuning/param_vector.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "spiketune/errors.hpp"
#include "spiketune/io/batch_io.hpp"
#include "spiketune/usi/usi_utils.hpp"

namespace spiketune::tuning {

namespace fs = std::filesystem;
using nlohmann::json;

static constexpr const char* kNotUsedMarker = "[[NOT USED]]";

int grid_max(const Tunable& t) noexcept {
  if (t.step < 1 || t.max < t.min) return t.min;
  return t.min + ((t.max - t.min) / t.step) * t.step;
}

int snap_to_grid(const Tunable& t, double v) noexcept {
  if (t.step < 1 || !std::isfinite(v)) return t.min;
  const double n = std::ceil((v - t.min) / t.step - 0.5);
  return t.min + static_cast<int>(n) * t.step;
}

int clamp_and_snap(const Tunable& t, double v) noexcept {
  if (!std::isfinite(v)) v = t.value;
  const double lo = t.min;
  const double hi = grid_max(t);
  // Clamp first so the grid index cannot overflow, then snap and clamp again.
  const int snapped = snap_to_grid(t, std::clamp(v, lo - t.step, hi + t.step));
  return std::clamp(snapped, t.min, grid_max(t));
}

void validate(const Tunable& t) {
  const std::string n = runner::wire_name(t.name);
  if (n.empty()) throw ConfigError("parameter with empty name");
  if (t.step < 1) throw ConfigError("parameter " + n + ": step must be >= 1");
  if (t.min > t.max) throw ConfigError("parameter " + n + ": min > max");
}

ParamFormat format_for_path(const std::string& path) {
  return fs::path(path).extension() == ".json" ? ParamFormat::Json : ParamFormat::Csv;
}

static void normalise_initial(Tunable& t) {
  validate(t);
  t.value = clamp_and_snap(t, t.value);
}

ParamVector parse_params_csv(const std::vector<std::string>& lines) {
  ParamVector out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    std::string payload = usi::trim(lines[i]);
    if (payload.empty() || payload[0] == '#') continue;
    const std::string where = "invalid params line " + std::to_string(i + 1) + ": '" + lines[i] + "'";

    Tunable t;
    if (auto pos = payload.find(kNotUsedMarker); pos != std::string::npos) {
      t.notUsed = true;
      payload.erase(pos, std::char_traits<char>::length(kNotUsedMarker));
    }
    if (auto pos = payload.find("//"); pos != std::string::npos) {
      t.comment = usi::trim(std::string_view(payload).substr(pos + 2));
      payload.resize(pos);
    }

    std::vector<std::string> cols;
    std::istringstream is(payload);
    for (std::string c; std::getline(is, c, ',');) cols.push_back(usi::trim(c));
    if (cols.size() < 7 || cols[0].empty()) throw ConfigError(where);

    try {
      t.name = runner::option_name_from_string(cols[0]);
      t.typeName = cols[1];
      t.value = static_cast<int>(std::lround(std::stod(cols[2])));
      t.min = static_cast<int>(std::lround(std::stod(cols[3])));
      t.max = static_cast<int>(std::lround(std::stod(cols[4])));
      t.step = static_cast<int>(std::lround(std::stod(cols[5])));
      t.delta = std::stod(cols[6]);
    } catch (const std::logic_error&) {
      throw ConfigError(where);
    }
    normalise_initial(t);
    out.push_back(std::move(t));
  }
  return out;
}

static ParamVector parse_params_json(const json& doc, const std::string& path) {
  const json* arr = &doc;
  if (doc.is_object()) {
    auto it = doc.find("params");
    if (it == doc.end()) throw ConfigError("No \"params\" array in " + path);
    arr = &*it;
  }
  if (!arr->is_array()) throw ConfigError("\"params\" is not an array in " + path);

  ParamVector out;
  for (const auto& rec : *arr) {
    Tunable t;
    try {
      const std::string name = rec.at("name").get<std::string>();
      if (auto g = rec.find("group"); g != rec.end() && g->is_string() && !g->get<std::string>().empty())
        t.name = runner::GroupName{g->get<std::string>(), name};
      else
        t.name = runner::ScalarName{name};
      t.value = rec.at("value").get<int>();
      t.min = rec.at("min").get<int>();
      t.max = rec.at("max").get<int>();
      t.step = rec.value("step", 1);
      t.notUsed = rec.value("not_used", false);
    } catch (const json::exception& e) {
      throw ConfigError("invalid parameter record in " + path + ": " + e.what());
    }
    normalise_initial(t);
    out.push_back(std::move(t));
  }
  return out;
}

ParamVector load_params(const std::string& path) {
  ParamVector out;
  if (format_for_path(path) == ParamFormat::Json) {
    out = parse_params_json(io::read_json_file(path), path);
  } else {
    std::vector<std::string> lines;
    if (!io::read_lines(path, lines)) throw ConfigError("failed to open " + path);
    out = parse_params_csv(lines);
  }
  if (out.empty()) throw ConfigError("no parameters loaded from " + path);
  return out;
}

std::vector<std::string> params_to_csv(const ParamVector& params) {
  std::vector<std::string> lines;
  lines.reserve(params.size());
  for (const auto& t : params) {
    std::ostringstream os;
    os << runner::wire_name(t.name) << "," << t.typeName << "," << t.value << "," << t.min << "," << t.max
       << "," << t.step << "," << t.delta;
    if (!t.comment.empty()) os << " //" << t.comment;
    if (t.notUsed) os << kNotUsedMarker;
    lines.push_back(os.str());
  }
  return lines;
}

void save_params(const std::string& path, const ParamVector& params, ParamFormat format) {
  if (format == ParamFormat::Csv) {
    io::write_lines(path, params_to_csv(params));
    return;
  }
  json arr = json::array();
  for (const auto& t : params) {
    json j;
    if (const auto* g = std::get_if<runner::GroupName>(&t.name)) {
      j["name"] = g->name;
      j["group"] = g->group;
    } else {
      j["name"] = std::get<runner::ScalarName>(t.name).name;
    }
    j["value"] = t.value;
    j["min"] = t.min;
    j["max"] = t.max;
    j["step"] = t.step;
    if (t.notUsed) j["not_used"] = true;
    arr.push_back(std::move(j));
  }
  io::write_json_file(path, json{{"params", std::move(arr)}});
}

std::vector<runner::OptionSetting> to_option_settings(const ParamVector& params) {
  std::vector<runner::OptionSetting> out;
  for (const auto& t : params) {
    if (t.notUsed) continue;
    out.push_back({t.name, usi::OptionValue{t.value}});
  }
  return out;
}

std::string describe(const ParamVector& params) {
  std::ostringstream os;
  bool first = true;
  for (const auto& t : params) {
    if (t.notUsed) continue;
    os << (first ? "" : " ") << runner::wire_name(t.name) << "=" << t.value;
    first = false;
  }
  return os.str();
}

}  // namespace spiketune::tuning
