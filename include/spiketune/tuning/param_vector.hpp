#pragma once
#include <string>
#include <vector>

#include "spiketune/runner/profile.hpp"

namespace spiketune::tuning {

// One integer engine parameter with its (min, max, step) domain.
struct Tunable {
  runner::OptionName name;
  int value = 0;
  int min = 0;
  int max = 0;
  int step = 1;
  bool notUsed = false;  // carried through unchanged, never perturbed or sent

  // CSV checkpoint passthrough.
  std::string typeName = "int";
  double delta = 0.0;
  std::string comment;
};

using ParamVector = std::vector<Tunable>;

enum class ParamFormat { Json, Csv };

// Largest grid point (min + n*step) not above max.
int grid_max(const Tunable& t) noexcept;

// Nearest grid point; an exact midpoint goes toward min. Not clamped.
int snap_to_grid(const Tunable& t, double v) noexcept;

// Snaps, then clamps into [min, grid_max]. Always a valid domain value.
int clamp_and_snap(const Tunable& t, double v) noexcept;

// Throws ConfigError when min > max or step < 1.
void validate(const Tunable& t);

ParamFormat format_for_path(const std::string& path);

// JSON: {"params":[{"name", "group"?, "value", "min", "max", "step"}]}.
// CSV: name,type,v,min,max,step,delta [//comment][[NOT USED]]; a dotted name is a group option.
// Initial values off the grid are moved onto it. Throws ConfigError on missing
// files, bad lines or an empty vector.
ParamVector load_params(const std::string& path);
ParamVector parse_params_csv(const std::vector<std::string>& lines);

void save_params(const std::string& path, const ParamVector& params, ParamFormat format);
std::vector<std::string> params_to_csv(const ParamVector& params);

// Options to send for the vector, skipping unused parameters.
std::vector<runner::OptionSetting> to_option_settings(const ParamVector& params);

// "Name=v Group.Name=v ..."
std::string describe(const ParamVector& params);

}  // namespace spiketune::tuning
