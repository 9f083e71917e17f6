#pragma once
#include <string>
#include <variant>
#include <vector>

#include "spiketune/usi/platform_spawn.hpp"
#include "spiketune/usi/usi_utils.hpp"

namespace spiketune::runner {

// Bare engine option, sent as "<name>".
struct ScalarName {
  std::string name;
};

// Option inside a logical parameter group, sent as "<group>.<name>".
struct GroupName {
  std::string group;
  std::string name;
};

using OptionName = std::variant<ScalarName, GroupName>;

std::string wire_name(const OptionName& n);

// Splits "Group.Name" at the first dot; names without a dot are scalar.
OptionName option_name_from_string(const std::string& s);

struct OptionSetting {
  OptionName name;
  usi::OptionValue value;
};

struct ProfileConfig {
  std::string name;
  std::vector<OptionSetting> options;  // applied in order after the common options
  usi::EnvOverrides env;
};

// Profile with no options and no environment changes.
ProfileConfig base_profile(const std::string& name = "base");

// {"profiles":[{"name":..., "options":{...}, "env":{...}}]} or a bare array of profiles.
// Inside "options" a scalar value is a bare option and a nested object is a group.
// Throws ConfigError for a missing file, invalid JSON or duplicate names; malformed
// entries are skipped with a warning.
std::vector<ProfileConfig> load_profiles(const std::string& path);

// Keeps the named profiles in the order requested. Throws ConfigError on an unknown name.
std::vector<ProfileConfig> select_profiles(const std::vector<ProfileConfig>& all,
                                           const std::vector<std::string>& names);

}  // namespace spiketune::runner
