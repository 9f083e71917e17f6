#include "spiketune/runner/profile.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <set>

#include <nlohmann/json.hpp>

#include "spiketune/errors.hpp"

namespace spiketune::runner {

using ojson = nlohmann::ordered_json;

std::string wire_name(const OptionName& n) {
  if (const auto* g = std::get_if<GroupName>(&n)) return g->group + "." + g->name;
  return std::get<ScalarName>(n).name;
}

OptionName option_name_from_string(const std::string& s) {
  const auto dot = s.find('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == s.size()) return ScalarName{s};
  return GroupName{s.substr(0, dot), s.substr(dot + 1)};
}

ProfileConfig base_profile(const std::string& name) {
  ProfileConfig p;
  p.name = name;
  return p;
}

static std::optional<usi::OptionValue> to_option_value(const ojson& v) {
  if (v.is_boolean()) return usi::OptionValue{v.get<bool>()};
  if (v.is_number_integer()) return usi::OptionValue{v.get<int>()};
  if (v.is_string()) return usi::OptionValue{v.get<std::string>()};
  return std::nullopt;
}

static std::optional<ProfileConfig> profile_from_json(const ojson& j) {
  if (!j.is_object()) return std::nullopt;
  auto nameIt = j.find("name");
  if (nameIt == j.end() || !nameIt->is_string() || nameIt->get<std::string>().empty())
    return std::nullopt;

  ProfileConfig p;
  p.name = nameIt->get<std::string>();

  if (auto opts = j.find("options"); opts != j.end() && opts->is_object()) {
    for (const auto& [key, val] : opts->items()) {
      if (val.is_object()) {
        for (const auto& [sub, subVal] : val.items()) {
          if (auto v = to_option_value(subVal)) {
            p.options.push_back({GroupName{key, sub}, *v});
          } else {
            std::cerr << "[profiles] " << p.name << ": ignoring " << key << "." << sub
                      << " (unsupported value)\n";
          }
        }
      } else if (auto v = to_option_value(val)) {
        p.options.push_back({ScalarName{key}, *v});
      } else {
        std::cerr << "[profiles] " << p.name << ": ignoring " << key << " (unsupported value)\n";
      }
    }
  }

  if (auto env = j.find("env"); env != j.end() && env->is_object()) {
    for (const auto& [key, val] : env->items()) {
      if (val.is_string()) p.env[key] = val.get<std::string>();
      else if (val.is_number_integer() || val.is_boolean()) p.env[key] = val.dump();
    }
  }
  return p;
}

std::vector<ProfileConfig> load_profiles(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ConfigError("Unable to open profiles file: " + path);
  const ojson doc = ojson::parse(in, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) throw ConfigError("Profiles file is not valid JSON: " + path);

  const ojson* arr = &doc;
  if (doc.is_object()) {
    auto it = doc.find("profiles");
    if (it == doc.end()) throw ConfigError("No \"profiles\" array in " + path);
    arr = &*it;
  }
  if (!arr->is_array()) throw ConfigError("\"profiles\" is not an array in " + path);

  std::vector<ProfileConfig> out;
  std::set<std::string> names;
  for (const auto& rec : *arr) {
    auto p = profile_from_json(rec);
    if (!p) {
      std::cerr << "[profiles] skipping malformed entry in " << path << "\n";
      continue;
    }
    if (!names.insert(p->name).second) throw ConfigError("Duplicate profile name: " + p->name);
    out.push_back(std::move(*p));
  }
  if (out.empty()) throw ConfigError("No usable profiles in " + path);
  return out;
}

std::vector<ProfileConfig> select_profiles(const std::vector<ProfileConfig>& all,
                                           const std::vector<std::string>& names) {
  if (names.empty()) return all;
  std::vector<ProfileConfig> out;
  for (const auto& n : names) {
    bool found = false;
    for (const auto& p : all) {
      if (p.name == n) {
        out.push_back(p);
        found = true;
        break;
      }
    }
    if (!found) throw ConfigError("Unknown profile: " + n);
  }
  return out;
}

}  // namespace spiketune::runner
