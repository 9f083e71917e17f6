#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace spiketune {

namespace fs = std::filesystem;

struct DefaultPaths {
  std::optional<fs::path> engine;
  fs::path runsDir;
};

// Walks up from `start` to the first directory holding a CMakeLists.txt or Cargo.toml;
// falls back to the current directory.
fs::path locate_project_root(fs::path start);

// "rshogi-usi" or "engine-usi" first, then any executable whose stem ends in "-usi".
std::optional<fs::path> find_engine_in_dir(const fs::path& dir);

// Engine next to the executable, then in ./target/release, then under the project root.
DefaultPaths compute_default_paths(const char* argv0);

}  // namespace spiketune
