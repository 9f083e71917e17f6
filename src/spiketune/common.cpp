#include "spiketune/common.hpp"

#include <array>
#include <system_error>

#include "spiketune/usi/platform_spawn.hpp"

namespace spiketune {

fs::path locate_project_root(fs::path start) {
  std::error_code ec;
  if (!start.is_absolute()) start = fs::absolute(start, ec);
  while (true) {
    if (fs::exists(start / "CMakeLists.txt", ec) || fs::exists(start / "Cargo.toml", ec)) return start;
    const auto parent = start.parent_path();
    if (parent.empty() || parent == start) return fs::current_path();
    start = parent;
  }
}

std::optional<fs::path> find_engine_in_dir(const fs::path& dir) {
  if (dir.empty()) return std::nullopt;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return std::nullopt;

  const std::array<const char*, 2> names = {"rshogi-usi", "engine-usi"};
  for (const auto* name : names) {
    const fs::path candidate = dir / name;
    if (usi::isExecutableFile(candidate.string())) return candidate;
  }
  for (fs::directory_iterator it{dir, ec}; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
    const std::string stem = it->path().stem().string();
    if (stem.size() > 4 && stem.compare(stem.size() - 4, 4, "-usi") == 0 &&
        usi::isExecutableFile(it->path().string()))
      return it->path();
  }
  return std::nullopt;
}

DefaultPaths compute_default_paths(const char* argv0) {
  std::error_code ec;
  fs::path exePath = fs::read_symlink("/proc/self/exe", ec);
  if (ec && argv0 && *argv0) exePath = fs::absolute(fs::path(argv0), ec);
  if (ec) exePath.clear();
  if (exePath.empty()) exePath = fs::current_path();
  fs::path exeDir = exePath.has_filename() ? exePath.parent_path() : exePath;
  if (exeDir.empty()) exeDir = fs::current_path();

  DefaultPaths defaults;
  defaults.runsDir = fs::path("runs");
  defaults.engine = find_engine_in_dir(exeDir);
  if (!defaults.engine) defaults.engine = find_engine_in_dir(fs::current_path() / "target" / "release");
  if (!defaults.engine) defaults.engine = find_engine_in_dir(locate_project_root(exeDir) / "target" / "release");
  return defaults;
}

}  // namespace spiketune
