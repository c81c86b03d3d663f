#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "lmputil/config/IniConfig.hpp"
#include "lmputil/core/DumpFile.hpp"
#include "lmputil/core/Snapshot.hpp"
#include "lmputil/tasks/TaskRegistry.hpp"

namespace lmputil::tasks {

inline std::filesystem::path resolve_path(const std::filesystem::path& base_dir, const std::string& p) {
  std::filesystem::path path(p);
  if (path.is_absolute()) return path;
  return (base_dir / path).lexically_normal();
}

// Rejects keys outside `allowed`; "type", "enabled" and "output" are accepted
// everywhere.
inline void check_known_keys(const IniConfig& cfg, const std::string& section,
                             std::initializer_list<const char*> allowed) {
  for (const auto& k : cfg.keys(section)) {
    if (k == "type" || k == "enabled" || k == "output") continue;
    const bool known = std::any_of(allowed.begin(), allowed.end(), [&](const char* a) { return k == a; });
    if (!known) {
      std::string msg = "[" + section + "]: unknown key '" + k + "' (allowed: type, enabled, output";
      for (const char* a : allowed) msg += std::string(", ") + a;
      throw std::runtime_error(msg + ")");
    }
  }
}

inline double require_nonnegative(const IniConfig& cfg, const std::string& section,
                                  const std::string& key, double def) {
  const double v = cfg.get_double(section, key, std::optional<double>(def));
  if (!(v >= 0.0)) {
    throw std::runtime_error("[" + section + "]: " + key + " must be >= 0 (got " + cfg.get_string(section, key) + ")");
  }
  return v;
}

// Input dump path, resolved against the config directory. Must exist.
inline std::filesystem::path require_input(const IniConfig& cfg, const std::string& section,
                                           const std::string& key, const TaskBuildEnv& env) {
  const std::filesystem::path p = resolve_path(env.cfg_dir, cfg.get_string(section, key));
  if (!std::filesystem::exists(p)) {
    throw std::runtime_error("[" + section + "]: " + key + " does not exist: " + p.string());
  }
  return p;
}

// Output path: the `output` key when present, else `default_name`; relative
// names land in the run's output directory.
inline std::filesystem::path output_path(const IniConfig& cfg, const std::string& section,
                                         const std::string& default_name, const TaskBuildEnv& env) {
  const std::string name = cfg.get_string(section, "output", std::optional<std::string>(default_name));
  if (name.empty()) throw std::runtime_error("[" + section + "]: output must not be empty");
  return resolve_path(env.output_dir, name);
}

// Earliest snapshot of a dump; analysis tasks work on single-snapshot files.
inline Snapshot read_first(const std::filesystem::path& path) {
  DumpFile dump = DumpFile::read(path);
  if (dump.empty()) throw std::runtime_error("no snapshots in " + path.string());
  return dump.first();
}

inline void save_snapshot(const std::filesystem::path& path, Snapshot s) {
  DumpFile out;
  out.insert(std::move(s));
  out.save(path);
}

} // namespace lmputil::tasks
