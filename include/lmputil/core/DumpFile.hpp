#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <span>
#include <string>
#include <vector>

#include "lmputil/core/Snapshot.hpp"

namespace lmputil {

// Snapshots of one dump keyed by timestep; iteration is ascending.
class DumpFile {
public:
  using Map = std::map<std::uint64_t, Snapshot>;

  DumpFile() = default;

  // Duplicate timesteps are rejected.
  explicit DumpFile(std::vector<Snapshot> snapshots);

  // Parse `path`, keeping only `timesteps` (all blocks when empty).
  static DumpFile read(const std::filesystem::path& path,
                       std::span<const std::uint64_t> timesteps = {});

  // Write every snapshot, ascending timestep, via temp file + rename.
  void save(const std::filesystem::path& path) const;

  void insert(Snapshot snapshot);

  bool contains(std::uint64_t timestep) const { return snapshots_.find(timestep) != snapshots_.end(); }
  const Snapshot& at(std::uint64_t timestep) const;
  Snapshot& at(std::uint64_t timestep);

  // Earliest snapshot; most tools work on single-snapshot dumps.
  const Snapshot& first() const;

  std::size_t size() const { return snapshots_.size(); }
  bool empty() const { return snapshots_.empty(); }

  std::vector<std::uint64_t> timesteps() const;

  std::span<const double> get_property(std::uint64_t timestep, const std::string& key) const {
    return at(timestep).get(key);
  }

  Map::const_iterator begin() const { return snapshots_.begin(); }
  Map::const_iterator end() const { return snapshots_.end(); }

private:
  Map snapshots_;
};

} // namespace lmputil
