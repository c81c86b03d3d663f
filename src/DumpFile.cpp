#include "lmputil/core/DumpFile.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "lmputil/io/DumpReader.hpp"
#include "lmputil/io/DumpWriter.hpp"

namespace lmputil {

DumpFile::DumpFile(std::vector<Snapshot> snapshots) {
  for (auto& s : snapshots) insert(std::move(s));
}

DumpFile DumpFile::read(const std::filesystem::path& path, std::span<const std::uint64_t> timesteps) {
  return io::read_dump(path, timesteps);
}

void DumpFile::save(const std::filesystem::path& path) const {
  io::save_dump(path, *this);
}

void DumpFile::insert(Snapshot snapshot) {
  const std::uint64_t ts = snapshot.timestep();
  auto [it, ok] = snapshots_.emplace(ts, std::move(snapshot));
  (void)it;
  if (!ok) {
    throw std::invalid_argument("DumpFile: duplicate timestep " + std::to_string(ts));
  }
}

const Snapshot& DumpFile::at(std::uint64_t timestep) const {
  auto it = snapshots_.find(timestep);
  if (it == snapshots_.end()) {
    throw std::out_of_range("DumpFile: no snapshot for timestep " + std::to_string(timestep));
  }
  return it->second;
}

Snapshot& DumpFile::at(std::uint64_t timestep) {
  auto it = snapshots_.find(timestep);
  if (it == snapshots_.end()) {
    throw std::out_of_range("DumpFile: no snapshot for timestep " + std::to_string(timestep));
  }
  return it->second;
}

const Snapshot& DumpFile::first() const {
  if (snapshots_.empty()) throw std::out_of_range("DumpFile: no snapshots");
  return snapshots_.begin()->second;
}

std::vector<std::uint64_t> DumpFile::timesteps() const {
  std::vector<std::uint64_t> out;
  out.reserve(snapshots_.size());
  for (const auto& kv : snapshots_) out.push_back(kv.first);
  return out;
}

} // namespace lmputil
