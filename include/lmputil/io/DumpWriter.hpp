#pragma once

#include <filesystem>
#include <ostream>

#include "lmputil/core/DumpFile.hpp"
#include "lmputil/core/Snapshot.hpp"

namespace lmputil::io {

// Writes the block layout DumpReader accepts. Values use the shortest
// round-tripping decimal form, so write -> read -> write is byte-identical.
void write_snapshot(std::ostream& os, const Snapshot& snapshot);

void write_dump(std::ostream& os, const DumpFile& dump);

// Atomic: the target only appears once the whole dump has been written.
void save_dump(const std::filesystem::path& path, const DumpFile& dump);

} // namespace lmputil::io
