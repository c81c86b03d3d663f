#include "lmputil/io/DumpWriter.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "lmputil/io/DumpReader.hpp"
#include "lmputil/util/AtomicFile.hpp"
#include "lmputil/util/Parse.hpp"

namespace lmputil::io {

void write_snapshot(std::ostream& os, const Snapshot& snapshot) {
  const SymBox& box = snapshot.box();
  std::string buf;
  buf.reserve(256);

  buf += kHeaderTimestep;
  buf += '\n';
  buf += std::to_string(snapshot.timestep());
  buf += '\n';
  buf += kHeaderNumberOfAtoms;
  buf += '\n';
  buf += std::to_string(snapshot.atoms_count());
  buf += '\n';
  buf += kHeaderBoxBounds;
  if (!box.boundaries().empty()) {
    buf += ' ';
    buf += box.boundaries();
  }
  buf += '\n';
  for (std::size_t a = 0; a < 3; ++a) {
    append_double(buf, box.lo(a));
    buf += ' ';
    append_double(buf, box.hi(a));
    buf += '\n';
  }
  buf += kHeaderAtoms;
  for (const auto& key : snapshot.keys()) {
    buf += ' ';
    buf += key;
  }
  buf += '\n';
  os << buf;

  const std::size_t ncols = snapshot.num_properties();
  std::vector<const double*> cols(ncols, nullptr);
  for (std::size_t c = 0; c < ncols; ++c) cols[c] = snapshot.column_values(c).data();

  for (std::size_t i = 0; i < snapshot.atoms_count(); ++i) {
    buf.clear();
    for (std::size_t c = 0; c < ncols; ++c) {
      if (c > 0) buf += ' ';
      append_double(buf, cols[c][i]);
    }
    buf += '\n';
    os << buf;
  }
  if (!os) throw std::runtime_error("DumpWriter: write failed at timestep " + std::to_string(snapshot.timestep()));
}

void write_dump(std::ostream& os, const DumpFile& dump) {
  for (const auto& kv : dump) {
    write_snapshot(os, kv.second);
  }
}

void save_dump(const std::filesystem::path& path, const DumpFile& dump) {
  util::write_file_atomically(path, [&](std::ostream& os) { write_dump(os, dump); });
}

} // namespace lmputil::io
