#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "lmputil/core/Snapshot.hpp"

namespace lmputil::test {

// Snapshot with columns "id type x y z"; id = row + 1, type = 1.
inline Snapshot make_points(const std::vector<std::array<double, 3>>& pts,
                            std::uint64_t timestep = 0,
                            SymBox box = SymBox("pp pp ff", 0.0, 10.0, 0.0, 10.0, 0.0, 10.0)) {
  Snapshot s(timestep, std::move(box), FieldSchema({"id", "type", "x", "y", "z"}), pts.size());
  for (std::size_t i = 0; i < pts.size(); ++i) {
    s.set("id", i, static_cast<double>(i + 1));
    s.set("type", i, 1.0);
    s.set("x", i, pts[i][0]);
    s.set("y", i, pts[i][1]);
    s.set("z", i, pts[i][2]);
  }
  return s;
}

// Fresh directory under the system temp dir, removed on scope exit.
class ScopedTempDir {
public:
  ScopedTempDir() {
    static std::atomic<unsigned> counter{0};
    const auto base = std::filesystem::temp_directory_path();
    for (;;) {
      std::ostringstream name;
      name << "lmputil_test_" << std::hex << reinterpret_cast<std::uintptr_t>(this) << "_" << counter++;
      path_ = base / name.str();
      if (std::filesystem::create_directory(path_)) break;
    }
  }

  ~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

inline void write_text(const std::filesystem::path& p, const std::string& text) {
  std::ofstream ofs(p, std::ios::binary);
  if (!ofs) throw std::runtime_error("failed to open " + p.string());
  ofs << text;
}

inline std::string read_text(const std::filesystem::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) throw std::runtime_error("failed to open " + p.string());
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

} // namespace lmputil::test
