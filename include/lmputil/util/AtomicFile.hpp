#pragma once

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace lmputil::util {

// Output file that only appears at its final path once commit() succeeds.
// Text goes to "<path>.tmp"; if the writer is destroyed before commit()
// (a throwing write, a failed flush) the temp file is removed and the
// previous contents of <path> are untouched.
class AtomicOutputFile {
public:
  explicit AtomicOutputFile(std::filesystem::path path)
      : path_(std::move(path)), tmp_(temp_path_for(path_)), os_(tmp_) {
    if (!os_) throw std::runtime_error("AtomicOutputFile: cannot open '" + tmp_.string() + "' for writing");
  }

  ~AtomicOutputFile() {
    if (committed_) return;
    os_.close();
    std::error_code ec;
    std::filesystem::remove(tmp_, ec);
  }

  AtomicOutputFile(const AtomicOutputFile&) = delete;
  AtomicOutputFile& operator=(const AtomicOutputFile&) = delete;

  std::ostream& stream() { return os_; }
  const std::filesystem::path& temp_path() const { return tmp_; }

  void commit() {
    os_.flush();
    os_.close();
    if (os_.fail()) throw std::runtime_error("AtomicOutputFile: write to '" + tmp_.string() + "' failed");

    std::error_code ec;
    std::filesystem::rename(tmp_, path_, ec);
    if (ec) {
      // Some filesystems refuse to rename over an existing file.
      std::filesystem::remove(path_, ec);
      std::filesystem::rename(tmp_, path_, ec);
    }
    if (ec) {
      throw std::runtime_error("AtomicOutputFile: cannot move '" + tmp_.string() + "' to '" + path_.string() +
                               "' (" + ec.message() + ")");
    }
    committed_ = true;
  }

  static std::filesystem::path temp_path_for(const std::filesystem::path& path) {
    std::filesystem::path tmp = path;
    tmp += ".tmp";
    return tmp;
  }

private:
  std::filesystem::path path_;
  std::filesystem::path tmp_;
  std::ofstream os_;
  bool committed_ = false;
};

// write(os) fills the file; any exception it throws leaves no temp file.
template <typename WriteFn>
void write_file_atomically(const std::filesystem::path& path, WriteFn&& write) {
  AtomicOutputFile out(path);
  write(out.stream());
  out.commit();
}

} // namespace lmputil::util
