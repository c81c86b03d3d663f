#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>

#include "lmputil/core/DumpFile.hpp"
#include "lmputil/core/Snapshot.hpp"

namespace lmputil::io {

inline constexpr const char* kHeaderTimestep = "ITEM: TIMESTEP";
inline constexpr const char* kHeaderNumberOfAtoms = "ITEM: NUMBER OF ATOMS";
inline constexpr const char* kHeaderBoxBounds = "ITEM: BOX BOUNDS";
inline constexpr const char* kHeaderAtoms = "ITEM: ATOMS";

// Structural error in a dump. Any of these aborts the whole read.
class DumpParseError : public std::runtime_error {
public:
  enum class Kind {
    InvalidOrMissingTimestep,
    InvalidOrMissingNumberOfAtoms,
    MissingSymBox,
    MissingAtomKeys,
    DuplicateAtomKeys,
    DuplicateSnapshots,
    InvalidOrMissingAtomRow,
    Io,
  };

  // `line` is 1-based; 0 when the error is not tied to a line.
  DumpParseError(Kind kind, std::size_t line, const std::string& detail);

  Kind kind() const { return kind_; }
  std::size_t line() const { return line_; }

private:
  Kind kind_;
  std::size_t line_;
};

const char* parse_error_kind_name(DumpParseError::Kind kind);

// Fixed-size part of a block that is read before deciding to keep or skip it.
struct BlockHeader {
  std::uint64_t timestep = 0;
  std::size_t atoms_count = 0;
  std::size_t line = 0; // line of "ITEM: TIMESTEP"
};

// Streaming, block-at-a-time reader for LAMMPS text dumps:
//
//   ITEM: TIMESTEP / <ts> / ITEM: NUMBER OF ATOMS / <n> /
//   ITEM: BOX BOUNDS <tag> / 3 x "<lo> <hi>" / ITEM: ATOMS <keys...> / n rows
//
// Usage: next_header() then exactly one of read_body() or skip_body().
class DumpReader {
public:
  explicit DumpReader(std::istream& in);
  explicit DumpReader(const std::filesystem::path& path);

  DumpReader(const DumpReader&) = delete;
  DumpReader& operator=(const DumpReader&) = delete;

  // Returns false on a clean end of input at a block boundary.
  bool next_header(BlockHeader& hdr);

  // Box, ATOMS header and rows of the block whose header was just read.
  Snapshot read_body(const BlockHeader& hdr);

  // Consume the block body without materializing it.
  void skip_body(const BlockHeader& hdr);

  std::size_t line_number() const { return lineno_; }

private:
  std::unique_ptr<std::ifstream> owned_;
  std::istream* in_ = nullptr;
  std::size_t lineno_ = 0;
  std::string line_;

  bool getline_();
  SymBox read_box_();
  FieldSchema read_atoms_header_();
};

// Whole-file read with timestep selection (empty = every block).
//
// Blocks are assumed to be in non-decreasing timestep order: once a block
// exceeds the largest requested timestep, reading stops.
DumpFile read_dump(std::istream& in, std::span<const std::uint64_t> timesteps = {});
DumpFile read_dump(const std::filesystem::path& path, std::span<const std::uint64_t> timesteps = {});

} // namespace lmputil::io
