#include "lmputil/io/DumpReader.hpp"

#include <algorithm>
#include <cstring>
#include <new>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "lmputil/util/Parse.hpp"

namespace lmputil::io {

namespace {

using Kind = DumpParseError::Kind;

std::string make_message(Kind kind, std::size_t line, const std::string& detail) {
  std::string msg = "DumpReader: ";
  if (line > 0) msg += "line " + std::to_string(line) + ": ";
  msg += detail;
  msg += " (";
  msg += parse_error_kind_name(kind);
  msg += ")";
  return msg;
}

// "ITEM: ATOMS id x" starts with "ITEM: ATOMS"; "ITEM: ATOMSX" does not.
bool starts_with_token(std::string_view line, std::string_view header) {
  if (line.size() < header.size()) return false;
  if (line.substr(0, header.size()) != header) return false;
  return line.size() == header.size() || is_ws(line[header.size()]);
}

DumpFile read_blocks(DumpReader& reader, std::span<const std::uint64_t> timesteps) {
  std::vector<std::uint64_t> wanted(timesteps.begin(), timesteps.end());
  std::sort(wanted.begin(), wanted.end());
  wanted.erase(std::unique(wanted.begin(), wanted.end()), wanted.end());

  DumpFile dump;
  BlockHeader hdr;
  while (reader.next_header(hdr)) {
    if (!wanted.empty()) {
      if (hdr.timestep > wanted.back()) break;
      if (!std::binary_search(wanted.begin(), wanted.end(), hdr.timestep)) {
        reader.skip_body(hdr);
        continue;
      }
    }
    if (dump.contains(hdr.timestep)) {
      throw DumpParseError(Kind::DuplicateSnapshots, hdr.line,
                           "duplicate timestep " + std::to_string(hdr.timestep));
    }
    dump.insert(reader.read_body(hdr));
  }
  return dump;
}

} // namespace

DumpParseError::DumpParseError(Kind kind, std::size_t line, const std::string& detail)
    : std::runtime_error(make_message(kind, line, detail)), kind_(kind), line_(line) {}

const char* parse_error_kind_name(DumpParseError::Kind kind) {
  switch (kind) {
    case Kind::InvalidOrMissingTimestep: return "InvalidOrMissingTimestep";
    case Kind::InvalidOrMissingNumberOfAtoms: return "InvalidOrMissingNumberOfAtoms";
    case Kind::MissingSymBox: return "MissingSymBox";
    case Kind::MissingAtomKeys: return "MissingAtomKeys";
    case Kind::DuplicateAtomKeys: return "DuplicateAtomKeys";
    case Kind::DuplicateSnapshots: return "DuplicateSnapshots";
    case Kind::InvalidOrMissingAtomRow: return "InvalidOrMissingAtomRow";
    case Kind::Io: return "Io";
  }
  return "Unknown";
}

DumpReader::DumpReader(std::istream& in) : in_(&in) {}

DumpReader::DumpReader(const std::filesystem::path& path)
    : owned_(std::make_unique<std::ifstream>(path)) {
  if (!*owned_) {
    throw DumpParseError(Kind::Io, 0, "failed to open file: " + path.string());
  }
  owned_->exceptions(std::ios::badbit);
  in_ = owned_.get();
}

bool DumpReader::getline_() {
  if (!std::getline(*in_, line_)) return false;
  ++lineno_;
  if (!line_.empty() && line_.back() == '\r') line_.pop_back();
  return true;
}

bool DumpReader::next_header(BlockHeader& hdr) {
  // Blank lines are tolerated between blocks; EOF here is the normal end.
  do {
    if (!getline_()) return false;
  } while (trim(line_).empty());

  if (trim(line_) != kHeaderTimestep) {
    throw DumpParseError(Kind::InvalidOrMissingTimestep, lineno_,
                         std::string("expected '") + kHeaderTimestep + "' but got: " + line_);
  }
  hdr.line = lineno_;

  if (!getline_()) {
    throw DumpParseError(Kind::InvalidOrMissingTimestep, lineno_, "unexpected EOF while reading timestep");
  }
  if (!parse_int(trim(line_), hdr.timestep)) {
    throw DumpParseError(Kind::InvalidOrMissingTimestep, lineno_, "failed to parse timestep from: " + line_);
  }

  if (!getline_()) {
    throw DumpParseError(Kind::InvalidOrMissingNumberOfAtoms, lineno_,
                         std::string("unexpected EOF while reading '") + kHeaderNumberOfAtoms + "'");
  }
  if (trim(line_) != kHeaderNumberOfAtoms) {
    throw DumpParseError(Kind::InvalidOrMissingNumberOfAtoms, lineno_,
                         std::string("expected '") + kHeaderNumberOfAtoms + "' but got: " + line_);
  }
  if (!getline_()) {
    throw DumpParseError(Kind::InvalidOrMissingNumberOfAtoms, lineno_, "unexpected EOF while reading atom count");
  }
  if (!parse_int(trim(line_), hdr.atoms_count)) {
    throw DumpParseError(Kind::InvalidOrMissingNumberOfAtoms, lineno_, "failed to parse atom count from: " + line_);
  }
  return true;
}

SymBox DumpReader::read_box_() {
  if (!getline_()) {
    throw DumpParseError(Kind::MissingSymBox, lineno_,
                         std::string("unexpected EOF while reading '") + kHeaderBoxBounds + "'");
  }
  if (!starts_with_token(line_, kHeaderBoxBounds)) {
    throw DumpParseError(Kind::MissingSymBox, lineno_,
                         std::string("expected '") + kHeaderBoxBounds + " ...' but got: " + line_);
  }
  const std::string tag(trim(std::string_view(line_).substr(std::strlen(kHeaderBoxBounds))));

  double lo[3] = {0.0, 0.0, 0.0};
  double hi[3] = {0.0, 0.0, 0.0};
  std::vector<std::string_view> toks;
  for (std::size_t a = 0; a < 3; ++a) {
    if (!getline_()) {
      throw DumpParseError(Kind::MissingSymBox, lineno_,
                           "BOX BOUNDS has " + std::to_string(a) + " bound lines, expected 3");
    }
    split_ws(line_, toks);
    if (toks.size() != 2) {
      throw DumpParseError(Kind::MissingSymBox, lineno_,
                           "BOX BOUNDS line for " + std::string(1, SymBox::axis_name(a)) +
                           " must be '<lo> <hi>' (triclinic boxes are not supported), got: " + line_);
    }
    if (!parse_double(toks[0], lo[a]) || !parse_double(toks[1], hi[a])) {
      throw DumpParseError(Kind::MissingSymBox, lineno_,
                           "failed to parse " + std::string(1, SymBox::axis_name(a)) + " bounds from: " + line_);
    }
  }

  try {
    return SymBox(tag, lo[0], hi[0], lo[1], hi[1], lo[2], hi[2]);
  } catch (const std::invalid_argument& e) {
    throw DumpParseError(Kind::MissingSymBox, lineno_, e.what());
  }
}

FieldSchema DumpReader::read_atoms_header_() {
  if (!getline_()) {
    throw DumpParseError(Kind::MissingAtomKeys, lineno_,
                         std::string("unexpected EOF while reading '") + kHeaderAtoms + "'");
  }
  if (!starts_with_token(line_, kHeaderAtoms)) {
    throw DumpParseError(Kind::MissingAtomKeys, lineno_,
                         std::string("expected '") + kHeaderAtoms + " ...' but got: " + line_);
  }
  std::vector<std::string_view> toks;
  split_ws(std::string_view(line_).substr(std::strlen(kHeaderAtoms)), toks);
  if (toks.empty()) {
    throw DumpParseError(Kind::MissingAtomKeys, lineno_, "ATOMS header declares no properties");
  }

  FieldSchema schema;
  for (auto t : toks) {
    const std::string key(t);
    if (schema.has(key)) {
      throw DumpParseError(Kind::DuplicateAtomKeys, lineno_, "duplicate property '" + key + "' in ATOMS header");
    }
    schema.add(key);
  }
  return schema;
}

Snapshot DumpReader::read_body(const BlockHeader& hdr) {
  SymBox box = read_box_();
  FieldSchema schema = read_atoms_header_();
  const std::size_t ncols = schema.size();

  Snapshot snap = [&] {
    try {
      return Snapshot(hdr.timestep, std::move(box), std::move(schema), hdr.atoms_count);
    } catch (const std::length_error& e) {
      throw DumpParseError(Kind::InvalidOrMissingNumberOfAtoms, hdr.line, e.what());
    } catch (const std::bad_alloc&) {
      throw DumpParseError(Kind::InvalidOrMissingNumberOfAtoms, hdr.line,
                           "cannot allocate storage for " + std::to_string(hdr.atoms_count) + " atoms");
    }
  }();
  std::vector<double*> cols(ncols, nullptr);
  for (std::size_t c = 0; c < ncols; ++c) {
    cols[c] = snap.column_values_mut(c).data();
  }

  for (std::size_t row = 0; row < hdr.atoms_count; ++row) {
    if (!getline_()) {
      throw DumpParseError(Kind::InvalidOrMissingAtomRow, lineno_,
                           "unexpected EOF after " + std::to_string(row) + " of " +
                           std::to_string(hdr.atoms_count) + " atom rows");
    }

    const char* p = line_.data();
    const char* end = p + line_.size();
    std::string_view tok;
    std::size_t c = 0;
    while (next_token(p, end, tok)) {
      if (c >= ncols) {
        throw DumpParseError(Kind::InvalidOrMissingAtomRow, lineno_,
                             "atom row has more than " + std::to_string(ncols) + " values");
      }
      double v = 0.0;
      if (!parse_double(tok, v)) {
        throw DumpParseError(Kind::InvalidOrMissingAtomRow, lineno_,
                             "non-numeric value '" + std::string(tok) + "' for property '" +
                             snap.schema().name(c) + "'");
      }
      cols[c][row] = v;
      ++c;
    }
    if (c != ncols) {
      throw DumpParseError(Kind::InvalidOrMissingAtomRow, lineno_,
                           "atom row has " + std::to_string(c) + " values, expected " + std::to_string(ncols));
    }
  }
  return snap;
}

void DumpReader::skip_body(const BlockHeader& hdr) {
  // Headers are still validated; only the rows go unparsed.
  (void)read_box_();
  (void)read_atoms_header_();
  for (std::size_t row = 0; row < hdr.atoms_count; ++row) {
    if (!getline_()) {
      throw DumpParseError(Kind::InvalidOrMissingAtomRow, lineno_,
                           "unexpected EOF after " + std::to_string(row) + " of " +
                           std::to_string(hdr.atoms_count) + " atom rows (skipped timestep " +
                           std::to_string(hdr.timestep) + ")");
    }
  }
}

DumpFile read_dump(std::istream& in, std::span<const std::uint64_t> timesteps) {
  DumpReader reader(in);
  return read_blocks(reader, timesteps);
}

DumpFile read_dump(const std::filesystem::path& path, std::span<const std::uint64_t> timesteps) {
  DumpReader reader(path);
  return read_blocks(reader, timesteps);
}

} // namespace lmputil::io
