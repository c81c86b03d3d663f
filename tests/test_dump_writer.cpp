#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "lmputil/core/DumpFile.hpp"
#include "lmputil/io/DumpReader.hpp"
#include "lmputil/io/DumpWriter.hpp"
#include "lmputil/util/AtomicFile.hpp"
#include "TestSupport.hpp"

using namespace lmputil;

namespace {

DumpFile sample_dump() {
  Snapshot a = test::make_points({{0.1, 0.2, 0.3}, {1.0 / 3.0, -2.5e-7, 9.75}}, 100);
  Snapshot b = test::make_points({{5, 5, 5}}, 200, SymBox("", -1.5, 1.5, 0.0, 2.0, -0.125, 0.0));
  std::vector<Snapshot> v;
  v.push_back(std::move(b));
  v.push_back(std::move(a));
  return DumpFile(std::move(v));
}

std::string to_text(const DumpFile& d) {
  std::ostringstream oss;
  io::write_dump(oss, d);
  return oss.str();
}

} // namespace

TEST(DumpWriter, BlockLayout) {
  const Snapshot s = test::make_points({{1.5, 2, -3}}, 7);
  std::ostringstream oss;
  io::write_snapshot(oss, s);
  EXPECT_EQ(oss.str(),
            "ITEM: TIMESTEP\n7\n"
            "ITEM: NUMBER OF ATOMS\n1\n"
            "ITEM: BOX BOUNDS pp pp ff\n0 10\n0 10\n0 10\n"
            "ITEM: ATOMS id type x y z\n"
            "1 1 1.5 2 -3\n");
}

TEST(DumpWriter, EmptyBoundaryTag) {
  Snapshot s(1, SymBox("", 0, 1, 0, 1, 0, 1), FieldSchema({"id"}), 0);
  std::ostringstream oss;
  io::write_snapshot(oss, s);
  EXPECT_NE(oss.str().find("ITEM: BOX BOUNDS\n"), std::string::npos);
}

TEST(DumpWriter, ParseWriteParseKeepsValues) {
  const DumpFile d = sample_dump();
  std::istringstream in(to_text(d));
  const DumpFile back = io::read_dump(in);
  ASSERT_EQ(back.timesteps(), (std::vector<std::uint64_t>{100, 200}));
  for (const auto& [ts, s] : d) {
    const Snapshot& r = back.at(ts);
    EXPECT_EQ(r.schema(), s.schema());
    EXPECT_EQ(r.data(), s.data());
    EXPECT_EQ(r.box().boundaries(), s.box().boundaries());
    for (std::size_t a = 0; a < 3; ++a) {
      EXPECT_EQ(r.box().lo(a), s.box().lo(a));
      EXPECT_EQ(r.box().hi(a), s.box().hi(a));
    }
  }
}

TEST(DumpWriter, WriteParseWriteIsByteIdentical) {
  const std::string first = to_text(sample_dump());
  std::istringstream in(first);
  EXPECT_EQ(to_text(io::read_dump(in)), first);
}

TEST(DumpWriter, SaveReplacesTargetAtomically) {
  test::ScopedTempDir dir;
  const auto path = dir.path() / "dump.out";
  test::write_text(path, "old contents\n");

  const DumpFile d = sample_dump();
  d.save(path);
  EXPECT_FALSE(std::filesystem::exists(dir.path() / "dump.out.tmp"));
  EXPECT_EQ(test::read_text(path), to_text(d));

  const DumpFile back = DumpFile::read(path, std::vector<std::uint64_t>{200});
  EXPECT_EQ(back.size(), 1u);
  EXPECT_EQ(back.first().value("x", 0), 5.0);
  EXPECT_EQ(back.get_property(200, "z")[0], 5.0);
  EXPECT_THROW((void)back.get_property(100, "z"), std::out_of_range);
}

TEST(DumpWriter, FailedWriteKeepsTargetAndRemovesTempFile) {
  test::ScopedTempDir dir;
  const auto path = dir.path() / "dump.out";
  test::write_text(path, "old contents\n");

  EXPECT_THROW(util::write_file_atomically(path,
                                           [](std::ostream& os) {
                                             os << "partial block\n";
                                             throw std::runtime_error("DumpWriter: write failed at timestep 1");
                                           }),
               std::runtime_error);
  EXPECT_FALSE(std::filesystem::exists(dir.path() / "dump.out.tmp"));
  EXPECT_EQ(test::read_text(path), "old contents\n");

  // Unwritable target directory: nothing is created.
  EXPECT_THROW(sample_dump().save(dir.path() / "missing" / "dump.out"), std::runtime_error);
  EXPECT_FALSE(std::filesystem::exists(dir.path() / "missing"));
}

TEST(DumpFile, RejectsDuplicateTimesteps) {
  std::vector<Snapshot> v;
  v.push_back(test::make_points({}, 3));
  v.push_back(test::make_points({}, 3));
  EXPECT_THROW(DumpFile(std::move(v)), std::invalid_argument);

  DumpFile d;
  EXPECT_THROW((void)d.first(), std::out_of_range);
  EXPECT_THROW((void)d.at(1), std::out_of_range);
}
