#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <unordered_set>

#include "lmputil/core/FieldSchema.hpp"
#include "lmputil/core/Snapshot.hpp"
#include "lmputil/core/SymBox.hpp"
#include "lmputil/core/Xyz.hpp"
#include "TestSupport.hpp"

using namespace lmputil;

TEST(SymBox, RejectsInvertedBounds) {
  EXPECT_THROW(SymBox("pp pp pp", 1.0, 0.0, 0.0, 1.0, 0.0, 1.0), std::invalid_argument);
  EXPECT_NO_THROW(SymBox("pp pp pp", 1.0, 1.0, 0.0, 1.0, 0.0, 1.0));
}

TEST(SymBox, PeriodicFromTag) {
  const SymBox box("pp fs pm", 0.0, 2.0, -1.0, 1.0, 0.0, 4.0);
  EXPECT_TRUE(box.periodic(0));
  EXPECT_FALSE(box.periodic(1));
  EXPECT_TRUE(box.periodic(2));
  EXPECT_DOUBLE_EQ(box.length(1), 2.0);

  const SymBox short_tag("pp", 0.0, 1.0, 0.0, 1.0, 0.0, 1.0);
  EXPECT_TRUE(short_tag.periodic(0));
  EXPECT_FALSE(short_tag.periodic(2));
  EXPECT_THROW((void)short_tag.periodic(3), std::out_of_range);
}

TEST(FieldSchema, KeepsDeclarationOrder) {
  FieldSchema s({"id", "x", "y"});
  EXPECT_EQ(s.require("id"), 0u);
  EXPECT_EQ(s.require("y"), 2u);
  EXPECT_EQ(s.add("vx"), 3u);
  EXPECT_EQ(s.name(3), "vx");
  EXPECT_THROW(s.add("x"), std::invalid_argument);
  EXPECT_THROW(s.add(""), std::invalid_argument);
  EXPECT_THROW((void)s.require("z"), std::out_of_range);
}

TEST(Snapshot, ColumnMajorLayout) {
  Snapshot s(7, SymBox(), FieldSchema({"a", "b"}), 3);
  ASSERT_EQ(s.data().size(), 6u);
  s.set("a", 0, 1.0);
  s.set("a", 2, 3.0);
  s.set("b", 1, 5.0);
  // value(p, i) at column(p) * atoms_count + i
  EXPECT_EQ(s.data()[0], 1.0);
  EXPECT_EQ(s.data()[2], 3.0);
  EXPECT_EQ(s.data()[1 * 3 + 1], 5.0);
  EXPECT_EQ(s.get("b").size(), 3u);
  EXPECT_EQ(s.value("b", 0), 0.0);
}

TEST(Snapshot, LookupErrors) {
  Snapshot s(7, SymBox(), FieldSchema({"a"}), 2);
  EXPECT_THROW((void)s.get("missing"), std::out_of_range);
  EXPECT_THROW(s.set("a", 2, 1.0), std::out_of_range);
  EXPECT_THROW((void)s.value("a", 5), std::out_of_range);
  // No x/y/z columns.
  EXPECT_THROW((void)s.coordinates(), std::out_of_range);
}

TEST(Snapshot, RejectsStorageSizeOverflow) {
  const std::size_t n = std::numeric_limits<std::size_t>::max() / 2 + 1;
  EXPECT_THROW(Snapshot(1, SymBox(), FieldSchema({"a", "b"}), n), std::length_error);
  EXPECT_THROW(Snapshot(1, SymBox(), FieldSchema({"a"}), n), std::length_error);
  const Snapshot empty(1, SymBox(), FieldSchema(), n);
  EXPECT_TRUE(empty.data().empty());
}

TEST(Snapshot, CoordinatesCarryRows) {
  const Snapshot s = test::make_points({{1, 2, 3}, {4, 5, 6}});
  const auto pts = s.coordinates();
  ASSERT_EQ(pts.size(), 2u);
  EXPECT_EQ(pts[1].index, 1u);
  EXPECT_EQ(pts[1].z(), 6.0);
}

TEST(Snapshot, ZeroLevelIsMaxZ) {
  EXPECT_DOUBLE_EQ(test::make_points({{0, 0, 1.5}, {0, 0, -2.0}, {0, 0, 4.25}}).zero_level(), 4.25);
  const double empty = test::make_points({}).zero_level();
  EXPECT_TRUE(std::isinf(empty) && empty < 0.0);
}

TEST(Xyz, EqualityIgnoresIndex) {
  const Xyz a(1.0, 2.0, 3.0, 0);
  const Xyz b(1.0, 2.0, 3.0, 9);
  EXPECT_EQ(a, b);
  EXPECT_EQ(XyzHash{}(a), XyzHash{}(b));
  EXPECT_NE(Xyz(0.0, 0.0, 0.0, 0), Xyz(-0.0, 0.0, 0.0, 0));

  std::unordered_set<Xyz, XyzHash> set{a, b, Xyz(1.0, 2.0, 3.5, 1)};
  EXPECT_EQ(set.size(), 2u);
}
