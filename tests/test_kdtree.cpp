#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <random>
#include <stdexcept>
#include <vector>

#include "lmputil/alg/neighbor/KdTree.hpp"
#include "lmputil/alg/neighbor/PeriodicImages.hpp"
#include "lmputil/core/SymBox.hpp"

using namespace lmputil;
using lmputil::alg::neighbor::KdTree;

namespace {

std::vector<Xyz> random_points(std::size_t n, unsigned seed) {
  std::mt19937 gen(seed);
  std::uniform_real_distribution<double> u(0.0, 10.0);
  std::vector<Xyz> pts;
  for (std::size_t i = 0; i < n; ++i) pts.emplace_back(u(gen), u(gen), u(gen), i);
  return pts;
}

std::vector<std::size_t> rows_of(const std::vector<Xyz>& pts) {
  std::vector<std::size_t> rows;
  for (const auto& p : pts) rows.push_back(p.index);
  std::sort(rows.begin(), rows.end());
  return rows;
}

} // namespace

TEST(KdTree, MatchesBruteForce) {
  const auto pts = random_points(500, 12345);
  const KdTree tree(pts);
  ASSERT_EQ(tree.size(), 500u);

  for (double r : {0.0, 0.5, 1.3, 4.0}) {
    for (std::size_t qi = 0; qi < pts.size(); qi += 37) {
      const Xyz& q = pts[qi];
      std::vector<std::size_t> expected;
      for (const auto& p : pts) {
        if (p.distance_sq(q) <= r * r) expected.push_back(p.index);
      }
      EXPECT_EQ(rows_of(tree.within_radius(q, r)), expected) << "r=" << r << " q=" << qi;
      EXPECT_EQ(tree.any_within_radius(q, r), !expected.empty());
    }
  }
}

TEST(KdTree, ZeroRadiusFindsOnlyCoincidentPoints) {
  std::vector<Xyz> pts{Xyz(1, 1, 1, 0), Xyz(1, 1, 1, 1), Xyz(1, 1, 1.0001, 2)};
  const KdTree tree(pts);
  EXPECT_EQ(rows_of(tree.within_radius(Xyz(1, 1, 1, 99), 0.0)), (std::vector<std::size_t>{0, 1}));
}

TEST(KdTree, BoundaryDistanceIsInclusive) {
  const KdTree tree(std::vector<Xyz>{Xyz(0, 0, 0, 0), Xyz(3, 0, 0, 1)});
  EXPECT_EQ(tree.within_radius(Xyz(0, 0, 0, 0), 3.0).size(), 2u);
  EXPECT_EQ(tree.within_radius(Xyz(0, 0, 0, 0), 2.999).size(), 1u);
}

TEST(KdTree, EmptyTreeAndBadRadius) {
  const KdTree tree(std::vector<Xyz>{});
  EXPECT_TRUE(tree.empty());
  EXPECT_TRUE(tree.within_radius(Xyz(0, 0, 0, 0), 5.0).empty());
  EXPECT_FALSE(tree.any_within_radius(Xyz(0, 0, 0, 0), 5.0));
  EXPECT_THROW((void)tree.within_radius(Xyz(0, 0, 0, 0), -1.0), std::invalid_argument);
}

TEST(KdTree, ForEachVisitsEveryHit) {
  const auto pts = random_points(200, 7);
  const KdTree tree(pts);
  std::size_t n = 0;
  tree.for_each_within_radius(pts[0], 2.0, [&](const Xyz&) { ++n; });
  EXPECT_EQ(n, tree.within_radius(pts[0], 2.0).size());
}

TEST(PeriodicImages, ShiftsOnlyAlongPeriodicAxes) {
  const SymBox box("pp ff pp", 0.0, 10.0, 0.0, 10.0, 0.0, 10.0);
  std::vector<Xyz> pts{Xyz(0.5, 0.5, 5.0, 0), Xyz(5, 5, 5, 1)};
  alg::neighbor::append_periodic_images(pts, box, 1.0);
  // Only the first point is near a periodic face (x lo); y is fixed.
  ASSERT_EQ(pts.size(), 3u);
  EXPECT_EQ(pts[2].index, 0u);
  EXPECT_DOUBLE_EQ(pts[2].x(), 10.5);
  EXPECT_DOUBLE_EQ(pts[2].y(), 0.5);
}

TEST(PeriodicImages, CornerGetsCombinedShifts) {
  const SymBox box("pp pp pp", 0.0, 10.0, 0.0, 10.0, 0.0, 10.0);
  std::vector<Xyz> pts{Xyz(0.2, 0.2, 0.2, 0)};
  alg::neighbor::append_periodic_images(pts, box, 1.0);
  EXPECT_EQ(pts.size(), 8u);

  const KdTree tree(pts);
  EXPECT_TRUE(tree.any_within_radius(Xyz(9.9, 9.9, 9.9, 1), 1.0));
}

TEST(PeriodicImages, NonPeriodicBoxAddsNothing) {
  std::vector<Xyz> pts{Xyz(0, 0, 0, 0)};
  alg::neighbor::append_periodic_images(pts, SymBox("ff ff ff", 0, 10, 0, 10, 0, 10), 2.0);
  EXPECT_EQ(pts.size(), 1u);
}
