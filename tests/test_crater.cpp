#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "lmputil/alg/cluster/Clusterizer.hpp"
#include "lmputil/analysis/Crater.hpp"
#include "lmputil/analysis/Sputter.hpp"
#include "TestSupport.hpp"

using namespace lmputil;
namespace cl = lmputil::alg::cluster;

namespace {

// 5 x 5 x 3 simple cubic slab, spacing 2, top layer at z = 4.
std::vector<std::array<double, 3>> slab() {
  std::vector<std::array<double, 3>> pts;
  for (int k = 0; k < 3; ++k) {
    for (int j = 0; j < 5; ++j) {
      for (int i = 0; i < 5; ++i) {
        pts.push_back({2.0 * i, 2.0 * j, 2.0 * k});
      }
    }
  }
  return pts;
}

bool near(const std::array<double, 3>& p, double x, double y, double z) {
  return p[0] == x && p[1] == y && p[2] == z;
}

} // namespace

TEST(Crater, IdenticalSnapshotsHaveNoCandidates) {
  const Snapshot s = test::make_points(slab());
  EXPECT_EQ(analysis::crater_candidates(s, s, 0.5).atoms_count(), 0u);
  EXPECT_EQ(analysis::crater_candidates(s, s, 0.0).atoms_count(), 0u);
  EXPECT_EQ(analysis::crater_region(s, s, 0.5, 3.0).atoms_count(), 0u);
}

TEST(Crater, CandidatesAreRowsWithoutNeighbor) {
  const Snapshot initial = test::make_points({{0, 0, 0}, {5, 5, 5}, {9, 9, 9}});
  const Snapshot final_state = test::make_points({{0.1, 0, 0}});
  const Snapshot out = analysis::crater_candidates(initial, final_state, 0.5);
  ASSERT_EQ(out.atoms_count(), 2u);
  EXPECT_EQ(out.value("id", 0), 2.0);
  EXPECT_EQ(out.value("id", 1), 3.0);
  EXPECT_FALSE(out.has(cl::kClusterKey));
  EXPECT_THROW((void)analysis::crater_candidates(initial, final_state, -1.0), std::invalid_argument);
}

TEST(Crater, RegionIsLargestMissingGroup) {
  // Remove a 2 x 2 patch from the top layer and one far-away lone atom.
  std::vector<std::array<double, 3>> kept;
  for (const auto& p : slab()) {
    const bool pit = p[2] == 4.0 && p[0] <= 2.0 && p[1] <= 2.0;
    if (pit || near(p, 8, 8, 4)) continue;
    kept.push_back(p);
  }
  const Snapshot initial = test::make_points(slab());
  const Snapshot final_state = test::make_points(kept);

  const Snapshot crater = analysis::crater_region(initial, final_state, 0.5, 2.5);
  ASSERT_EQ(crater.atoms_count(), 4u);
  ASSERT_TRUE(crater.has(cl::kClusterKey));
  for (double z : crater.get("z")) EXPECT_EQ(z, 4.0);

  const analysis::CraterSummary sum = analysis::crater_summary(crater, initial.zero_level());
  EXPECT_EQ(sum.count, 4u);
  EXPECT_EQ(sum.surface_count, 4u);
  EXPECT_DOUBLE_EQ(sum.volume, 4 * 20.1);
  EXPECT_DOUBLE_EQ(sum.surface, 4 * 7.3712);
  EXPECT_DOUBLE_EQ(sum.z_avg, 0.0);
  EXPECT_DOUBLE_EQ(sum.z_min, 0.0);
}

TEST(Crater, SummaryDepthStatistics) {
  const Snapshot region = test::make_points({{0, 0, 10}, {0, 0, 9}, {0, 0, 6}});
  const analysis::CraterSummary sum = analysis::crater_summary(region, 10.0);
  EXPECT_EQ(sum.count, 3u);
  // z > 10 - 2.4 * 0.707 counts as surface.
  EXPECT_EQ(sum.surface_count, 2u);
  EXPECT_DOUBLE_EQ(sum.z_avg, (0.0 - 1.0 - 4.0) / 3.0);
  EXPECT_DOUBLE_EQ(sum.z_min, -4.0);
  EXPECT_EQ(sum.format().substr(0, 2), "3 ");
}

TEST(Crater, EmptySummary) {
  const analysis::CraterSummary sum = analysis::crater_summary(test::make_points({}), 1.0);
  EXPECT_EQ(sum.count, 0u);
  EXPECT_EQ(sum.volume, 0.0);
  EXPECT_TRUE(std::isnan(sum.z_avg));
  EXPECT_TRUE(std::isnan(sum.z_min));
}

TEST(Rim, LargestGroupAboveSurface) {
  const Snapshot initial = test::make_points(slab());
  std::vector<std::array<double, 3>> fin = slab();
  // Ridge of three adatoms plus a lone one elsewhere.
  fin.push_back({0, 0, 6});
  fin.push_back({2, 0, 6});
  fin.push_back({4, 0, 6});
  fin.push_back({8, 8, 6});
  const Snapshot final_state = test::make_points(fin);

  const Snapshot rim = analysis::rim_region(initial, final_state, 2.5);
  ASSERT_EQ(rim.atoms_count(), 3u);
  for (double z : rim.get("z")) EXPECT_EQ(z, 6.0);
  EXPECT_THROW((void)analysis::rim_region(initial, final_state, -2.0), std::invalid_argument);
}

TEST(Rim, NothingAboveSurface) {
  const Snapshot s = test::make_points(slab());
  EXPECT_EQ(analysis::rim_region(s, s, 2.5).atoms_count(), 0u);
}

TEST(Sputter, SmallClustersAreSputtered) {
  std::vector<std::array<double, 3>> pts = slab();
  pts.push_back({0, 0, 20});
  pts.push_back({0, 0, 21});
  pts.push_back({8, 8, 30});
  const Snapshot s = test::make_points(pts);

  const analysis::SputterSplit split = analysis::split_sputtered(s, 2.5, 10);
  EXPECT_EQ(split.sputtered.atoms_count(), 3u);
  EXPECT_EQ(split.bulk.atoms_count(), slab().size());
  EXPECT_EQ(split.sputtered_ids.size(), 2u);
  EXPECT_TRUE(split.sputtered.has(cl::kClusterKey));
  EXPECT_EQ(split.sputtered.value("id", 0), static_cast<double>(slab().size() + 1));

  const analysis::SputterSplit none = analysis::split_sputtered(s, 2.5, 1);
  EXPECT_EQ(none.sputtered.atoms_count(), 0u);
  EXPECT_EQ(none.bulk.atoms_count(), s.atoms_count());
}
