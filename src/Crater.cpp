#include "lmputil/analysis/Crater.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "lmputil/alg/neighbor/KdTree.hpp"
#include "lmputil/core/Transform.hpp"
#include "lmputil/util/Parse.hpp"

namespace lmputil::analysis {

namespace cl = lmputil::alg::cluster;

Snapshot crater_candidates(const Snapshot& reference,
                           const Snapshot& comparison,
                           double neighbor_cutoff) {
  if (!(neighbor_cutoff >= 0.0)) {
    throw std::invalid_argument("crater_candidates: neighbor cutoff must be nonnegative");
  }

  const std::vector<Xyz> ref = reference.coordinates();
  const alg::neighbor::KdTree tree(comparison.coordinates());

  // The tree is read-only here; each iteration writes only its own slot.
  const std::size_t n = ref.size();
  std::vector<unsigned char> lonely(n, 0);
#if defined(LMPUTIL_HAS_OPENMP) && LMPUTIL_HAS_OPENMP
  #pragma omp parallel for schedule(static)
  for (std::int64_t ii = 0; ii < static_cast<std::int64_t>(n); ++ii) {
    const std::size_t i = static_cast<std::size_t>(ii);
    lonely[i] = tree.any_within_radius(ref[i], neighbor_cutoff) ? 0 : 1;
  }
#else
  for (std::size_t i = 0; i < n; ++i) {
    lonely[i] = tree.any_within_radius(ref[i], neighbor_cutoff) ? 0 : 1;
  }
#endif

  std::vector<std::size_t> rows;
  for (std::size_t i = 0; i < n; ++i) {
    if (lonely[i]) rows.push_back(i);
  }
  return subset(reference, rows);
}

Snapshot largest_region(const Snapshot& s,
                        double cluster_cutoff,
                        const cl::ClusterOptions& opts) {
  const Snapshot clustered = cl::clusterize(s, cluster_cutoff, opts);
  if (clustered.atoms_count() == 0) return clustered;

  const double best = cl::max_cluster(clustered);
  const auto rows = rows_where(clustered, cl::kClusterKey, [best](double v) { return v == best; });
  return subset(clustered, rows);
}

Snapshot crater_region(const Snapshot& reference,
                       const Snapshot& comparison,
                       double neighbor_cutoff,
                       double cluster_cutoff,
                       const cl::ClusterOptions& opts) {
  if (!(cluster_cutoff >= 0.0)) {
    throw std::invalid_argument("crater_region: cluster cutoff must be nonnegative");
  }
  return largest_region(crater_candidates(reference, comparison, neighbor_cutoff), cluster_cutoff, opts);
}

Snapshot rim_region(const Snapshot& initial,
                    const Snapshot& final_state,
                    double cluster_cutoff,
                    const cl::ClusterOptions& opts) {
  if (!(cluster_cutoff >= 0.0)) {
    throw std::invalid_argument("rim_region: cluster cutoff must be nonnegative");
  }
  const double zero_lvl = initial.zero_level();
  const auto rows = rows_where(final_state, "z", [zero_lvl](double z) { return z > zero_lvl; });
  return largest_region(subset(final_state, rows), cluster_cutoff, opts);
}

std::string CraterSummary::format() const {
  std::string s = std::to_string(count);
  s += ' ';
  append_double(s, volume);
  s += ' ';
  append_double(s, surface);
  s += ' ';
  append_double(s, z_avg);
  s += ' ';
  append_double(s, z_min);
  return s;
}

CraterSummary crater_summary(const Snapshot& region,
                             double zero_level,
                             const CraterSummaryParams& params) {
  CraterSummary out;
  const auto z = region.get("z");
  double z_sum = 0.0;
  double z_min = std::numeric_limits<double>::infinity();
  for (double zi : z) {
    const double depth = zi - zero_level;
    if (zi > zero_level - params.surface_depth) ++out.surface_count;
    z_sum += depth;
    z_min = std::min(z_min, depth);
  }
  out.count = z.size();
  out.volume = static_cast<double>(out.count) * params.atom_volume;
  out.surface = static_cast<double>(out.surface_count) * params.surface_area_per_atom;
  if (out.count > 0) {
    out.z_avg = z_sum / static_cast<double>(out.count);
    out.z_min = z_min;
  } else {
    out.z_avg = std::numeric_limits<double>::quiet_NaN();
    out.z_min = std::numeric_limits<double>::quiet_NaN();
  }
  return out;
}

} // namespace lmputil::analysis
