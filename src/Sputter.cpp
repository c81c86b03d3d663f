#include "lmputil/analysis/Sputter.hpp"

#include <algorithm>

#include "lmputil/core/Transform.hpp"

namespace lmputil::analysis {

namespace cl = lmputil::alg::cluster;

SputterSplit split_sputtered(const Snapshot& s,
                             double cluster_cutoff,
                             std::size_t max_cluster_size,
                             const cl::ClusterOptions& opts) {
  const Snapshot clustered = cl::clusterize(s, cluster_cutoff, opts);

  SputterSplit out;
  for (const auto& [id, count] : cl::cluster_counts(clustered)) {
    if (count < max_cluster_size) out.sputtered_ids.push_back(id);
  }

  const auto is_sputtered = [&](double id) {
    return std::binary_search(out.sputtered_ids.begin(), out.sputtered_ids.end(), id);
  };
  const auto sputter_rows = rows_where(clustered, cl::kClusterKey, is_sputtered);
  const auto bulk_rows = rows_where(clustered, cl::kClusterKey, [&](double id) { return !is_sputtered(id); });

  out.sputtered = subset(clustered, sputter_rows);
  out.bulk = subset(clustered, bulk_rows);
  return out;
}

} // namespace lmputil::analysis
