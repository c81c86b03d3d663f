#pragma once

#include <cstddef>
#include <vector>

#include "lmputil/alg/cluster/Clusterizer.hpp"
#include "lmputil/core/Snapshot.hpp"

namespace lmputil::analysis {

// Atoms split by the size of the cluster they belong to. Both parts carry the
// "cluster" column and keep ascending row order.
struct SputterSplit {
  Snapshot sputtered;                // clusters with < max_cluster_size atoms
  Snapshot bulk;                     // everything else
  std::vector<double> sputtered_ids; // ascending
};

SputterSplit split_sputtered(const Snapshot& s,
                             double cluster_cutoff,
                             std::size_t max_cluster_size,
                             const alg::cluster::ClusterOptions& opts = {});

} // namespace lmputil::analysis
