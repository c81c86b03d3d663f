#pragma once

#include <algorithm>
#include <cstddef>
#include <map>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "lmputil/alg/neighbor/KdTree.hpp"
#include "lmputil/alg/neighbor/PeriodicImages.hpp"
#include "lmputil/core/Snapshot.hpp"
#include "lmputil/core/Transform.hpp"

namespace lmputil::alg::cluster {

inline constexpr const char* kClusterKey = "cluster";

struct ClusterOptions {
  // Connect atoms across faces whose BOX BOUNDS tag is periodic.
  bool periodic = false;
  // Property whose value at the seed row names the cluster.
  std::string id_key = "id";
};

// Connected components of the "distance <= cutoff" graph over a snapshot.
struct ClusterLabeling {
  std::vector<double> labels;        // size = atoms_count, cluster id per row
  std::vector<std::size_t> seed_rows; // per cluster, in discovery order
  std::vector<std::size_t> sizes;     // per cluster, same order as seed_rows

  std::size_t size() const { return labels.size(); }
  std::size_t n_clusters() const { return seed_rows.size(); }

  std::size_t largest_size() const {
    std::size_t m = 0;
    for (auto s : sizes) m = std::max(m, s);
    return m;
  }
};

// Flood fill over rows in increasing order with an explicit stack; neighbors
// come from one KdTree built per call. The seed of each cluster is its
// smallest row, and the cluster id is the seed's `opts.id_key` value.
inline ClusterLabeling cluster_rows(const Snapshot& s, double cutoff, const ClusterOptions& opts = {}) {
  if (!(cutoff >= 0.0)) throw std::invalid_argument("cluster_rows: cutoff must be nonnegative");

  const auto ids = s.get(opts.id_key);
  std::vector<Xyz> coords = s.coordinates();
  if (opts.periodic) {
    neighbor::append_periodic_images(coords, s.box(), cutoff);
  }
  const std::size_t n = s.atoms_count();
  // Real atoms occupy coords[0, n); images follow and are only ever hit as
  // neighbors, which report their original row.
  const std::vector<Xyz> atoms(coords.begin(), coords.begin() + static_cast<std::ptrdiff_t>(n));
  const neighbor::KdTree tree(std::move(coords));

  ClusterLabeling out;
  out.labels.assign(n, 0.0);
  std::vector<unsigned char> visited(n, 0);
  std::vector<std::size_t> stack;

  for (std::size_t seed = 0; seed < n; ++seed) {
    if (visited[seed]) continue;
    const double cid = ids[seed];
    std::size_t count = 1;
    visited[seed] = 1;
    out.labels[seed] = cid;
    stack.push_back(seed);

    while (!stack.empty()) {
      const std::size_t r = stack.back();
      stack.pop_back();
      tree.for_each_within_radius(atoms[r], cutoff, [&](const Xyz& nb) {
        const std::size_t j = nb.index;
        if (visited[j]) return;
        visited[j] = 1;
        out.labels[j] = cid;
        ++count;
        stack.push_back(j);
      });
    }

    out.seed_rows.push_back(seed);
    out.sizes.push_back(count);
  }
  return out;
}

// cluster id -> atom count, ordered by id.
inline std::map<double, std::size_t> cluster_counts(std::span<const double> labels) {
  std::map<double, std::size_t> counts;
  for (double l : labels) ++counts[l];
  return counts;
}

inline std::map<double, std::size_t> cluster_counts(const ClusterLabeling& lab) {
  return cluster_counts(std::span<const double>(lab.labels));
}

// Id of the most populated cluster; ties go to the smallest id.
inline double max_cluster(std::span<const double> labels) {
  if (labels.empty()) throw std::invalid_argument("max_cluster: empty labeling");
  const auto counts = cluster_counts(labels);
  auto best = counts.begin();
  for (auto it = counts.begin(); it != counts.end(); ++it) {
    if (it->second > best->second) best = it;
  }
  return best->first;
}

inline double max_cluster(const ClusterLabeling& lab) {
  return max_cluster(std::span<const double>(lab.labels));
}

// Copy of `s` with a trailing "cluster" column holding the labels.
inline Snapshot clusterize(const Snapshot& s, double cutoff, const ClusterOptions& opts = {}) {
  const ClusterLabeling lab = cluster_rows(s, cutoff, opts);
  Snapshot out = extend_schema(s, {kClusterKey});
  auto col = out.get_mut(kClusterKey);
  std::copy(lab.labels.begin(), lab.labels.end(), col.begin());
  return out;
}

// Aggregates over the "cluster" column of a clusterized snapshot.
inline std::map<double, std::size_t> cluster_counts(const Snapshot& clusterized) {
  return cluster_counts(clusterized.get(kClusterKey));
}

inline double max_cluster(const Snapshot& clusterized) {
  return max_cluster(clusterized.get(kClusterKey));
}

} // namespace lmputil::alg::cluster
