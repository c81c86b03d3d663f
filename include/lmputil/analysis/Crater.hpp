#pragma once

#include <cstddef>
#include <string>

#include "lmputil/alg/cluster/Clusterizer.hpp"
#include "lmputil/core/Snapshot.hpp"

namespace lmputil::analysis {

// Rows of `reference` with no `comparison` atom within `neighbor_cutoff`,
// in ascending row order. With reference == comparison the result is empty.
Snapshot crater_candidates(const Snapshot& reference,
                           const Snapshot& comparison,
                           double neighbor_cutoff);

// Largest connected region of `s` under `cluster_cutoff`, carrying the
// "cluster" column. An empty snapshot yields an empty region.
Snapshot largest_region(const Snapshot& s,
                        double cluster_cutoff,
                        const alg::cluster::ClusterOptions& opts = {});

// largest_region(crater_candidates(reference, comparison, d), c).
Snapshot crater_region(const Snapshot& reference,
                       const Snapshot& comparison,
                       double neighbor_cutoff,
                       double cluster_cutoff,
                       const alg::cluster::ClusterOptions& opts = {});

// Largest connected group of `final_state` atoms strictly above the initial
// surface (initial.zero_level()).
Snapshot rim_region(const Snapshot& initial,
                    const Snapshot& final_state,
                    double cluster_cutoff,
                    const alg::cluster::ClusterOptions& opts = {});

// Per-atom constants default to crystalline silicon.
struct CraterSummaryParams {
  double atom_volume = 20.1;             // A^3
  double surface_depth = 2.4 * 0.707;    // A below zero level still counted as surface
  double surface_area_per_atom = 7.3712; // A^2
};

struct CraterSummary {
  std::size_t count = 0;
  std::size_t surface_count = 0;
  double volume = 0.0;
  double surface = 0.0;
  double z_avg = 0.0; // mean of z - zero_level
  double z_min = 0.0; // min of z - zero_level

  // "count volume surface z_avg z_min"
  std::string format() const;
};

CraterSummary crater_summary(const Snapshot& region,
                             double zero_level,
                             const CraterSummaryParams& params = {});

} // namespace lmputil::analysis
