#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "lmputil/core/Snapshot.hpp"

namespace lmputil {

// Pure builders for derived snapshots. The input is never modified; timestep
// and box are copied unchanged.

// New store holding rows[0], rows[1], ... of `s` in that order.
Snapshot subset(const Snapshot& s, std::span<const std::size_t> rows);

// Same rows, plus `names` appended as all-zero columns in declared order.
Snapshot extend_schema(const Snapshot& s, const std::vector<std::string>& names);

// extend_schema(subset(s, rows), names) in a single allocation.
Snapshot subset_and_extend(const Snapshot& s,
                           const std::vector<std::string>& names,
                           std::span<const std::size_t> rows);

// Ascending rows whose `name` value satisfies `pred`.
template <class Pred>
std::vector<std::size_t> rows_where(const Snapshot& s, const std::string& name, Pred&& pred) {
  const auto col = s.get(name);
  std::vector<std::size_t> rows;
  for (std::size_t i = 0; i < col.size(); ++i) {
    if (pred(col[i])) rows.push_back(i);
  }
  return rows;
}

} // namespace lmputil
