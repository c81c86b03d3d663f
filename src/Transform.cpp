#include "lmputil/core/Transform.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace lmputil {

namespace {

std::vector<std::size_t> all_rows(std::size_t n) {
  std::vector<std::size_t> rows(n);
  for (std::size_t i = 0; i < n; ++i) rows[i] = i;
  return rows;
}

} // namespace

Snapshot subset_and_extend(const Snapshot& s,
                           const std::vector<std::string>& names,
                           std::span<const std::size_t> rows) {
  for (std::size_t r : rows) {
    if (r >= s.atoms_count()) {
      throw std::out_of_range("subset: row " + std::to_string(r) +
                              " out of range (atoms_count=" + std::to_string(s.atoms_count()) + ")");
    }
  }

  FieldSchema schema = s.schema();
  for (const auto& n : names) {
    if (schema.has(n)) {
      throw std::invalid_argument("extend_schema: property '" + n + "' already present");
    }
    schema.add(n);
  }

  Snapshot out(s.timestep(), s.box(), std::move(schema), rows.size());

  // New columns stay zero; copy the existing ones column by column so both
  // source and destination are walked contiguously.
  for (std::size_t c = 0; c < s.num_properties(); ++c) {
    const auto src = s.column_values(c);
    auto dst = out.column_values_mut(c);
    for (std::size_t i = 0; i < rows.size(); ++i) {
      dst[i] = src[rows[i]];
    }
  }
  return out;
}

Snapshot subset(const Snapshot& s, std::span<const std::size_t> rows) {
  return subset_and_extend(s, {}, rows);
}

Snapshot extend_schema(const Snapshot& s, const std::vector<std::string>& names) {
  const auto rows = all_rows(s.atoms_count());
  return subset_and_extend(s, names, rows);
}

} // namespace lmputil
