#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "lmputil/core/FieldSchema.hpp"
#include "lmputil/core/SymBox.hpp"
#include "lmputil/core/Xyz.hpp"

namespace lmputil {

// One timestep of per-atom data.
//
// Storage is a single flat buffer laid out property-major: the value of
// column c for row i lives at c * atoms_count() + i, so every column is one
// contiguous span. The schema and atom count are fixed at construction;
// deriving a store with different rows or columns goes through Transform.
class Snapshot {
public:
  Snapshot() = default;

  // Zero-initialized store with the given schema.
  Snapshot(std::uint64_t timestep, SymBox box, FieldSchema schema, std::size_t atoms_count);

  std::uint64_t timestep() const { return timestep_; }

  const SymBox& box() const { return box_; }

  std::size_t atoms_count() const { return atoms_count_; }
  std::size_t num_properties() const { return schema_.size(); }
  const FieldSchema& schema() const { return schema_; }

  bool has(const std::string& name) const { return schema_.has(name); }
  std::size_t column(const std::string& name) const;

  // Property names in column order.
  const std::vector<std::string>& keys() const { return schema_.names(); }

  std::span<const double> get(const std::string& name) const;
  std::span<double> get_mut(const std::string& name);

  std::span<const double> column_values(std::size_t col) const;
  std::span<double> column_values_mut(std::size_t col);

  double value(const std::string& name, std::size_t row) const;
  void set(const std::string& name, std::size_t row, double v);

  // Positions from the "x", "y", "z" columns; point k carries index k.
  std::vector<Xyz> coordinates() const;

  // Highest z over all atoms: the free-surface level of an unperturbed slab.
  // -inf for an empty snapshot.
  double zero_level() const;

  const std::vector<double>& data() const { return atoms_; }

private:
  std::uint64_t timestep_ = 0;
  SymBox box_;
  FieldSchema schema_;
  std::size_t atoms_count_ = 0;
  std::vector<double> atoms_;

  void check_row_(std::size_t row) const;
};

} // namespace lmputil
