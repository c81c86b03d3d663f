#include "lmputil/core/Snapshot.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lmputil {

namespace {

std::size_t buffer_size(std::size_t atoms_count, std::size_t ncols) {
  const std::size_t limit = std::vector<double>().max_size();
  if (atoms_count != 0 && ncols > limit / atoms_count) {
    throw std::length_error("Snapshot: " + std::to_string(atoms_count) + " atoms x " +
                            std::to_string(ncols) + " properties exceeds addressable storage");
  }
  return atoms_count * ncols;
}

} // namespace

Snapshot::Snapshot(std::uint64_t timestep, SymBox box, FieldSchema schema, std::size_t atoms_count)
    : timestep_(timestep),
      box_(std::move(box)),
      schema_(std::move(schema)),
      atoms_count_(atoms_count),
      atoms_(buffer_size(atoms_count, schema_.size()), 0.0) {}

std::size_t Snapshot::column(const std::string& name) const {
  if (!schema_.has(name)) {
    throw std::out_of_range("Snapshot[" + std::to_string(timestep_) + "]: unknown property '" + name + "'");
  }
  return schema_.require(name);
}

std::span<const double> Snapshot::get(const std::string& name) const {
  return column_values(column(name));
}

std::span<double> Snapshot::get_mut(const std::string& name) {
  return column_values_mut(column(name));
}

std::span<const double> Snapshot::column_values(std::size_t col) const {
  if (col >= schema_.size()) throw std::out_of_range("Snapshot: column id out of range");
  return {atoms_.data() + col * atoms_count_, atoms_count_};
}

std::span<double> Snapshot::column_values_mut(std::size_t col) {
  if (col >= schema_.size()) throw std::out_of_range("Snapshot: column id out of range");
  return {atoms_.data() + col * atoms_count_, atoms_count_};
}

double Snapshot::value(const std::string& name, std::size_t row) const {
  check_row_(row);
  return get(name)[row];
}

void Snapshot::set(const std::string& name, std::size_t row, double v) {
  check_row_(row);
  get_mut(name)[row] = v;
}

std::vector<Xyz> Snapshot::coordinates() const {
  const auto x = get("x");
  const auto y = get("y");
  const auto z = get("z");
  std::vector<Xyz> out;
  out.reserve(atoms_count_);
  for (std::size_t i = 0; i < atoms_count_; ++i) {
    out.emplace_back(x[i], y[i], z[i], i);
  }
  return out;
}

double Snapshot::zero_level() const {
  const auto z = get("z");
  double level = -std::numeric_limits<double>::infinity();
  for (double v : z) level = std::max(level, v);
  return level;
}

void Snapshot::check_row_(std::size_t row) const {
  if (row >= atoms_count_) {
    throw std::out_of_range("Snapshot[" + std::to_string(timestep_) + "]: row " + std::to_string(row) +
                            " out of range (atoms_count=" + std::to_string(atoms_count_) + ")");
  }
}

} // namespace lmputil
