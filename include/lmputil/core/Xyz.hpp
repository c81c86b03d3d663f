#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>

namespace lmputil {

// A position plus the snapshot row it was taken from.
//
// Equality and hashing look at the coordinate bits only; `index` is a
// back-reference and does not take part. Periodic images of one atom share
// its index but compare unequal.
struct Xyz {
  std::array<double, 3> r{0.0, 0.0, 0.0};
  std::size_t index = 0;

  Xyz() = default;
  Xyz(double x, double y, double z, std::size_t row) : r{x, y, z}, index(row) {}

  double operator[](std::size_t axis) const { return r[axis]; }
  double x() const { return r[0]; }
  double y() const { return r[1]; }
  double z() const { return r[2]; }

  double distance_sq(const Xyz& o) const {
    const double dx = r[0] - o.r[0];
    const double dy = r[1] - o.r[1];
    const double dz = r[2] - o.r[2];
    return dx * dx + dy * dy + dz * dz;
  }

  friend bool operator==(const Xyz& a, const Xyz& b) {
    for (std::size_t k = 0; k < 3; ++k) {
      if (std::bit_cast<std::uint64_t>(a.r[k]) != std::bit_cast<std::uint64_t>(b.r[k])) return false;
    }
    return true;
  }
  friend bool operator!=(const Xyz& a, const Xyz& b) { return !(a == b); }
};

// FNV-1a over the 24 coordinate bytes.
struct XyzHash {
  std::size_t operator()(const Xyz& p) const {
    std::uint64_t h = 1469598103934665603ull;
    for (std::size_t k = 0; k < 3; ++k) {
      std::uint64_t bits = std::bit_cast<std::uint64_t>(p.r[k]);
      for (int b = 0; b < 8; ++b) {
        h ^= bits & 0xffu;
        h *= 1099511628211ull;
        bits >>= 8;
      }
    }
    return static_cast<std::size_t>(h);
  }
};

} // namespace lmputil
