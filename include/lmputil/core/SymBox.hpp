#pragma once

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lmputil/util/Parse.hpp"

namespace lmputil {

// Orthorhombic simulation cell as written in a dump's BOX BOUNDS block.
//
// `boundaries` keeps the free-form tag that follows "ITEM: BOX BOUNDS"
// (e.g. "pp pp ff"). The per-axis lo <= hi invariant is checked on construction.
class SymBox {
public:
  SymBox() = default;

  SymBox(std::string boundaries,
         double xlo, double xhi,
         double ylo, double yhi,
         double zlo, double zhi)
      : boundaries_(std::move(boundaries)),
        lo_{xlo, ylo, zlo},
        hi_{xhi, yhi, zhi} {
    for (std::size_t a = 0; a < 3; ++a) {
      if (!(lo_[a] <= hi_[a])) {
        throw std::invalid_argument("SymBox: lo > hi on axis " + std::string(1, axis_name(a)) +
                                    " (" + format_double(lo_[a]) + " > " + format_double(hi_[a]) + ")");
      }
    }
  }

  const std::string& boundaries() const { return boundaries_; }

  double lo(std::size_t axis) const { return lo_.at(axis); }
  double hi(std::size_t axis) const { return hi_.at(axis); }
  double length(std::size_t axis) const { return hi_.at(axis) - lo_.at(axis); }

  double xlo() const { return lo_[0]; }
  double xhi() const { return hi_[0]; }
  double ylo() const { return lo_[1]; }
  double yhi() const { return hi_[1]; }
  double zlo() const { return lo_[2]; }
  double zhi() const { return hi_[2]; }

  // LAMMPS convention: one token per axis, "p" first for periodic ("pp", "p").
  bool periodic(std::size_t axis) const {
    if (axis >= 3) throw std::out_of_range("SymBox: axis out of range");
    std::vector<std::string_view> toks;
    split_ws(boundaries_, toks);
    if (axis >= toks.size()) return false;
    return !toks[axis].empty() && toks[axis][0] == 'p';
  }

  static char axis_name(std::size_t axis) { return "xyz"[axis % 3]; }

private:
  std::string boundaries_;
  std::array<double, 3> lo_{0.0, 0.0, 0.0};
  std::array<double, 3> hi_{0.0, 0.0, 0.0};
};

} // namespace lmputil
