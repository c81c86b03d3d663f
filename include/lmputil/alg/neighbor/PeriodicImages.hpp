#pragma once

#include <array>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include "lmputil/core/SymBox.hpp"
#include "lmputil/core/Xyz.hpp"

namespace lmputil::alg::neighbor {

// Append shifted copies of points lying within `cutoff` of a periodic face.
//
// A point near the lo face of a periodic axis gets an image shifted by +L on
// that axis, one near the hi face an image shifted by -L; corner and edge
// points get the combined shifts. Images keep the row index of the original
// point, so a radius query against the extended list reports neighbors
// across the boundary by their real rows. Valid for cutoff < L / 2.
inline void append_periodic_images(std::vector<Xyz>& points, const SymBox& box, double cutoff) {
  if (!(cutoff >= 0.0)) throw std::invalid_argument("append_periodic_images: cutoff must be nonnegative");

  const std::array<bool, 3> periodic{box.periodic(0), box.periodic(1), box.periodic(2)};
  if (!periodic[0] && !periodic[1] && !periodic[2]) return;

  std::vector<std::array<int, 3>> shifts;
  for (int sx = -1; sx <= 1; ++sx) {
    for (int sy = -1; sy <= 1; ++sy) {
      for (int sz = -1; sz <= 1; ++sz) {
        const std::array<int, 3> s{sx, sy, sz};
        if (sx == 0 && sy == 0 && sz == 0) continue;
        bool ok = true;
        for (std::size_t a = 0; a < 3; ++a) {
          if (s[a] != 0 && !periodic[a]) ok = false;
        }
        if (ok) shifts.push_back(s);
      }
    }
  }

  const std::size_t n = points.size();
  for (std::size_t i = 0; i < n; ++i) {
    for (const auto& s : shifts) {
      const Xyz p = points[i];
      bool near = true;
      for (std::size_t a = 0; a < 3 && near; ++a) {
        if (s[a] == 1) near = p.r[a] < box.lo(a) + cutoff;
        else if (s[a] == -1) near = p.r[a] > box.hi(a) - cutoff;
      }
      if (!near) continue;
      Xyz img = p;
      for (std::size_t a = 0; a < 3; ++a) {
        img.r[a] += static_cast<double>(s[a]) * box.length(a);
      }
      points.push_back(img);
    }
  }
}

} // namespace lmputil::alg::neighbor
