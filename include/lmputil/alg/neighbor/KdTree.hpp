#pragma once

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

#include "lmputil/core/Xyz.hpp"

namespace lmputil::alg::neighbor {

// Static 3-d tree over a point list.
//
// The tree is implicit: for a range [lo, hi) at depth d, the node sits at
// mid = lo + (hi - lo) / 2 after an nth_element on axis d % 3; the left
// child range is [lo, mid) and the right one [mid + 1, hi). Build and
// queries use explicit stacks.
//
// Immutable after construction, so concurrent queries are safe. Rebuild when
// the point list changes.
class KdTree {
public:
  KdTree() = default;

  explicit KdTree(std::vector<Xyz> points) : pts_(std::move(points)) {
    build_();
  }

  std::size_t size() const { return pts_.size(); }
  bool empty() const { return pts_.empty(); }

  // All points p with |p - q|^2 <= r^2, q itself included when indexed.
  std::vector<Xyz> within_radius(const Xyz& q, double r) const {
    std::vector<Xyz> out;
    visit_(q, checked_r2_(r), [&](const Xyz& p) {
      out.push_back(p);
      return false;
    });
    return out;
  }

  // Stops at the first hit.
  bool any_within_radius(const Xyz& q, double r) const {
    bool hit = false;
    visit_(q, checked_r2_(r), [&](const Xyz&) {
      hit = true;
      return true;
    });
    return hit;
  }

  template <class F>
  void for_each_within_radius(const Xyz& q, double r, F&& fn) const {
    visit_(q, checked_r2_(r), [&](const Xyz& p) {
      fn(p);
      return false;
    });
  }

private:
  struct Range {
    std::size_t lo;
    std::size_t hi;
    std::size_t depth;
  };

  std::vector<Xyz> pts_;

  static double checked_r2_(double r) {
    if (!(r >= 0.0)) throw std::invalid_argument("KdTree: radius must be nonnegative");
    return r * r;
  }

  void build_() {
    std::vector<Range> stack;
    stack.push_back({0, pts_.size(), 0});
    while (!stack.empty()) {
      const Range rg = stack.back();
      stack.pop_back();
      if (rg.hi - rg.lo <= 1) continue;
      const std::size_t axis = rg.depth % 3;
      const std::size_t mid = rg.lo + (rg.hi - rg.lo) / 2;
      std::nth_element(pts_.begin() + static_cast<std::ptrdiff_t>(rg.lo),
                       pts_.begin() + static_cast<std::ptrdiff_t>(mid),
                       pts_.begin() + static_cast<std::ptrdiff_t>(rg.hi),
                       [axis](const Xyz& a, const Xyz& b) { return a.r[axis] < b.r[axis]; });
      stack.push_back({rg.lo, mid, rg.depth + 1});
      stack.push_back({mid + 1, rg.hi, rg.depth + 1});
    }
  }

  // fn returns true to stop the traversal.
  template <class F>
  void visit_(const Xyz& q, double r2, F&& fn) const {
    std::vector<Range> stack;
    stack.push_back({0, pts_.size(), 0});
    while (!stack.empty()) {
      const Range rg = stack.back();
      stack.pop_back();
      if (rg.lo >= rg.hi) continue;

      const std::size_t mid = rg.lo + (rg.hi - rg.lo) / 2;
      const Xyz& p = pts_[mid];
      if (q.distance_sq(p) <= r2) {
        if (fn(p)) return;
      }
      if (rg.hi - rg.lo == 1) continue;

      // Left of mid: coordinate <= pivot; right of mid: >= pivot.
      const std::size_t axis = rg.depth % 3;
      const double diff = q.r[axis] - p.r[axis];
      const bool far_ok = diff * diff <= r2;
      const Range left{rg.lo, mid, rg.depth + 1};
      const Range right{mid + 1, rg.hi, rg.depth + 1};
      if (diff <= 0.0) {
        if (far_ok) stack.push_back(right);
        stack.push_back(left);
      } else {
        if (far_ok) stack.push_back(left);
        stack.push_back(right);
      }
    }
  }
};

} // namespace lmputil::alg::neighbor
