#pragma once

#include <chrono>
#include <cstdio>
#include <string>

namespace lmputil {

// Steady-clock stopwatch started on construction; used for per-task and
// per-run timing in the runner's log lines.
class WallTimer {
public:
  using clock = std::chrono::steady_clock;

  WallTimer() : t0_(clock::now()) {}

  double elapsed_seconds() const {
    return std::chrono::duration<double>(clock::now() - t0_).count();
  }

  // "12.345s"
  std::string str() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3fs", elapsed_seconds());
    return std::string(buf);
  }

private:
  clock::time_point t0_;
};

} // namespace lmputil
