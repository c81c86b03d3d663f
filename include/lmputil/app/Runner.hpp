#pragma once

#include <iostream>
#include <ostream>

#include "lmputil/config/IniConfig.hpp"

namespace lmputil {

// main() only handles CLI + config, then calls Runner(cfg).run().
// Runner builds every [task.<name>] section (sorted by name) before running
// any of them, so a bad key fails the run before a file is read. Summary lines
// go to `out`, log lines to std::cerr.
class Runner {
public:
  explicit Runner(const IniConfig& cfg, std::ostream& out = std::cout);

  // Execute every enabled task. Returns 0 on success, 1 when a task failed
  // and [run] keep_going is set; otherwise task errors propagate.
  int run();

  // Build every task without reading inputs or writing outputs
  // (CLI: --validate-config).
  int validate_config();

private:
  const IniConfig& cfg_;
  std::ostream& out_;

  int run_impl_(bool validate_only);
};

} // namespace lmputil
