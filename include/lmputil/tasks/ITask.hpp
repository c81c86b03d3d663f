#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace lmputil {

struct TaskResult {
  // Files written by the task, in the order they were produced.
  std::vector<std::filesystem::path> outputs;
  // One-line scalar summaries printed to stdout by the runner.
  std::vector<std::string> summary_lines;
};

// One analysis task built from a [task.<name>] section.
// - Factories validate every key before returning; run() does all file I/O.
// - A task is run at most once.
class ITask {
public:
  virtual ~ITask() = default;

  // Task type (e.g. "crater", "clusterize").
  virtual std::string type() const = 0;

  // Instance name from config (e.g. section [task.foo] -> "foo").
  virtual std::string instance_name() const = 0;

  virtual TaskResult run() = 0;
};

} // namespace lmputil
