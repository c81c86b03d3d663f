#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "lmputil/tasks/TaskHelpers.hpp"
#include "lmputil/util/Parse.hpp"

namespace fs = std::filesystem;

namespace lmputil {
namespace {

// Surface height of an unperturbed sample: max z of its first snapshot.
class ZeroLevelTask final : public ITask {
public:
  ZeroLevelTask(std::string instance, fs::path input)
      : instance_(std::move(instance)), input_(std::move(input)) {}

  std::string type() const override { return "zero_level"; }
  std::string instance_name() const override { return instance_; }

  TaskResult run() override {
    const Snapshot s = tasks::read_first(input_);
    TaskResult r;
    r.summary_lines.push_back("zero_lvl: " + format_double(s.zero_level()));
    return r;
  }

private:
  std::string instance_;
  fs::path input_;
};

std::unique_ptr<ITask> create_zero_level(const IniConfig& cfg,
                                         const std::string& section,
                                         const std::string& instance,
                                         const TaskBuildEnv& env) {
  tasks::check_known_keys(cfg, section, {"input"});
  return std::make_unique<ZeroLevelTask>(instance, tasks::require_input(cfg, section, "input", env));
}

static TaskRegistrar g_register_zero_level("zero_level", &create_zero_level);

} // namespace
} // namespace lmputil
