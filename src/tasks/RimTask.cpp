#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "lmputil/analysis/Crater.hpp"
#include "lmputil/tasks/TaskHelpers.hpp"

namespace fs = std::filesystem;

namespace lmputil {
namespace {

class RimTask final : public ITask {
public:
  RimTask(std::string instance, fs::path initial, fs::path final_state, double cutoff, fs::path output)
      : instance_(std::move(instance)), initial_(std::move(initial)), final_(std::move(final_state)),
        cutoff_(cutoff), output_(std::move(output)) {}

  std::string type() const override { return "rim"; }
  std::string instance_name() const override { return instance_; }

  TaskResult run() override {
    const Snapshot initial = tasks::read_first(initial_);
    const Snapshot final_state = tasks::read_first(final_);

    Snapshot rim = analysis::rim_region(initial, final_state, cutoff_);
    const std::size_t count = rim.atoms_count();
    tasks::save_snapshot(output_, std::move(rim));

    TaskResult r;
    r.outputs.push_back(output_);
    r.summary_lines.push_back("rim count: " + std::to_string(count));
    return r;
  }

private:
  std::string instance_;
  fs::path initial_;
  fs::path final_;
  double cutoff_ = 3.0;
  fs::path output_;
};

std::unique_ptr<ITask> create_rim(const IniConfig& cfg,
                                  const std::string& section,
                                  const std::string& instance,
                                  const TaskBuildEnv& env) {
  tasks::check_known_keys(cfg, section, {"initial", "final", "cutoff"});
  const double cutoff = tasks::require_nonnegative(cfg, section, "cutoff", 3.0);
  return std::make_unique<RimTask>(instance,
                                   tasks::require_input(cfg, section, "initial", env),
                                   tasks::require_input(cfg, section, "final", env),
                                   cutoff,
                                   tasks::output_path(cfg, section, "dump.rim", env));
}

static TaskRegistrar g_register_rim("rim", &create_rim);

} // namespace
} // namespace lmputil
