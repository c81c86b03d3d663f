#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "lmputil/analysis/Crater.hpp"
#include "lmputil/tasks/TaskHelpers.hpp"

namespace fs = std::filesystem;

namespace lmputil {
namespace {

// Largest region of initial atoms left without a final-state neighbor.
class CraterTask final : public ITask {
public:
  CraterTask(std::string instance, fs::path initial, fs::path final_state,
             double neighbor_cutoff, double cluster_cutoff, fs::path output)
      : instance_(std::move(instance)), initial_(std::move(initial)), final_(std::move(final_state)),
        neighbor_cutoff_(neighbor_cutoff), cluster_cutoff_(cluster_cutoff), output_(std::move(output)) {}

  std::string type() const override { return "crater"; }
  std::string instance_name() const override { return instance_; }

  TaskResult run() override {
    const Snapshot initial = tasks::read_first(initial_);
    const Snapshot final_state = tasks::read_first(final_);

    Snapshot crater = analysis::crater_region(initial, final_state, neighbor_cutoff_, cluster_cutoff_);
    const analysis::CraterSummary summary = analysis::crater_summary(crater, initial.zero_level());
    tasks::save_snapshot(output_, std::move(crater));

    TaskResult r;
    r.outputs.push_back(output_);
    r.summary_lines.push_back(summary.format());
    return r;
  }

private:
  std::string instance_;
  fs::path initial_;
  fs::path final_;
  double neighbor_cutoff_ = 3.0;
  double cluster_cutoff_ = 3.0;
  fs::path output_;
};

std::unique_ptr<ITask> create_crater(const IniConfig& cfg,
                                     const std::string& section,
                                     const std::string& instance,
                                     const TaskBuildEnv& env) {
  tasks::check_known_keys(cfg, section, {"initial", "final", "neighbor_cutoff", "cluster_cutoff"});
  const double neighbor_cutoff = tasks::require_nonnegative(cfg, section, "neighbor_cutoff", 3.0);
  const double cluster_cutoff = tasks::require_nonnegative(cfg, section, "cluster_cutoff", 3.0);
  return std::make_unique<CraterTask>(instance,
                                      tasks::require_input(cfg, section, "initial", env),
                                      tasks::require_input(cfg, section, "final", env),
                                      neighbor_cutoff, cluster_cutoff,
                                      tasks::output_path(cfg, section, "dump.crater", env));
}

static TaskRegistrar g_register_crater("crater", &create_crater);

} // namespace
} // namespace lmputil
