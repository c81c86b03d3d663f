#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "lmputil/analysis/Sputter.hpp"
#include "lmputil/tasks/TaskHelpers.hpp"

namespace fs = std::filesystem;

namespace lmputil {
namespace {

// Splits the final state into small detached clusters and the bulk. The
// `output` key names the sputtered dump; the bulk goes next to it.
class SputterTask final : public ITask {
public:
  SputterTask(std::string instance, fs::path input, double cutoff, std::size_t max_cluster_size,
              fs::path sputter_out, fs::path bulk_out)
      : instance_(std::move(instance)), input_(std::move(input)), cutoff_(cutoff),
        max_cluster_size_(max_cluster_size), sputter_out_(std::move(sputter_out)),
        bulk_out_(std::move(bulk_out)) {}

  std::string type() const override { return "sputtered"; }
  std::string instance_name() const override { return instance_; }

  TaskResult run() override {
    const Snapshot s = tasks::read_first(input_);
    analysis::SputterSplit split = analysis::split_sputtered(s, cutoff_, max_cluster_size_);
    const std::size_t count = split.sputtered.atoms_count();
    const std::size_t n_clusters = split.sputtered_ids.size();
    tasks::save_snapshot(sputter_out_, std::move(split.sputtered));
    tasks::save_snapshot(bulk_out_, std::move(split.bulk));

    TaskResult r;
    r.outputs.push_back(sputter_out_);
    r.outputs.push_back(bulk_out_);
    r.summary_lines.push_back("sputtered: " + std::to_string(count) +
                              " (clusters: " + std::to_string(n_clusters) + ")");
    return r;
  }

private:
  std::string instance_;
  fs::path input_;
  double cutoff_ = 3.0;
  std::size_t max_cluster_size_ = 1000;
  fs::path sputter_out_;
  fs::path bulk_out_;
};

std::unique_ptr<ITask> create_sputtered(const IniConfig& cfg,
                                        const std::string& section,
                                        const std::string& instance,
                                        const TaskBuildEnv& env) {
  tasks::check_known_keys(cfg, section, {"input", "cutoff", "max_cluster_size", "bulk_output"});
  const double cutoff = tasks::require_nonnegative(cfg, section, "cutoff", 3.0);
  const std::size_t max_size = cfg.get_size(section, "max_cluster_size", std::optional<std::size_t>(1000));
  const std::string bulk_name = cfg.get_string(section, "bulk_output", std::optional<std::string>("dump.no_sputter"));
  if (bulk_name.empty()) throw std::runtime_error("[" + section + "]: bulk_output must not be empty");
  return std::make_unique<SputterTask>(instance,
                                       tasks::require_input(cfg, section, "input", env),
                                       cutoff, max_size,
                                       tasks::output_path(cfg, section, "dump.sputter", env),
                                       tasks::resolve_path(env.output_dir, bulk_name));
}

static TaskRegistrar g_register_sputtered("sputtered", &create_sputtered);

} // namespace
} // namespace lmputil
