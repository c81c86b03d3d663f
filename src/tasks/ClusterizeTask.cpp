#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "lmputil/alg/cluster/Clusterizer.hpp"
#include "lmputil/core/DumpFile.hpp"
#include "lmputil/tasks/TaskHelpers.hpp"

namespace fs = std::filesystem;

namespace lmputil {
namespace {

namespace cl = lmputil::alg::cluster;

// Labels every selected snapshot with its connected components.
class ClusterizeTask final : public ITask {
public:
  ClusterizeTask(std::string instance, fs::path input, std::vector<std::uint64_t> timesteps,
                 double cutoff, cl::ClusterOptions opts, fs::path output)
      : instance_(std::move(instance)), input_(std::move(input)), timesteps_(std::move(timesteps)),
        cutoff_(cutoff), opts_(std::move(opts)), output_(std::move(output)) {}

  std::string type() const override { return "clusterize"; }
  std::string instance_name() const override { return instance_; }

  TaskResult run() override {
    const DumpFile dump = DumpFile::read(input_, timesteps_);

    TaskResult r;
    DumpFile out;
    for (const auto& [ts, snapshot] : dump) {
      Snapshot clustered = cl::clusterize(snapshot, cutoff_, opts_);
      const auto counts = cl::cluster_counts(clustered);
      std::size_t largest = 0;
      for (const auto& kv : counts) largest = std::max(largest, kv.second);
      r.summary_lines.push_back("timestep " + std::to_string(ts) +
                                ": clusters " + std::to_string(counts.size()) +
                                " largest " + std::to_string(largest));
      out.insert(std::move(clustered));
    }
    out.save(output_);
    r.outputs.push_back(output_);
    return r;
  }

private:
  std::string instance_;
  fs::path input_;
  std::vector<std::uint64_t> timesteps_;
  double cutoff_ = 3.0;
  cl::ClusterOptions opts_;
  fs::path output_;
};

std::unique_ptr<ITask> create_clusterize(const IniConfig& cfg,
                                         const std::string& section,
                                         const std::string& instance,
                                         const TaskBuildEnv& env) {
  tasks::check_known_keys(cfg, section, {"input", "timesteps", "cutoff", "periodic"});
  const double cutoff = tasks::require_nonnegative(cfg, section, "cutoff", 3.0);
  cl::ClusterOptions opts;
  opts.periodic = cfg.get_bool(section, "periodic", std::optional<bool>(false));
  return std::make_unique<ClusterizeTask>(instance,
                                          tasks::require_input(cfg, section, "input", env),
                                          cfg.get_u64_list(section, "timesteps"),
                                          cutoff, std::move(opts),
                                          tasks::output_path(cfg, section, "dump.cluster", env));
}

static TaskRegistrar g_register_clusterize("clusterize", &create_clusterize);

} // namespace
} // namespace lmputil
