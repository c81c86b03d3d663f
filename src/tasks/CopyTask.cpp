#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "lmputil/core/DumpFile.hpp"
#include "lmputil/tasks/TaskHelpers.hpp"

namespace fs = std::filesystem;

namespace lmputil {
namespace {

// Re-writes the selected timesteps of a dump in canonical form.
class CopyTask final : public ITask {
public:
  CopyTask(std::string instance, fs::path input, std::vector<std::uint64_t> timesteps, fs::path output)
      : instance_(std::move(instance)), input_(std::move(input)), timesteps_(std::move(timesteps)),
        output_(std::move(output)) {}

  std::string type() const override { return "copy"; }
  std::string instance_name() const override { return instance_; }

  TaskResult run() override {
    const DumpFile dump = DumpFile::read(input_, timesteps_);
    dump.save(output_);

    TaskResult r;
    r.outputs.push_back(output_);
    r.summary_lines.push_back("snapshots: " + std::to_string(dump.size()));
    return r;
  }

private:
  std::string instance_;
  fs::path input_;
  std::vector<std::uint64_t> timesteps_;
  fs::path output_;
};

std::unique_ptr<ITask> create_copy(const IniConfig& cfg,
                                   const std::string& section,
                                   const std::string& instance,
                                   const TaskBuildEnv& env) {
  tasks::check_known_keys(cfg, section, {"input", "timesteps"});
  return std::make_unique<CopyTask>(instance,
                                    tasks::require_input(cfg, section, "input", env),
                                    cfg.get_u64_list(section, "timesteps"),
                                    tasks::output_path(cfg, section, "dump.copy", env));
}

static TaskRegistrar g_register_copy("copy", &create_copy);

} // namespace
} // namespace lmputil
