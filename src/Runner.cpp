#include "lmputil/app/Runner.hpp"

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "lmputil/tasks/ITask.hpp"
#include "lmputil/tasks/TaskHelpers.hpp"
#include "lmputil/tasks/TaskRegistry.hpp"
#include "lmputil/util/Timer.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTaskPrefix = "task.";

bool starts_with(const std::string& s, std::string_view prefix) {
  return s.size() >= prefix.size() && std::string_view(s).substr(0, prefix.size()) == prefix;
}

} // namespace

namespace lmputil {

Runner::Runner(const IniConfig& cfg, std::ostream& out) : cfg_(cfg), out_(out) {}

int Runner::run() { return run_impl_(false); }

int Runner::validate_config() { return run_impl_(true); }

int Runner::run_impl_(bool validate_only) {
  WallTimer wall;

  const fs::path cfg_dir = cfg_.base_dir();

  // --- [run] settings ---
  for (const auto& k : cfg_.keys("run")) {
    if (k != "output_dir" && k != "verbose" && k != "keep_going") {
      throw std::runtime_error("[run]: unknown key '" + k + "' (allowed: output_dir, verbose, keep_going)");
    }
  }
  const fs::path output_dir = tasks::resolve_path(cfg_dir, cfg_.get_string("run", "output_dir", std::optional<std::string>(".")));
  const bool verbose = cfg_.get_bool("run", "verbose", std::optional<bool>(false));
  const bool keep_going = cfg_.get_bool("run", "keep_going", std::optional<bool>(false));

  TaskBuildEnv env;
  env.cfg_dir = cfg_dir;
  env.output_dir = output_dir;

  // --- Build every task up front ---
  std::vector<std::unique_ptr<ITask>> tasks;
  for (const auto& sec : cfg_.section_names()) {
    if (sec == "run") continue;
    if (!starts_with(sec, kTaskPrefix)) {
      throw std::runtime_error("unknown config section: [" + sec + "] (expected [run] or [task.<name>])");
    }
    const std::string instance = sec.substr(kTaskPrefix.size());
    if (instance.empty()) {
      throw std::runtime_error("invalid task section name: [" + sec + "]");
    }

    const bool enabled = cfg_.get_bool(sec, "enabled", std::optional<bool>(true));
    if (!enabled) continue;

    const std::string type = cfg_.get_string(sec, "type");
    const auto& factory = TaskRegistry::instance().require(type);
    try {
      tasks.push_back(factory.create(cfg_, sec, instance, env));
    } catch (const std::exception& e) {
      throw std::runtime_error("task '" + instance + "' (type='" + type + "'): " + e.what());
    }
  }

  if (tasks.empty()) {
    std::cerr << "[lmputil] no enabled tasks; nothing to do.\n";
    return 0;
  }

  if (validate_only) {
    std::cerr << "[lmputil] validation OK (no dump processing performed)\n"
              << "          tasks=" << tasks.size() << " output_dir=" << output_dir.string() << "\n";
    return 0;
  }

  fs::create_directories(output_dir);

  std::size_t failed = 0;
  for (auto& task : tasks) {
    const std::string label = "task." + task->instance_name() + " (type=" + task->type() + ")";
    if (verbose) std::cerr << "[lmputil] running " << label << "\n";

    WallTimer tm;
    TaskResult result;
    try {
      result = task->run();
    } catch (const std::exception& e) {
      if (!keep_going) {
        throw std::runtime_error(label + ": " + e.what());
      }
      std::cerr << "[lmputil] " << label << " failed: " << e.what() << "\n";
      ++failed;
      continue;
    }

    for (const auto& line : result.summary_lines) {
      out_ << line << "\n";
    }
    if (verbose) {
      for (const auto& p : result.outputs) {
        std::cerr << "          wrote " << p.string() << "\n";
      }
      std::cerr << "          took " << tm.str() << "\n";
    }
  }
  out_.flush();

  if (verbose) {
    std::cerr << "[lmputil] done: tasks=" << tasks.size() << " failed=" << failed
              << " wall=" << wall.str() << "\n";
  }
  if (failed > 0) {
    std::cerr << "[lmputil] " << failed << " of " << tasks.size() << " tasks failed\n";
    return 1;
  }
  return 0;
}

} // namespace lmputil
