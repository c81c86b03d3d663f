#pragma once

#include <algorithm>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lmputil/config/IniConfig.hpp"
#include "lmputil/tasks/ITask.hpp"

namespace lmputil {

// Context used by task factories. Factories only resolve and check paths;
// nothing is created until ITask::run().
struct TaskBuildEnv {
  std::filesystem::path cfg_dir;    // relative inputs resolve here
  std::filesystem::path output_dir; // relative outputs resolve here
};

struct TaskFactoryEntry {
  using CreateFn = std::unique_ptr<ITask> (*)(const IniConfig&, const std::string& section,
                                              const std::string& instance,
                                              const TaskBuildEnv& env);

  std::string type;
  CreateFn create = nullptr;
};

class TaskRegistry {
public:
  static TaskRegistry& instance() {
    static TaskRegistry r;
    return r;
  }

  void register_factory(TaskFactoryEntry e) {
    if (e.type.empty()) throw std::runtime_error("TaskRegistry: factory type is empty");
    if (!e.create) throw std::runtime_error("TaskRegistry: factory entry missing create function for type='" + e.type + "'");
    auto it = factories_.find(e.type);
    if (it != factories_.end()) {
      throw std::runtime_error("TaskRegistry: duplicate factory registration for type='" + e.type + "'");
    }
    factories_.emplace(e.type, std::move(e));
  }

  bool has(const std::string& type) const {
    return factories_.find(type) != factories_.end();
  }

  const TaskFactoryEntry& require(const std::string& type) const {
    auto it = factories_.find(type);
    if (it == factories_.end()) {
      std::string msg = "TaskRegistry: unknown task type '" + type + "'. Registered types:";
      for (const auto& k : registered_types()) msg += " " + k;
      throw std::runtime_error(msg);
    }
    return it->second;
  }

  std::vector<std::string> registered_types() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& kv : factories_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
  }

private:
  std::unordered_map<std::string, TaskFactoryEntry> factories_;
};

// Registers a task factory from a single translation unit:
//
//   static TaskRegistrar g_register_crater("crater", &create_crater);
//
// CMake compiles every source under src/tasks/ into an object library so the
// registrars are never dropped by the linker.
class TaskRegistrar {
public:
  TaskRegistrar(const char* type, TaskFactoryEntry::CreateFn create) {
    TaskFactoryEntry e;
    e.type = std::string(type ? type : "");
    e.create = create;
    TaskRegistry::instance().register_factory(std::move(e));
  }
};

} // namespace lmputil
