#include <filesystem>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#if LMPUTIL_HAS_OPENMP
#include <omp.h>
#endif

#include "lmputil/app/Runner.hpp"
#include "lmputil/config/IniConfig.hpp"
#include "lmputil/tasks/TaskRegistry.hpp"
#include "lmputil/util/Parse.hpp"

namespace {

enum class Action { Run, Validate, ListTasks, Help, Version };

struct Options {
  Action action = Action::Run;
  std::filesystem::path config;
  std::optional<int> threads;
};

void print_usage(std::ostream& os) {
  os << "lmputil " << LMPUTIL_VERSION_STR << ": post-processing for LAMMPS text dumps\n"
     << "\n"
     << "Usage:\n"
     << "  lmputil --config <file.ini> [--threads N] [--validate-config]\n"
     << "  lmputil --list-tasks | --version | --help\n"
     << "\n"
     << "Options:\n"
     << "  --config <file>     task file with a [run] section and [task.<name>] sections\n"
     << "  --threads N         OpenMP threads for neighbor queries (0 keeps the default)\n"
     << "  --validate-config   build every task and check its inputs, then stop\n"
     << "  --list-tasks        print the task types a [task.<name>] section may use\n"
     << "\n"
     << "Task types:";
  for (const auto& t : lmputil::TaskRegistry::instance().registered_types()) os << ' ' << t;
  os << '\n';
}

// Accepts "--flag value" and "--flag=value".
class ArgCursor {
public:
  explicit ArgCursor(std::span<char* const> args) : args_(args) {}

  bool next(std::string_view& flag) {
    if (pos_ >= args_.size()) return false;
    std::string_view a = args_[pos_++];
    inline_value_.reset();
    const auto eq = a.find('=');
    if (a.starts_with("--") && eq != std::string_view::npos) {
      inline_value_ = a.substr(eq + 1);
      a = a.substr(0, eq);
    }
    flag = a;
    return true;
  }

  std::string_view value(std::string_view flag) {
    if (inline_value_) return *inline_value_;
    if (pos_ >= args_.size()) throw std::runtime_error(std::string(flag) + " requires a value");
    return args_[pos_++];
  }

  void reject_value(std::string_view flag) const {
    if (inline_value_) throw std::runtime_error(std::string(flag) + " does not take a value");
  }

private:
  std::span<char* const> args_;
  std::size_t pos_ = 0;
  std::optional<std::string_view> inline_value_;
};

Options parse_options(std::span<char* const> args) {
  Options opt;
  bool validate = false;
  ArgCursor cur(args);
  std::string_view flag;
  while (cur.next(flag)) {
    if (flag == "--config") {
      opt.config = std::filesystem::path(std::string(cur.value(flag)));
    } else if (flag == "--threads") {
      const std::string_view v = cur.value(flag);
      int n = 0;
      if (!lmputil::parse_int(v, n) || n < 0) {
        throw std::runtime_error("--threads expects a nonnegative integer, got '" + std::string(v) + "'");
      }
      opt.threads = n;
    } else if (flag == "--validate-config") {
      cur.reject_value(flag);
      validate = true;
    } else if (flag == "--list-tasks") {
      cur.reject_value(flag);
      opt.action = Action::ListTasks;
    } else if (flag == "--version") {
      opt.action = Action::Version;
    } else if (flag == "--help" || flag == "-h") {
      opt.action = Action::Help;
    } else {
      throw std::runtime_error("unknown argument '" + std::string(flag) + "' (see --help)");
    }
  }

  if (opt.action != Action::Run) return opt;
  if (opt.config.empty()) throw std::runtime_error("--config <file> is required (see --help)");
  if (validate) opt.action = Action::Validate;
  return opt;
}

void apply_threads(const std::optional<int>& threads) {
  if (!threads || *threads == 0) return;
#if LMPUTIL_HAS_OPENMP
  omp_set_num_threads(*threads);
  std::cerr << "[lmputil] using " << *threads << " OpenMP threads\n";
#else
  std::cerr << "[lmputil] built without OpenMP; --threads " << *threads << " ignored\n";
#endif
}

int dispatch(const Options& opt) {
  switch (opt.action) {
    case Action::Help:
      print_usage(std::cout);
      return 0;
    case Action::Version:
      std::cout << "lmputil " << LMPUTIL_VERSION_STR << '\n';
      return 0;
    case Action::ListTasks:
      for (const auto& t : lmputil::TaskRegistry::instance().registered_types()) std::cout << t << '\n';
      return 0;
    case Action::Run:
    case Action::Validate:
      break;
  }

  apply_threads(opt.threads);
  const lmputil::IniConfig cfg(opt.config);
  lmputil::Runner runner(cfg);
  return opt.action == Action::Validate ? runner.validate_config() : runner.run();
}

} // namespace

int main(int argc, char** argv) {
  try {
    const std::span<char* const> args(argv + 1, argc > 1 ? static_cast<std::size_t>(argc - 1) : 0u);
    return dispatch(parse_options(args));
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << '\n';
    return 1;
  }
}
