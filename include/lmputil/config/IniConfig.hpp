#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "lmputil/util/Parse.hpp"

namespace lmputil {

// Minimal INI parser:
// - Sections: [section.name]
// - Key: key = value
// - Comments: lines starting with '#' or ';'
// - Values: raw strings; surrounding quotes (single/double) are stripped.
class IniConfig {
public:
  explicit IniConfig(const std::filesystem::path& file) : file_(file) {
    parse_();
  }

  const std::filesystem::path& file_path() const { return file_; }
  std::filesystem::path base_dir() const { return file_.parent_path(); }

  bool has_section(const std::string& section) const {
    return data_.find(section) != data_.end();
  }

  // Deterministic list of section names (sorted).
  std::vector<std::string> section_names() const {
    std::vector<std::string> out;
    out.reserve(data_.size());
    for (const auto& kv : data_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
  }

  bool has_key(const std::string& section, const std::string& key) const {
    auto it = data_.find(section);
    if (it == data_.end()) return false;
    return it->second.find(key) != it->second.end();
  }

  // Keys of one section, sorted. Used to reject unknown task keys.
  std::vector<std::string> keys(const std::string& section) const {
    std::vector<std::string> out;
    auto it = data_.find(section);
    if (it == data_.end()) return out;
    out.reserve(it->second.size());
    for (const auto& kv : it->second) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
  }

  std::string get_string(const std::string& section, const std::string& key,
                         const std::optional<std::string>& def = std::nullopt) const {
    if (auto v = get_raw_(section, key)) {
      return *v;
    }
    if (def) return *def;
    throw std::runtime_error(err_prefix_() + "missing required key '" + key + "' in section [" + section + "]");
  }

  std::size_t get_size(const std::string& section, const std::string& key,
                       const std::optional<std::size_t>& def = std::nullopt) const {
    const std::string s = get_string(section, key, def ? std::optional<std::string>(std::to_string(*def)) : std::nullopt);
    std::size_t v = 0;
    if (!parse_int(trim(s), v)) {
      throw std::runtime_error(err_prefix_() + "failed to parse size for " + section + "." + key + " from value: '" + s + "'");
    }
    return v;
  }

  double get_double(const std::string& section, const std::string& key,
                    const std::optional<double>& def = std::nullopt) const {
    const std::string s = get_string(section, key, def ? std::optional<std::string>(to_string_prec_(*def)) : std::nullopt);
    double v = 0.0;
    if (!parse_double(trim(s), v)) {
      throw std::runtime_error(err_prefix_() + "failed to parse double for " + section + "." + key + " from value: '" + s + "'");
    }
    return v;
  }

  bool get_bool(const std::string& section, const std::string& key,
                const std::optional<bool>& def = std::nullopt) const {
    auto s = get_string(section, key, def ? std::optional<std::string>(*def ? "true" : "false") : std::nullopt);
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    throw std::runtime_error(err_prefix_() + "failed to parse bool for " + section + "." + key + " from value: '" + s + "'");
  }

  // Parse comma-separated list. Whitespace around items is trimmed.
  std::vector<std::string> get_list(const std::string& section, const std::string& key,
                                    const std::optional<std::string>& def = std::nullopt) const {
    const std::string s = get_string(section, key, def);
    std::vector<std::string> out;
    split_csv_(s, out);
    return out;
  }

  // Comma-separated list of timesteps; an absent key yields an empty list.
  std::vector<std::uint64_t> get_u64_list(const std::string& section, const std::string& key) const {
    std::vector<std::uint64_t> out;
    for (const auto& item : get_list(section, key, std::optional<std::string>(""))) {
      std::uint64_t v = 0;
      if (!parse_int(std::string_view(item), v)) {
        throw std::runtime_error(err_prefix_() + "failed to parse unsigned integer in " + section + "." + key + ": '" + item + "'");
      }
      out.push_back(v);
    }
    return out;
  }

private:
  std::filesystem::path file_;
  std::unordered_map<std::string, std::unordered_map<std::string, std::string>> data_;

  static std::string strip_quotes_(std::string s) {
    if (s.size() >= 2) {
      const char a = s.front();
      const char b = s.back();
      if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
        return s.substr(1, s.size() - 2);
      }
    }
    return s;
  }

  static void split_csv_(const std::string& s, std::vector<std::string>& out) {
    out.clear();
    std::string cur;
    for (char ch : s) {
      if (ch == ',') {
        const std::string t(trim(cur));
        if (!t.empty()) out.push_back(t);
        cur.clear();
      } else {
        cur.push_back(ch);
      }
    }
    const std::string t(trim(cur));
    if (!t.empty()) out.push_back(t);
  }

  static std::string to_string_prec_(double x) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.17g", x);
    return std::string(buf);
  }

  std::string err_prefix_() const {
    return std::string("IniConfig[") + file_.string() + "]: ";
  }

  std::optional<std::string> get_raw_(const std::string& section, const std::string& key) const {
    auto it = data_.find(section);
    if (it == data_.end()) return std::nullopt;
    auto it2 = it->second.find(key);
    if (it2 == it->second.end()) return std::nullopt;
    return it2->second;
  }

  void parse_() {
    std::ifstream ifs(file_);
    if (!ifs) {
      throw std::runtime_error(err_prefix_() + "failed to open config");
    }

    std::string section;
    std::string line;
    std::size_t lineno = 0;

    while (std::getline(ifs, line)) {
      ++lineno;
      const std::string s(trim(line));
      if (s.empty()) continue;
      if (s[0] == '#' || s[0] == ';') continue;

      if (s.front() == '[' && s.back() == ']') {
        section = std::string(trim(std::string_view(s).substr(1, s.size() - 2)));
        if (section.empty()) {
          throw std::runtime_error(err_prefix_() + "empty section header at line " + std::to_string(lineno));
        }
        (void)data_[section];
        continue;
      }

      const auto eq = s.find('=');
      if (eq == std::string::npos) {
        throw std::runtime_error(err_prefix_() + "expected key=value at line " + std::to_string(lineno) + ": " + s);
      }

      const std::string key(trim(std::string_view(s).substr(0, eq)));
      std::string val(trim(std::string_view(s).substr(eq + 1)));
      if (key.empty()) {
        throw std::runtime_error(err_prefix_() + "empty key at line " + std::to_string(lineno));
      }
      // Trailing "# comment" after a value.
      const auto hash = val.find(" #");
      if (hash != std::string::npos) val = std::string(trim(std::string_view(val).substr(0, hash)));
      val = strip_quotes_(val);

      if (section.empty()) {
        throw std::runtime_error(err_prefix_() + "key outside any section at line " + std::to_string(lineno) + ": " + key);
      }

      data_[section][key] = val;
    }
  }
};

} // namespace lmputil
