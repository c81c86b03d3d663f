#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace lmputil {

// Ordered, bijective map: property name -> column index in [0, size()).
//
// Columns are numbered in insertion order, which for parsed snapshots is the
// order of the "ITEM: ATOMS" header. Hot loops should resolve a name to its
// column once and then work on column indices.
class FieldSchema {
public:
  FieldSchema() = default;

  explicit FieldSchema(const std::vector<std::string>& names) {
    for (const auto& n : names) add(n);
  }

  // Append a new column; a name that is already present is rejected.
  std::size_t add(const std::string& name) {
    if (name.empty()) {
      throw std::invalid_argument("FieldSchema: empty property name");
    }
    if (has(name)) {
      throw std::invalid_argument("FieldSchema: duplicate property '" + name + "'");
    }
    const std::size_t id = names_.size();
    names_.push_back(name);
    name2id_.emplace(names_.back(), id);
    return id;
  }

  std::size_t require(const std::string& name) const {
    auto it = name2id_.find(name);
    if (it == name2id_.end()) {
      throw std::out_of_range("FieldSchema: property '" + name + "' not found in schema");
    }
    return it->second;
  }

  bool has(const std::string& name) const {
    return name2id_.find(name) != name2id_.end();
  }

  const std::string& name(std::size_t id) const {
    if (id >= names_.size()) throw std::out_of_range("FieldSchema: invalid column id");
    return names_[id];
  }

  const std::vector<std::string>& names() const { return names_; }
  std::size_t size() const { return names_.size(); }
  bool empty() const { return names_.empty(); }

  bool operator==(const FieldSchema& o) const { return names_ == o.names_; }
  bool operator!=(const FieldSchema& o) const { return !(*this == o); }

private:
  std::vector<std::string> names_;
  std::unordered_map<std::string, std::size_t> name2id_;
};

} // namespace lmputil
