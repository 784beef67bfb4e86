#pragma once

#include "radish/model.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace radish {

using AttrValue = std::variant<std::string, double, int64_t>;
using AttrMap = std::map<std::string, AttrValue>;

// Labeled N-d array whose values are a non-owning view into a VolumeData.
struct LabeledArray {
  std::vector<std::string> dims;
  std::vector<std::size_t> shape;
  std::variant<std::span<const float>, std::span<const double>> values;
  AttrMap attrs;

  const char* dtype() const;
  std::size_t size() const;
  std::span<const std::uint8_t> bytes() const;
};

using NamedArray = std::pair<std::string, LabeledArray>;

struct DatasetNode {
  std::string name;
  AttrMap attrs;
  std::vector<NamedArray> coords;
  std::vector<NamedArray> data_vars;
  std::vector<DatasetNode> children;

  const LabeledArray* coord(const std::string& key) const;
  const LabeledArray* data_var(const std::string& key) const;
  const DatasetNode* child(const std::string& key) const;
};

// Root node carries the site attributes and sweep_fixed_angle; one child
// "sweep_<i>" per sweep. The volume must outlive the returned tree.
DatasetNode to_dataset_tree(const VolumeData& volume);

#ifdef RADISH_USE_MSGPACK
// Node: {name, attrs, coords, data_vars, children}; array:
// {dims, shape, dtype, data (bin), attrs}.
std::vector<std::uint8_t> pack_dataset_tree(const DatasetNode& root);
#endif

}  // namespace radish
